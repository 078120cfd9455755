#include "judge/transcript_log.hpp"

#include <fstream>
#include <sstream>

#include "utils/logging.hpp"

namespace shellbox::judge {

void TranscriptLog::AddUserLine(const std::string& line) {
    FlushPartial();
    entries_.push_back({kUser, line});
}

void TranscriptLog::AddProgramOutput(const std::string& output) {
    partial_ += output;
    std::size_t start = 0;
    while (true) {
        const auto newline = partial_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        auto line = partial_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        entries_.push_back({kProgram, std::move(line)});
        start = newline + 1;
    }
    partial_.erase(0, start);
}

void TranscriptLog::Close() {
    FlushPartial();
}

void TranscriptLog::FlushPartial() {
    if (partial_.empty()) {
        return;
    }
    if (partial_.back() == '\r') {
        partial_.pop_back();
    }
    entries_.push_back({kProgram, partial_});
    partial_.clear();
}

std::string TranscriptLog::Render() const {
    std::ostringstream oss;
    for (const auto& entry : entries_) {
        oss << entry.speaker << ": " << entry.text << "\n";
    }
    if (!partial_.empty()) {
        oss << kProgram << ": " << partial_ << "\n";
    }
    return oss.str();
}

bool TranscriptLog::WriteTo(const std::filesystem::path& path) const {
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        utils::LogWarn("judge", "failed to open transcript file", {{"path", path.string()}});
        return false;
    }
    output << Render();
    return static_cast<bool>(output);
}

}  // namespace shellbox::judge
