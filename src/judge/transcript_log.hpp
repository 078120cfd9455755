#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace shellbox::judge {

struct TranscriptEntry {
    std::string speaker;
    std::string text;
};

// Interaction record of one judge run, rendered as "speaker: text" lines.
// Program output is split on line boundaries; an unterminated tail is held
// back until the line completes or the other side speaks.
class TranscriptLog {
public:
    static constexpr const char* kUser = "user";
    static constexpr const char* kProgram = "program";
    static constexpr const char* kInterruptLine = "<Ctrl+C>";

    void AddUserLine(const std::string& line);
    void AddProgramOutput(const std::string& output);
    void AddInterrupt() { AddUserLine(kInterruptLine); }

    // Flushes any partial program line.
    void Close();

    const std::vector<TranscriptEntry>& Entries() const { return entries_; }
    std::string Render() const;
    // Returns false when the file cannot be written.
    bool WriteTo(const std::filesystem::path& path) const;

private:
    void FlushPartial();

    std::vector<TranscriptEntry> entries_;
    std::string partial_;
};

}  // namespace shellbox::judge
