#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "pty/pty_process.hpp"
#include "utils/boost_process.hpp"
#include "utils/common.hpp"

namespace shellbox::testing {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("shellbox_test_" + utils::GenerateId());
        std::filesystem::create_directories(path_);
        path_ = std::filesystem::canonical(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::string Str() const { return path_.string(); }

    std::filesystem::path Write(const std::string& name, const std::string& content) const {
        const auto file = path_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream output(file, std::ios::trunc);
        output << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

inline bool HasProgram(const std::string& name) {
    return !bp::search_path(name).empty();
}

// Reads until end of stream or until the timeout expires.
inline std::string ReadUntilEnd(pty::PtyProcess& process,
                                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::string output;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto chunk = process.ReadAvailable(std::chrono::milliseconds(100));
        output += chunk.data;
        if (chunk.end_of_stream) {
            break;
        }
    }
    return output;
}

// Reads until needle has appeared `count` times or the timeout expires.
inline std::string ReadUntilSeen(pty::PtyProcess& process,
                                 const std::string& needle,
                                 int count = 1,
                                 std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::string output;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto occurrences = [&]() {
        int seen = 0;
        for (auto pos = output.find(needle); pos != std::string::npos; pos = output.find(needle, pos + 1)) {
            ++seen;
        }
        return seen;
    };
    while (occurrences() < count && std::chrono::steady_clock::now() < deadline) {
        auto chunk = process.ReadAvailable(std::chrono::milliseconds(100));
        output += chunk.data;
        if (chunk.end_of_stream) {
            break;
        }
    }
    return output;
}

inline std::string SeqOutput(int last) {
    std::string expected;
    for (int i = 1; i <= last; ++i) {
        expected += std::to_string(i) + "\r\n";
    }
    return expected;
}

}  // namespace shellbox::testing
