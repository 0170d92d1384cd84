#pragma once

#include "logging/LogRegistry.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <spdlog/sinks/ostream_sink.h>

namespace lw::test {

namespace fs = std::filesystem;

// mkdtemp-backed directory (mode 0700), removed recursively on destruction.
class TempDir {
public:
    TempDir() {
        auto tmpl = (fs::temp_directory_path() / "logwarden-test-XXXXXX").string();
        if (!::mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed");
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

// Collects everything the registered loggers emit while in scope.
class LogCapture {
public:
    LogCapture() : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(os_, true)) {
        sink_->set_level(spdlog::level::trace);
        logging::LogRegistry::addSink(sink_);
    }

    ~LogCapture() { logging::LogRegistry::removeSink(sink_); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] std::string text() const { return os_.str(); }

    [[nodiscard]] std::size_t count(const std::string_view needle) const {
        const auto s = os_.str();
        std::size_t n = 0;
        for (auto pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + needle.size())) ++n;
        return n;
    }

private:
    std::ostringstream os_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

inline void writeFile(const fs::path& p, const std::string_view content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot write " + p.string());
    out << content;
}

inline std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
}

// Creates p with `bytes` bytes and backdates its mtime by `age`.
inline void makeLog(const fs::path& p, const std::size_t bytes, const std::chrono::hours age = std::chrono::hours(0)) {
    writeFile(p, std::string(bytes, 'x'));
    fs::last_write_time(p, fs::file_time_type::clock::now() - age);
}

constexpr std::chrono::hours days(const int n) { return std::chrono::hours(24 * n); }

}
