#pragma once
#include <fstream>
#include <string>

namespace geocell {

// Append-only diagnostics file. An empty path leaves the logger closed and
// every call a no-op, so callers can always hold one.
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path);
    ~DiagLogger();

    DiagLogger(const DiagLogger&) = delete;
    DiagLogger& operator=(const DiagLogger&) = delete;

    bool ok() const { return out_.is_open(); }
    const std::string& path() const { return path_; }

    void log(const std::string& line);
    // "<op> <args> -> <outcome>"
    void log(const std::string& op, const std::string& args, const std::string& outcome);

private:
    void banner(const char* which);

    std::string path_;
    std::ofstream out_;
};

} // namespace geocell
