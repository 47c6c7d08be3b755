#include "diag_logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace geocell {

namespace {

// Local wall-clock time with milliseconds, e.g. "2026-10-18 09:41:07.032".
std::string wallClock() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &secs);
#else
    localtime_r(&secs, &local);
#endif
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03ld", date, millis);
    return stamp;
}

} // namespace

DiagLogger::DiagLogger(const std::string& path) : path_(path) {
    if (!path_.empty()) {
        out_.open(path_, std::ios::app);
        banner("start");
    }
}

DiagLogger::~DiagLogger() {
    banner("end");
}

void DiagLogger::banner(const char* which) {
    if (ok()) out_ << "=== geocell diag " << which << ' ' << wallClock() << " ===\n";
}

void DiagLogger::log(const std::string& line) {
    if (!ok()) return;
    out_ << wallClock() << " | " << line << std::endl;
}

void DiagLogger::log(const std::string& op, const std::string& args, const std::string& outcome) {
    log(op + " " + args + " -> " + outcome);
}

} // namespace geocell
