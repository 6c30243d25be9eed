#include "strata/reporter.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <print>

namespace strata {

namespace {

const char *outcome_color(Outcome outcome) {
    switch (outcome) {
    case Outcome::CacheHit:
        return "\033[1;36m";
    case Outcome::Built:
        return "\033[1;32m";
    case Outcome::Failed:
        return "\033[1;31m";
    case Outcome::Planned:
        return "\033[1;33m";
    }
    return "\033[0m";
}

} // namespace

// Escape codes go to the terminal only, so redirected output stays plain.
ConsoleReporter::ConsoleReporter(size_t total_stages, bool verbose)
    : total_(total_stages), verbose_(verbose), tty_("/dev/tty") {
}

void ConsoleReporter::on_result(const BuildResult &result) {
    std::lock_guard lock(mtx_);
    ++completed_;

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(result.duration).count();

    tty_ << "\033[1m" << std::flush;
    std::cout << "[" << completed_ << "/" << total_ << "] " << std::flush;
    tty_ << "\033[0m" << outcome_color(result.outcome) << std::flush;
    std::cout << std::setw(9) << to_string(result.outcome) << std::flush;
    tty_ << "\033[0m" << std::flush;
    std::cout << " " << result.stage << " (" << ms << " ms)";
    if (verbose_ && result.fingerprint)
        std::cout << " " << result.fingerprint->to_hex();
    std::cout << std::endl;

    if (result.outcome == Outcome::Failed && !result.error.empty()) {
        std::println(stderr, "  {}", result.error);
    }
}

} // namespace strata
