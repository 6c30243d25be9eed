#pragma once

#include "strata/domain.hpp"

#include <fstream>
#include <mutex>

namespace strata {

/**
 * @brief Receives BuildResult records as stages complete.
 *
 * The Executor never calls a reporter from two threads at once.
 */
class BuildReporter {
public:
    virtual ~BuildReporter() = default;
    virtual void on_result(const BuildResult &result) = 0;
};

/** @brief Prints one `[n/N] outcome stage` line per result. */
class ConsoleReporter final : public BuildReporter {
public:
    explicit ConsoleReporter(size_t total_stages, bool verbose = false);

    void on_result(const BuildResult &result) override;

private:
    size_t total_;
    size_t completed_ = 0;
    bool verbose_;
    std::ofstream tty_;
    std::mutex mtx_;
};

} // namespace strata
