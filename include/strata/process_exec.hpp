#pragma once

#include "strata/utility.hpp"

#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

struct ProcessOutput {
    int exit_code = -1;
    std::string out; ///< Everything the process wrote to stdout.
};

/**
 * @brief Executes a subprocess and captures its stdout.
 *
 * stdin is empty and stderr is passed through to the parent. When `stop` is requested while the
 * process runs, it is sent SIGTERM and the call fails with `Cancelled`.
 *
 * @param args The command line arguments (first argument is the executable).
 * @param working_dir Optional working directory for the subprocess.
 * @param env Optional environment variables to extend/override the parent environment.
 * @return The exit code and captured output, or `RunnerFailure` if the process could not be run.
 */
Result<ProcessOutput> process_exec(std::vector<std::string> &&args,
                                   std::optional<std::string> working_dir = std::nullopt,
                                   std::optional<std::unordered_map<std::string, std::string>> env = std::nullopt,
                                   std::stop_token stop = {});

} // namespace strata
