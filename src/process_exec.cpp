#include "strata/process_exec.hpp"

#include <atomic>
#include <optional>
#include <reproc++/drain.hpp>
#include <reproc++/reproc.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata {

Result<ProcessOutput> process_exec(std::vector<std::string> &&args,
                                   std::optional<std::string> working_dir,
                                   std::optional<std::unordered_map<std::string, std::string>> env,
                                   std::stop_token stop) {
    if (args.empty()) {
        return make_error(ErrorCode::RunnerFailure, "Cannot execute empty command");
    }
    if (stop.stop_requested()) {
        return make_error(ErrorCode::Cancelled, "cancelled before {} started", args.front());
    }

    reproc::options options;
    options.redirect.in.type = reproc::redirect::discard;
    options.redirect.err.type = reproc::redirect::parent;
    options.stop = {
        {reproc::stop::wait, reproc::milliseconds(0)},
        {reproc::stop::terminate, reproc::milliseconds(5000)},
        {reproc::stop::kill, reproc::milliseconds(2000)},
    };

    if (working_dir) {
        options.working_directory = working_dir->c_str();
    }

    std::vector<std::string> env_strings;
    std::vector<const char *> env_ptrs;
    if (env) {
        options.env.behavior = reproc::env::extend;
        for (const auto &[key, value] : *env) {
            env_strings.push_back(key + "=" + value);
        }
        for (const auto &s : env_strings) {
            env_ptrs.push_back(s.c_str());
        }
        env_ptrs.push_back(nullptr);
        options.env.extra = env_ptrs.data();
    }

    reproc::process process;
    if (std::error_code ec = process.start(args, options); ec) {
        return make_error(ErrorCode::RunnerFailure, "Failed to start {}: {}", args.front(), ec.message());
    }

    std::atomic<bool> terminated = false;
    std::stop_callback on_stop(stop, [&process, &terminated] {
        terminated = true;
        if (std::error_code ec = process.terminate(); ec) {
            std::error_code kill_ec = process.kill();
            (void)kill_ec; // the wait below reports what actually happened
        }
    });

    ProcessOutput result;
    reproc::sink::string sink(result.out);
    if (std::error_code ec = reproc::drain(process, sink, reproc::sink::null); ec && !terminated) {
        return make_error(ErrorCode::RunnerFailure, "Failed to read output of {}: {}", args.front(), ec.message());
    }

    auto [status, ec] = process.wait(reproc::infinite);
    if (terminated) {
        return make_error(ErrorCode::Cancelled, "{} was stopped", args.front());
    }
    if (ec) {
        return make_error(ErrorCode::RunnerFailure, "Failed to wait for {}: {}", args.front(), ec.message());
    }
    result.exit_code = status;
    return result;
}

} // namespace strata
