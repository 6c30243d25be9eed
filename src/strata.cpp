#include "strata/cache_store.hpp"
#include "strata/executor.hpp"
#include "strata/file_access.hpp"
#include "strata/parser.hpp"
#include "strata/pipeline.hpp"
#include "strata/reporter.hpp"
#include "strata/stage_graph.hpp"
#include "strata/stage_runner.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <thread>

namespace {

std::atomic<bool> interrupted = false;

extern "C" void on_interrupt(int) {
    interrupted = true;
}

void print_help() {
    std::println("Usage: strata [options]");
    std::println("Options:");
    std::println("  -h, --help            Show this help message");
    std::println("  -v, --version         Show version");
    std::println("  -d <dir>              Change working directory before doing anything");
    std::println("  -f <file>             Use <file> as the pipeline spec (default: strata.json)");
    std::println("  -j, --jobs <N>        Run up to N independent stages at once (default: 1, 0 = auto)");
    std::println("  --cache-dir <dir>     Stage cache location (default: .strata-cache)");
    std::println("  --dry-run             Report cache hits and planned builds without running anything");
    std::println("  --graph               Print the stage graph in DOT format");
    std::println("  --clean               Remove every cache entry");
    std::println("  --max-entries <N>     After the build, evict least recently used entries beyond N");
    std::println("  --max-bytes <N>       After the build, evict least recently used entries beyond N bytes");
    std::println("  --output <file>       Write the final stage's artifact to <file>");
    std::println("  --verbose             Print stage fingerprints");
}

void print_version() {
    std::println("strata {}", STRATA_PROJ_VER);
}

std::optional<size_t> parse_count(const char *text) {
    size_t value = 0;
    auto res = std::from_chars(text, text + std::strlen(text), value);
    if (res.ec != std::errc() || res.ptr != text + std::strlen(text))
        return std::nullopt;
    return value;
}

} // namespace

int main(const int argc, const char *const *argv) {
    strata::ExecutorConfig config;
    bool graph_only = false;
    bool clean = false;
    bool verbose = false;
    std::optional<size_t> max_entries;
    std::optional<size_t> max_bytes;
    std::optional<std::filesystem::path> output_path;
    std::string input_path = "strata.json";
    std::filesystem::path cache_dir = ".strata-cache";
    std::filesystem::path work_dir = ".";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> const char * {
            if (i + 1 < argc)
                return argv[++i];
            std::println(std::cerr, "Missing argument for {}", arg);
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d") {
            const char *value = next();
            if (!value)
                return 1;
            work_dir = value;
        } else if (arg == "-f") {
            const char *value = next();
            if (!value)
                return 1;
            input_path = value;
        } else if (arg == "--cache-dir") {
            const char *value = next();
            if (!value)
                return 1;
            cache_dir = value;
        } else if (arg == "--output") {
            const char *value = next();
            if (!value)
                return 1;
            output_path = value;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--graph") {
            graph_only = true;
        } else if (arg == "--clean") {
            clean = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "-j" || arg == "--jobs" || arg == "--max-entries" || arg == "--max-bytes") {
            const char *value = next();
            if (!value)
                return 1;
            auto count = parse_count(value);
            if (!count) {
                std::println(std::cerr, "Invalid value for {}: {}", arg, value);
                return 1;
            }
            if (arg == "--max-entries")
                max_entries = *count;
            else if (arg == "--max-bytes")
                max_bytes = *count;
            else
                config.jobs = *count;
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    auto store = strata::CacheStore::open(std::make_unique<strata::DiskBackend>(cache_dir));
    if (!store) {
        std::println(std::cerr, "Failed to open cache {}: {}", cache_dir.string(), store.error().describe());
        return 1;
    }
    strata::CacheStore &cache = **store;

    if (clean) {
        auto removed = cache.evict(strata::LruEntryLimit{0});
        if (!removed) {
            std::println(std::cerr, "Clean failed: {}", removed.error().describe());
            return 1;
        }
        std::println("Removed {} cache entries", *removed);
        return 0;
    }

    if (!std::filesystem::exists(input_path)) {
        std::println(std::cerr, "Pipeline File: {} does not exist.", input_path);
        return 1;
    }

    auto spec = strata::load_spec(input_path);
    if (!spec) {
        std::println(std::cerr, "Failed to parse: {}", spec.error().describe());
        return 1;
    }

    auto graph = strata::StageGraph::build(*spec);
    if (!graph) {
        std::println(std::cerr, "Invalid pipeline: {}", graph.error().describe());
        return 1;
    }

    std::error_code cwd_ec;
    std::filesystem::path cwd = std::filesystem::current_path(cwd_ec);
    if (cwd_ec) {
        std::println(std::cerr, "Failed to resolve working directory: {}", cwd_ec.message());
        return 1;
    }
    strata::LocalFileAccess files{cwd};
    strata::ProcessStageRunner runner{cwd, cache_dir / "tmp"};

    if (graph_only) {
        // Green stages would be rebuilt, white ones are served from the cache.
        strata::ExecutorConfig plan_config = config;
        plan_config.dry_run = true;
        strata::Fingerprinter fingerprinter{files};
        strata::Executor planner{*graph, cache, fingerprinter, runner, plan_config};
        auto plan = planner.execute();

        std::vector<std::string> colors(graph->size(), "0.9 0.9 0.9");
        for (const auto &result : plan.results) {
            auto id = graph->find(result.stage);
            if (!id)
                continue;
            if (result.outcome == strata::Outcome::CacheHit)
                colors[*id] = "white";
            else if (result.outcome == strata::Outcome::Planned)
                colors[*id] = "green";
            else if (result.outcome == strata::Outcome::Failed)
                colors[*id] = "red";
        }
        graph->write_dot(std::cout, colors);
        return 0;
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
    std::stop_source cancel;
    std::jthread interrupt_watch([&cancel](std::stop_token watch_stop) {
        while (!watch_stop.stop_requested()) {
            if (interrupted) {
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    strata::ConsoleReporter reporter{graph->size(), verbose};
    strata::PipelineController controller{cache, files, runner, config};
    strata::PipelineOutcome outcome = controller.run(*graph, &reporter, cancel.get_token());

    interrupt_watch.request_stop();
    interrupt_watch.join();

    if (!outcome.succeeded()) {
        std::println(std::cerr,
                     "Build failed{}: {}",
                     outcome.failed_stage ? std::format(" at stage '{}'", *outcome.failed_stage) : "",
                     outcome.error ? outcome.error->describe() : "unknown error");
        return 1;
    }

    if (max_entries) {
        if (auto res = cache.evict(strata::LruEntryLimit{*max_entries}); !res) {
            std::println(std::cerr, "Eviction failed: {}", res.error().describe());
            return 1;
        }
    }
    if (max_bytes) {
        if (auto res = cache.evict(strata::SizeLimit{*max_bytes}); !res) {
            std::println(std::cerr, "Eviction failed: {}", res.error().describe());
            return 1;
        }
    }

    if (output_path && outcome.output) {
        std::ofstream out(*output_path, std::ios::binary | std::ios::trunc);
        out.write(outcome.output->payload.data(), static_cast<std::streamsize>(outcome.output->payload.size()));
        if (!out.flush()) {
            std::println(std::cerr, "Failed to write {}", output_path->string());
            return 1;
        }
    }

    return 0;
}
