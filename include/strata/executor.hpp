#pragma once

#include "strata/cache_store.hpp"
#include "strata/domain.hpp"
#include "strata/fingerprint.hpp"
#include "strata/reporter.hpp"
#include "strata/stage_graph.hpp"
#include "strata/stage_runner.hpp"
#include "strata/utility.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace strata {

struct ExecutorConfig {
    bool dry_run = false;
    size_t jobs = 1; // 1 runs stages inline in topological order, 0 means auto-detect
};

enum class StageState : uint8_t {
    Pending,
    Fingerprinting,
    CacheCheck,
    Running,
    Committing,
    Done,
    Failed,
    Skipped, // never attempted: an ancestor failed or the build stopped first
};

/** @brief Everything one execute() call produced, indexed by stage id. */
struct ExecutionReport {
    std::vector<BuildResult> results; ///< In completion order.
    std::vector<StageState> states;
    std::vector<std::optional<Fingerprint>> fingerprints;
    std::vector<std::shared_ptr<const Artifact>> artifacts; ///< Set for Done stages (not for dry-run plans).
    std::vector<std::optional<Error>> errors;                ///< Set for Failed stages.
    std::optional<Error> fatal;                              ///< Set when the build was aborted, e.g. CacheCorruption.

    bool succeeded() const;
};

/**
 * @brief Walks a stage graph, serving stages from the cache or running them.
 *
 * Per stage: Pending → Fingerprinting → CacheCheck → Done on a hit, or
 * Running → Committing → Done on a miss, and Failed on any error. A stage
 * starts only after its parent is Done, and the descendants of a failed
 * stage are never attempted. Committed cache entries are never rolled back.
 */
class Executor {
public:
    Executor(const StageGraph &graph,
             CacheStore &cache,
             const Fingerprinter &fingerprinter,
             StageRunner &runner,
             ExecutorConfig config = {});

    /**
     * @param stop Cancels the build: no further stage starts and running
     *        stages are asked to stop.
     * @param reporter Receives each BuildResult as soon as the stage completes.
     */
    ExecutionReport execute(std::stop_token stop = {}, BuildReporter *reporter = nullptr);

private:
    struct StageRun {
        BuildResult result;
        std::shared_ptr<const Artifact> artifact;
        bool fatal = false;
        Error error{ErrorCode::RunnerFailure, {}};
    };

    Result<Artifact> invoke_runner(const StageContext &ctx, std::stop_token stop);

    StageRun run_stage(size_t id,
                       const std::optional<Fingerprint> &parent_fp,
                       std::shared_ptr<const Artifact> parent_artifact,
                       bool parent_planned,
                       std::stop_token stop,
                       StageState &state);

    void record(ExecutionReport &report, size_t id, StageRun &&run, BuildReporter *reporter, std::stop_source &internal);
    void execute_sequential(ExecutionReport &report, std::stop_source &internal, BuildReporter *reporter);
    void execute_parallel(ExecutionReport &report,
                          std::stop_source &internal,
                          BuildReporter *reporter,
                          size_t thread_count);

    const StageGraph &graph_;
    CacheStore &cache_;
    const Fingerprinter &fingerprinter_;
    StageRunner &runner_;
    ExecutorConfig config_;
    std::vector<std::jthread> pool_;
};

} // namespace strata
