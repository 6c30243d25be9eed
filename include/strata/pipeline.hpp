#pragma once

#include "strata/cache_store.hpp"
#include "strata/domain.hpp"
#include "strata/executor.hpp"
#include "strata/file_access.hpp"
#include "strata/fingerprint.hpp"
#include "strata/reporter.hpp"
#include "strata/stage_graph.hpp"
#include "strata/stage_runner.hpp"
#include "strata/utility.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace strata {

enum class PipelineStatus : uint8_t { Success, Failed };

struct PipelineOutcome {
    PipelineStatus status = PipelineStatus::Failed;
    std::vector<BuildResult> results; ///< Every stage attempted, in completion order.
    std::optional<std::string> failed_stage;
    std::optional<Error> error;
    std::shared_ptr<const Artifact> output; ///< Artifact of the last stage in topological order.

    bool succeeded() const {
        return status == PipelineStatus::Success;
    }
};

/**
 * @brief Runs one build invocation end to end.
 *
 * The cache store is passed in so independent builds can share a store or
 * use isolated ones. Re-running after a failure serves every stage that was
 * committed before from the cache.
 */
class PipelineController {
public:
    PipelineController(CacheStore &cache, FileAccess &files, StageRunner &runner, ExecutorConfig config = {});

    /** @brief Builds the graph of `spec` and runs it. Graph errors fail before any stage runs. */
    PipelineOutcome run(const PipelineSpec &spec, BuildReporter *reporter = nullptr, std::stop_token stop = {});

    PipelineOutcome run(const StageGraph &graph, BuildReporter *reporter = nullptr, std::stop_token stop = {});

private:
    CacheStore &cache_;
    Fingerprinter fingerprinter_;
    StageRunner &runner_;
    ExecutorConfig config_;
};

} // namespace strata
