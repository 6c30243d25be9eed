#pragma once

#include "strata/domain.hpp"
#include "strata/stage_graph.hpp"
#include "strata/utility.hpp"

#include <filesystem>
#include <memory>
#include <stop_token>

namespace strata {

/** @brief What a runner needs to produce one stage's artifact. */
struct StageContext {
    const Stage &stage;
    std::shared_ptr<const Artifact> parent_artifact; ///< Null for root stages.
};

/**
 * @brief Executes a stage command on a cache miss.
 *
 * Called synchronously by the Executor, possibly from several worker threads
 * at once for independent stages. Failures are `RunnerFailure`; a run abandoned
 * because `stop` was requested is `Cancelled`.
 */
class StageRunner {
public:
    virtual ~StageRunner() = default;
    virtual Result<Artifact> run(const StageContext &ctx, std::stop_token stop) = 0;
};

/**
 * @brief Runs stage commands as local processes.
 *
 * Shell commands go through `/bin/sh -c`, argument lists are executed
 * directly. The child sees:
 *  - `STRATA_STAGE`: the stage name,
 *  - `STRATA_PARENT_ARTIFACT`: a file holding the parent's artifact payload,
 *  - `STRATA_INPUT_<n>`: the value of the n-th declared input.
 *
 * The artifact payload is the command's stdout.
 */
class ProcessStageRunner final : public StageRunner {
public:
    ProcessStageRunner(std::filesystem::path work_dir, std::filesystem::path scratch_dir);

    Result<Artifact> run(const StageContext &ctx, std::stop_token stop) override;

private:
    std::filesystem::path work_dir_;
    std::filesystem::path scratch_dir_;
};

} // namespace strata
