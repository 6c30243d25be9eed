#include "strata/pipeline.hpp"

namespace strata {

PipelineController::PipelineController(CacheStore &cache,
                                       FileAccess &files,
                                       StageRunner &runner,
                                       ExecutorConfig config)
    : cache_(cache), fingerprinter_(files), runner_(runner), config_(config) {
}

PipelineOutcome PipelineController::run(const PipelineSpec &spec, BuildReporter *reporter, std::stop_token stop) {
    auto graph = StageGraph::build(spec);
    if (!graph) {
        PipelineOutcome outcome;
        outcome.error = graph.error();
        return outcome;
    }
    return run(*graph, reporter, std::move(stop));
}

PipelineOutcome PipelineController::run(const StageGraph &graph, BuildReporter *reporter, std::stop_token stop) {
    Executor executor{graph, cache_, fingerprinter_, runner_, config_};
    ExecutionReport report = executor.execute(std::move(stop), reporter);

    PipelineOutcome outcome;
    outcome.results = std::move(report.results);

    if (report.succeeded()) {
        outcome.status = PipelineStatus::Success;
        if (!graph.empty())
            outcome.output = report.artifacts[graph.topological_order().back()];
        return outcome;
    }

    outcome.status = PipelineStatus::Failed;
    for (size_t id : graph.topological_order()) {
        if (report.states[id] == StageState::Failed) {
            outcome.failed_stage = graph.stage(id).name;
            outcome.error = report.errors[id];
            break;
        }
    }
    // A corrupt cache outranks whichever stage happened to fail first.
    if (report.fatal) {
        for (size_t id : graph.topological_order()) {
            if (report.errors[id] && report.errors[id]->code == report.fatal->code) {
                outcome.failed_stage = graph.stage(id).name;
                break;
            }
        }
        outcome.error = report.fatal;
    }
    if (!outcome.error)
        outcome.error = Error{ErrorCode::Cancelled, "build stopped before every stage ran"};
    return outcome;
}

} // namespace strata
