#include "strata/executor.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <utility>

namespace strata {

bool ExecutionReport::succeeded() const {
    if (fatal)
        return false;
    return std::ranges::all_of(states, [](StageState s) { return s == StageState::Done; });
}

Executor::Executor(const StageGraph &graph,
                   CacheStore &cache,
                   const Fingerprinter &fingerprinter,
                   StageRunner &runner,
                   ExecutorConfig config)
    : graph_(graph), cache_(cache), fingerprinter_(fingerprinter), runner_(runner), config_(config) {
}

// Runners are external code; an exception must not escape a worker thread.
Result<Artifact> Executor::invoke_runner(const StageContext &ctx, std::stop_token stop) {
    try {
        return runner_.run(ctx, std::move(stop));
    } catch (const std::exception &e) {
        return make_error(ErrorCode::RunnerFailure, "stage '{}' threw: {}", ctx.stage.name, e.what());
    }
}

Executor::StageRun Executor::run_stage(size_t id,
                                       const std::optional<Fingerprint> &parent_fp,
                                       std::shared_ptr<const Artifact> parent_artifact,
                                       bool parent_planned,
                                       std::stop_token stop,
                                       StageState &state) {
    const Stage &stage = graph_.stage(id);
    const auto start = std::chrono::steady_clock::now();

    StageRun run;
    run.result.stage = stage.name;

    auto finish = [&](Outcome outcome) -> StageRun {
        run.result.outcome = outcome;
        run.result.duration = std::chrono::steady_clock::now() - start;
        state = outcome == Outcome::Failed ? StageState::Failed : StageState::Done;
        return std::move(run);
    };
    auto fail = [&](Error err) -> StageRun {
        run.result.error = err.describe();
        run.error = std::move(err);
        return finish(Outcome::Failed);
    };

    // A dry-run parent that would be rebuilt has no artifact and possibly no
    // fingerprint; everything below it would be rebuilt too.
    if (parent_planned && !parent_fp)
        return finish(Outcome::Planned);

    state = StageState::Fingerprinting;
    auto fp = fingerprinter_.fingerprint(stage, parent_fp, parent_artifact.get());
    if (!fp) {
        if (parent_planned)
            return finish(Outcome::Planned);
        return fail(fp.error());
    }
    run.result.fingerprint = *fp;
    if (parent_planned)
        return finish(Outcome::Planned);

    state = StageState::CacheCheck;
    if (cache_.has(*fp)) {
        auto hit = cache_.get(*fp);
        if (hit) {
            run.artifact = std::move(*hit);
            return finish(Outcome::CacheHit);
        }
        // A CacheMiss here means the entry was evicted after has(); rebuild it.
        if (hit.error().code != ErrorCode::CacheMiss)
            return fail(hit.error());
    }

    if (config_.dry_run)
        return finish(Outcome::Planned);

    if (stop.stop_requested())
        return fail(Error{ErrorCode::Cancelled, "build cancelled"});

    state = StageState::Running;
    auto built = invoke_runner(StageContext{stage, parent_artifact}, stop);
    if (!built)
        return fail(built.error());

    state = StageState::Committing;
    built->stage = stage.name;
    if (auto res = cache_.put(*fp, *built); !res) {
        run.fatal = res.error().code == ErrorCode::CacheCorruption;
        return fail(res.error());
    }
    run.artifact = std::make_shared<const Artifact>(std::move(*built));
    return finish(Outcome::Built);
}

void Executor::record(
    ExecutionReport &report, size_t id, StageRun &&run, BuildReporter *reporter, std::stop_source &internal) {
    report.fingerprints[id] = run.result.fingerprint;
    report.artifacts[id] = std::move(run.artifact);
    if (run.result.outcome == Outcome::Failed)
        report.errors[id] = run.error;
    if (run.fatal && !report.fatal) {
        report.fatal = run.error;
        internal.request_stop();
    }
    if (reporter)
        reporter->on_result(run.result);
    report.results.push_back(std::move(run.result));
}

void Executor::execute_sequential(ExecutionReport &report, std::stop_source &internal, BuildReporter *reporter) {
    for (size_t id : graph_.topological_order()) {
        if (internal.stop_requested())
            break;

        const Stage &stage = graph_.stage(id);
        std::optional<Fingerprint> parent_fp;
        std::shared_ptr<const Artifact> parent_artifact;
        bool parent_planned = false;
        if (stage.parent) {
            size_t p = *stage.parent;
            if (report.states[p] != StageState::Done) {
                report.states[id] = StageState::Skipped;
                continue;
            }
            parent_fp = report.fingerprints[p];
            parent_artifact = report.artifacts[p];
            parent_planned = !parent_artifact;
        }

        StageRun run = run_stage(id, parent_fp, parent_artifact, parent_planned, internal.get_token(), report.states[id]);
        record(report, id, std::move(run), reporter, internal);
    }
}

void Executor::execute_parallel(ExecutionReport &report,
                                std::stop_source &internal,
                                BuildReporter *reporter,
                                size_t thread_count) {
    const auto &order = graph_.topological_order();
    std::vector<size_t> position(graph_.size());
    for (size_t i = 0; i < order.size(); ++i) {
        position[order[i]] = i;
    }

    // Ready stages, earliest in topological order first.
    using Ready = std::pair<size_t, size_t>; // (position, stage id)
    std::priority_queue<Ready, std::vector<Ready>, std::greater<>> ready_queue;
    for (size_t id = 0; id < graph_.size(); ++id) {
        if (!graph_.stage(id).parent)
            ready_queue.emplace(position[id], id);
    }

    std::mutex mtx;
    std::condition_variable cv_ready;
    size_t active_workers = 0;

    auto worker = [&]() {
        while (true) {
            size_t id;
            std::optional<Fingerprint> parent_fp;
            std::shared_ptr<const Artifact> parent_artifact;
            bool parent_planned = false;
            {
                std::unique_lock lock(mtx);
                cv_ready.wait(lock, [&] {
                    return !ready_queue.empty() || active_workers == 0 || internal.stop_requested();
                });

                // Nothing queued and nobody left to queue more: the build is over.
                if (internal.stop_requested() || ready_queue.empty())
                    return;

                id = ready_queue.top().second;
                ready_queue.pop();
                active_workers++;

                if (auto p = graph_.stage(id).parent) {
                    parent_fp = report.fingerprints[*p];
                    parent_artifact = report.artifacts[*p];
                    parent_planned = !parent_artifact;
                }
            }

            StageRun run =
                run_stage(id, parent_fp, parent_artifact, parent_planned, internal.get_token(), report.states[id]);

            {
                std::lock_guard lock(mtx);
                active_workers--;
                bool done = report.states[id] == StageState::Done;
                record(report, id, std::move(run), reporter, internal);
                if (done) {
                    for (size_t child : graph_.children(id)) {
                        ready_queue.emplace(position[child], child);
                    }
                }
                cv_ready.notify_all();
            }
        }
    };

    for (size_t i = 0; i < thread_count; ++i) {
        pool_.emplace_back(worker);
    }

    pool_.clear(); // Join all threads
}

ExecutionReport Executor::execute(std::stop_token stop, BuildReporter *reporter) {
    pool_.clear(); // Ensure clean state

    ExecutionReport report;
    report.states.assign(graph_.size(), StageState::Pending);
    report.fingerprints.assign(graph_.size(), std::nullopt);
    report.artifacts.assign(graph_.size(), nullptr);
    report.errors.assign(graph_.size(), std::nullopt);

    if (graph_.empty())
        return report;

    std::stop_source internal;
    std::stop_callback forward_stop(stop, [&internal] { internal.request_stop(); });

    size_t thread_count = config_.jobs;
    if (thread_count == 0)
        thread_count = std::thread::hardware_concurrency();
    if (thread_count == 0)
        thread_count = 1;
    thread_count = std::min(thread_count, graph_.size());

    if (thread_count == 1) {
        execute_sequential(report, internal, reporter);
    } else {
        execute_parallel(report, internal, reporter, thread_count);
    }

    for (auto &state : report.states) {
        if (state == StageState::Pending)
            state = StageState::Skipped;
    }
    return report;
}

} // namespace strata
