#include "strata/stage_runner.hpp"

#include "strata/process_exec.hpp"

#include <atomic>
#include <fstream>
#include <print>
#include <string>
#include <unordered_map>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace strata {

namespace {

std::atomic<uint64_t> scratch_counter{0};

// Holds the parent artifact for the duration of one run.
class ScratchFile {
public:
    ScratchFile() = default;
    ScratchFile(const ScratchFile &) = delete;
    ScratchFile &operator=(const ScratchFile &) = delete;

    ~ScratchFile() {
        if (path_.empty())
            return;
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec)
            std::println(stderr, "Failed to remove {}: {}", path_.string(), ec.message());
    }

    Result<void> write(const fs::path &dir, std::string_view bytes) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return make_error(ErrorCode::RunnerFailure, "Failed to create {}: {}", dir.string(), ec.message());
        }
        // Stage names are not safe path components.
        path_ = dir / std::format("{}.{}.parent", ::getpid(), scratch_counter.fetch_add(1));

        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out.flush()) {
            return make_error(ErrorCode::RunnerFailure, "Failed to write {}", path_.string());
        }
        return {};
    }

    const fs::path &path() const {
        return path_;
    }

private:
    fs::path path_;
};

} // namespace

ProcessStageRunner::ProcessStageRunner(fs::path work_dir, fs::path scratch_dir)
    : work_dir_(std::move(work_dir)), scratch_dir_(std::move(scratch_dir)) {
}

Result<Artifact> ProcessStageRunner::run(const StageContext &ctx, std::stop_token stop) {
    const Stage &stage = ctx.stage;

    std::vector<std::string> args;
    if (stage.shell) {
        args = {"/bin/sh", "-c", stage.command.front()};
    } else {
        args = stage.command;
    }

    std::unordered_map<std::string, std::string> env;
    env.emplace("STRATA_STAGE", stage.name);
    for (size_t i = 0; i < stage.inputs.size(); ++i) {
        if (stage.inputs[i].kind != InputKind::ParentArtifact)
            env.emplace(std::format("STRATA_INPUT_{}", i), stage.inputs[i].value);
    }

    ScratchFile parent_file;
    if (ctx.parent_artifact) {
        if (auto res = parent_file.write(scratch_dir_, ctx.parent_artifact->payload); !res)
            return std::unexpected(res.error());
        std::error_code ec;
        fs::path absolute = fs::absolute(parent_file.path(), ec);
        env.emplace("STRATA_PARENT_ARTIFACT", ec ? parent_file.path().string() : absolute.string());
    }

    auto res = process_exec(std::move(args), work_dir_.string(), std::move(env), stop);
    if (!res)
        return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return make_error(ErrorCode::RunnerFailure, "stage '{}' exited with code {}", stage.name, res->exit_code);
    }

    Artifact artifact;
    artifact.payload = std::move(res->out);
    artifact.stage = stage.name;
    return artifact;
}

} // namespace strata
