#pragma once

#include "strata/domain.hpp"
#include "strata/file_access.hpp"
#include "strata/reporter.hpp"
#include "strata/stage_runner.hpp"

#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata::testing {

StageDecl make_stage(std::string name,
                     std::optional<std::string> parent,
                     std::string command,
                     std::vector<InputDecl> inputs = {});

InputDecl text_input(std::string value);
InputDecl file_input(std::string reference);
InputDecl parent_input();

/** @brief File access over an in-memory map. */
class MapFileAccess final : public FileAccess {
public:
    void set(const std::string &reference, std::string content);
    void erase(const std::string &reference);

    Result<std::string> read_input(std::string_view reference) override;

private:
    std::mutex mtx_;
    std::map<std::string, std::string, std::less<>> files_;
};

/**
 * @brief Stage runner that records calls instead of running processes.
 *
 * The payload is `<command>[<parent payload>]`, so it changes whenever the
 * command or any ancestor output changes.
 */
class ScriptedRunner final : public StageRunner {
public:
    Result<Artifact> run(const StageContext &ctx, std::stop_token stop) override;

    void fail_stage(const std::string &name);
    void throw_in_stage(const std::string &name);
    void clear_failures();

    /** @brief The stage blocks until the build is stopped, then reports Cancelled. */
    void block_stage(const std::string &name);
    void wait_until_blocked();

    size_t runs(const std::string &name) const;
    size_t total_runs() const;
    std::vector<std::string> run_order() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::set<std::string> failing_;
    std::set<std::string> throwing_;
    std::set<std::string> blocking_;
    bool blocked_ = false;
    std::vector<std::string> order_;
};

class CollectingReporter final : public BuildReporter {
public:
    void on_result(const BuildResult &result) override {
        results.push_back(result);
    }

    std::optional<BuildResult> find(const std::string &stage) const;

    std::vector<BuildResult> results;
};

/** @brief A fresh directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const {
        return path_;
    }

private:
    std::filesystem::path path_;
};

} // namespace strata::testing
