#pragma once

#include "strata/domain.hpp"
#include "strata/utility.hpp"

#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata {

/** @brief A stage whose parent reference has been resolved to an index. */
struct Stage {
    std::string name;
    std::optional<size_t> parent; ///< Index of the parent stage, if any.
    std::vector<std::string> command;
    bool shell = true;
    std::vector<InputDecl> inputs;
};

/**
 * @brief The parent-chain graph of a pipeline.
 *
 * Stages are stored in declaration order and addressed by that index. Parent
 * names are resolved once at construction; the graph never holds pointers
 * between stages.
 */
class StageGraph {
public:
    /**
     * @brief Builds and validates the graph of a pipeline spec.
     * @return The graph, or `InvalidSpec`, `DuplicateStage`, `UnknownParent`
     *         or `CycleDetected`.
     */
    static Result<StageGraph> build(const PipelineSpec &spec);

    const std::vector<Stage> &stages() const {
        return stages_;
    }
    const Stage &stage(size_t id) const {
        return stages_[id];
    }
    size_t size() const {
        return stages_.size();
    }
    bool empty() const {
        return stages_.empty();
    }

    std::optional<size_t> find(std::string_view name) const;

    /** @brief Direct children of a stage, in declaration order. */
    const std::vector<size_t> &children(size_t id) const {
        return children_[id];
    }

    /** @brief All transitive children of a stage, in topological order. */
    std::vector<size_t> descendants(size_t id) const;

    /**
     * @brief Stage indices with every parent before its children.
     *
     * Among stages that are ready at the same point, the one declared first
     * comes first, so the order is identical across runs.
     */
    const std::vector<size_t> &topological_order() const {
        return order_;
    }

    /**
     * @brief Writes the graph in Graphviz DOT format.
     * @param fill_colors Optional per-stage fill color, indexed by stage id.
     */
    void write_dot(std::ostream &os, std::span<const std::string> fill_colors = {}) const;

private:
    Result<size_t> add_stage(const StageDecl &decl);
    Result<void> resolve_parents(const PipelineSpec &spec);
    Result<void> check_cycles() const;
    void sort();

    std::vector<Stage> stages_;
    std::vector<std::vector<size_t>> children_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<size_t> order_;
};

} // namespace strata
