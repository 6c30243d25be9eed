#include "strata/stage_graph.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <queue>

namespace strata {

Result<size_t> StageGraph::add_stage(const StageDecl &decl) {
    if (decl.name.empty()) {
        return make_error(ErrorCode::InvalidSpec, "Stage #{} has an empty name", stages_.size());
    }
    if (decl.command.empty() || decl.command.front().empty()) {
        return make_error(ErrorCode::InvalidSpec, "Stage '{}' has an empty command", decl.name);
    }
    if (index_.contains(decl.name)) {
        return make_error(ErrorCode::DuplicateStage, "Duplicate stage name: {}", decl.name);
    }

    size_t id = stages_.size();
    stages_.push_back({decl.name, std::nullopt, decl.command, decl.shell, decl.inputs});
    children_.emplace_back();
    index_.emplace(decl.name, id);
    return id;
}

Result<void> StageGraph::resolve_parents(const PipelineSpec &spec) {
    for (size_t id = 0; id < stages_.size(); ++id) {
        const auto &parent_name = spec.stages[id].parent;
        if (!parent_name)
            continue;

        auto it = index_.find(*parent_name);
        if (it == index_.end()) {
            return make_error(
                ErrorCode::UnknownParent, "Stage '{}' extends unknown stage '{}'", stages_[id].name, *parent_name);
        }
        stages_[id].parent = it->second;
        children_[it->second].push_back(id);
    }
    return {};
}

// Every stage has at most one parent, so following the parent chain from each
// unvisited stage and looking for a stage still on the current chain finds
// every cycle.
Result<void> StageGraph::check_cycles() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(stages_.size(), STATUS::UNSTARTED);
    std::vector<size_t> chain;

    for (size_t start = 0; start < stages_.size(); ++start) {
        chain.clear();
        std::optional<size_t> cur = start;
        while (cur && status[*cur] == STATUS::UNSTARTED) {
            status[*cur] = STATUS::WORKING;
            chain.push_back(*cur);
            cur = stages_[*cur].parent;
        }
        if (cur && status[*cur] == STATUS::WORKING) {
            return make_error(ErrorCode::CycleDetected, "Cycle detected in the stage graph at: {}", stages_[*cur].name);
        }
        for (size_t id : chain) {
            status[id] = STATUS::FINISHED;
        }
    }
    return {};
}

void StageGraph::sort() {
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready;
    for (size_t id = 0; id < stages_.size(); ++id) {
        if (!stages_[id].parent)
            ready.push(id);
    }

    order_.clear();
    order_.reserve(stages_.size());
    while (!ready.empty()) {
        size_t id = ready.top();
        ready.pop();
        order_.push_back(id);
        for (size_t child : children_[id]) {
            ready.push(child);
        }
    }
}

Result<StageGraph> StageGraph::build(const PipelineSpec &spec) {
    StageGraph graph;
    graph.stages_.reserve(spec.stages.size());

    for (const auto &decl : spec.stages) {
        if (auto res = graph.add_stage(decl); !res)
            return std::unexpected(res.error());
    }
    if (auto res = graph.resolve_parents(spec); !res)
        return std::unexpected(res.error());
    if (auto res = graph.check_cycles(); !res)
        return std::unexpected(res.error());

    graph.sort();
    return graph;
}

std::optional<size_t> StageGraph::find(std::string_view name) const {
    if (auto it = index_.find(std::string(name)); it != index_.end())
        return it->second;
    return std::nullopt;
}

std::vector<size_t> StageGraph::descendants(size_t id) const {
    std::vector<bool> marked(stages_.size(), false);
    std::vector<size_t> pending{id};
    while (!pending.empty()) {
        size_t cur = pending.back();
        pending.pop_back();
        for (size_t child : children_[cur]) {
            if (!marked[child]) {
                marked[child] = true;
                pending.push_back(child);
            }
        }
    }

    std::vector<size_t> out;
    for (size_t sid : order_) {
        if (marked[sid])
            out.push_back(sid);
    }
    return out;
}

namespace {

std::string dot_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

void StageGraph::write_dot(std::ostream &os, std::span<const std::string> fill_colors) const {
    os << "digraph strata_pipeline {\n";
    os << "  rankdir=LR;\n";
    os << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    for (size_t i = 0; i < stages_.size(); ++i) {
        std::string_view color = i < fill_colors.size() ? std::string_view(fill_colors[i]) : "white";
        os << "  s" << i << " [label=\"" << dot_escape(stages_[i].name) << "\", fillcolor=\"" << color << "\"];\n";
    }
    for (size_t i = 0; i < stages_.size(); ++i) {
        for (size_t child : children_[i]) {
            os << "  s" << i << " -> s" << child << ";\n";
        }
    }
    os << "}\n";
}

} // namespace strata
