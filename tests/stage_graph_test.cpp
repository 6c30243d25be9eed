#include "strata/stage_graph.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace strata;
using namespace strata::testing;

namespace {

PipelineSpec spec_of(std::vector<StageDecl> stages) {
    return PipelineSpec{std::move(stages)};
}

std::vector<std::string> names_in_order(const StageGraph &graph) {
    std::vector<std::string> out;
    for (size_t id : graph.topological_order()) {
        out.push_back(graph.stage(id).name);
    }
    return out;
}

} // namespace

TEST(StageGraphTest, BuildsChain) {
    auto graph = StageGraph::build(spec_of({
        make_stage("Deps", std::nullopt, "npm ci"),
        make_stage("Compile", "Deps", "tsc"),
        make_stage("Package", "Compile", "tar czf out.tgz dist"),
    }));
    ASSERT_TRUE(graph.has_value()) << graph.error().describe();

    EXPECT_EQ(graph->size(), 3u);
    EXPECT_EQ(graph->stage(1).parent, 0u);
    EXPECT_EQ(graph->stage(2).parent, 1u);
    EXPECT_FALSE(graph->stage(0).parent.has_value());
    EXPECT_EQ(names_in_order(*graph), (std::vector<std::string>{"Deps", "Compile", "Package"}));
    EXPECT_EQ(graph->find("Compile"), 1u);
    EXPECT_FALSE(graph->find("Lint").has_value());
}

TEST(StageGraphTest, EmptySpec) {
    auto graph = StageGraph::build({});
    ASSERT_TRUE(graph.has_value());
    EXPECT_TRUE(graph->empty());
    EXPECT_TRUE(graph->topological_order().empty());
}

TEST(StageGraphTest, UnknownParent) {
    auto graph = StageGraph::build(spec_of({
        make_stage("Compile", "Deps", "tsc"),
    }));
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::UnknownParent);
    EXPECT_NE(graph.error().message.find("Deps"), std::string::npos);
}

TEST(StageGraphTest, CycleDetected) {
    auto graph = StageGraph::build(spec_of({
        make_stage("A", "C", "a"),
        make_stage("B", "A", "b"),
        make_stage("C", "B", "c"),
        make_stage("Root", std::nullopt, "root"),
    }));
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::CycleDetected);
}

TEST(StageGraphTest, SelfParentIsCycle) {
    auto graph = StageGraph::build(spec_of({
        make_stage("A", "A", "a"),
    }));
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::CycleDetected);
}

TEST(StageGraphTest, DuplicateStage) {
    auto graph = StageGraph::build(spec_of({
        make_stage("A", std::nullopt, "a"),
        make_stage("A", std::nullopt, "b"),
    }));
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::DuplicateStage);
}

TEST(StageGraphTest, EmptyCommandOrName) {
    auto no_command = StageGraph::build(spec_of({make_stage("A", std::nullopt, "")}));
    ASSERT_FALSE(no_command.has_value());
    EXPECT_EQ(no_command.error().code, ErrorCode::InvalidSpec);

    auto no_name = StageGraph::build(spec_of({make_stage("", std::nullopt, "a")}));
    ASSERT_FALSE(no_name.has_value());
    EXPECT_EQ(no_name.error().code, ErrorCode::InvalidSpec);
}

TEST(StageGraphTest, ForwardParentReferenceAndDeclarationOrderTieBreak) {
    auto graph = StageGraph::build(spec_of({
        make_stage("Package", "Build", "tar"),
        make_stage("Lint", std::nullopt, "lint"),
        make_stage("Build", std::nullopt, "make"),
    }));
    ASSERT_TRUE(graph.has_value()) << graph.error().describe();
    EXPECT_EQ(graph->topological_order(), (std::vector<size_t>{1, 2, 0}));
}

TEST(StageGraphTest, OrderIsStableAcrossBuilds) {
    auto spec = spec_of({
        make_stage("Root", std::nullopt, "r"),
        make_stage("Left", "Root", "l"),
        make_stage("Other", std::nullopt, "o"),
        make_stage("Right", "Root", "r2"),
        make_stage("LeftLeaf", "Left", "ll"),
    });
    auto first = StageGraph::build(spec);
    auto second = StageGraph::build(spec);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->topological_order(), second->topological_order());
    EXPECT_EQ(names_in_order(*first), (std::vector<std::string>{"Root", "Left", "Other", "Right", "LeftLeaf"}));
}

TEST(StageGraphTest, ChildrenAndDescendants) {
    auto graph = StageGraph::build(spec_of({
        make_stage("Root", std::nullopt, "r"),
        make_stage("A", "Root", "a"),
        make_stage("B", "Root", "b"),
        make_stage("A1", "A", "a1"),
        make_stage("Solo", std::nullopt, "s"),
    }));
    ASSERT_TRUE(graph.has_value());

    EXPECT_EQ(graph->children(0), (std::vector<size_t>{1, 2}));
    EXPECT_EQ(graph->descendants(0), (std::vector<size_t>{1, 2, 3}));
    EXPECT_EQ(graph->descendants(1), (std::vector<size_t>{3}));
    EXPECT_TRUE(graph->descendants(4).empty());
}

TEST(StageGraphTest, WritesDot) {
    auto graph = StageGraph::build(spec_of({
        make_stage("Deps", std::nullopt, "npm ci"),
        make_stage("say \"hi\"", "Deps", "echo hi"),
    }));
    ASSERT_TRUE(graph.has_value());

    std::vector<std::string> colors{"green", "white"};
    std::ostringstream os;
    graph->write_dot(os, colors);
    std::string dot = os.str();

    EXPECT_NE(dot.find("digraph"), std::string::npos);
    EXPECT_NE(dot.find("s0 -> s1;"), std::string::npos);
    EXPECT_NE(dot.find("label=\"Deps\", fillcolor=\"green\""), std::string::npos);
    EXPECT_NE(dot.find("label=\"say \\\"hi\\\"\""), std::string::npos);
}
