// File: src/transaction/tests/WaitForGraphTest.cpp
// 等待图测试

#include "../src/WaitForGraph.hpp"
#include "../../utils/tests/TestUtil.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace datasync::transaction;

namespace {

GraphNode T(const std::string& id) { return GraphNode(NodeKind::TRANSACTION, id); }
GraphNode R(const std::string& id) { return GraphNode(NodeKind::RESOURCE, id); }

std::set<GraphNode> as_set(const std::vector<GraphNode>& nodes) {
    return std::set<GraphNode>(nodes.begin(), nodes.end());
}

// 环上相邻节点之间（含首尾）都必须有边
bool is_closed_walk(const WaitForGraph& graph, const std::vector<GraphNode>& cycle) {
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (!graph.has_edge(cycle[i], cycle[(i + 1) % cycle.size()])) {
            return false;
        }
    }
    return true;
}

} // namespace

void test_three_node_cycle() {
    TEST_CASE("三节点环");

    WaitForGraph graph;
    graph.add_edge(T("A"), T("B"));
    graph.add_edge(T("B"), T("C"));
    graph.add_edge(T("C"), T("A"));

    ASSERT(graph.has_cycle(), "A->B->C->A 应该有环");
    auto cycle = graph.cycle_nodes();
    ASSERT(cycle.has_value(), "应该返回环");
    ASSERT(as_set(*cycle) == (std::set<GraphNode>{T("A"), T("B"), T("C")}), "环应包含 A、B、C");
    ASSERT(is_closed_walk(graph, *cycle), "返回的节点应构成环");

    TEST_PASS("三节点环检测通过");
}

void test_chain_without_cycle() {
    TEST_CASE("无环链");

    WaitForGraph graph;
    graph.add_edge(T("A"), T("B"));
    graph.add_edge(T("B"), T("C"));

    ASSERT(!graph.has_cycle(), "A->B->C 不应有环");
    ASSERT(!graph.cycle_nodes().has_value(), "不应返回环");
    ASSERT(graph.node_count() == 3, "应有 3 个节点");
    ASSERT(graph.edge_count() == 2, "应有 2 条边");

    TEST_PASS("无环链检测通过");
}

void test_self_loop() {
    TEST_CASE("自环");

    WaitForGraph graph;
    graph.add_edge(T("A"), T("A"));

    auto cycle = graph.cycle_nodes();
    ASSERT(cycle.has_value(), "自环应被检测到");
    ASSERT(cycle->size() == 1 && cycle->front() == T("A"), "自环只含 A");

    TEST_PASS("自环检测通过");
}

void test_disconnected_components() {
    TEST_CASE("非连通图");

    WaitForGraph graph;
    graph.add_edge(T("X"), T("Y"));
    graph.add_edge(T("Y"), T("Z"));
    graph.add_edge(T("P"), T("Q"));
    graph.add_edge(T("Q"), T("P"));

    auto cycle = graph.cycle_nodes();
    ASSERT(cycle.has_value(), "P<->Q 应被检测到");
    ASSERT(as_set(*cycle) == (std::set<GraphNode>{T("P"), T("Q")}), "环应只含 P、Q");

    graph.remove_edge(T("Q"), T("P"));
    ASSERT(!graph.has_cycle(), "删除回边后无环");

    TEST_PASS("非连通图检测通过");
}

void test_remove_last_edge_drops_node() {
    TEST_CASE("删除最后一条出边");

    WaitForGraph graph;
    graph.add_edge(T("A"), T("B"));
    graph.add_edge(T("A"), T("B"));   // 重复边
    ASSERT(graph.edge_count() == 1, "重复边只计一次");

    ASSERT(graph.remove_edge(T("A"), T("B")), "边应存在");
    ASSERT(!graph.remove_edge(T("A"), T("B")), "重复删除返回 false");
    ASSERT(graph.empty(), "节点应随最后一条出边删除");
    ASSERT(graph.node_count() == 0, "没有剩余节点");
    ASSERT(graph.edge_count() == 0, "没有剩余边");

    TEST_PASS("删除边通过");
}

void test_bipartite_wait_for() {
    TEST_CASE("二部等待图");

    WaitForGraph graph;
    // 上下文 1 持有 k1 等待 k2；上下文 2 持有 k2 等待 k1
    graph.add_hold("k1", 1);
    graph.add_hold("k2", 2);
    graph.add_wait(1, "k2");
    ASSERT(!graph.has_cycle(), "单向等待无环");

    graph.add_wait(2, "k1");
    auto cycle = graph.cycle_nodes();
    ASSERT(cycle.has_value(), "互相等待应有环");
    ASSERT(cycle->size() == 4, "环上有两个上下文和两个资源");
    size_t resources = std::count_if(cycle->begin(), cycle->end(),
                                     [](const GraphNode& n) { return n.is_resource(); });
    ASSERT(resources == 2, "环上有两个资源节点");

    ASSERT(graph.waits_of(1) == std::vector<ResourceID>{"k2"}, "上下文 1 等待 k2");
    ASSERT(graph.remove_waits_of(1) == 1, "删除上下文 1 的等待边");
    ASSERT(!graph.has_cycle(), "删除等待边后无环");
    ASSERT(graph.has_edge(GraphNode::resource("k1"), GraphNode::transaction(1)), "持有边保留");

    // 同名的上下文节点与资源节点互不相同
    WaitForGraph mixed;
    mixed.add_edge(GraphNode(NodeKind::TRANSACTION, "7"), GraphNode(NodeKind::RESOURCE, "7"));
    ASSERT(!mixed.has_cycle(), "T:7 与 R:7 是不同节点");

    TEST_PASS("二部等待图通过");
}

void test_long_chain_is_iterative() {
    TEST_CASE("长链（迭代 DFS）");

    const int n = 200000;
    WaitForGraph graph;
    for (int i = 0; i < n - 1; ++i) {
        graph.add_edge(R("n" + std::to_string(i)), R("n" + std::to_string(i + 1)));
    }
    ASSERT(!graph.has_cycle(), "长链无环");

    graph.add_edge(R("n" + std::to_string(n - 1)), R("n0"));
    auto cycle = graph.cycle_nodes();
    ASSERT(cycle.has_value(), "闭合后有环");
    ASSERT(cycle->size() == static_cast<size_t>(n), "环覆盖整条链");

    TEST_PASS("长链检测通过");
}

int main() {
    std::cout << "\n╔══════════════════════════════════════╗\n";
    std::cout << "║         等待图测试                   ║\n";
    std::cout << "╚══════════════════════════════════════╝\n";

    datasync::test::TestRunner runner("WaitForGraph");
    runner.run("三节点环", test_three_node_cycle);
    runner.run("无环链", test_chain_without_cycle);
    runner.run("自环", test_self_loop);
    runner.run("非连通图", test_disconnected_components);
    runner.run("删除最后一条出边", test_remove_last_edge_drops_node);
    runner.run("二部等待图", test_bipartite_wait_for);
    runner.run("长链", test_long_chain_is_iterative);
    return runner.summary();
}
