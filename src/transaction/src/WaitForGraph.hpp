// File: src/transaction/src/WaitForGraph.hpp
// 等待图
#pragma once

#include "../include/Transaction.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace datasync {
namespace transaction {

/**
 * NodeKind - 等待图节点类型
 */
enum class NodeKind : uint8_t {
    TRANSACTION,   // 执行上下文
    RESOURCE       // 被锁的键
};

/**
 * GraphNode - 等待图节点
 *
 * 二部图：TRANSACTION -> RESOURCE 表示"上下文在等待该资源"，
 *         RESOURCE -> TRANSACTION 表示"资源被该上下文持有"
 */
struct GraphNode {
    NodeKind kind = NodeKind::TRANSACTION;
    std::string id;

    GraphNode() = default;
    GraphNode(NodeKind k, std::string node_id) : kind(k), id(std::move(node_id)) {}

    static GraphNode transaction(ContextID ctx) {
        return GraphNode(NodeKind::TRANSACTION, std::to_string(ctx));
    }
    static GraphNode resource(const ResourceID& resource) {
        return GraphNode(NodeKind::RESOURCE, resource);
    }

    bool is_transaction() const { return kind == NodeKind::TRANSACTION; }
    bool is_resource() const { return kind == NodeKind::RESOURCE; }

    bool operator==(const GraphNode& other) const {
        return kind == other.kind && id == other.id;
    }
    bool operator!=(const GraphNode& other) const { return !(*this == other); }
    bool operator<(const GraphNode& other) const {
        if (kind != other.kind) {
            return kind < other.kind;
        }
        return id < other.id;
    }

    // "T:7" / "R:s2:k1"
    std::string to_string() const {
        return (kind == NodeKind::TRANSACTION ? "T:" : "R:") + id;
    }
};

/**
 * WaitForGraph - 等待图
 *
 * 邻接表只保存有出边的节点：删除一个节点的最后一条出边时该节点随之删除。
 * 图自身由一把独立的互斥锁保护，与锁表项的锁互不嵌套。
 */
class WaitForGraph {
public:
    WaitForGraph() = default;
    ~WaitForGraph() = default;

    // 禁止拷贝
    WaitForGraph(const WaitForGraph&) = delete;
    WaitForGraph& operator=(const WaitForGraph&) = delete;

    /**
     * add_edge - 添加有向边（重复添加无效果）
     */
    void add_edge(const GraphNode& from, const GraphNode& to);

    /**
     * remove_edge - 删除有向边
     * @return 边是否存在
     */
    bool remove_edge(const GraphNode& from, const GraphNode& to);

    bool has_edge(const GraphNode& from, const GraphNode& to) const;

    /**
     * remove_outgoing - 删除节点的所有出边
     * @return 删除的边数
     */
    size_t remove_outgoing(const GraphNode& from);

    /**
     * has_cycle - 图中是否存在环
     */
    bool has_cycle() const;

    /**
     * cycle_nodes - 找到一个环
     *
     * 迭代 DFS，显式栈。遇到指向栈上节点的回边时，返回栈中
     * 从回边终点到当前节点的一段（不一定是最小环）。
     * @return 环上的节点（按路径顺序），无环时返回 std::nullopt
     */
    std::optional<std::vector<GraphNode>> cycle_nodes() const;

    // ---- 二部图的便捷操作 ----

    void add_wait(ContextID ctx, const ResourceID& resource);
    bool remove_wait(ContextID ctx, const ResourceID& resource);
    void add_hold(const ResourceID& resource, ContextID ctx);
    bool remove_hold(const ResourceID& resource, ContextID ctx);

    // 删除 ctx 的全部等待边
    size_t remove_waits_of(ContextID ctx);

    // ctx 正在等待的资源
    std::vector<ResourceID> waits_of(ContextID ctx) const;

    size_t node_count() const;
    size_t edge_count() const;
    bool empty() const;
    void clear();

    std::string to_string() const;

private:
    std::optional<std::vector<GraphNode>> find_cycle_locked() const;
    bool remove_edge_locked(const GraphNode& from, const GraphNode& to);

    std::map<GraphNode, std::set<GraphNode>> adjacency_;
    size_t edge_count_ = 0;

    mutable std::mutex mutex_;
};

} // namespace transaction
} // namespace datasync
