// File: src/transaction/src/WaitForGraph.cpp
#include "WaitForGraph.hpp"
#include <sstream>

namespace datasync {
namespace transaction {

namespace {

// DFS 节点状态：未出现在 color 中即未访问
enum class Color : uint8_t {
    ON_STACK,
    DONE
};

const std::set<GraphNode> kNoSuccessors;

} // namespace

void WaitForGraph::add_edge(const GraphNode& from, const GraphNode& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (adjacency_[from].insert(to).second) {
        edge_count_++;
    }
}

bool WaitForGraph::remove_edge(const GraphNode& from, const GraphNode& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    return remove_edge_locked(from, to);
}

bool WaitForGraph::remove_edge_locked(const GraphNode& from, const GraphNode& to) {
    auto it = adjacency_.find(from);
    if (it == adjacency_.end()) {
        return false;
    }
    if (it->second.erase(to) == 0) {
        return false;
    }
    edge_count_--;
    if (it->second.empty()) {
        adjacency_.erase(it);
    }
    return true;
}

bool WaitForGraph::has_edge(const GraphNode& from, const GraphNode& to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adjacency_.find(from);
    return it != adjacency_.end() && it->second.count(to) > 0;
}

size_t WaitForGraph::remove_outgoing(const GraphNode& from) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adjacency_.find(from);
    if (it == adjacency_.end()) {
        return 0;
    }
    const size_t removed = it->second.size();
    edge_count_ -= removed;
    adjacency_.erase(it);
    return removed;
}

bool WaitForGraph::has_cycle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_cycle_locked().has_value();
}

std::optional<std::vector<GraphNode>> WaitForGraph::cycle_nodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_cycle_locked();
}

std::optional<std::vector<GraphNode>> WaitForGraph::find_cycle_locked() const {
    struct Frame {
        GraphNode node;
        std::set<GraphNode>::const_iterator next;
        std::set<GraphNode>::const_iterator end;
    };

    auto successors = [this](const GraphNode& node) -> const std::set<GraphNode>& {
        auto it = adjacency_.find(node);
        return it == adjacency_.end() ? kNoSuccessors : it->second;
    };

    std::map<GraphNode, Color> color;
    std::vector<Frame> stack;

    for (const auto& root : adjacency_) {
        if (color.count(root.first) > 0) {
            continue;
        }

        color[root.first] = Color::ON_STACK;
        stack.push_back(Frame{root.first, root.second.begin(), root.second.end()});

        while (!stack.empty()) {
            Frame& top = stack.back();
            if (top.next == top.end) {
                color[top.node] = Color::DONE;
                stack.pop_back();
                continue;
            }

            const GraphNode succ = *top.next;
            ++top.next;

            auto c = color.find(succ);
            if (c == color.end()) {
                color[succ] = Color::ON_STACK;
                const auto& next = successors(succ);
                // push_back 之后 top 失效
                stack.push_back(Frame{succ, next.begin(), next.end()});
            } else if (c->second == Color::ON_STACK) {
                // 回边：栈中 succ 到栈顶即为环
                std::vector<GraphNode> cycle;
                bool in_cycle = false;
                for (const auto& frame : stack) {
                    if (frame.node == succ) {
                        in_cycle = true;
                    }
                    if (in_cycle) {
                        cycle.push_back(frame.node);
                    }
                }
                return cycle;
            }
        }
    }
    return std::nullopt;
}

void WaitForGraph::add_wait(ContextID ctx, const ResourceID& resource) {
    add_edge(GraphNode::transaction(ctx), GraphNode::resource(resource));
}

bool WaitForGraph::remove_wait(ContextID ctx, const ResourceID& resource) {
    return remove_edge(GraphNode::transaction(ctx), GraphNode::resource(resource));
}

void WaitForGraph::add_hold(const ResourceID& resource, ContextID ctx) {
    add_edge(GraphNode::resource(resource), GraphNode::transaction(ctx));
}

bool WaitForGraph::remove_hold(const ResourceID& resource, ContextID ctx) {
    return remove_edge(GraphNode::resource(resource), GraphNode::transaction(ctx));
}

size_t WaitForGraph::remove_waits_of(ContextID ctx) {
    // 上下文节点只有等待边作为出边
    return remove_outgoing(GraphNode::transaction(ctx));
}

std::vector<ResourceID> WaitForGraph::waits_of(ContextID ctx) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceID> result;
    auto it = adjacency_.find(GraphNode::transaction(ctx));
    if (it != adjacency_.end()) {
        for (const auto& node : it->second) {
            result.push_back(node.id);
        }
    }
    return result;
}

size_t WaitForGraph::node_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<GraphNode> nodes;
    for (const auto& pair : adjacency_) {
        nodes.insert(pair.first);
        nodes.insert(pair.second.begin(), pair.second.end());
    }
    return nodes.size();
}

size_t WaitForGraph::edge_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edge_count_;
}

bool WaitForGraph::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adjacency_.empty();
}

void WaitForGraph::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    adjacency_.clear();
    edge_count_ = 0;
}

std::string WaitForGraph::to_string() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    oss << "WaitForGraph{";
    bool first = true;
    for (const auto& pair : adjacency_) {
        for (const auto& to : pair.second) {
            if (!first) {
                oss << ", ";
            }
            oss << pair.first.to_string() << "->" << to.to_string();
            first = false;
        }
    }
    oss << "}";
    return oss.str();
}

} // namespace transaction
} // namespace datasync
