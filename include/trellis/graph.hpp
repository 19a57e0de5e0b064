#pragma once

#include <string>
#include <vector>
#include <unordered_set>
#include <functional>
#include <sstream>
#include <variant>

namespace trellis {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed graph with ordered adjacency lists
//
// Edge order is insertion order and every traversal honours it, so results
// are deterministic for a given construction sequence.
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        radj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, std::move(data)});
        radj_[to].push_back(from);
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    // Depth-first post-order of the nodes reachable from root: every node
    // appears after all of its successors, root last. Shared successors
    // appear once, at their first completion. The graph must be acyclic.
    std::vector<NodeId> postorder_from(NodeId root) const {
        std::vector<NodeId> order;
        std::unordered_set<NodeId> visited;
        postorder_impl(root, visited, order);
        return order;
    }

    // Tree display: format the dependency tree as a string.
    // to_string_fn converts NodeData to a display string.
    std::string tree_display(
        NodeId root,
        std::function<std::string(const NodeData&)> to_string_fn) const
    {
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", true, visited, to_string_fn, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
    std::vector<std::vector<NodeId>> radj_;

    void postorder_impl(NodeId u,
                        std::unordered_set<NodeId>& visited,
                        std::vector<NodeId>& order) const {
        if (!visited.insert(u).second) return;
        for (const auto& e : adj_[u]) {
            postorder_impl(e.to, visited, order);
        }
        order.push_back(u);
    }

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_last,
        std::unordered_set<NodeId>& visited,
        std::function<std::string(const NodeData&)>& to_string_fn,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!prefix.empty()) {
            out << (is_last ? "└── " : "├── ");
        }
        out << to_string_fn(nodes_[u]);

        if (!visited.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        auto& edges = adj_[u];
        for (size_t i = 0; i < edges.size(); ++i) {
            std::string child_prefix = prefix;
            if (!prefix.empty()) {
                child_prefix += (is_last ? "    " : "│   ");
            } else {
                child_prefix = " ";
            }
            tree_display_impl(edges[i].to, child_prefix,
                              i == edges.size() - 1,
                              visited, to_string_fn, out);
        }
    }
};

} // namespace trellis
