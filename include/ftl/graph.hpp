#pragma once

#include <algorithm>
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ftl {

// ---------------------------------------------------------------------------
// Graph<NodeData>: directed graph with adjacency list
// ---------------------------------------------------------------------------

template<typename NodeData>
class Graph {
public:
    using NodeId = size_t;

    NodeId add_node(NodeData data) {
        nodes_.push_back(std::move(data));
        adj_.emplace_back();
        return nodes_.size() - 1;
    }

    // Parallel edges are collapsed
    void add_edge(NodeId from, NodeId to) {
        if (!has_edge(from, to)) adj_[from].push_back(to);
    }

    bool has_edge(NodeId from, NodeId to) const {
        const auto& out = adj_[from];
        return std::find(out.begin(), out.end(), to) != out.end();
    }

    size_t node_count() const { return nodes_.size(); }
    const NodeData& node(NodeId id) const { return nodes_[id]; }
    const std::vector<NodeId>& successors(NodeId id) const { return adj_[id]; }

    // Every elementary cycle reached by a depth-first walk, each reported
    // once as a closed path [a, b, ..., a]. Nodes are visited in insertion
    // order so the output is deterministic.
    std::vector<std::vector<NodeId>> find_cycles() const {
        enum Mark { Unseen, OnPath, Done };
        std::vector<Mark> mark(nodes_.size(), Unseen);
        std::vector<NodeId> path;
        std::vector<std::vector<NodeId>> cycles;

        std::function<void(NodeId)> walk = [&](NodeId u) {
            mark[u] = OnPath;
            path.push_back(u);
            for (NodeId v : adj_[u]) {
                if (mark[v] == Unseen) {
                    walk(v);
                } else if (mark[v] == OnPath) {
                    std::vector<NodeId> cycle(std::find(path.begin(), path.end(), v), path.end());
                    cycle.push_back(v);
                    cycles.push_back(std::move(cycle));
                }
            }
            path.pop_back();
            mark[u] = Done;
        };

        for (NodeId id = 0; id < nodes_.size(); ++id) {
            if (mark[id] == Unseen) walk(id);
        }
        return cycles;
    }

    // Everything reachable from root, one node per line. A node seen
    // before is printed once more with " (*)" and not expanded again.
    std::string tree_display(NodeId root,
                             const std::function<std::string(const NodeData&)>& label) const {
        std::ostringstream out;
        std::unordered_set<NodeId> seen;
        out << label(nodes_[root]) << "\n";
        seen.insert(root);
        draw_children(root, "  ", seen, label, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<NodeId>> adj_;

    void draw_children(NodeId u, const std::string& indent,
                       std::unordered_set<NodeId>& seen,
                       const std::function<std::string(const NodeData&)>& label,
                       std::ostringstream& out) const {
        const auto& children = adj_[u];
        for (size_t i = 0; i < children.size(); ++i) {
            NodeId v = children[i];
            bool last = i + 1 == children.size();
            out << indent << (last ? "└── " : "├── ") << label(nodes_[v]);
            if (!seen.insert(v).second) {
                out << " (*)\n";
                continue;
            }
            out << "\n";
            draw_children(v, indent + (last ? "    " : "│   "), seen, label, out);
        }
    }
};

// ---------------------------------------------------------------------------
// ReferenceGraph: which FTL patterns reference which
//
// Nodes are keyed the way references are written: "msg", "msg.attr",
// "-term", "-term.attr".
// ---------------------------------------------------------------------------

class ReferenceGraph {
public:
    using NodeId = Graph<std::string>::NodeId;

    NodeId add_entry(const std::string& key) {
        auto it = ids_.find(key);
        if (it != ids_.end()) return it->second;
        NodeId id = graph_.add_node(key);
        ids_.emplace(key, id);
        return id;
    }

    bool has_entry(const std::string& key) const { return ids_.count(key) > 0; }

    // Both ends are added when missing
    void add_reference(const std::string& from, const std::string& to) {
        NodeId f = add_entry(from);
        graph_.add_edge(f, add_entry(to));
    }

    bool references(const std::string& from, const std::string& to) const {
        auto f = ids_.find(from);
        auto t = ids_.find(to);
        return f != ids_.end() && t != ids_.end() && graph_.has_edge(f->second, t->second);
    }

    size_t entry_count() const { return graph_.node_count(); }

    // Each cycle as the keys along it, first key repeated at the end
    std::vector<std::vector<std::string>> cycles() const {
        std::vector<std::vector<std::string>> out;
        for (const auto& cycle : graph_.find_cycles()) {
            std::vector<std::string> keys;
            keys.reserve(cycle.size());
            for (NodeId id : cycle) keys.push_back(graph_.node(id));
            out.push_back(std::move(keys));
        }
        return out;
    }

    bool has_cycle() const { return !graph_.find_cycles().empty(); }

    // "a -> b -> a"
    static std::string chain(const std::vector<std::string>& keys) {
        std::string out;
        for (const auto& k : keys) {
            if (!out.empty()) out += " -> ";
            out += k;
        }
        return out;
    }

    // Empty when the root is unknown
    std::string tree_display(const std::string& root) const {
        auto it = ids_.find(root);
        if (it == ids_.end()) return "";
        return graph_.tree_display(it->second, [](const std::string& s) { return s; });
    }

private:
    Graph<std::string> graph_;
    std::unordered_map<std::string, NodeId> ids_;
};

} // namespace ftl
