// ==============================================================================
// graph.cpp - MOD-0009: Граф зависимостей
// ==============================================================================
//
// MOD-0009 graph
// ADR-0011: детерминизм
//
// ==============================================================================

#include "luarestore/graph.hpp"

#include <algorithm>
#include <stdexcept>

namespace luarestore::graph {

namespace {

const Node* find_in(const std::vector<Node>& nodes, const NodeIndex& index,
                    std::string_view key) {
    auto it = index.find(key);
    if (it == index.end()) {
        return nullptr;
    }
    return &nodes[it->second];
}

std::out_of_range unknown_node(std::string_view key) {
    return std::out_of_range("unknown graph node '" + std::string(key) + "'");
}

bool transition_allowed(NodeState from, NodeState to) {
    switch (from) {
    case NodeState::Discovered:
        return to == NodeState::Reading || to == NodeState::Unresolved || to == NodeState::Error;
    case NodeState::Reading:
        return to == NodeState::Resolved || to == NodeState::Error;
    case NodeState::Resolved:
    case NodeState::Unresolved:
    case NodeState::Error:
    default:
        return false;
    }
}

}  // anonymous namespace

const char* node_state_to_string(NodeState state) {
    switch (state) {
    case NodeState::Discovered:
        return "discovered";
    case NodeState::Reading:
        return "reading";
    case NodeState::Resolved:
        return "resolved";
    case NodeState::Unresolved:
        return "unresolved";
    case NodeState::Error:
    default:
        return "error";
    }
}

GraphStatistics compute_statistics(const std::vector<Node>& nodes) {
    GraphStatistics stats;
    stats.total_nodes = nodes.size();
    if (nodes.empty()) {
        return stats;
    }

    stats.min_dependencies = nodes.front().dependencies.size();
    for (const auto& node : nodes) {
        const std::size_t deps = node.dependencies.size();
        stats.total_edges += deps;
        stats.max_dependencies = std::max(stats.max_dependencies, deps);
        stats.min_dependencies = std::min(stats.min_dependencies, deps);
        stats.unresolved_references += node.unresolved.size();
        stats.dynamic_references += node.dynamic_references;
        stats.malformed_references += node.malformed_references;
        if (node.state == NodeState::Error) {
            ++stats.error_nodes;
        } else if (node.state == NodeState::Unresolved) {
            ++stats.unresolved_nodes;
        }
    }
    stats.avg_dependencies =
        static_cast<double>(stats.total_edges) / static_cast<double>(stats.total_nodes);
    return stats;
}

// ----------------------------------------------------------------------------
// GraphSnapshot
// ----------------------------------------------------------------------------

const Node* GraphSnapshot::find(std::string_view key) const {
    return find_in(nodes_, index_, key);
}

const Node& GraphSnapshot::at(std::string_view key) const {
    const Node* node = find(key);
    if (node == nullptr) {
        throw unknown_node(key);
    }
    return *node;
}

std::vector<std::string> GraphSnapshot::keys() const {
    std::vector<std::string> result;
    result.reserve(index_.size());
    for (const auto& entry : index_) {
        result.push_back(entry.first);
    }
    return result;
}

std::size_t GraphSnapshot::edge_count() const {
    std::size_t count = 0;
    for (const auto& node : nodes_) {
        count += node.dependencies.size();
    }
    return count;
}

std::vector<std::string> GraphSnapshot::dependents(std::string_view key) const {
    std::vector<std::string> result;
    for (const auto& entry : index_) {
        const Node& node = nodes_[entry.second];
        if (node.dependencies.find(std::string(key)) != node.dependencies.end()) {
            result.push_back(node.key);
        }
    }
    return result;
}

std::set<std::string> GraphSnapshot::transitive_dependencies(std::string_view key) const {
    const Node& start = at(key);

    std::set<std::string> visited;
    std::vector<const Node*> stack{&start};
    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();
        for (const auto& dep : node->dependencies) {
            if (visited.insert(dep).second) {
                stack.push_back(&at(dep));
            }
        }
    }
    visited.erase(start.key);
    return visited;
}

GraphStatistics GraphSnapshot::statistics() const {
    return compute_statistics(nodes_);
}

// ----------------------------------------------------------------------------
// DependencyGraph
// ----------------------------------------------------------------------------

bool DependencyGraph::add_node(const std::string& key, std::size_t depth) {
    if (index_.find(key) != index_.end()) {
        return false;
    }
    Node node;
    node.key = key;
    node.depth = depth;
    index_.emplace(key, nodes_.size());
    nodes_.push_back(std::move(node));
    return true;
}

bool DependencyGraph::add_edge(const std::string& from, const std::string& to) {
    const std::size_t from_depth = at(from).depth;
    add_node(to, from_depth + 1);

    // Ссылка на from берётся после add_node: вставка может переместить вектор
    Node& source = mutable_at(from);
    if (!source.dependencies.insert(to).second) {
        return false;
    }
    ++edge_count_;
    return true;
}

void DependencyGraph::mark_reading(std::string_view key) {
    transition(mutable_at(key), NodeState::Reading);
}

void DependencyGraph::mark_resolved(std::string_view key) {
    transition(mutable_at(key), NodeState::Resolved);
}

void DependencyGraph::mark_unresolved(std::string_view key) {
    transition(mutable_at(key), NodeState::Unresolved);
}

void DependencyGraph::mark_error(std::string_view key, std::string cause) {
    Node& node = mutable_at(key);
    transition(node, NodeState::Error);
    node.error = std::move(cause);
}

void DependencyGraph::set_content(std::string_view key, std::string content) {
    Node& node = mutable_at(key);
    if (node.content) {
        throw std::logic_error("content of '" + node.key + "' is already set");
    }
    node.content = std::make_shared<const std::string>(std::move(content));
}

void DependencyGraph::add_raw_reference(std::string_view key, std::string identifier) {
    mutable_at(key).raw_references.push_back(std::move(identifier));
}

void DependencyGraph::add_unresolved(std::string_view key, const std::string& identifier) {
    Node& node = mutable_at(key);
    if (std::find(node.unresolved.begin(), node.unresolved.end(), identifier) ==
        node.unresolved.end()) {
        node.unresolved.push_back(identifier);
    }
}

void DependencyGraph::add_dynamic_reference(std::string_view key, std::size_t count) {
    mutable_at(key).dynamic_references += count;
}

void DependencyGraph::add_malformed_reference(std::string_view key, std::size_t count) {
    mutable_at(key).malformed_references += count;
}

const Node* DependencyGraph::find(std::string_view key) const {
    return find_in(nodes_, index_, key);
}

const Node& DependencyGraph::at(std::string_view key) const {
    const Node* node = find(key);
    if (node == nullptr) {
        throw unknown_node(key);
    }
    return *node;
}

Node& DependencyGraph::mutable_at(std::string_view key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw unknown_node(key);
    }
    return nodes_[it->second];
}

GraphStatistics DependencyGraph::statistics() const {
    return compute_statistics(nodes_);
}

GraphSnapshot DependencyGraph::snapshot() const {
    return GraphSnapshot(nodes_, index_);
}

void DependencyGraph::clear() {
    nodes_.clear();
    index_.clear();
    edge_count_ = 0;
}

void DependencyGraph::transition(Node& node, NodeState to) {
    if (!transition_allowed(node.state, to)) {
        throw std::logic_error(std::string("invalid state transition for '") + node.key + "': " +
                               node_state_to_string(node.state) + " -> " +
                               node_state_to_string(to));
    }
    node.state = to;
}

}  // namespace luarestore::graph
