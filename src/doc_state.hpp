#pragma once

// Internal header, not installed. Implementation detail of Document.

#include <jsonctc-cpp/document.hpp>
#include <jsonctc-cpp/edit.hpp>
#include <jsonctc-cpp/path.hpp>
#include <jsonctc-cpp/value.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace jsonctc_cpp::detail {

// The tracked state of one object or array.
//
// A key lives in at most one of children, changes and deletions. Keys are
// normalized: indices on arrays, strings on objects.
struct NodeState {
    Path path;
    // Keeps the baseline alive: the parsed snapshot, or for fresh nodes the
    // value they were created from.
    std::shared_ptr<const Json> anchor;
    const Json* baseline{nullptr};
    // Created from an assigned value; it has no backing text.
    bool fresh{false};
    bool attached{true};

    std::map<PathElement, NodeId> children;
    std::vector<std::pair<PathElement, Json>> changes;  // in assignment order
    std::set<PathElement> deletions;
    std::vector<PathElement> added;  // keys not in the baseline, in order

    auto find_change(const PathElement& key) -> std::vector<std::pair<PathElement, Json>>::iterator {
        auto it = changes.begin();
        while (it != changes.end() && it->first != key) ++it;
        return it;
    }

    auto find_change(const PathElement& key) const
        -> std::vector<std::pair<PathElement, Json>>::const_iterator {
        auto it = changes.begin();
        while (it != changes.end() && it->first != key) ++it;
        return it;
    }
};

// The complete internal state of a Document.
struct DocState {
    std::shared_ptr<const std::string> source;
    std::shared_ptr<const Json> snapshot;
    std::vector<NodeState> nodes;  // nodes[0] is the root
    std::shared_ptr<const PathEditor> editor;

    // Add a node for the structured value at baseline and, recursively,
    // for every structured value nested in it.
    auto wrap(Path path, std::shared_ptr<const Json> anchor, const Json* baseline, bool fresh)
        -> NodeId {
        auto id = nodes.size();
        auto state = NodeState{};
        state.path = std::move(path);
        state.anchor = std::move(anchor);
        state.baseline = baseline;
        state.fresh = fresh;
        nodes.push_back(std::move(state));

        if (baseline->is_object()) {
            for (const auto& [key, value] : baseline->items()) {
                if (!is_structured(value)) continue;
                auto child_path = nodes[id].path;
                child_path.emplace_back(key);
                auto child = wrap(std::move(child_path), nodes[id].anchor, &value, fresh);
                nodes[id].children.emplace(PathElement{key}, child);
            }
        } else if (baseline->is_array()) {
            for (std::size_t i = 0; i < baseline->size(); ++i) {
                const auto& value = (*baseline)[i];
                if (!is_structured(value)) continue;
                auto child_path = nodes[id].path;
                child_path.emplace_back(i);
                auto child = wrap(std::move(child_path), nodes[id].anchor, &value, fresh);
                nodes[id].children.emplace(PathElement{i}, child);
            }
        }
        return id;
    }

    // Mark a node and everything below it as no longer part of the tree.
    void detach(NodeId id) {
        nodes[id].attached = false;
        for (const auto& [key, child] : nodes[id].children) detach(child);
    }

    auto handle(NodeId id) -> Node { return Node{this, id}; }
};

}  // namespace jsonctc_cpp::detail
