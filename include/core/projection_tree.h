#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prism {
namespace core {

/**
 * @brief Immutable whitelist tree of fields to keep in a response
 *
 * Structure for the directive "id,name,profile(avatar,bio)":
 *   ROOT
 *   |-- id
 *   |-- name
 *   +-- profile
 *       |-- avatar
 *       +-- bio
 *
 * Children keep insertion order. A default-constructed tree is the empty tree,
 * which means "no projection" at the root and "whole value" below it.
 * Safe for concurrent reads once built; copies share their subtrees.
 */
class ProjectionTree {
public:
    /**
     * @brief Pre-computed projection step for one field
     *
     * Lets the projector walk many documents (array elements) against the same
     * tree without hashing the field name for every element.
     */
    struct FieldInstruction {
        std::string field_name;
        const ProjectionTree* child;
        bool is_leaf;
    };

    class Builder;

    ProjectionTree() = default;

    static ProjectionTree empty() { return ProjectionTree(); }
    static Builder builder();

    bool isEmpty() const { return children_.empty(); }
    // Leaf and empty are the same thing for a node; kept for readability at call sites
    bool isLeaf() const { return children_.empty(); }
    size_t size() const { return children_.size(); }

    bool hasChild(const std::string& field_name) const;
    // nullptr when absent
    const ProjectionTree* getChild(const std::string& field_name) const;
    std::vector<std::string> getChildNames() const;

    const std::vector<FieldInstruction>& compile() const { return instructions_; }

    // Directive text that parses back into an equal tree
    std::string toDirective() const;
    // ASCII rendering for debugging
    std::string toString() const;

    bool operator==(const ProjectionTree& other) const;
    bool operator!=(const ProjectionTree& other) const { return !(*this == other); }

private:
    using Child = std::pair<std::string, std::shared_ptr<const ProjectionTree>>;

    explicit ProjectionTree(std::vector<Child> children);

    void formatTree(std::string& out, const std::string& prefix) const;

    std::vector<Child> children_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<FieldInstruction> instructions_;
};

/**
 * @brief Accumulates fields for a ProjectionTree
 *
 * Re-adding a name replaces its subtree in place (last write wins).
 */
class ProjectionTree::Builder {
public:
    Builder& addLeaf(const std::string& field_name);
    Builder& addChild(const std::string& field_name, ProjectionTree subtree);

    bool hasChild(const std::string& field_name) const;
    const ProjectionTree* getChild(const std::string& field_name) const;

    ProjectionTree build() const;

private:
    std::vector<Child> children_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace core
} // namespace prism
