#include "core/projection_tree.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace prism {
namespace core {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

ProjectionTree::ProjectionTree(std::vector<Child> children)
    : children_(std::move(children)) {
    index_.reserve(children_.size());
    instructions_.reserve(children_.size());
    for (size_t i = 0; i < children_.size(); ++i) {
        const auto& [name, subtree] = children_[i];
        index_.emplace(name, i);
        instructions_.push_back(FieldInstruction{name, subtree.get(), subtree->isEmpty()});
    }
}

ProjectionTree::Builder ProjectionTree::builder() {
    return Builder();
}

bool ProjectionTree::hasChild(const std::string& field_name) const {
    return index_.find(field_name) != index_.end();
}

const ProjectionTree* ProjectionTree::getChild(const std::string& field_name) const {
    auto it = index_.find(field_name);
    if (it == index_.end()) {
        return nullptr;
    }
    return children_[it->second].second.get();
}

std::vector<std::string> ProjectionTree::getChildNames() const {
    std::vector<std::string> names;
    names.reserve(children_.size());
    for (const auto& child : children_) {
        names.push_back(child.first);
    }
    return names;
}

std::string ProjectionTree::toDirective() const {
    std::string out;
    for (size_t i = 0; i < children_.size(); ++i) {
        if (i > 0) out += ',';
        out += children_[i].first;
        const auto& subtree = children_[i].second;
        if (!subtree->isEmpty()) {
            out += '(';
            out += subtree->toDirective();
            out += ')';
        }
    }
    return out;
}

std::string ProjectionTree::toString() const {
    std::string out = "ROOT\n";
    formatTree(out, "");
    return out;
}

void ProjectionTree::formatTree(std::string& out, const std::string& prefix) const {
    for (size_t i = 0; i < children_.size(); ++i) {
        bool last = (i + 1 == children_.size());
        out += prefix;
        out += last ? "+-- " : "|-- ";
        out += children_[i].first;
        out += '\n';
        children_[i].second->formatTree(out, prefix + (last ? "    " : "|   "));
    }
}

bool ProjectionTree::operator==(const ProjectionTree& other) const {
    if (children_.size() != other.children_.size()) {
        return false;
    }
    for (size_t i = 0; i < children_.size(); ++i) {
        if (children_[i].first != other.children_[i].first) return false;
        if (*children_[i].second != *other.children_[i].second) return false;
    }
    return true;
}

// ============================================================================
// Builder
// ============================================================================

ProjectionTree::Builder& ProjectionTree::Builder::addLeaf(const std::string& field_name) {
    return addChild(field_name, ProjectionTree());
}

ProjectionTree::Builder& ProjectionTree::Builder::addChild(const std::string& field_name, ProjectionTree subtree) {
    if (field_name.empty() || isBlank(field_name)) {
        throw std::invalid_argument("field_name must not be blank");
    }
    auto node = std::make_shared<const ProjectionTree>(std::move(subtree));
    auto it = index_.find(field_name);
    if (it != index_.end()) {
        children_[it->second].second = std::move(node);
    } else {
        index_.emplace(field_name, children_.size());
        children_.emplace_back(field_name, std::move(node));
    }
    return *this;
}

bool ProjectionTree::Builder::hasChild(const std::string& field_name) const {
    return index_.find(field_name) != index_.end();
}

const ProjectionTree* ProjectionTree::Builder::getChild(const std::string& field_name) const {
    auto it = index_.find(field_name);
    if (it == index_.end()) {
        return nullptr;
    }
    return children_[it->second].second.get();
}

ProjectionTree ProjectionTree::Builder::build() const {
    return ProjectionTree(children_);
}

} // namespace core
} // namespace prism
