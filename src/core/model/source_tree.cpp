// File: src/core/model/source_tree.cpp
#include "tcr/core/model/source_tree.hpp"

#include <utility>

namespace tcr {
namespace {

bool descend(const SourceNode& node, const NodePredicate& pred, Path& path) {
  path.push_back(node.node);
  if (pred(node.node)) return true;
  for (const auto& child : node.children) {
    if (descend(child, pred, path)) return true;
  }
  path.pop_back();
  return false;
}

}  // namespace

std::optional<Path> find_path(const SourceNode& tree, const NodePredicate& pred) {
  Path path;
  if (descend(tree, pred, path)) return path;
  return std::nullopt;
}

void SourceRegistry::register_source(const std::string& uri, std::vector<SourceNode> roots) {
  sources_[uri] = std::move(roots);
}

std::optional<Path> SourceRegistry::find_path(const std::string& uri, const Location& location) const {
  const auto it = sources_.find(uri);
  if (it == sources_.end()) return std::nullopt;

  const NodePredicate at_location = [&location](const StructuralNode& candidate) {
    return candidate.location == location;
  };
  for (const auto& root : it->second) {
    auto path = tcr::find_path(root, at_location);
    if (path) return path;
  }
  return std::nullopt;
}

PathLookup SourceRegistry::lookup() const {
  return [this](const std::string& uri, const Location& location) { return find_path(uri, location); };
}

}  // namespace tcr
