// File: include/tcr/core/model/source_tree.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tcr/core/types.hpp"

namespace tcr {

using NodePredicate = std::function<bool(const StructuralNode&)>;

// Pre-order search. Returns root..match (inclusive) for the first node that
// satisfies `pred`, or nullopt.
std::optional<Path> find_path(const SourceNode& tree, const NodePredicate& pred);

// Looks up the path to the node at `location` in the document `uri`.
using PathLookup = std::function<std::optional<Path>(const std::string& uri, const Location& location)>;

// Parsed documents keyed by URI. Re-registering a URI replaces its trees.
class SourceRegistry {
 public:
  void register_source(const std::string& uri, std::vector<SourceNode> roots);

  [[nodiscard]] std::size_t size() const { return sources_.size(); }

  // First root (in registration order) containing a node at `location`.
  // Unknown URIs and unmatched locations both yield nullopt.
  std::optional<Path> find_path(const std::string& uri, const Location& location) const;

  PathLookup lookup() const;

 private:
  std::map<std::string, std::vector<SourceNode>> sources_;
};

}  // namespace tcr
