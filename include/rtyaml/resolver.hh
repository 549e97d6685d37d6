#pragma once

#include "./nodes.hh"

#include <functional>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace rtyaml {

// Where a node sits in its parent: nothing for a mapping key or the root, the key node for a
// mapping value, the position for a sequence item
using ResolverIndex = std::variant<std::monostate, NodePtr, std::size_t>;

// Determines the tag of untagged nodes
//
// Plain scalars are matched against the implicit resolvers of the YAML version being processed,
// looked up by the first character of the text. Path resolvers force a tag by position in the
// node tree; the composer and the serializer report that position through descend/ascend.
class Resolver {
public:
  struct ImplicitResolver {
    std::string tag;
    std::regex regexp;
  };

  // One step of a path: conditions on the parent node and on the index within it
  struct PathElement {
    std::optional<NodeKind> node_kind; // any kind when absent
    std::string node_tag;              // any tag when empty
    // monostate: any value or item; true: a mapping key; false: a mapping value or sequence item;
    // string: the value of the key with this text; size_t: the sequence item at this position
    std::variant<std::monostate, bool, std::string, std::size_t> index;
  };

private:
  using Table = std::map<std::string, std::vector<ImplicitResolver>>; // by first character

  std::map<VersionInfo, Table> tables_;
  std::function<VersionInfo()> version_source_;

  struct PathKey {
    std::vector<PathElement> path;
    std::optional<NodeKind> kind;
  };
  std::vector<std::pair<PathKey, std::string>> path_resolvers_;
  std::vector<std::map<std::optional<NodeKind>, std::string>> exact_paths_;
  std::vector<std::vector<std::size_t>> prefix_paths_; // indices into path_resolvers_

  bool check_prefix(std::size_t depth, const PathKey &key, const NodePtr &current_node,
                    const ResolverIndex &current_index) const;

public:
  // Installs the standard YAML 1.1 and 1.2 implicit resolvers
  Resolver();

  // Where the version being processed comes from, YAML 1.2 when not set
  void set_version_source(std::function<VersionInfo()> source) { version_source_ = std::move(source); }

  VersionInfo processing_version() const { return version_source_ ? version_source_() : VersionInfo{1, 2}; }

  // Plain scalars starting with one of `first` (the empty string for the empty scalar) and
  // matching `regexp` get `tag`, for the given versions only
  void add_implicit_resolver(const std::string &tag, const std::string &regexp, const std::vector<std::string> &first,
                             const std::set<VersionInfo> &versions = {{1, 1}, {1, 2}});

  void add_path_resolver(const std::string &tag, std::vector<PathElement> path,
                         std::optional<NodeKind> kind = std::nullopt);

  void descend_resolver(const NodePtr &current_node, const ResolverIndex &current_index);
  void ascend_resolver();

  // The tag for a node of `kind` without explicit tag; `implicit` allows matching plain scalar text
  Tag resolve(NodeKind kind, const std::string &value, bool implicit) const;

  // The implicit resolvers in effect, by first character
  const Table &versioned_resolver() const;
};

} // namespace rtyaml
