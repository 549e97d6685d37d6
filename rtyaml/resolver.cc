#include "rtyaml/resolver.hh"

namespace rtyaml {

namespace {

const std::string kAnyFirst = "any";

const VersionInfo kV11{1, 1};
const VersionInfo kV12{1, 2};

std::vector<std::string> chars(std::string_view s) {
  std::vector<std::string> out;
  for (char c : s)
    out.emplace_back(1, c);
  return out;
}

} // namespace

Resolver::Resolver() {
  add_implicit_resolver(yaml_tag("bool"), "^(?:true|True|TRUE|false|False|FALSE)$", chars("tTfF"), {kV12});
  add_implicit_resolver(yaml_tag("bool"),
                        "^(?:y|Y|yes|Yes|YES|n|N|no|No|NO"
                        "|true|True|TRUE|false|False|FALSE"
                        "|on|On|ON|off|Off|OFF)$",
                        chars("yYnNtTfFoO"), {kV11});
  add_implicit_resolver(yaml_tag("float"),
                        "^(?:[-+]?(?:[0-9][0-9_]*)\\.[0-9_]*(?:[eE][-+]?[0-9]+)?"
                        "|[-+]?(?:[0-9][0-9_]*)(?:[eE][-+]?[0-9]+)"
                        "|[-+]?\\.[0-9_]+(?:[eE][-+][0-9]+)?"
                        "|[-+]?\\.(?:inf|Inf|INF)"
                        "|\\.(?:nan|NaN|NAN))$",
                        chars("-+0123456789."), {kV12});
  add_implicit_resolver(yaml_tag("float"),
                        "^(?:[-+]?(?:[0-9][0-9_]*)\\.[0-9_]*(?:[eE][-+]?[0-9]+)?"
                        "|[-+]?(?:[0-9][0-9_]*)(?:[eE][-+]?[0-9]+)"
                        "|\\.[0-9_]+(?:[eE][-+][0-9]+)?"
                        "|[-+]?[0-9][0-9_]*(?::[0-5]?[0-9])+\\.[0-9_]*"
                        "|[-+]?\\.(?:inf|Inf|INF)"
                        "|\\.(?:nan|NaN|NAN))$",
                        chars("-+0123456789."), {kV11});
  add_implicit_resolver(yaml_tag("int"),
                        "^(?:[-+]?0b[0-1_]+"
                        "|[-+]?0o?[0-7_]+"
                        "|[-+]?[0-9_]+"
                        "|[-+]?0x[0-9a-fA-F_]+)$",
                        chars("-+0123456789"), {kV12});
  add_implicit_resolver(yaml_tag("int"),
                        "^(?:[-+]?0b[0-1_]+"
                        "|[-+]?0?[0-7_]+"
                        "|[-+]?(?:0|[1-9][0-9_]*)"
                        "|[-+]?0x[0-9a-fA-F_]+"
                        "|[-+]?[1-9][0-9_]*(?::[0-5]?[0-9])+)$",
                        chars("-+0123456789"), {kV11});
  add_implicit_resolver(yaml_tag("merge"), "^(?:<<)$", {"<"});
  add_implicit_resolver(yaml_tag("null"), "^(?:~|null|Null|NULL|)$", {"~", "n", "N", ""});
  add_implicit_resolver(yaml_tag("timestamp"),
                        "^(?:[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9]"
                        "|[0-9][0-9][0-9][0-9]-[0-9][0-9]?-[0-9][0-9]?"
                        "(?:[Tt]|[ \\t]+)[0-9][0-9]?"
                        ":[0-9][0-9]:[0-9][0-9](?:\\.[0-9]*)?"
                        "(?:[ \\t]*(?:Z|[-+][0-9][0-9]?(?::[0-9][0-9])?))?)$",
                        chars("0123456789"));
  add_implicit_resolver(yaml_tag("value"), "^(?:=)$", {"="});
  // plain scalars cannot start with these, kept for completeness of the table
  add_implicit_resolver(yaml_tag("yaml"), "^(?:!|&|\\*)$", chars("!&*"));
}

void Resolver::add_implicit_resolver(const std::string &tag, const std::string &regexp,
                                     const std::vector<std::string> &first, const std::set<VersionInfo> &versions) {
  std::regex re(regexp, std::regex::ECMAScript | std::regex::optimize);
  for (const auto &version : versions) {
    Table &table = tables_[version];
    if (first.empty()) {
      table[kAnyFirst].push_back({tag, re});
      continue;
    }
    for (const auto &ch : first) {
      table[ch.substr(0, 1)].push_back({tag, re});
    }
  }
}

const Resolver::Table &Resolver::versioned_resolver() const {
  VersionInfo version = processing_version();
  auto it = tables_.find(version);
  if (it == tables_.end()) {
    // unknown minor versions are processed as 1.2
    it = tables_.find(kV12);
  }
  static const Table empty;
  return it != tables_.end() ? it->second : empty;
}

void Resolver::add_path_resolver(const std::string &tag, std::vector<PathElement> path,
                                 std::optional<NodeKind> kind) {
  path_resolvers_.push_back({PathKey{std::move(path), kind}, tag});
}

void Resolver::descend_resolver(const NodePtr &current_node, const ResolverIndex &current_index) {
  if (path_resolvers_.empty()) {
    return;
  }
  std::map<std::optional<NodeKind>, std::string> exact_paths;
  std::vector<std::size_t> prefix_paths;
  if (current_node) {
    std::size_t depth = prefix_paths_.size();
    for (std::size_t i : prefix_paths_.back()) {
      const auto &[key, tag] = path_resolvers_[i];
      if (!check_prefix(depth, key, current_node, current_index)) {
        continue;
      }
      if (key.path.size() > depth) {
        prefix_paths.push_back(i);
      } else {
        exact_paths[key.kind] = tag;
      }
    }
  } else {
    for (std::size_t i = 0; i < path_resolvers_.size(); ++i) {
      const auto &[key, tag] = path_resolvers_[i];
      if (key.path.empty()) {
        exact_paths[key.kind] = tag;
      } else {
        prefix_paths.push_back(i);
      }
    }
  }
  exact_paths_.push_back(std::move(exact_paths));
  prefix_paths_.push_back(std::move(prefix_paths));
}

void Resolver::ascend_resolver() {
  if (path_resolvers_.empty() || exact_paths_.empty()) {
    return;
  }
  exact_paths_.pop_back();
  prefix_paths_.pop_back();
}

bool Resolver::check_prefix(std::size_t depth, const PathKey &key, const NodePtr &current_node,
                            const ResolverIndex &current_index) const {
  const PathElement &element = key.path[depth - 1];
  if (!element.node_tag.empty() && current_node->tag != element.node_tag) {
    return false;
  }
  if (element.node_kind && current_node->kind != *element.node_kind) {
    return false;
  }
  bool is_key = std::holds_alternative<std::monostate>(current_index);
  if (auto b = std::get_if<bool>(&element.index)) {
    return *b == is_key;
  }
  if (std::holds_alternative<std::monostate>(element.index)) {
    return !is_key;
  }
  if (auto s = std::get_if<std::string>(&element.index)) {
    auto key_node = std::get_if<NodePtr>(&current_index);
    return key_node && *key_node && (*key_node)->is_scalar() && (*key_node)->value == *s;
  }
  auto pos = std::get_if<std::size_t>(&current_index);
  return pos && *pos == std::get<std::size_t>(element.index);
}

Tag Resolver::resolve(NodeKind kind, const std::string &value, bool implicit) const {
  if (kind == NodeKind::Scalar && implicit) {
    const Table &table = versioned_resolver();
    for (const std::string &first : {value.substr(0, 1), kAnyFirst}) {
      auto it = table.find(first);
      if (it == table.end()) {
        continue;
      }
      for (const auto &resolver : it->second) {
        if (std::regex_match(value, resolver.regexp)) {
          return Tag(resolver.tag);
        }
      }
    }
  }
  if (!path_resolvers_.empty() && !exact_paths_.empty()) {
    const auto &exact = exact_paths_.back();
    if (auto it = exact.find(kind); it != exact.end()) {
      return Tag(it->second);
    }
    if (auto it = exact.find(std::nullopt); it != exact.end()) {
      return Tag(it->second);
    }
  }
  switch (kind) {
  case NodeKind::Scalar:
    return Tag(yaml_tag("str"));
  case NodeKind::Sequence:
    return Tag(yaml_tag("seq"));
  case NodeKind::Mapping:
    return Tag(yaml_tag("map"));
  }
  return Tag(yaml_tag("str"));
}

} // namespace rtyaml
