#include "rtyaml/nodes.hh"

#include <ostream>
#include <set>

namespace rtyaml {

const char *node_kind_name(NodeKind kind) noexcept {
  switch (kind) {
  case NodeKind::Scalar:
    return "ScalarNode";
  case NodeKind::Sequence:
    return "SequenceNode";
  case NodeKind::Mapping:
    return "MappingNode";
  }
  return "Node";
}

namespace {

void write_comment_count(std::ostream &os, const CommentSlots &comment, int indent) {
  if (!has_comment(comment))
    return;
  os << std::string(indent * 2 + 4, ' ') << "comment: [";
  for (std::size_t i = 0; i < comment.size(); ++i) {
    if (i)
      os << ", ";
    os << comment[i].size();
  }
  os << "]\n";
}

void dump_node_impl(std::ostream &os, const NodePtr &node, int indent, std::set<const Node *> &seen) {
  std::string pad(indent * 2, ' ');
  if (!seen.insert(node.get()).second) {
    os << pad << "*" << node->anchor.value_or("?") << "\n";
    return;
  }
  os << pad << node_kind_name(node->kind) << "(tag='" << node->tag.value() << "'";
  if (node->anchor)
    os << ", anchor='" << *node->anchor << "'";
  if (node->is_scalar()) {
    os << ", value='" << node->value << "'";
    if (node->style != ScalarStyle::Plain)
      os << ", style=" << static_cast<char>(node->style);
    os << ")\n";
    write_comment_count(os, node->comment, indent);
    return;
  }
  if (node->flow_style.value_or(false))
    os << ", flow";
  os << ")\n";
  write_comment_count(os, node->comment, indent);
  if (node->is_sequence()) {
    for (const auto &item : node->items)
      dump_node_impl(os, item, indent + 1, seen);
  } else {
    for (const auto &[key, value] : node->pairs) {
      dump_node_impl(os, key, indent + 1, seen);
      dump_node_impl(os, value, indent + 1, seen);
    }
  }
}

} // namespace

void dump_node(std::ostream &os, const NodePtr &node, int indent) {
  std::set<const Node *> seen;
  dump_node_impl(os, node, indent, seen);
}

} // namespace rtyaml
