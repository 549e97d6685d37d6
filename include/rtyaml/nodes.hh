#pragma once

#include "./tag.hh"
#include "./tokens.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rtyaml {

enum class NodeKind { Scalar, Sequence, Mapping };

const char *node_kind_name(NodeKind kind) noexcept;

struct Node;

// Nodes are shared: an alias refers to the very node its anchor was put on
using NodePtr = std::shared_ptr<Node>;
using NodePair = std::pair<NodePtr, NodePtr>;

// The representation graph
//
// A scalar node keeps its text and style, a sequence node its items, a mapping node its key/value
// pairs in document order. Cycles are possible through aliases.
struct Node {
  NodeKind kind;
  Tag tag;
  Mark start_mark;
  Mark end_mark;
  CommentSlots comment;
  std::optional<std::string> anchor;
  bool anchor_always_dump = false; // write the anchor even when the node is not aliased

  // Scalar
  std::string value;
  ScalarStyle style = ScalarStyle::Plain;
  // Sequence, Mapping
  std::optional<bool> flow_style;
  std::vector<NodePtr> items;
  std::vector<NodePair> pairs;
  // Mapping: the pairs pulled in by `<<` merges, filled by the safe constructor
  std::vector<NodePair> merge;

  Node(NodeKind kind, Tag tag, Mark start_mark = Mark(), Mark end_mark = Mark())
      : kind(kind), tag(std::move(tag)), start_mark(std::move(start_mark)), end_mark(std::move(end_mark)) {}

  bool is_scalar() const noexcept { return kind == NodeKind::Scalar; }
  bool is_sequence() const noexcept { return kind == NodeKind::Sequence; }
  bool is_mapping() const noexcept { return kind == NodeKind::Mapping; }

  static NodePtr scalar(Tag tag, std::string value, ScalarStyle style = ScalarStyle::Plain, Mark start_mark = Mark(),
                        Mark end_mark = Mark()) {
    auto node = std::make_shared<Node>(NodeKind::Scalar, std::move(tag), std::move(start_mark), std::move(end_mark));
    node->value = std::move(value);
    node->style = style;
    return node;
  }

  static NodePtr sequence(Tag tag, std::optional<bool> flow_style = std::nullopt, Mark start_mark = Mark()) {
    auto node = std::make_shared<Node>(NodeKind::Sequence, std::move(tag), std::move(start_mark));
    node->flow_style = flow_style;
    return node;
  }

  static NodePtr mapping(Tag tag, std::optional<bool> flow_style = std::nullopt, Mark start_mark = Mark()) {
    auto node = std::make_shared<Node>(NodeKind::Mapping, std::move(tag), std::move(start_mark));
    node->flow_style = flow_style;
    return node;
  }
};

// Whether `anchor` looks like a generated one (`id` followed by three or more digits, not `id000`),
// such anchors are not kept on load and are generated afresh on dump
inline bool templated_id(std::string_view anchor) noexcept {
  if (!anchor.starts_with("id") || anchor == "id000")
    return false;
  std::size_t digits = 0;
  while (2 + digits < anchor.size() && anchor[2 + digits] >= '0' && anchor[2 + digits] <= '9') {
    ++digits;
  }
  return digits >= 3;
}

// Indented tree dump of a node graph, aliased nodes are printed once and referenced by anchor
void dump_node(std::ostream &os, const NodePtr &node, int indent = 0);

} // namespace rtyaml
