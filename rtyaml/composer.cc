#include "rtyaml/composer.hh"

namespace rtyaml {

Composer::Composer(Parser &parser, Resolver &resolver, WarningHandler warning_handler)
    : parser_(parser), resolver_(resolver), warning_handler_(std::move(warning_handler)) {}

bool Composer::check_node() {
  if (parser_.check_event({EventKind::StreamStart})) {
    parser_.get_event();
  }
  return !parser_.check_event({EventKind::StreamEnd});
}

NodePtr Composer::get_node() {
  if (parser_.check_event({EventKind::StreamStart})) {
    parser_.get_event();
  }
  if (!parser_.check_event({EventKind::StreamEnd})) {
    return compose_document();
  }
  return nullptr;
}

NodePtr Composer::get_single_node() {
  parser_.get_event();
  NodePtr document;
  if (!parser_.check_event({EventKind::StreamEnd})) {
    document = compose_document();
  }
  if (!parser_.check_event({EventKind::StreamEnd})) {
    Event event = parser_.get_event();
    throw ComposerError("expected a single document in the stream", document->start_mark,
                        "but found another document", event.start_mark);
  }
  parser_.get_event();
  return document;
}

NodePtr Composer::compose_document() {
  parser_.get_event(); // DOCUMENT-START
  NodePtr node = compose_node(nullptr, std::monostate{});
  parser_.get_event(); // DOCUMENT-END
  anchors_.clear();
  return node;
}

void Composer::register_anchor(const std::optional<std::string> &anchor, const NodePtr &node) {
  if (anchor) {
    anchors_[*anchor] = node;
  }
}

NodePtr Composer::compose_node(const NodePtr &parent, const ResolverIndex &index) {
  if (parser_.check_event({EventKind::Alias})) {
    Event event = parser_.get_event();
    auto it = anchors_.find(*event.anchor);
    if (it == anchors_.end()) {
      throw ComposerError("", std::nullopt, "found undefined alias '" + *event.anchor + "'", event.start_mark);
    }
    return it->second;
  }
  const Event *event = parser_.peek_event();
  std::optional<std::string> anchor = event->anchor;
  if (anchor && warning_handler_) {
    if (auto it = anchors_.find(*anchor); it != anchors_.end()) {
      // the later definition replaces the earlier one for the aliases that follow
      warning_handler_(MarkedWarning{WarningKind::ReusedAnchor, "found duplicate anchor '" + *anchor + "'",
                                     it->second->start_mark, "second occurrence", event->start_mark, ""});
    }
  }
  resolver_.descend_resolver(parent, index);
  NodePtr node;
  if (event->kind == EventKind::Scalar) {
    node = compose_scalar_node(anchor);
  } else if (event->kind == EventKind::SequenceStart) {
    node = compose_sequence_node(anchor);
  } else if (event->kind == EventKind::MappingStart) {
    node = compose_mapping_node(anchor);
  } else {
    throw ComposerError("", std::nullopt, std::string("expected a node, but found ") + event_name(event->kind),
                        event->start_mark);
  }
  resolver_.ascend_resolver();
  return node;
}

NodePtr Composer::compose_scalar_node(const std::optional<std::string> &anchor) {
  Event event = parser_.get_event();
  Tag tag = event.tag && *event.tag != "!" ? *event.tag
                                           : resolver_.resolve(NodeKind::Scalar, event.value, event.scalar_implicit.plain);
  NodePtr node = Node::scalar(std::move(tag), std::move(event.value), event.style, event.start_mark, event.end_mark);
  node->comment = std::move(event.comment);
  node->anchor = anchor;
  register_anchor(anchor, node);
  return node;
}

NodePtr Composer::compose_sequence_node(const std::optional<std::string> &anchor) {
  Event start_event = parser_.get_event();
  Tag tag = start_event.tag && *start_event.tag != "!"
                ? *start_event.tag
                : resolver_.resolve(NodeKind::Sequence, "", start_event.implicit);
  NodePtr node = Node::sequence(std::move(tag), start_event.flow_style, start_event.start_mark);
  node->comment = std::move(start_event.comment);
  node->anchor = anchor;
  register_anchor(anchor, node);
  std::size_t index = 0;
  while (!parser_.check_event({EventKind::SequenceEnd})) {
    node->items.push_back(compose_node(node, index));
    ++index;
  }
  Event end_event = parser_.get_event();
  if (node->flow_style == true && !end_event.comment.empty()) {
    node->comment = end_event.comment;
  }
  node->end_mark = end_event.end_mark;
  check_end_doc_comment(end_event, *node);
  return node;
}

NodePtr Composer::compose_mapping_node(const std::optional<std::string> &anchor) {
  Event start_event = parser_.get_event();
  Tag tag = start_event.tag && *start_event.tag != "!"
                ? *start_event.tag
                : resolver_.resolve(NodeKind::Mapping, "", start_event.implicit);
  NodePtr node = Node::mapping(std::move(tag), start_event.flow_style, start_event.start_mark);
  node->comment = std::move(start_event.comment);
  node->anchor = anchor;
  register_anchor(anchor, node);
  while (!parser_.check_event({EventKind::MappingEnd})) {
    NodePtr key = compose_node(node, std::monostate{});
    NodePtr value = compose_node(node, key);
    node->pairs.emplace_back(std::move(key), std::move(value));
  }
  Event end_event = parser_.get_event();
  if (node->flow_style == true && !end_event.comment.empty()) {
    node->comment = end_event.comment;
  }
  node->end_mark = end_event.end_mark;
  check_end_doc_comment(end_event, *node);
  return node;
}

void Composer::check_end_doc_comment(Event &end_event, Node &node) {
  if (comment_slot(end_event.comment, 1).empty()) {
    return;
  }
  // pre comments on an end event have nothing following to move to, keep them as end comment
  if (node.comment.empty()) {
    node.comment.resize(2);
  }
  node.comment.push_back(end_event.comment[1]);
  end_event.comment[1].clear();
}

} // namespace rtyaml
