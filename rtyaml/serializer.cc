#include "rtyaml/serializer.hh"

#include <cstdio>

namespace rtyaml {

Serializer::Serializer(Emitter &emitter, Resolver &resolver, Options options)
    : emitter_(emitter), resolver_(resolver), options_(std::move(options)) {}

void Serializer::open() {
  if (!closed_) {
    emitter_.emit(Event::stream_start(Mark(), Mark(), options_.encoding));
    closed_ = false;
  } else if (*closed_) {
    throw SerializerError("serializer is closed");
  } else {
    throw SerializerError("serializer is already opened");
  }
}

void Serializer::close() {
  if (!closed_) {
    throw SerializerError("serializer is not opened");
  }
  if (!*closed_) {
    emitter_.emit(Event(EventKind::StreamEnd));
    closed_ = true;
  }
}

void Serializer::serialize(const NodePtr &node) {
  if (!closed_) {
    throw SerializerError("serializer is not opened");
  }
  if (*closed_) {
    throw SerializerError("serializer is closed");
  }
  emitter_.emit(
      Event::document_start(Mark(), Mark(), options_.explicit_start, options_.version, options_.tags));
  anchor_node(node);
  serialize_node(node, nullptr, std::monostate{});
  emitter_.emit(Event::document_end(Mark(), Mark(), options_.explicit_end));
  serialized_nodes_.clear();
  anchors_.clear();
  last_anchor_id_ = 0;
}

void Serializer::anchor_node(const NodePtr &node) {
  if (auto it = anchors_.find(node.get()); it != anchors_.end()) {
    if (!it->second) {
      it->second = generate_anchor(*node);
    }
    return;
  }
  std::optional<std::string> anchor;
  if (node->anchor && node->anchor_always_dump) {
    anchor = node->anchor;
  }
  anchors_[node.get()] = anchor;
  if (node->is_sequence()) {
    for (const auto &item : node->items) {
      anchor_node(item);
    }
  } else if (node->is_mapping()) {
    for (const auto &[key, value] : node->pairs) {
      anchor_node(key);
      anchor_node(value);
    }
  }
}

std::string Serializer::generate_anchor(const Node &node) {
  if (node.anchor) {
    return *node.anchor;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "id%03d", ++last_anchor_id_);
  return buf;
}

CommentSlots Serializer::end_comment(const Node &node) {
  CommentSlots slots(2);
  if (node.flow_style == true) {
    slots[0] = comment_slot(node.comment, 0);
  }
  slots[1] = comment_slot(node.comment, 2);
  return slots;
}

void Serializer::serialize_node(const NodePtr &node, const NodePtr &parent, const ResolverIndex &index) {
  const std::optional<std::string> &alias = anchors_.at(node.get());
  if (serialized_nodes_.count(node.get())) {
    Event event = Event::alias(alias.value_or(""), Mark(), Mark());
    if (node->style == ScalarStyle::ExplicitKey) {
      event.style = ScalarStyle::ExplicitKey;
    }
    emitter_.emit(std::move(event));
    return;
  }
  serialized_nodes_[node.get()] = true;
  resolver_.descend_resolver(parent, index);
  switch (node->kind) {
  case NodeKind::Scalar: {
    ScalarImplicit implicit{node->tag == resolver_.resolve(NodeKind::Scalar, node->value, true),
                            node->tag == resolver_.resolve(NodeKind::Scalar, node->value, false),
                            node->tag.starts_with(kYamlTagPrefix)};
    emitter_.emit(Event::scalar(alias, node->tag, implicit, node->value, Mark(), Mark(), node->style, node->comment));
    break;
  }
  case NodeKind::Sequence: {
    bool implicit = node->tag == resolver_.resolve(NodeKind::Sequence, "", true);
    emitter_.emit(Event::collection_start(EventKind::SequenceStart, alias, node->tag, implicit, Mark(), Mark(),
                                          node->flow_style, node->comment));
    std::size_t i = 0;
    for (const auto &item : node->items) {
      serialize_node(item, node, i++);
    }
    Event end(EventKind::SequenceEnd, Mark(), Mark(), end_comment(*node));
    emitter_.emit(std::move(end));
    break;
  }
  case NodeKind::Mapping: {
    bool implicit = node->tag == resolver_.resolve(NodeKind::Mapping, "", true);
    emitter_.emit(Event::collection_start(EventKind::MappingStart, alias, node->tag, implicit, Mark(), Mark(),
                                          node->flow_style, node->comment, node->pairs.size()));
    for (const auto &[key, value] : node->pairs) {
      serialize_node(key, node, std::monostate{});
      serialize_node(value, node, key);
    }
    Event end(EventKind::MappingEnd, Mark(), Mark(), end_comment(*node));
    emitter_.emit(std::move(end));
    break;
  }
  }
  resolver_.ascend_resolver();
}

} // namespace rtyaml
