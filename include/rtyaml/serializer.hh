#pragma once

#include "./emitter.hh"
#include "./resolver.hh"

#include <optional>
#include <string>
#include <unordered_map>

namespace rtyaml {

// Turns the node graph of each document into events for the emitter
//
// A node reached a second time is written as an alias. Its anchor is the one it was loaded with,
// or a generated `id001`, `id002`, ... Nodes whose anchor is marked always-dump get it written even
// when they are not aliased.
class Serializer {
public:
  struct Options {
    std::string encoding;
    bool explicit_start = false;
    bool explicit_end = false;
    std::optional<VersionInfo> version;
    TagHandles tags;
  };

private:
  Emitter &emitter_;
  Resolver &resolver_;
  Options options_;

  std::unordered_map<const Node *, bool> serialized_nodes_;
  std::unordered_map<const Node *, std::optional<std::string>> anchors_;
  int last_anchor_id_ = 0;
  std::optional<bool> closed_; // absent until opened

  void anchor_node(const NodePtr &node);
  std::string generate_anchor(const Node &node);
  void serialize_node(const NodePtr &node, const NodePtr &parent, const ResolverIndex &index);

  // [flow eol comment, end comments] for the end event of a collection
  static CommentSlots end_comment(const Node &node);

public:
  Serializer(Emitter &emitter, Resolver &resolver) : Serializer(emitter, resolver, Options()) {}
  Serializer(Emitter &emitter, Resolver &resolver, Options options);

  Serializer(const Serializer &) = delete;
  Serializer &operator=(const Serializer &) = delete;

  const Options &options() const noexcept { return options_; }

  void open();
  void close();

  // One document, throws SerializerError unless opened and not yet closed
  void serialize(const NodePtr &node);
};

} // namespace rtyaml
