#pragma once

#include "./parser.hh"
#include "./resolver.hh"

#include <map>
#include <string>

namespace rtyaml {

// Builds the node graph of each document from the event stream
//
// Anchored nodes are registered before their content is composed, so an alias inside the node
// refers back to it. The anchor table is cleared at the end of every document.
class Composer {
private:
  Parser &parser_;
  Resolver &resolver_;
  WarningHandler warning_handler_;
  std::map<std::string, NodePtr> anchors_;

  NodePtr compose_document();
  NodePtr compose_node(const NodePtr &parent, const ResolverIndex &index);
  NodePtr compose_scalar_node(const std::optional<std::string> &anchor);
  NodePtr compose_sequence_node(const std::optional<std::string> &anchor);
  NodePtr compose_mapping_node(const std::optional<std::string> &anchor);
  void register_anchor(const std::optional<std::string> &anchor, const NodePtr &node);
  static void check_end_doc_comment(Event &end_event, Node &node);

public:
  Composer(Parser &parser, Resolver &resolver, WarningHandler warning_handler = default_warning_handler);

  Composer(const Composer &) = delete;
  Composer &operator=(const Composer &) = delete;

  // Whether another document follows, drops the stream start
  bool check_node();

  // The root of the next document, null at the stream end
  NodePtr get_node();

  // The root of the only document in the stream, null for an empty stream
  NodePtr get_single_node();
};

} // namespace rtyaml
