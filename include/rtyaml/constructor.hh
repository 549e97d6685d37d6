#pragma once

#include "./composer.hh"
#include "./value.hh"

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rtyaml {

// Turns the node graph of a document into values
//
// Construction is two-phase: a constructor hands back the (still empty) collection at once and a
// fill step that populates it. The value is cached per node before the fill step runs, so an alias
// back into a collection under construction gets the collection itself. Fill steps run right away
// when a complete value is needed (mapping keys, merge sources), else after the root is built.
class BaseConstructor {
public:
  struct Constructed {
    Value value;
    std::function<void()> fill;
  };

  using ConstructorFn = std::function<Constructed(const NodePtr &node)>;
  using MultiConstructorFn = std::function<Constructed(const std::string &tag_suffix, const NodePtr &node)>;

  struct Options {
    DuplicateKeyPolicy duplicate_keys = DuplicateKeyPolicy::Warn;
    MantissaPolicy mantissa = MantissaPolicy::Warn;
    bool preserve_quotes = false;
    WarningHandler warning_handler = default_warning_handler;
  };

protected:
  Composer &composer_;
  Resolver &resolver_;
  Options options_;

  std::map<std::string, ConstructorFn> constructors_;
  std::vector<std::pair<std::string, MultiConstructorFn>> multi_constructors_; // matched in order
  ConstructorFn fallback_;

  std::unordered_map<const Node *, Value> constructed_objects_;
  std::unordered_map<const Node *, Value> recursive_objects_;
  std::vector<std::function<void()>> pending_fills_;
  bool deep_construct_ = false;

  Constructed construct_non_recursive_object(const NodePtr &node);

  // Warn, throw DuplicateKeyError or stay silent, as the duplicate key policy says
  void report_duplicate(const std::string &context, const Node &node, const std::string &problem,
                        const Node &key_node);

  // A 1.1 float like `1e3` without a dot in its mantissa
  void mantissa_no_dot(const Node &node, const std::string &text);

  // Run the fill step of `data` with every value it reaches completed right away
  void fill_deep(const Constructed &data);

  void warn(MarkedWarning warning) const {
    if (options_.warning_handler) {
      options_.warning_handler(warning);
    }
  }

public:
  BaseConstructor(Composer &composer, Resolver &resolver) : BaseConstructor(composer, resolver, Options()) {}
  BaseConstructor(Composer &composer, Resolver &resolver, Options options);
  virtual ~BaseConstructor() = default;

  BaseConstructor(const BaseConstructor &) = delete;
  BaseConstructor &operator=(const BaseConstructor &) = delete;

  const Options &options() const noexcept { return options_; }

  // Whether another document follows
  bool check_data() { return composer_.check_node(); }

  // The next document, null at the stream end
  Value get_data();

  // The only document of the stream, null for an empty stream
  Value get_single_data();

  // Construct the document rooted at `node` and run every pending fill step
  Value construct_document(const NodePtr &node);

  // The value of `node`, cached per node; with `deep` the value and all it contains are complete
  Value construct_object(const NodePtr &node, bool deep = false);

  // The text of a scalar node, throws ConstructorError for other nodes
  virtual const std::string &construct_scalar(const NodePtr &node);

  std::vector<Value> construct_sequence(const NodePtr &node, bool deep = false);

  // Key/value pairs of a mapping node in document order, no duplicate check
  std::vector<std::pair<Value, Value>> construct_pairs(const NodePtr &node, bool deep = false);

  // A mapping key that can go in a map: sequence keys are frozen, mapping keys frozen when
  // `allow_map_keys`, anything unhashable is a ConstructorError
  Value mapping_key(const Node &node, const Node &key_node, Value key, bool allow_map_keys) const;

  // Reports `key` when already in `mapping`, a duplicate replaces the earlier value
  void check_mapping_key(const Node &node, const Node &key_node, const CommentedMap &mapping, const Value &key,
                         const Value &value);
  void check_set_key(const Node &node, const Node &key_node, const CommentedSet &setting, const Value &key);

  // Constructor for an exact tag, replaces an earlier one
  void add_constructor(const std::string &tag, ConstructorFn constructor);
  // Constructor for all tags starting with `tag_prefix`, called with the rest of the tag
  void add_multi_constructor(const std::string &tag_prefix, MultiConstructorFn constructor);
  // Constructor for tags nothing else claims
  void set_fallback_constructor(ConstructorFn constructor) { fallback_ = std::move(constructor); }

  // The value of `node` as if it carried the standard tag of its kind, complete
  virtual Value construct_plain(const NodePtr &node) = 0;

  VersionInfo processing_version() const { return resolver_.processing_version(); }
};

// Builds plain values: no comments, styles, positions or anchors are kept
class SafeConstructor : public BaseConstructor {
protected:
  // Move `<<` pairs out of the mapping into `node.merge`, merge sources first
  void flatten_mapping(Node &node);

  void fill_mapping(CommentedMap &mapping, const NodePtr &node, bool deep);

  Value construct_yaml_null(const NodePtr &node);
  Value construct_yaml_bool(const NodePtr &node);
  Value construct_yaml_int(const NodePtr &node);
  Value construct_yaml_float(const NodePtr &node);
  Value construct_yaml_binary(const NodePtr &node);
  Value construct_yaml_timestamp(const NodePtr &node);
  Constructed construct_yaml_omap(const NodePtr &node);
  Constructed construct_yaml_pairs(const NodePtr &node);
  Constructed construct_yaml_set(const NodePtr &node);
  Value construct_yaml_str(const NodePtr &node);
  Constructed construct_yaml_seq(const NodePtr &node);
  Constructed construct_yaml_map(const NodePtr &node);

  // The items of an omap/pairs node, each checked to be a single pair mapping
  static std::vector<NodePtr> single_pair_items(const NodePtr &node, const std::string &context);

public:
  SafeConstructor(Composer &composer, Resolver &resolver) : SafeConstructor(composer, resolver, Options()) {}
  SafeConstructor(Composer &composer, Resolver &resolver, Options options);

  // A mapping node with a `=` key stands for the scalar under that key
  const std::string &construct_scalar(const NodePtr &node) override;

  Value construct_plain(const NodePtr &node) override;
};

// Builds round-trip values: styled scalars, commented collections with positions, anchors and tags
class RoundTripConstructor : public SafeConstructor {
protected:
  Value construct_rt_scalar(const NodePtr &node);
  Value construct_rt_bool(const NodePtr &node);
  Value construct_rt_int(const NodePtr &node);
  Value construct_rt_float(const NodePtr &node);
  Value construct_rt_str(const NodePtr &node);

  void construct_rt_sequence(const NodePtr &node, CommentedSeq &seq, bool deep = false);
  // Remove the `<<` pairs, returning the maps they merge at their positions
  std::vector<MergeEntry> flatten_rt_mapping(Node &node);
  void construct_rt_mapping(const NodePtr &node, const std::shared_ptr<CommentedMap> &mapping, bool deep = false);
  void construct_setting(const NodePtr &node, CommentedSet &setting, bool deep = false);

  Constructed construct_rt_seq(const NodePtr &node);
  Constructed construct_rt_map(const NodePtr &node);
  Constructed construct_rt_omap(const NodePtr &node);
  Constructed construct_rt_set(const NodePtr &node);
  Constructed construct_unknown(const NodePtr &node);

  static void set_collection_style(Format &fa, std::size_t size, const Node &node);

  // Anchors other than generated ones are kept
  template <typename C> static void keep_anchor(C &collection, const Node &node, bool always_dump = false) {
    if (node.anchor && !templated_id(*node.anchor)) {
      collection.yaml_set_anchor(*node.anchor, always_dump);
    }
  }

  template <typename K> static void attach_node_comment(CommentedBase<K> &collection, const Node &node) {
    if (node.comment.empty())
      return;
    CommentSlots head(node.comment.begin(), node.comment.begin() + std::min<std::size_t>(2, node.comment.size()));
    collection.ca().comment = std::move(head);
    if (node.comment.size() > 2 && !node.comment[2].empty()) {
      collection.yaml_end_comment_extend(node.comment[2], true);
    }
  }

public:
  RoundTripConstructor(Composer &composer, Resolver &resolver) : RoundTripConstructor(composer, resolver, Options()) {}
  RoundTripConstructor(Composer &composer, Resolver &resolver, Options options);

  Value construct_plain(const NodePtr &node) override;
};

} // namespace rtyaml
