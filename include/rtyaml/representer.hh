#pragma once

#include "./nodes.hh"
#include "./value.hh"

#include <algorithm>
#include <array>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <variant>
#include <vector>

namespace rtyaml {

// Turns values into a node graph, the reverse of the constructor
//
// Representers are looked up by the exact type of a value first (its kind, or the registered
// class of a host object), then by kind through the multi representers, then the fallback.
// A value with identity (a collection, an anchored scalar, a host object) is represented once:
// every later occurrence yields the same node, which the serializer writes as an alias.
class BaseRepresenter {
public:
  using RepresenterFn = std::function<NodePtr(BaseRepresenter &representer, const Value &data)>;
  using TypeKey = std::variant<ValueKind, std::type_index>;

  struct Options {
    std::optional<ScalarStyle> default_style;
    std::optional<bool> default_flow_style = false;
    std::array<std::string, 2> boolean_representation{"false", "true"};
    // the document start marker is written, so a null root needs no text
    bool explicit_start = false;
    // version the output is written for, 1.1 changes octal and float text
    std::optional<VersionInfo> version;
    // sort mapping keys of plain maps on output, safe representer only
    bool sort_keys = true;
  };

protected:
  Options options_;

  std::map<TypeKey, RepresenterFn> representers_;
  std::map<ValueKind, RepresenterFn> multi_representers_;
  RepresenterFn fallback_;

  std::unordered_map<const void *, NodePtr> represented_objects_;
  std::vector<Value> object_keeper_;
  const void *alias_key_ = nullptr;

  static TypeKey type_key(const Value &data);

  // Values for which no aliases are generated
  virtual bool ignore_aliases(const Value &data) const;

  bool use_version_1_1() const noexcept { return options_.version && *options_.version == VersionInfo{1, 1}; }

  // Style of a collection whose items all are plain scalars, unless a default is configured
  std::optional<bool> best_flow_style(bool best_style) const {
    return options_.default_flow_style ? options_.default_flow_style : std::optional<bool>(best_style);
  }

  void remember(const NodePtr &node) {
    if (alias_key_) {
      represented_objects_[alias_key_] = node;
    }
  }

  template <typename R> static RepresenterFn bind(NodePtr (R::*fn)(const Value &)) {
    return [fn](BaseRepresenter &representer, const Value &data) { return (static_cast<R &>(representer).*fn)(data); };
  }

public:
  BaseRepresenter() : BaseRepresenter(Options()) {}
  explicit BaseRepresenter(Options options);
  virtual ~BaseRepresenter() = default;

  BaseRepresenter(const BaseRepresenter &) = delete;
  BaseRepresenter &operator=(const BaseRepresenter &) = delete;

  const Options &options() const noexcept { return options_; }
  Options &options() noexcept { return options_; }

  // The node graph of one document, the alias bookkeeping is reset afterwards
  NodePtr represent(const Value &data);

  NodePtr represent_data(const Value &data);

  // Mapping keys go through here, so key-only presentation can differ
  virtual NodePtr represent_key(const Value &data);

  NodePtr represent_scalar(const std::string &tag, std::string value, std::optional<ScalarStyle> style = std::nullopt,
                           const Anchor *anchor = nullptr, const CommentRef &block_comment = nullptr);

  virtual NodePtr represent_sequence(const Tag &tag, const Value &sequence, std::optional<bool> flow_style = std::nullopt);
  virtual NodePtr represent_mapping(const Tag &tag, const Value &mapping, std::optional<bool> flow_style = std::nullopt);
  virtual NodePtr represent_omap(const Tag &tag, const Value &omap, std::optional<bool> flow_style = std::nullopt);

  // A mapping node from ordered pairs, for host objects dumped as mappings
  NodePtr represent_pairs(const Tag &tag, const std::vector<std::pair<Value, Value>> &pairs,
                          std::optional<bool> flow_style = std::nullopt);

  // Representer for values of exactly this kind, replaces an earlier one
  void add_representer(ValueKind kind, RepresenterFn representer) { representers_[kind] = std::move(representer); }
  // Representer for host objects of exactly this class
  void add_representer(std::type_index type, RepresenterFn representer) {
    representers_[type] = std::move(representer);
  }
  // Representer for all values of a kind without an exact representer
  void add_multi_representer(ValueKind kind, RepresenterFn representer) {
    multi_representers_[kind] = std::move(representer);
  }
  void set_fallback_representer(RepresenterFn representer) { fallback_ = std::move(representer); }
};

// Represents plain values: keys of plain maps are sorted, no comments or styles are kept
class SafeRepresenter : public BaseRepresenter {
protected:
  bool ignore_aliases(const Value &data) const override;

public:
  SafeRepresenter() : SafeRepresenter(Options()) {}
  explicit SafeRepresenter(Options options);

  virtual NodePtr represent_none(const Value &data);
  NodePtr represent_str(const Value &data);
  NodePtr represent_binary(const Value &data);
  NodePtr represent_bool(const Value &data);
  NodePtr represent_int(const Value &data);
  NodePtr represent_float(const Value &data);
  NodePtr represent_list(const Value &data);
  NodePtr represent_dict(const Value &data);
  NodePtr represent_set(const Value &data);
  NodePtr represent_datetime(const Value &data);
  NodePtr represent_undefined(const Value &data);

  // Text of a float the way the resolver reads it back
  std::string float_text(double d) const;
};

// Represents round-trip values: styles, number shapes, comments, anchors and tags are reproduced
class RoundTripRepresenter : public SafeRepresenter {
protected:
  bool ignore_aliases(const Value &data) const override;

  // Let the comments already on `node` win over `comments`, then attach them
  static void merge_comments(Node &node, CommentSlots comments);

  // The collection's own comments with pre comments marked unwritten and the end comments appended
  template <typename K> static CommentSlots node_comments(const CommentedBase<K> &collection) {
    CommentSlots slots = collection.ca().comment;
    for (const auto &c : comment_slot(slots, 1)) {
      c->reset();
    }
    for (const auto &[_, item] : collection.ca().items) {
      for (const auto &c : comment_slot(item, 1)) {
        c->reset();
      }
    }
    slots.resize(std::max<std::size_t>(slots.size(), 2));
    slots.push_back(collection.ca().end);
    return slots;
  }

  // The stored tag of a collection, `!!x` spelled out as `tag:yaml.org,2002:x`
  static Tag collection_tag(const std::optional<Tag> &tag, std::string_view standard);

  NodePtr insert_underscore(const std::string &prefix, std::string digits, const std::optional<Underscore> &underscore,
                            const Anchor *anchor);

public:
  RoundTripRepresenter() : RoundTripRepresenter(Options()) {}
  explicit RoundTripRepresenter(Options options);

  NodePtr represent_none(const Value &data) override;
  NodePtr represent_key(const Value &data) override;

  NodePtr represent_scalar_string(const Value &data);
  NodePtr represent_scalar_bool(const Value &data);
  NodePtr represent_scalar_int(const Value &data);
  NodePtr represent_scalar_float(const Value &data);
  NodePtr represent_rt_datetime(const Value &data);
  NodePtr represent_tagged_scalar(const Value &data);
  NodePtr represent_rt_list(const Value &data);
  NodePtr represent_rt_dict(const Value &data);
  NodePtr represent_rt_set(const Value &data);

  NodePtr represent_sequence(const Tag &tag, const Value &sequence,
                             std::optional<bool> flow_style = std::nullopt) override;
  NodePtr represent_mapping(const Tag &tag, const Value &mapping,
                            std::optional<bool> flow_style = std::nullopt) override;
  NodePtr represent_omap(const Tag &tag, const Value &omap, std::optional<bool> flow_style = std::nullopt) override;
};

} // namespace rtyaml
