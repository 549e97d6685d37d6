#pragma once

#include "./constructor.hh"
#include "./emitter.hh"
#include "./representer.hh"
#include "./serializer.hh"

#include <array>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <variant>
#include <vector>

namespace rtyaml {

using LoadResult = std::variant<Value, MarkedError>;
using LoadAllResult = std::variant<std::vector<Value>, MarkedError>;

// Load and dump with one configuration
//
// Every load or dump builds a fresh pipeline (reader, scanner, parser, composer, constructor or
// representer, serializer, emitter) from the settings below, with the registrations applied.
// The `%YAML` version and `%TAG` handles of the last loaded stream are remembered, and written
// again on dump unless a version or tags are configured.
class YAML {
public:
  enum class Kind {
    RoundTrip, // comments, styles, anchors and number shapes survive a load and dump
    Safe,      // plain values only
  };

  using FromYaml = std::function<Value(BaseConstructor &constructor, const NodePtr &node)>;
  using MultiFromYaml =
      std::function<Value(BaseConstructor &constructor, const std::string &tag_suffix, const NodePtr &node)>;
  using ToYaml = BaseRepresenter::RepresenterFn;

  Kind typ = Kind::RoundTrip;

  // Load settings
  bool preserve_quotes = false;
  std::optional<VersionInfo> version; // pinned version, a %YAML directive still wins
  DuplicateKeyPolicy duplicate_keys = DuplicateKeyPolicy::Warn;
  MantissaPolicy mantissa_policy = MantissaPolicy::Warn;
  WarningHandler warning_handler = default_warning_handler;

  // Dump settings
  std::optional<int> old_indent; // the single indent, sets mapping and sequence indent alike
  std::optional<int> map_indent;
  std::optional<int> sequence_indent;
  int sequence_dash_offset = 0;
  std::optional<int> width;
  std::string line_break = "\n";
  bool explicit_start = false;
  bool explicit_end = false;
  bool canonical = false;
  bool allow_unicode = true;
  std::optional<bool> default_flow_style = false;
  std::optional<ScalarStyle> default_style;
  std::optional<int> top_level_colon_align;
  std::string prefix_colon;
  bool brace_single_entry_mapping_in_flow_sequence = false;
  bool compact_seq_seq = true;
  bool compact_seq_map = true;
  bool scalar_after_indicator = true;
  bool sort_base_mapping_type_on_output = true;
  std::array<std::string, 2> boolean_representation{"false", "true"};
  TagHandles tags;
  std::string encoding = "utf-8";

private:
  std::vector<std::function<void(Resolver &)>> resolver_setup_;
  std::vector<std::function<void(BaseConstructor &)>> constructor_setup_;
  std::vector<std::function<void(BaseRepresenter &)>> representer_setup_;

  TagHandles loaded_tags_;
  std::optional<VersionInfo> loaded_version_;

  // Run `fn` on a load pipeline over `input`, remembering the directives found
  template <typename R> R with_constructor(std::string_view input, const std::string &name,
                                           const std::function<R(BaseConstructor &)> &fn);

  Emitter::Options emitter_options() const;
  Serializer::Options serializer_options() const;
  BaseRepresenter::Options representer_options() const;
  std::optional<VersionInfo> dump_version() const { return version ? version : loaded_version_; }

public:
  YAML() = default;
  explicit YAML(Kind typ) : typ(typ) {}

  // Mapping indent, sequence indent and the offset of the dash within the sequence indent
  void indent(std::optional<int> mapping = std::nullopt, std::optional<int> sequence = std::nullopt,
              std::optional<int> offset = std::nullopt) {
    if (mapping)
      map_indent = mapping;
    if (sequence)
      sequence_indent = sequence;
    if (offset)
      sequence_dash_offset = *offset;
  }

  void compact(std::optional<bool> seq_seq = std::nullopt, std::optional<bool> seq_map = std::nullopt) {
    if (seq_seq)
      compact_seq_seq = *seq_seq;
    if (seq_map)
      compact_seq_map = *seq_map;
  }

  // The single document of `input` (bytes, UTF-8 unless a BOM says otherwise), null when empty
  Value load(std::string_view input, const std::string &name = "<byte string>");
  std::vector<Value> load_all(std::string_view input, const std::string &name = "<byte string>");
  Value load_file(const std::string &path);

  // Like load, but returns the error instead of throwing it
  LoadResult try_load(std::string_view input, const std::string &name = "<byte string>") noexcept;
  LoadAllResult try_load_all(std::string_view input, const std::string &name = "<byte string>") noexcept;

  void dump(const Value &data, std::ostream &out);
  void dump_all(const std::vector<Value> &documents, std::ostream &out);
  std::string dump(const Value &data);
  std::string dump_all(const std::vector<Value> &documents);

  // Directives of the last loaded stream
  const TagHandles &loaded_tags() const noexcept { return loaded_tags_; }
  const std::optional<VersionInfo> &loaded_version() const noexcept { return loaded_version_; }

  void add_constructor(const std::string &tag, FromYaml constructor);
  void add_multi_constructor(const std::string &tag_prefix, MultiFromYaml constructor);
  void add_representer(ValueKind kind, ToYaml representer);
  void add_representer(std::type_index type, ToYaml representer);
  void add_multi_representer(ValueKind kind, ToYaml representer);
  void add_implicit_resolver(const std::string &tag, const std::string &regexp, const std::vector<std::string> &first);

  // A host class dumped under `tag` through `to_yaml` and loaded back through `from_yaml`
  template <typename T>
  void register_class(const std::string &tag,
                      std::function<NodePtr(BaseRepresenter &, const std::string &tag, const T &)> to_yaml,
                      std::function<std::shared_ptr<T>(BaseConstructor &, const NodePtr &)> from_yaml) {
    add_representer(std::type_index(typeid(T)), [tag, to_yaml](BaseRepresenter &representer, const Value &data) {
      return to_yaml(representer, tag, data.asObject<T>());
    });
    add_constructor(tag, [from_yaml](BaseConstructor &constructor, const NodePtr &node) {
      return Value::object(from_yaml(constructor, node));
    });
  }
};

} // namespace rtyaml
