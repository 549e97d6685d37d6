#include "rtyaml/yaml.hh"

#include <fstream>
#include <iterator>
#include <sstream>

namespace rtyaml {

template <typename R>
R YAML::with_constructor(std::string_view input, const std::string &name,
                         const std::function<R(BaseConstructor &)> &fn) {
  const bool round_trip = typ == Kind::RoundTrip;
  Reader reader(input, name);
  std::unique_ptr<Scanner> scanner;
  std::unique_ptr<Parser> parser;
  if (round_trip) {
    scanner = std::make_unique<RoundTripScanner>(reader, version);
    parser = std::make_unique<RoundTripParser>(*scanner, warning_handler);
  } else {
    scanner = std::make_unique<Scanner>(reader, version);
    parser = std::make_unique<Parser>(*scanner, warning_handler);
  }
  Resolver resolver;
  resolver.set_version_source([&scanner = *scanner] { return scanner.processing_version(); });
  for (const auto &setup : resolver_setup_) {
    setup(resolver);
  }
  Composer composer(*parser, resolver, warning_handler);

  BaseConstructor::Options options;
  options.duplicate_keys = duplicate_keys;
  options.mantissa = mantissa_policy;
  options.preserve_quotes = preserve_quotes;
  options.warning_handler = warning_handler;
  std::unique_ptr<BaseConstructor> constructor;
  if (round_trip) {
    constructor = std::make_unique<RoundTripConstructor>(composer, resolver, options);
  } else {
    constructor = std::make_unique<SafeConstructor>(composer, resolver, options);
  }
  for (const auto &setup : constructor_setup_) {
    setup(*constructor);
  }

  // tags and version of an earlier load must not leak into this one
  loaded_tags_.clear();
  loaded_version_.reset();
  R result = fn(*constructor);
  loaded_tags_ = parser->loaded_tags();
  loaded_version_ = parser->loaded_version();
  return result;
}

Value YAML::load(std::string_view input, const std::string &name) {
  return with_constructor<Value>(input, name,
                                 [](BaseConstructor &constructor) { return constructor.get_single_data(); });
}

std::vector<Value> YAML::load_all(std::string_view input, const std::string &name) {
  return with_constructor<std::vector<Value>>(input, name, [](BaseConstructor &constructor) {
    std::vector<Value> documents;
    while (constructor.check_data()) {
      documents.push_back(constructor.get_data());
    }
    return documents;
  });
}

Value YAML::load_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StreamError("Could not open file: " + path);
  }
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return load(content, path);
}

LoadResult YAML::try_load(std::string_view input, const std::string &name) noexcept {
  try {
    return LoadResult{std::in_place_type<Value>, load(input, name)};
  } catch (const MarkedError &e) {
    return e;
  } catch (const std::exception &e) {
    return MarkedError("", std::nullopt, "YAML loading error: " + std::string(e.what()), std::nullopt);
  }
}

LoadAllResult YAML::try_load_all(std::string_view input, const std::string &name) noexcept {
  try {
    return LoadAllResult{std::in_place_type<std::vector<Value>>, load_all(input, name)};
  } catch (const MarkedError &e) {
    return e;
  } catch (const std::exception &e) {
    return MarkedError("", std::nullopt, "YAML loading error: " + std::string(e.what()), std::nullopt);
  }
}

Emitter::Options YAML::emitter_options() const {
  Emitter::Options options;
  options.canonical = canonical;
  options.indent = old_indent;
  options.map_indent = map_indent;
  options.sequence_indent = sequence_indent;
  options.sequence_dash_offset = sequence_dash_offset;
  options.width = width;
  options.allow_unicode = allow_unicode;
  options.line_break = line_break;
  options.top_level_colon_align = top_level_colon_align;
  options.prefix_colon = prefix_colon;
  options.brace_single_entry_mapping_in_flow_sequence = brace_single_entry_mapping_in_flow_sequence;
  options.compact_seq_seq = compact_seq_seq;
  options.compact_seq_map = compact_seq_map;
  options.scalar_after_indicator = scalar_after_indicator;
  options.version = dump_version();
  return options;
}

Serializer::Options YAML::serializer_options() const {
  Serializer::Options options;
  options.encoding = encoding;
  options.explicit_start = explicit_start;
  options.explicit_end = explicit_end;
  options.version = dump_version();
  options.tags = tags.empty() ? loaded_tags_ : tags;
  return options;
}

BaseRepresenter::Options YAML::representer_options() const {
  BaseRepresenter::Options options;
  options.default_style = default_style;
  options.default_flow_style = default_flow_style;
  options.boolean_representation = boolean_representation;
  options.explicit_start = explicit_start;
  options.version = dump_version();
  options.sort_keys = sort_base_mapping_type_on_output;
  return options;
}

void YAML::dump_all(const std::vector<Value> &documents, std::ostream &out) {
  Emitter emitter(out, emitter_options());
  Resolver resolver;
  const VersionInfo resolve_version = dump_version().value_or(VersionInfo{1, 2});
  resolver.set_version_source([resolve_version] { return resolve_version; });
  for (const auto &setup : resolver_setup_) {
    setup(resolver);
  }
  Serializer serializer(emitter, resolver, serializer_options());
  std::unique_ptr<BaseRepresenter> representer;
  if (typ == Kind::RoundTrip) {
    representer = std::make_unique<RoundTripRepresenter>(representer_options());
  } else {
    representer = std::make_unique<SafeRepresenter>(representer_options());
  }
  for (const auto &setup : representer_setup_) {
    setup(*representer);
  }
  serializer.open();
  for (const auto &data : documents) {
    serializer.serialize(representer->represent(data));
  }
  serializer.close();
}

void YAML::dump(const Value &data, std::ostream &out) { dump_all({data}, out); }

std::string YAML::dump(const Value &data) {
  std::ostringstream out;
  dump(data, out);
  return out.str();
}

std::string YAML::dump_all(const std::vector<Value> &documents) {
  std::ostringstream out;
  dump_all(documents, out);
  return out.str();
}

void YAML::add_constructor(const std::string &tag, FromYaml constructor) {
  constructor_setup_.push_back([tag, constructor](BaseConstructor &target) {
    target.add_constructor(tag, [&target, constructor](const NodePtr &node) {
      return BaseConstructor::Constructed{constructor(target, node), nullptr};
    });
  });
}

void YAML::add_multi_constructor(const std::string &tag_prefix, MultiFromYaml constructor) {
  constructor_setup_.push_back([tag_prefix, constructor](BaseConstructor &target) {
    target.add_multi_constructor(tag_prefix, [&target, constructor](const std::string &suffix, const NodePtr &node) {
      return BaseConstructor::Constructed{constructor(target, suffix, node), nullptr};
    });
  });
}

void YAML::add_representer(ValueKind kind, ToYaml representer) {
  representer_setup_.push_back([kind, representer](BaseRepresenter &target) { target.add_representer(kind, representer); });
}

void YAML::add_representer(std::type_index type, ToYaml representer) {
  representer_setup_.push_back([type, representer](BaseRepresenter &target) { target.add_representer(type, representer); });
}

void YAML::add_multi_representer(ValueKind kind, ToYaml representer) {
  representer_setup_.push_back(
      [kind, representer](BaseRepresenter &target) { target.add_multi_representer(kind, representer); });
}

void YAML::add_implicit_resolver(const std::string &tag, const std::string &regexp,
                                 const std::vector<std::string> &first) {
  resolver_setup_.push_back(
      [tag, regexp, first](Resolver &resolver) { resolver.add_implicit_resolver(tag, regexp, first); });
}

} // namespace rtyaml
