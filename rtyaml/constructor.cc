#include "rtyaml/constructor.hh"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <string_view>

namespace rtyaml {

namespace {

const char *const kDuplicateKeyNote =
    "Duplicate keys keep the last value, set the duplicate key policy to Error to reject them";

ConstructorError kind_error(const char *expected, const Node &node) {
  return ConstructorError("", std::nullopt,
                          std::string("expected a ") + expected + " node, but found " + node_kind_name(node.kind),
                          node.start_mark);
}

[[noreturn]] void bad_scalar(const char *what, const Node &node) {
  throw ConstructorError("", std::nullopt, std::string("failed to construct ") + what + " from \"" + node.value + "\"",
                         node.start_mark);
}

std::string strip_underscores(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c != '_')
      out += c;
  }
  return out;
}

std::string lower(std::string s) {
  for (char &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

// An integer beyond the int64 range keeps its magnitude as decimal digits
ScalarInt int_value(std::string_view digits, int radix, bool negative, const Node &node) {
  std::uint64_t magnitude = 0;
  const char *end = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(digits.data(), end, magnitude, radix);
  if (digits.empty() || ec == std::errc::invalid_argument || ptr != end) {
    bad_scalar("integer", node);
  }
  constexpr std::uint64_t max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  ScalarInt si;
  if (ec == std::errc::result_out_of_range || magnitude > max + (negative ? 1 : 0)) {
    si.value = negative ? std::numeric_limits<std::int64_t>::min() : std::numeric_limits<std::int64_t>::max();
    si.big = convert_digits(digits, radix, 10);
  } else if (negative) {
    si.value = magnitude == max + 1 ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(magnitude);
  } else {
    si.value = static_cast<std::int64_t>(magnitude);
  }
  return si;
}

// Unsigned float text that std::from_chars reported out of range: true when too large, false when
// too close to zero
bool float_overflows(std::string_view text) {
  std::size_t e = text.find_first_of("eE");
  std::string_view mantissa = text.substr(0, e);
  long exponent = 0;
  if (e != std::string_view::npos) {
    std::string_view exp_text = text.substr(e + 1);
    const bool exp_negative = !exp_text.empty() && exp_text[0] == '-';
    if (!exp_text.empty() && (exp_text[0] == '-' || exp_text[0] == '+')) {
      exp_text.remove_prefix(1);
    }
    auto [ptr, ec] = std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
    if (ec == std::errc::result_out_of_range) {
      return !exp_negative;
    }
    if (exp_negative) {
      exponent = -exponent;
    }
  }
  std::size_t dot = mantissa.find('.');
  if (dot == std::string_view::npos) {
    dot = mantissa.size();
  }
  std::size_t first = mantissa.find_first_not_of("0.");
  if (first == std::string_view::npos) {
    return false;
  }
  // decimal exponent of the leading digit, plus one
  long scale = first < dot ? static_cast<long>(dot - first) : -static_cast<long>(first - dot - 1);
  return exponent + scale > 0;
}

// Overflow gives infinity and underflow zero, both flagged in `out_of_range`
double float_value(std::string_view text, const Node &node, bool *out_of_range = nullptr) {
  double d = 0.0;
  const char *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, d);
  if (text.empty() || ec == std::errc::invalid_argument || ptr != end) {
    bad_scalar("float", node);
  }
  if (ec == std::errc::result_out_of_range) {
    if (out_of_range) {
      *out_of_range = true;
    }
    return float_overflows(text) ? std::numeric_limits<double>::infinity() : 0.0;
  }
  return d;
}

// 1.1 base 60 numbers, e.g. 190:20:30
std::vector<std::string_view> sexagesimal_parts(std::string_view s) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    std::size_t colon = s.find(':', start);
    parts.push_back(s.substr(start, colon == std::string_view::npos ? std::string_view::npos : colon - start));
    if (colon == std::string_view::npos)
      return parts;
    start = colon + 1;
  }
}

std::int64_t sexagesimal_int(std::string_view s, bool negative, const Node &node) {
  std::int64_t value = 0;
  for (auto part : sexagesimal_parts(s)) {
    ScalarInt si = int_value(part, 10, false, node);
    if (si.is_big()) {
      throw ConstructorError("", std::nullopt, "integer out of range \"" + node.value + "\"", node.start_mark);
    }
    value = value * 60 + si.value;
  }
  return negative ? -value : value;
}

double sexagesimal_float(std::string_view s, const Node &node) {
  double value = 0.0;
  for (auto part : sexagesimal_parts(s)) {
    value = value * 60 + float_value(part, node);
  }
  return value;
}

int leading_zeros(std::string_view v) {
  int lead0 = 0;
  for (std::size_t idx = 0; idx < v.size() && (v[idx] == '0' || v[idx] == '.'); ++idx) {
    if (v[idx] == '0')
      ++lead0;
  }
  return lead0;
}

int find_dot(std::string_view s) {
  std::size_t pos = s.find('.');
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

std::optional<bool> bool_value(const std::string &text) {
  static const std::map<std::string, bool> values{
      {"yes", true}, {"no", false}, {"y", true},   {"n", false},
      {"true", true}, {"false", false}, {"on", true}, {"off", false},
  };
  auto it = values.find(lower(text));
  if (it == values.end())
    return std::nullopt;
  return it->second;
}

int base64_digit(char c) {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}

// Decodes `text` into `bytes`, characters outside the alphabet are skipped. Returns an error message
// or an empty string.
std::string decode_base64(std::string_view text, std::string &bytes) {
  std::uint32_t acc = 0;
  int count = 0;
  std::size_t data_chars = 0;
  bool padded = false;
  for (char c : text) {
    if (c == '=') {
      padded = true;
      break;
    }
    int d = base64_digit(c);
    if (d < 0)
      continue;
    ++data_chars;
    acc = (acc << 6) | static_cast<std::uint32_t>(d);
    if (++count == 4) {
      bytes += static_cast<char>((acc >> 16) & 0xff);
      bytes += static_cast<char>((acc >> 8) & 0xff);
      bytes += static_cast<char>(acc & 0xff);
      acc = 0;
      count = 0;
    }
  }
  if (count == 1) {
    return "Invalid base64-encoded string: number of data characters (" + std::to_string(data_chars) +
           ") cannot be 1 more than a multiple of 4";
  }
  if (count > 0 && !padded) {
    return "Incorrect padding";
  }
  if (count == 2) {
    bytes += static_cast<char>((acc >> 4) & 0xff);
  } else if (count == 3) {
    bytes += static_cast<char>((acc >> 10) & 0xff);
    bytes += static_cast<char>((acc >> 2) & 0xff);
  }
  return "";
}

int days_in_month(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0))
    return 29;
  return days[month - 1];
}

TimeStamp parse_timestamp(const Node &node) {
  // year, month, day, T, blanks, hour, minute, second, fraction, tz blanks, tz, tz sign, tz hour, tz minute
  static const std::regex timestamp_regexp(R"(^([0-9]{4})-([0-9]{1,2})-([0-9]{1,2}))"
                                           R"((?:(?:([Tt])|([ \t]+))([0-9]{1,2}):([0-9]{2}):([0-9]{2}))"
                                           R"((?:\.([0-9]*))?)"
                                           R"((?:([ \t]*)(Z|([-+])([0-9]{1,2})(?::([0-9]{2}))?))?)?$)");
  std::smatch m;
  if (!std::regex_match(node.value, m, timestamp_regexp)) {
    bad_scalar("timestamp", node);
  }
  TimeStamp ts;
  ts.year = std::stoi(m[1].str());
  ts.month = std::stoi(m[2].str());
  ts.day = std::stoi(m[3].str());
  if (ts.month < 1 || ts.month > 12 || ts.day < 1 || ts.day > days_in_month(ts.year, ts.month)) {
    bad_scalar("timestamp", node);
  }
  if (!m[6].matched)
    return ts;
  ts.has_time = true;
  ts.separator = m[4].matched ? m[4].str() : m[5].str();
  ts.hour = std::stoi(m[6].str());
  ts.minute = std::stoi(m[7].str());
  ts.second = std::stoi(m[8].str());
  if (ts.hour > 23 || ts.minute > 59 || ts.second > 59) {
    bad_scalar("timestamp", node);
  }
  ts.fraction = m[9].str();
  ts.tz_separator = m[10].str();
  ts.tz = m[11].str();
  return ts;
}

AnchorRef scalar_anchor(const Node &node) {
  return node.anchor ? std::make_shared<Anchor>(Anchor{*node.anchor, true}) : nullptr;
}

std::shared_ptr<CommentedMap> map_ptr(const Value &v) { return std::get<std::shared_ptr<CommentedMap>>(v.data()); }

template <typename S, typename C>
BaseConstructor::ConstructorFn scalar_constructor(S *self, Value (C::*fn)(const NodePtr &)) {
  return [self, fn](const NodePtr &node) { return BaseConstructor::Constructed{(self->*fn)(node), nullptr}; };
}

template <typename S, typename C>
BaseConstructor::ConstructorFn collection_constructor(S *self, BaseConstructor::Constructed (C::*fn)(const NodePtr &)) {
  return [self, fn](const NodePtr &node) { return (self->*fn)(node); };
}

} // namespace

// BaseConstructor

BaseConstructor::BaseConstructor(Composer &composer, Resolver &resolver, Options options)
    : composer_(composer), resolver_(resolver), options_(std::move(options)) {}

Value BaseConstructor::get_data() {
  if (composer_.check_node()) {
    return construct_document(composer_.get_node());
  }
  return Value();
}

Value BaseConstructor::get_single_data() {
  NodePtr node = composer_.get_single_node();
  if (node) {
    return construct_document(node);
  }
  return Value();
}

Value BaseConstructor::construct_document(const NodePtr &node) {
  auto reset = [this] {
    pending_fills_.clear();
    constructed_objects_.clear();
    recursive_objects_.clear();
    deep_construct_ = false;
  };
  try {
    Value data = construct_object(node);
    while (!pending_fills_.empty()) {
      auto fills = std::move(pending_fills_);
      pending_fills_.clear();
      for (auto &fill : fills) {
        fill();
      }
    }
    reset();
    return data;
  } catch (...) {
    // leave no half built document behind for the next one
    reset();
    throw;
  }
}

Value BaseConstructor::construct_object(const NodePtr &node, bool deep) {
  if (auto it = constructed_objects_.find(node.get()); it != constructed_objects_.end()) {
    return it->second;
  }
  if (auto it = recursive_objects_.find(node.get()); it != recursive_objects_.end()) {
    return it->second;
  }
  const bool old_deep = deep_construct_;
  if (deep) {
    deep_construct_ = true;
  }
  recursive_objects_.emplace(node.get(), Value());
  Constructed data = construct_non_recursive_object(node);
  constructed_objects_[node.get()] = data.value;
  recursive_objects_.erase(node.get());
  if (data.fill) {
    if (deep_construct_) {
      data.fill();
    } else {
      pending_fills_.push_back(std::move(data.fill));
    }
  }
  deep_construct_ = old_deep;
  return data.value;
}

BaseConstructor::Constructed BaseConstructor::construct_non_recursive_object(const NodePtr &node) {
  const std::string &tag = node->tag.value();
  if (auto it = constructors_.find(tag); it != constructors_.end()) {
    return it->second(node);
  }
  for (const auto &[prefix, constructor] : multi_constructors_) {
    if (tag.starts_with(prefix)) {
      return constructor(tag.substr(prefix.size()), node);
    }
  }
  if (fallback_) {
    return fallback_(node);
  }
  switch (node->kind) {
  case NodeKind::Scalar:
    return {Value(construct_scalar(node)), nullptr};
  case NodeKind::Sequence: {
    Value data = Value::seq();
    return {data, [this, node, data] {
              for (auto &item : construct_sequence(node)) {
                data.asSequence().push_back(std::move(item));
              }
            }};
  }
  case NodeKind::Mapping: {
    Value data = Value::map();
    return {data, [this, node, data] {
              for (auto &[key, value] : construct_pairs(node)) {
                data.asMap().set(mapping_key(*node, *node, key, true), std::move(value));
              }
            }};
  }
  }
  throw ConstructorError("", std::nullopt, "could not determine a constructor for the tag '" + tag + "'",
                         node->start_mark);
}

void BaseConstructor::fill_deep(const Constructed &data) {
  if (!data.fill)
    return;
  const bool old_deep = deep_construct_;
  deep_construct_ = true;
  data.fill();
  deep_construct_ = old_deep;
}

const std::string &BaseConstructor::construct_scalar(const NodePtr &node) {
  if (!node->is_scalar()) {
    throw kind_error("scalar", *node);
  }
  return node->value;
}

std::vector<Value> BaseConstructor::construct_sequence(const NodePtr &node, bool deep) {
  if (!node->is_sequence()) {
    throw kind_error("sequence", *node);
  }
  std::vector<Value> items;
  items.reserve(node->items.size());
  for (const auto &child : node->items) {
    items.push_back(construct_object(child, deep));
  }
  return items;
}

std::vector<std::pair<Value, Value>> BaseConstructor::construct_pairs(const NodePtr &node, bool deep) {
  if (!node->is_mapping()) {
    throw kind_error("mapping", *node);
  }
  std::vector<std::pair<Value, Value>> pairs;
  for (const auto &[key_node, value_node] : node->pairs) {
    Value key = construct_object(key_node, deep);
    Value value = construct_object(value_node, deep);
    pairs.emplace_back(std::move(key), std::move(value));
  }
  return pairs;
}

Value BaseConstructor::mapping_key(const Node &node, const Node &key_node, Value key, bool allow_map_keys) const {
  auto key_style = [&key_node](Format &fa) {
    if (key_node.flow_style == true) {
      fa.set_flow_style();
    } else if (key_node.flow_style == false) {
      fa.set_block_style();
    }
  };
  switch (key.kind()) {
  case ValueKind::Sequence: {
    if (key.asSequence().frozen())
      return key;
    auto frozen = key.asSequence().frozen_copy();
    key_style(frozen->fa());
    return Value(std::move(frozen));
  }
  case ValueKind::Mapping: {
    if (key.asMap().frozen())
      return key;
    if (!allow_map_keys)
      break;
    auto frozen = key.asMap().frozen_copy();
    key_style(frozen->fa());
    return Value(std::move(frozen));
  }
  case ValueKind::Set:
    break;
  default:
    return key;
  }
  throw ConstructorError("while constructing a mapping", node.start_mark, "found unhashable key", key_node.start_mark);
}

void BaseConstructor::report_duplicate(const std::string &context, const Node &node, const std::string &problem,
                                       const Node &key_node) {
  switch (options_.duplicate_keys) {
  case DuplicateKeyPolicy::Allow:
    return;
  case DuplicateKeyPolicy::Error:
    throw DuplicateKeyError(context, node.start_mark, problem, key_node.start_mark, kDuplicateKeyNote);
  case DuplicateKeyPolicy::Warn:
    warn(MarkedWarning{WarningKind::DuplicateKey, context, node.start_mark, problem, key_node.start_mark,
                       kDuplicateKeyNote});
    return;
  }
}

void BaseConstructor::check_mapping_key(const Node &node, const Node &key_node, const CommentedMap &mapping,
                                        const Value &key, const Value &value) {
  if (const Value *mk = mapping.find_entry(key)) {
    report_duplicate("while constructing a mapping", node,
                     "found duplicate key \"" + key.str() + "\" with value \"" + value.str() + "\" (original value: \"" +
                         mk->str() + "\")",
                     key_node);
  }
}

void BaseConstructor::check_set_key(const Node &node, const Node &key_node, const CommentedSet &setting,
                                    const Value &key) {
  if (setting.contains(key)) {
    report_duplicate("while constructing a set", node, "found duplicate key \"" + key.str() + "\"", key_node);
  }
}

void BaseConstructor::mantissa_no_dot(const Node &node, const std::string &text) {
  const std::string problem =
      "In YAML 1.1 floating point values should have a dot ('.') in their mantissa. This dot is not required "
      "for JSON nor for YAML 1.2";
  const std::string note = "Correct your float: \"" + text + "\" on line: " + std::to_string(node.start_mark.line + 1) +
                           ", column: " + std::to_string(node.start_mark.column + 1);
  if (options_.mantissa == MantissaPolicy::Error) {
    throw ConstructorError("", std::nullopt, problem, node.start_mark, note);
  }
  warn(MarkedWarning{WarningKind::MantissaNoDot, "", std::nullopt, problem, node.start_mark, note});
}

void BaseConstructor::add_constructor(const std::string &tag, ConstructorFn constructor) {
  constructors_[tag] = std::move(constructor);
}

void BaseConstructor::add_multi_constructor(const std::string &tag_prefix, MultiConstructorFn constructor) {
  for (auto &[prefix, existing] : multi_constructors_) {
    if (prefix == tag_prefix) {
      existing = std::move(constructor);
      return;
    }
  }
  multi_constructors_.emplace_back(tag_prefix, std::move(constructor));
}

// SafeConstructor

SafeConstructor::SafeConstructor(Composer &composer, Resolver &resolver, Options options)
    : BaseConstructor(composer, resolver, std::move(options)) {
  add_constructor(yaml_tag("null"), scalar_constructor(this, &SafeConstructor::construct_yaml_null));
  add_constructor(yaml_tag("bool"), scalar_constructor(this, &SafeConstructor::construct_yaml_bool));
  add_constructor(yaml_tag("int"), scalar_constructor(this, &SafeConstructor::construct_yaml_int));
  add_constructor(yaml_tag("float"), scalar_constructor(this, &SafeConstructor::construct_yaml_float));
  add_constructor(yaml_tag("binary"), scalar_constructor(this, &SafeConstructor::construct_yaml_binary));
  add_constructor(yaml_tag("timestamp"), scalar_constructor(this, &SafeConstructor::construct_yaml_timestamp));
  add_constructor(yaml_tag("omap"), collection_constructor(this, &SafeConstructor::construct_yaml_omap));
  add_constructor(yaml_tag("pairs"), collection_constructor(this, &SafeConstructor::construct_yaml_pairs));
  add_constructor(yaml_tag("set"), collection_constructor(this, &SafeConstructor::construct_yaml_set));
  add_constructor(yaml_tag("str"), scalar_constructor(this, &SafeConstructor::construct_yaml_str));
  add_constructor(yaml_tag("seq"), collection_constructor(this, &SafeConstructor::construct_yaml_seq));
  add_constructor(yaml_tag("map"), collection_constructor(this, &SafeConstructor::construct_yaml_map));
  set_fallback_constructor([](const NodePtr &node) -> Constructed {
    throw ConstructorError("", std::nullopt, "could not determine a constructor for the tag '" + node->tag.value() + "'",
                           node->start_mark);
  });
}

const std::string &SafeConstructor::construct_scalar(const NodePtr &node) {
  if (node->is_mapping()) {
    for (const auto &[key_node, value_node] : node->pairs) {
      if (key_node->tag == yaml_tag("value")) {
        return construct_scalar(value_node);
      }
    }
  }
  return BaseConstructor::construct_scalar(node);
}

void SafeConstructor::flatten_mapping(Node &node) {
  std::vector<NodePair> merge;
  bool merged = false;
  std::size_t index = 0;
  while (index < node.pairs.size()) {
    NodePtr key_node = node.pairs[index].first;
    NodePtr value_node = node.pairs[index].second;
    if (key_node->tag == yaml_tag("merge")) {
      if (merged) {
        if (options_.duplicate_keys == DuplicateKeyPolicy::Allow) {
          node.pairs.erase(node.pairs.begin() + static_cast<std::ptrdiff_t>(index));
          continue;
        }
        report_duplicate("while constructing a mapping", node, "found duplicate key \"" + key_node->value + "\"",
                         *key_node);
      }
      merged = true;
      node.pairs.erase(node.pairs.begin() + static_cast<std::ptrdiff_t>(index));
      if (value_node->is_mapping()) {
        flatten_mapping(*value_node);
        merge.insert(merge.end(), value_node->pairs.begin(), value_node->pairs.end());
      } else if (value_node->is_sequence()) {
        std::vector<std::vector<NodePair>> submerge;
        for (const auto &subnode : value_node->items) {
          if (!subnode->is_mapping()) {
            throw ConstructorError("while constructing a mapping", node.start_mark,
                                   std::string("expected a mapping for merging, but found ") +
                                       node_kind_name(subnode->kind),
                                   subnode->start_mark);
          }
          flatten_mapping(*subnode);
          submerge.push_back(subnode->pairs);
        }
        // the first map listed wins, so it goes in last
        std::reverse(submerge.begin(), submerge.end());
        for (const auto &pairs : submerge) {
          merge.insert(merge.end(), pairs.begin(), pairs.end());
        }
      } else {
        throw ConstructorError("while constructing a mapping", node.start_mark,
                               std::string("expected a mapping or list of mappings for merging, but found ") +
                                   node_kind_name(value_node->kind),
                               value_node->start_mark);
      }
    } else if (key_node->tag == yaml_tag("value")) {
      key_node->tag = Tag(yaml_tag("str"));
      ++index;
    } else {
      ++index;
    }
  }
  if (!merge.empty()) {
    node.merge = merge;
    node.pairs.insert(node.pairs.begin(), merge.begin(), merge.end());
  }
}

void SafeConstructor::fill_mapping(CommentedMap &mapping, const NodePtr &node, bool deep) {
  if (!node->is_mapping()) {
    throw kind_error("mapping", *node);
  }
  flatten_mapping(*node);
  // explicit keys override merged ones without being duplicates of them
  const bool check = node->merge.empty();
  const auto pairs = node->pairs;
  for (const auto &[key_node, value_node] : pairs) {
    Value key = mapping_key(*node, *key_node, construct_object(key_node, true), false);
    Value value = construct_object(value_node, deep);
    if (check) {
      check_mapping_key(*node, *key_node, mapping, key, value);
    }
    mapping.set(std::move(key), std::move(value));
  }
}

Value SafeConstructor::construct_yaml_null(const NodePtr &node) {
  construct_scalar(node);
  return Value();
}

Value SafeConstructor::construct_yaml_bool(const NodePtr &node) {
  auto b = bool_value(construct_scalar(node));
  if (!b) {
    bad_scalar("boolean", *node);
  }
  return Value(*b);
}

Value SafeConstructor::construct_yaml_int(const NodePtr &node) {
  std::string value_s = strip_underscores(construct_scalar(node));
  const bool negative = !value_s.empty() && value_s[0] == '-';
  if (!value_s.empty() && (value_s[0] == '-' || value_s[0] == '+')) {
    value_s.erase(0, 1);
  }
  if (value_s.empty()) {
    bad_scalar("integer", *node);
  }
  const VersionInfo version = processing_version();
  if (value_s == "0") {
    return Value(std::int64_t{0});
  }
  if (value_s.starts_with("0b")) {
    return Value(int_value(std::string_view(value_s).substr(2), 2, negative, *node));
  }
  if (value_s.starts_with("0x")) {
    return Value(int_value(std::string_view(value_s).substr(2), 16, negative, *node));
  }
  if (value_s.starts_with("0o")) {
    return Value(int_value(std::string_view(value_s).substr(2), 8, negative, *node));
  }
  if (version == VersionInfo{1, 1} && value_s[0] == '0') {
    return Value(int_value(value_s, 8, negative, *node));
  }
  if (version == VersionInfo{1, 1} && value_s.find(':') != std::string::npos) {
    return Value(sexagesimal_int(value_s, negative, *node));
  }
  return Value(int_value(value_s, 10, negative, *node));
}

Value SafeConstructor::construct_yaml_float(const NodePtr &node) {
  const std::string &value_so = construct_scalar(node);
  std::string value_s = lower(strip_underscores(value_so));
  double sign = 1.0;
  if (!value_s.empty() && value_s[0] == '-') {
    sign = -1.0;
  }
  if (!value_s.empty() && (value_s[0] == '-' || value_s[0] == '+')) {
    value_s.erase(0, 1);
  }
  if (value_s == ".inf") {
    return Value(sign * std::numeric_limits<double>::infinity());
  }
  if (value_s == ".nan") {
    return Value(std::numeric_limits<double>::quiet_NaN());
  }
  const VersionInfo version = processing_version();
  if (version != VersionInfo{1, 2} && value_s.find(':') != std::string::npos) {
    return Value(sign * sexagesimal_float(value_s, *node));
  }
  if (version != VersionInfo{1, 2}) {
    std::size_t e = value_s.find('e');
    if (e != std::string::npos && value_s.substr(0, e).find('.') == std::string::npos) {
      mantissa_no_dot(*node, value_so);
    }
  }
  return Value(sign * float_value(value_s, *node));
}

Value SafeConstructor::construct_yaml_binary(const NodePtr &node) {
  const std::string &text = construct_scalar(node);
  for (unsigned char c : text) {
    if (c >= 0x80) {
      throw ConstructorError("", std::nullopt, "failed to convert base64 data into ascii: non-ascii character",
                             node->start_mark);
    }
  }
  Binary data;
  std::string error = decode_base64(text, data.bytes);
  if (!error.empty()) {
    throw ConstructorError("", std::nullopt, "failed to decode base64 data: " + error, node->start_mark);
  }
  return Value(std::move(data));
}

Value SafeConstructor::construct_yaml_timestamp(const NodePtr &node) {
  construct_scalar(node);
  return Value(parse_timestamp(*node));
}

std::vector<NodePtr> SafeConstructor::single_pair_items(const NodePtr &node, const std::string &context) {
  if (!node->is_sequence()) {
    throw ConstructorError(context, node->start_mark,
                           std::string("expected a sequence, but found ") + node_kind_name(node->kind),
                           node->start_mark);
  }
  for (const auto &subnode : node->items) {
    if (!subnode->is_mapping()) {
      throw ConstructorError(context, node->start_mark,
                             std::string("expected a mapping of length 1, but found ") + node_kind_name(subnode->kind),
                             subnode->start_mark);
    }
    if (subnode->pairs.size() != 1) {
      throw ConstructorError(context, node->start_mark,
                             "expected a single mapping item, but found " + std::to_string(subnode->pairs.size()) +
                                 " items",
                             subnode->start_mark);
    }
  }
  return node->items;
}

BaseConstructor::Constructed SafeConstructor::construct_yaml_omap(const NodePtr &node) {
  Value data = Value::omap();
  return {data, [this, node, data] {
            CommentedMap &omap = data.asMap();
            for (const auto &subnode : single_pair_items(node, "while constructing an ordered map")) {
              const auto &[key_node, value_node] = subnode->pairs.front();
              Value key = mapping_key(*node, *key_node, construct_object(key_node, true), false);
              Value value = construct_object(value_node);
              check_mapping_key(*node, *key_node, omap, key, value);
              omap.set(std::move(key), std::move(value));
            }
          }};
}

// Pairs keep their duplicates, so they load as a `!!pairs` sequence of single pair mappings
BaseConstructor::Constructed SafeConstructor::construct_yaml_pairs(const NodePtr &node) {
  Value data = Value::seq();
  data.asSequence().yaml_set_tag(Tag(yaml_tag("pairs")));
  return {data, [this, node, data] {
            for (const auto &subnode : single_pair_items(node, "while constructing pairs")) {
              const auto &[key_node, value_node] = subnode->pairs.front();
              Value pair = Value::map();
              pair.asMap().set(mapping_key(*subnode, *key_node, construct_object(key_node, true), false),
                               construct_object(value_node));
              data.asSequence().push_back(std::move(pair));
            }
          }};
}

BaseConstructor::Constructed SafeConstructor::construct_yaml_set(const NodePtr &node) {
  Value data = Value::set();
  return {data, [this, node, data] {
            CommentedMap members;
            fill_mapping(members, node, false);
            for (const auto &e : members) {
              data.asSet().add(e.key);
            }
          }};
}

Value SafeConstructor::construct_yaml_str(const NodePtr &node) { return Value(construct_scalar(node)); }

BaseConstructor::Constructed SafeConstructor::construct_yaml_seq(const NodePtr &node) {
  Value data = Value::seq();
  return {data, [this, node, data] {
            for (auto &item : construct_sequence(node)) {
              data.asSequence().push_back(std::move(item));
            }
          }};
}

BaseConstructor::Constructed SafeConstructor::construct_yaml_map(const NodePtr &node) {
  Value data = Value::map();
  return {data, [this, node, data] { fill_mapping(data.asMap(), node, false); }};
}

Value SafeConstructor::construct_plain(const NodePtr &node) {
  switch (node->kind) {
  case NodeKind::Scalar:
    return Value(construct_scalar(node));
  case NodeKind::Sequence: {
    Constructed data = construct_yaml_seq(node);
    fill_deep(data);
    return data.value;
  }
  case NodeKind::Mapping: {
    Constructed data = construct_yaml_map(node);
    fill_deep(data);
    return data.value;
  }
  }
  return Value();
}

// RoundTripConstructor

RoundTripConstructor::RoundTripConstructor(Composer &composer, Resolver &resolver, Options options)
    : SafeConstructor(composer, resolver, std::move(options)) {
  add_constructor(yaml_tag("bool"), scalar_constructor(this, &RoundTripConstructor::construct_rt_bool));
  add_constructor(yaml_tag("int"), scalar_constructor(this, &RoundTripConstructor::construct_rt_int));
  add_constructor(yaml_tag("float"), scalar_constructor(this, &RoundTripConstructor::construct_rt_float));
  add_constructor(yaml_tag("str"), scalar_constructor(this, &RoundTripConstructor::construct_rt_str));
  add_constructor(yaml_tag("omap"), collection_constructor(this, &RoundTripConstructor::construct_rt_omap));
  add_constructor(yaml_tag("set"), collection_constructor(this, &RoundTripConstructor::construct_rt_set));
  add_constructor(yaml_tag("seq"), collection_constructor(this, &RoundTripConstructor::construct_rt_seq));
  add_constructor(yaml_tag("map"), collection_constructor(this, &RoundTripConstructor::construct_rt_map));
  set_fallback_constructor(collection_constructor(this, &RoundTripConstructor::construct_unknown));
}

Value RoundTripConstructor::construct_rt_scalar(const NodePtr &node) {
  if (!node->is_scalar()) {
    throw kind_error("scalar", *node);
  }
  if (node->style == ScalarStyle::Literal) {
    return Value(ScalarString{node->value, ScalarStyle::Literal, comment_at(node->comment, 1), {}, scalar_anchor(*node)});
  }
  if (node->style == ScalarStyle::Folded) {
    ScalarString fss{"", ScalarStyle::Folded, comment_at(node->comment, 1), {}, scalar_anchor(*node)};
    fss.value.reserve(node->value.size());
    for (char c : node->value) {
      if (c == '\a') {
        fss.fold_pos.push_back(fss.value.size());
      } else {
        fss.value += c;
      }
    }
    return Value(std::move(fss));
  }
  if (options_.preserve_quotes &&
      (node->style == ScalarStyle::SingleQuoted || node->style == ScalarStyle::DoubleQuoted)) {
    return Value(ScalarString{node->value, node->style, nullptr, {}, scalar_anchor(*node)});
  }
  if (node->anchor) {
    return Value(ScalarString{node->value, ScalarStyle::Plain, nullptr, {}, scalar_anchor(*node)});
  }
  return Value(node->value);
}

Value RoundTripConstructor::construct_rt_bool(const NodePtr &node) {
  Value b = construct_yaml_bool(node);
  if (node->anchor) {
    return Value(ScalarBool{b.asBool(), scalar_anchor(*node)});
  }
  return b;
}

Value RoundTripConstructor::construct_rt_int(const NodePtr &node) {
  const std::string &value_su = construct_scalar(node);
  std::optional<Underscore> underscore;
  {
    std::string_view sx = value_su;
    while (!sx.empty() && sx.back() == '_') {
      sx.remove_suffix(1);
    }
    if (std::size_t pos = sx.rfind('_'); pos != std::string_view::npos) {
      underscore = Underscore{static_cast<int>(sx.size() - pos - 1), false, false};
    }
  }
  std::string value_s = strip_underscores(value_su);
  const bool negative = !value_s.empty() && value_s[0] == '-';
  if (!value_s.empty() && (value_s[0] == '-' || value_s[0] == '+')) {
    value_s.erase(0, 1);
  }
  if (value_s.empty()) {
    bad_scalar("integer", *node);
  }
  const VersionInfo version = processing_version();
  if (value_s == "0") {
    return Value(std::int64_t{0});
  }

  auto prefixed = [&](int radix, IntBase base) {
    ScalarInt si;
    if (version > VersionInfo{1, 1} && value_s.size() > 2 && value_s[2] == '0') {
      si.width = static_cast<int>(value_s.size() - 2);
    }
    if (underscore) {
      underscore->leading = value_su.size() > 2 && value_su[2] == '_';
      underscore->trailing = value_su.size() > 3 && value_su.back() == '_';
    }
    ScalarInt parsed = int_value(std::string_view(value_s).substr(2), radix, negative, *node);
    si.value = parsed.value;
    si.big = std::move(parsed.big);
    si.base = base;
    si.underscore = underscore;
    si.anchor = scalar_anchor(*node);
    return Value(std::move(si));
  };

  if (value_s.starts_with("0b")) {
    return prefixed(2, IntBase::Binary);
  }
  if (value_s.starts_with("0x")) {
    // the case of the first hex letter decides, lower case without letters
    IntBase base = IntBase::Hex;
    for (char ch : std::string_view(value_s).substr(2)) {
      if (ch >= 'A' && ch <= 'F') {
        base = IntBase::HexCaps;
        break;
      }
      if (ch >= 'a' && ch <= 'f')
        break;
    }
    return prefixed(16, base);
  }
  if (value_s.starts_with("0o")) {
    return prefixed(8, IntBase::Octal);
  }
  auto shaped = [&](ScalarInt si, IntBase base, std::optional<int> width, AnchorRef anchor) {
    si.base = base;
    si.width = width;
    si.underscore = underscore;
    si.anchor = std::move(anchor);
    return Value(std::move(si));
  };

  if (version != VersionInfo{1, 2} && value_s[0] == '0') {
    return shaped(int_value(value_s, 8, negative, *node), IntBase::Octal, std::nullopt, scalar_anchor(*node));
  }
  if (version != VersionInfo{1, 2} && value_s.find(':') != std::string::npos) {
    return Value(sexagesimal_int(value_s, negative, *node));
  }
  if (underscore) {
    // no leading underscore on a decimal
    underscore->trailing = value_su.size() > 1 && value_su.back() == '_';
  }
  if (version > VersionInfo{1, 1} && value_s[0] == '0') {
    // leading zeros, not an octal
    return shaped(int_value(value_s, 10, negative, *node), IntBase::Decimal, static_cast<int>(value_s.size()),
                  nullptr);
  }
  if (underscore || node->anchor) {
    return shaped(int_value(value_s, 10, negative, *node), IntBase::Decimal, std::nullopt, scalar_anchor(*node));
  }
  return Value(int_value(value_s, 10, negative, *node));
}

Value RoundTripConstructor::construct_rt_float(const NodePtr &node) {
  const std::string &value_so = construct_scalar(node);
  std::string value_s = lower(strip_underscores(value_so));
  double sign = 1.0;
  char m_sign = '\0';
  if (!value_s.empty() && value_s[0] == '-') {
    sign = -1.0;
  }
  if (!value_s.empty() && (value_s[0] == '-' || value_s[0] == '+')) {
    m_sign = value_s[0];
    value_s.erase(0, 1);
  }
  if (value_s == ".inf") {
    return Value(sign * std::numeric_limits<double>::infinity());
  }
  if (value_s == ".nan") {
    return Value(std::numeric_limits<double>::quiet_NaN());
  }
  const VersionInfo version = processing_version();
  if (version != VersionInfo{1, 2} && value_s.find(':') != std::string::npos) {
    return Value(sign * sexagesimal_float(value_s, *node));
  }

  ScalarFloat sf;
  bool out_of_range = false;
  sf.value = sign * float_value(value_s, *node, &out_of_range);
  sf.m_sign = m_sign;
  sf.anchor = scalar_anchor(*node);
  if (out_of_range) {
    sf.source = value_so;
  }
  if (std::size_t e = value_so.find_first_of("eE"); e != std::string::npos) {
    std::string_view mantissa = std::string_view(value_so).substr(0, e);
    std::string_view exponent = std::string_view(value_so).substr(e + 1);
    if (version != VersionInfo{1, 2} && mantissa.find('.') == std::string_view::npos) {
      mantissa_no_dot(*node, value_so);
    }
    sf.exp = value_so[e];
    sf.m_lead0 = leading_zeros(mantissa);
    sf.width = static_cast<int>(mantissa.size()) - (m_sign ? 1 : 0);
    sf.prec = find_dot(mantissa);
    sf.e_width = static_cast<int>(exponent.size());
    sf.e_sign = !exponent.empty() && (exponent[0] == '+' || exponent[0] == '-');
    return Value(std::move(sf));
  }
  sf.width = static_cast<int>(value_so.size());
  sf.prec = find_dot(value_so);
  sf.m_lead0 = leading_zeros(value_so);
  return Value(std::move(sf));
}

Value RoundTripConstructor::construct_rt_str(const NodePtr &node) {
  if (node->tag.handle()) {
    // explicitly tagged, e.g. `!!str 42`, keeps its tag
    return construct_unknown(node).value;
  }
  return construct_rt_scalar(node);
}

void RoundTripConstructor::set_collection_style(Format &fa, std::size_t size, const Node &node) {
  if (size == 0)
    return;
  if (node.flow_style == true) {
    fa.set_flow_style();
  } else if (node.flow_style == false) {
    fa.set_block_style();
  }
}

void RoundTripConstructor::construct_rt_sequence(const NodePtr &node, CommentedSeq &seq, bool deep) {
  if (!node->is_sequence()) {
    throw kind_error("sequence", *node);
  }
  attach_node_comment(seq, *node);
  keep_anchor(seq, *node);
  const auto items = node->items;
  for (std::size_t idx = 0; idx < items.size(); ++idx) {
    const NodePtr &child = items[idx];
    if (has_comment(child->comment)) {
      seq.yaml_key_comment_extend(idx, child->comment);
      // moved to the sequence
      child->comment.clear();
    }
    seq.push_back(construct_object(child, deep));
    seq.lc().data[idx] = std::array<std::size_t, 4>{child->start_mark.line, child->start_mark.column, 0, 0};
  }
}

std::vector<MergeEntry> RoundTripConstructor::flatten_rt_mapping(Node &node) {
  // merge sources defined in place are not constructed yet, aliased ones come from the cache
  auto constructed = [this, &node](const NodePtr &value_node) {
    Value value = construct_object(value_node, true);
    if (!value.IsMap()) {
      throw ConstructorError("while constructing a mapping", node.start_mark,
                             std::string("expected a mapping for merging, but found ") +
                                 value_kind_name(value.kind()),
                             value_node->start_mark);
    }
    return map_ptr(value);
  };

  std::vector<MergeEntry> merge_map_list;
  bool merged = false;
  std::size_t index = 0;
  while (index < node.pairs.size()) {
    NodePtr key_node = node.pairs[index].first;
    NodePtr value_node = node.pairs[index].second;
    if (key_node->tag == yaml_tag("merge")) {
      if (merged) {
        if (options_.duplicate_keys == DuplicateKeyPolicy::Allow) {
          node.pairs.erase(node.pairs.begin() + static_cast<std::ptrdiff_t>(index));
          continue;
        }
        report_duplicate("while constructing a mapping", node, "found duplicate key \"" + key_node->value + "\"",
                         *key_node);
      }
      merged = true;
      node.pairs.erase(node.pairs.begin() + static_cast<std::ptrdiff_t>(index));
      if (value_node->is_mapping()) {
        merge_map_list.push_back(MergeEntry{index, constructed(value_node)});
      } else if (value_node->is_sequence()) {
        for (const auto &subnode : value_node->items) {
          if (!subnode->is_mapping()) {
            throw ConstructorError("while constructing a mapping", node.start_mark,
                                   std::string("expected a mapping for merging, but found ") +
                                       node_kind_name(subnode->kind),
                                   subnode->start_mark);
          }
          merge_map_list.push_back(MergeEntry{index, constructed(subnode)});
        }
      } else {
        throw ConstructorError("while constructing a mapping", node.start_mark,
                               std::string("expected a mapping or list of mappings for merging, but found ") +
                                   node_kind_name(value_node->kind),
                               value_node->start_mark);
      }
    } else if (key_node->tag == yaml_tag("value")) {
      key_node->tag = Tag(yaml_tag("str"));
      ++index;
    } else {
      ++index;
    }
  }
  return merge_map_list;
}

void RoundTripConstructor::construct_rt_mapping(const NodePtr &node, const std::shared_ptr<CommentedMap> &mapping,
                                                bool deep) {
  if (!node->is_mapping()) {
    throw kind_error("mapping", *node);
  }
  std::vector<MergeEntry> merge_map = flatten_rt_mapping(*node);
  attach_node_comment(*mapping, *node);
  keep_anchor(*mapping, *node);

  Value last_key;
  bool have_last = false;
  bool last_value_null = false;
  const auto pairs = node->pairs;
  for (const auto &[key_node, value_node] : pairs) {
    // keys can be collections, which must be complete to be hashed
    Value key = mapping_key(*node, *key_node, construct_object(key_node, true), true);
    Value value = construct_object(value_node, deep);
    check_mapping_key(*node, *key_node, *mapping, key, value);

    // an eol comment after an empty value shows up on the key that follows
    if (key_node->comment.size() > 4 && !key_node->comment[4].empty()) {
      CommentSlots comment = key_node->comment;
      if (have_last && last_value_null) {
        comment[0] = comment[4];
        comment.erase(comment.begin() + 4);
        mapping->yaml_value_comment_extend(last_key, comment);
      } else {
        comment[2] = comment[4];
        comment.erase(comment.begin() + 4);
        mapping->yaml_key_comment_extend(key, comment);
      }
      key_node->comment.clear();
    }
    if (has_comment(key_node->comment)) {
      mapping->yaml_key_comment_extend(key, key_node->comment);
    }
    if (has_comment(value_node->comment)) {
      mapping->yaml_value_comment_extend(key, value_node->comment);
    }
    mapping->lc().data[key] = std::array<std::size_t, 4>{key_node->start_mark.line, key_node->start_mark.column,
                                                         value_node->start_mark.line, value_node->start_mark.column};
    mapping->set(key, value);
    last_key = key;
    last_value_null = value.IsNull();
    have_last = true;
  }
  // last, so explicit keys are in place before merged ones are added
  if (!merge_map.empty()) {
    mapping->add_yaml_merge(merge_map);
  }
}

void RoundTripConstructor::construct_setting(const NodePtr &node, CommentedSet &setting, bool deep) {
  if (!node->is_mapping()) {
    throw kind_error("mapping", *node);
  }
  attach_node_comment(setting, *node);
  keep_anchor(setting, *node);
  const auto pairs = node->pairs;
  for (const auto &[key_node, value_node] : pairs) {
    Value key = mapping_key(*node, *key_node, construct_object(key_node, true), false);
    // the value should be null, it is constructed for its errors only
    construct_object(value_node, deep);
    check_set_key(*node, *key_node, setting, key);
    if (has_comment(key_node->comment)) {
      setting.yaml_key_comment_extend(key, key_node->comment);
    }
    if (has_comment(value_node->comment)) {
      setting.yaml_value_comment_extend(key, value_node->comment);
    }
    setting.add(std::move(key));
  }
}

BaseConstructor::Constructed RoundTripConstructor::construct_rt_seq(const NodePtr &node) {
  Value data = Value::seq();
  data.asSequence().lc().line = node->start_mark.line;
  data.asSequence().lc().col = node->start_mark.column;
  return {data, [this, node, data] {
            CommentedSeq &seq = data.asSequence();
            construct_rt_sequence(node, seq);
            set_collection_style(seq.fa(), seq.size(), *node);
          }};
}

BaseConstructor::Constructed RoundTripConstructor::construct_rt_map(const NodePtr &node) {
  Value data = Value::map();
  data.asMap().lc().line = node->start_mark.line;
  data.asMap().lc().col = node->start_mark.column;
  return {data, [this, node, data] {
            construct_rt_mapping(node, map_ptr(data), true);
            set_collection_style(data.asMap().fa(), data.asMap().size(), *node);
          }};
}

BaseConstructor::Constructed RoundTripConstructor::construct_rt_omap(const NodePtr &node) {
  Value data = Value::omap();
  data.asMap().lc().line = node->start_mark.line;
  data.asMap().lc().col = node->start_mark.column;
  set_collection_style(data.asMap().fa(), 1, *node);
  return {data, [this, node, data] {
            CommentedMap &omap = data.asMap();
            attach_node_comment(omap, *node);
            keep_anchor(omap, *node);
            for (const auto &subnode : single_pair_items(node, "while constructing an ordered map")) {
              const auto &[key_node, value_node] = subnode->pairs.front();
              Value key = mapping_key(*node, *key_node, construct_object(key_node, true), true);
              Value value = construct_object(value_node);
              check_mapping_key(*node, *key_node, omap, key, value);
              if (has_comment(key_node->comment)) {
                omap.yaml_key_comment_extend(key, key_node->comment);
              }
              if (has_comment(subnode->comment)) {
                omap.yaml_key_comment_extend(key, subnode->comment);
              }
              if (has_comment(value_node->comment)) {
                omap.yaml_value_comment_extend(key, value_node->comment);
              }
              omap.set(std::move(key), std::move(value));
            }
          }};
}

BaseConstructor::Constructed RoundTripConstructor::construct_rt_set(const NodePtr &node) {
  Value data = Value::set();
  data.asSet().lc().line = node->start_mark.line;
  data.asSet().lc().col = node->start_mark.column;
  return {data, [this, node, data] { construct_setting(node, data.asSet()); }};
}

BaseConstructor::Constructed RoundTripConstructor::construct_unknown(const NodePtr &node) {
  switch (node->kind) {
  case NodeKind::Mapping: {
    Value data = Value::map();
    CommentedMap &m = data.asMap();
    m.lc().line = node->start_mark.line;
    m.lc().col = node->start_mark.column;
    set_collection_style(m.fa(), 1, *node);
    m.yaml_set_tag(node->tag);
    keep_anchor(m, *node);
    return {data, [this, node, data] { construct_rt_mapping(node, map_ptr(data)); }};
  }
  case NodeKind::Scalar: {
    auto tagged = std::make_shared<TaggedScalar>(construct_scalar(node), node->style, node->tag);
    keep_anchor(*tagged, *node, true);
    return {Value(std::move(tagged)), nullptr};
  }
  case NodeKind::Sequence: {
    Value data = Value::seq();
    CommentedSeq &s = data.asSequence();
    s.lc().line = node->start_mark.line;
    s.lc().col = node->start_mark.column;
    set_collection_style(s.fa(), 1, *node);
    s.yaml_set_tag(node->tag);
    keep_anchor(s, *node);
    return {data, [this, node, data] { construct_rt_sequence(node, data.asSequence()); }};
  }
  }
  throw ConstructorError("", std::nullopt, "could not determine a constructor for the tag '" + node->tag.value() + "'",
                         node->start_mark);
}

Value RoundTripConstructor::construct_plain(const NodePtr &node) {
  switch (node->kind) {
  case NodeKind::Scalar:
    return construct_rt_scalar(node);
  case NodeKind::Sequence: {
    Constructed data = construct_rt_seq(node);
    fill_deep(data);
    return data.value;
  }
  case NodeKind::Mapping: {
    Constructed data = construct_rt_map(node);
    fill_deep(data);
    return data.value;
  }
  }
  return Value();
}

} // namespace rtyaml
