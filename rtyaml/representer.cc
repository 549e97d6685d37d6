#include "rtyaml/representer.hh"

#include "llvm/Support/Base64.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace rtyaml {

namespace {

const std::string kNullTag = yaml_tag("null");
const std::string kBoolTag = yaml_tag("bool");
const std::string kIntTag = yaml_tag("int");
const std::string kFloatTag = yaml_tag("float");
const std::string kStrTag = yaml_tag("str");
const std::string kBinaryTag = yaml_tag("binary");
const std::string kTimestampTag = yaml_tag("timestamp");
const std::string kSeqTag = yaml_tag("seq");
const std::string kMapTag = yaml_tag("map");
const std::string kOmapTag = yaml_tag("omap");
const std::string kSetTag = yaml_tag("set");
const std::string kMergeTag = yaml_tag("merge");

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f'; }

double number(const Value &v) {
  if (!v.IsInt()) {
    return v.asDouble();
  }
  const ScalarInt &si = v.asScalarInt();
  return si.is_big() ? std::strtod(si.decimal().c_str(), nullptr) : static_cast<double>(si.value);
}

bool plain_scalar_node(const NodePtr &node) { return node->is_scalar() && node->style == ScalarStyle::Plain; }

void set_anchor(Node &node, const Anchor *anchor) {
  if (anchor) {
    node.anchor = anchor->value;
    node.anchor_always_dump = anchor->always_dump;
  }
}

// Digits of `value` in `base`, zero padded to `width`
std::string zero_padded(std::uint64_t value, int base, bool caps, std::optional<int> width) {
  std::string digits;
  do {
    int d = static_cast<int>(value % static_cast<std::uint64_t>(base));
    digits += static_cast<char>(d < 10 ? '0' + d : (caps ? 'A' : 'a') + d - 10);
    value /= static_cast<std::uint64_t>(base);
  } while (value > 0);
  std::reverse(digits.begin(), digits.end());
  if (width && static_cast<int>(digits.size()) < *width) {
    digits.insert(0, static_cast<std::size_t>(*width) - digits.size(), '0');
  }
  return digits;
}

std::string format_exponent(int e, bool sign, int width) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), sign ? "%+0*d" : "%0*d", width, e);
  return buf;
}

// base64 with a line break after every 76 characters and at the end
std::string encode_lines(const std::string &bytes) {
  std::string encoded = llvm::encodeBase64(bytes);
  std::string text;
  for (std::size_t pos = 0; pos < encoded.size(); pos += 76) {
    text += encoded.substr(pos, 76);
    text += '\n';
  }
  return text;
}

} // namespace

// BaseRepresenter -----------------------------------------------------------

BaseRepresenter::BaseRepresenter(Options options) : options_(std::move(options)) {}

BaseRepresenter::TypeKey BaseRepresenter::type_key(const Value &data) {
  if (const auto *object = std::get_if<HostObject>(&data.data())) {
    return object->type;
  }
  return data.kind();
}

bool BaseRepresenter::ignore_aliases(const Value &) const { return false; }

NodePtr BaseRepresenter::represent(const Value &data) {
  NodePtr node = represent_data(data);
  represented_objects_.clear();
  object_keeper_.clear();
  alias_key_ = nullptr;
  return node;
}

NodePtr BaseRepresenter::represent_data(const Value &data) {
  alias_key_ = ignore_aliases(data) ? nullptr : data.identity();
  const void *key = alias_key_;
  if (key) {
    if (auto it = represented_objects_.find(key); it != represented_objects_.end()) {
      return it->second;
    }
    object_keeper_.push_back(data);
  }
  NodePtr node;
  if (auto it = representers_.find(type_key(data)); it != representers_.end()) {
    node = it->second(*this, data);
  } else if (auto mit = multi_representers_.find(data.kind()); mit != multi_representers_.end()) {
    node = mit->second(*this, data);
  } else if (fallback_) {
    node = fallback_(*this, data);
  } else {
    node = Node::scalar(Tag(), data.str());
  }
  if (key) {
    // representers of host objects may not have registered their node
    represented_objects_.emplace(key, node);
  }
  return node;
}

NodePtr BaseRepresenter::represent_key(const Value &data) { return represent_data(data); }

NodePtr BaseRepresenter::represent_scalar(const std::string &tag, std::string value, std::optional<ScalarStyle> style,
                                          const Anchor *anchor, const CommentRef &block_comment) {
  if (!style) {
    style = options_.default_style;
  }
  NodePtr node = Node::scalar(Tag(tag), std::move(value), style.value_or(ScalarStyle::Plain));
  if (block_comment && (node->style == ScalarStyle::Literal || node->style == ScalarStyle::Folded)) {
    node->comment = {{}, {block_comment}};
  }
  set_anchor(*node, anchor);
  remember(node);
  return node;
}

NodePtr BaseRepresenter::represent_sequence(const Tag &tag, const Value &sequence, std::optional<bool> flow_style) {
  NodePtr node = Node::sequence(tag, flow_style);
  remember(node);
  bool best_style = true;
  for (const auto &item : sequence.asSequence()) {
    NodePtr node_item = represent_data(item);
    if (!plain_scalar_node(node_item)) {
      best_style = false;
    }
    node->items.push_back(node_item);
  }
  if (!flow_style) {
    node->flow_style = best_flow_style(best_style);
  }
  return node;
}

NodePtr BaseRepresenter::represent_omap(const Tag &tag, const Value &omap, std::optional<bool> flow_style) {
  NodePtr node = Node::sequence(tag, flow_style);
  remember(node);
  for (const auto &entry : omap.asMap()) {
    alias_key_ = nullptr;
    node->items.push_back(represent_pairs(Tag(kMapTag), {{entry.key, entry.value}}));
  }
  if (!flow_style) {
    node->flow_style = best_flow_style(true);
  }
  return node;
}

NodePtr BaseRepresenter::represent_mapping(const Tag &tag, const Value &mapping, std::optional<bool> flow_style) {
  std::vector<std::pair<Value, Value>> pairs;
  for (const auto &entry : mapping.asMap()) {
    pairs.emplace_back(entry.key, entry.value);
  }
  if (options_.sort_keys) {
    // keys sort only when all are strings or all are numbers, else the order is kept
    auto all_of = [&pairs](auto pred) {
      return std::all_of(pairs.begin(), pairs.end(), [&](const auto &p) { return pred(p.first); });
    };
    if (all_of([](const Value &k) { return k.IsString(); })) {
      std::stable_sort(pairs.begin(), pairs.end(),
                       [](const auto &a, const auto &b) { return a.first.asString() < b.first.asString(); });
    } else if (all_of([](const Value &k) { return k.IsInt() || k.IsFloat(); })) {
      std::stable_sort(pairs.begin(), pairs.end(),
                       [](const auto &a, const auto &b) { return number(a.first) < number(b.first); });
    }
  }
  return represent_pairs(tag, pairs, flow_style);
}

NodePtr BaseRepresenter::represent_pairs(const Tag &tag, const std::vector<std::pair<Value, Value>> &pairs,
                                         std::optional<bool> flow_style) {
  NodePtr node = Node::mapping(tag, flow_style);
  remember(node);
  bool best_style = true;
  for (const auto &[key, value] : pairs) {
    NodePtr node_key = represent_key(key);
    NodePtr node_value = represent_data(value);
    if (!plain_scalar_node(node_key) || !plain_scalar_node(node_value)) {
      best_style = false;
    }
    node->pairs.emplace_back(node_key, node_value);
  }
  if (!flow_style) {
    node->flow_style = best_flow_style(best_style);
  }
  return node;
}

// SafeRepresenter -----------------------------------------------------------

SafeRepresenter::SafeRepresenter(Options options) : BaseRepresenter(std::move(options)) {
  add_representer(ValueKind::Null, bind(&SafeRepresenter::represent_none));
  add_representer(ValueKind::String, bind(&SafeRepresenter::represent_str));
  add_representer(ValueKind::Binary, bind(&SafeRepresenter::represent_binary));
  add_representer(ValueKind::Bool, bind(&SafeRepresenter::represent_bool));
  add_representer(ValueKind::Int, bind(&SafeRepresenter::represent_int));
  add_representer(ValueKind::Float, bind(&SafeRepresenter::represent_float));
  add_representer(ValueKind::Sequence, bind(&SafeRepresenter::represent_list));
  add_representer(ValueKind::Mapping, bind(&SafeRepresenter::represent_dict));
  add_representer(ValueKind::Set, bind(&SafeRepresenter::represent_set));
  add_representer(ValueKind::Timestamp, bind(&SafeRepresenter::represent_datetime));
  set_fallback_representer(bind(&SafeRepresenter::represent_undefined));
}

bool SafeRepresenter::ignore_aliases(const Value &data) const { return data.IsNull() || data.IsScalar(); }

NodePtr SafeRepresenter::represent_none(const Value &) { return represent_scalar(kNullTag, "null"); }

NodePtr SafeRepresenter::represent_str(const Value &data) { return represent_scalar(kStrTag, data.asString()); }

NodePtr SafeRepresenter::represent_binary(const Value &data) {
  return represent_scalar(kBinaryTag, encode_lines(data.asBinary().bytes), ScalarStyle::Literal);
}

NodePtr SafeRepresenter::represent_bool(const Value &data) {
  return represent_scalar(kBoolTag, options_.boolean_representation[data.asBool() ? 1 : 0]);
}

NodePtr SafeRepresenter::represent_int(const Value &data) {
  return represent_scalar(kIntTag, data.asScalarInt().decimal());
}

std::string SafeRepresenter::float_text(double d) const {
  std::string value = float_repr(d);
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
  if (use_version_1_1() && value.find('.') == std::string::npos) {
    if (auto e = value.find('e'); e != std::string::npos) {
      value.replace(e, 1, ".0e");
    }
  }
  return value;
}

NodePtr SafeRepresenter::represent_float(const Value &data) {
  return represent_scalar(kFloatTag, float_text(data.asDouble()));
}

NodePtr SafeRepresenter::represent_list(const Value &data) {
  const auto &tag = data.asSequence().tag();
  return represent_sequence(tag && !tag->empty() ? *tag : Tag(kSeqTag), data);
}

NodePtr SafeRepresenter::represent_dict(const Value &data) {
  if (data.IsOrderedMap()) {
    return represent_omap(Tag(kOmapTag), data);
  }
  return represent_mapping(Tag(kMapTag), data);
}

NodePtr SafeRepresenter::represent_set(const Value &data) {
  std::vector<std::pair<Value, Value>> pairs;
  for (const auto &member : data.asSet().members()) {
    pairs.emplace_back(member, Value());
  }
  return represent_pairs(Tag(kSetTag), pairs);
}

NodePtr SafeRepresenter::represent_datetime(const Value &data) {
  TimeStamp ts = data.asTimestamp();
  if (ts.has_time) {
    ts.separator = " ";
    ts.tz_separator.clear();
    if (!ts.fraction.empty()) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "%06d", ts.microsecond());
      ts.fraction = buf;
    }
    if (ts.tz == "Z" || ts.tz == "z") {
      ts.tz = "+00:00";
    }
  }
  return represent_scalar(kTimestampTag, ts.str());
}

NodePtr SafeRepresenter::represent_undefined(const Value &data) {
  throw RepresenterError("cannot represent an object: " + data.str());
}

// RoundTripRepresenter ------------------------------------------------------

RoundTripRepresenter::RoundTripRepresenter(Options options) : SafeRepresenter(std::move(options)) {
  add_representer(ValueKind::Null, bind(&RoundTripRepresenter::represent_none));
  add_representer(ValueKind::String, bind(&RoundTripRepresenter::represent_scalar_string));
  add_representer(ValueKind::Bool, bind(&RoundTripRepresenter::represent_scalar_bool));
  add_representer(ValueKind::Int, bind(&RoundTripRepresenter::represent_scalar_int));
  add_representer(ValueKind::Float, bind(&RoundTripRepresenter::represent_scalar_float));
  add_representer(ValueKind::Sequence, bind(&RoundTripRepresenter::represent_rt_list));
  add_representer(ValueKind::Mapping, bind(&RoundTripRepresenter::represent_rt_dict));
  add_representer(ValueKind::Set, bind(&RoundTripRepresenter::represent_rt_set));
  add_representer(ValueKind::Tagged, bind(&RoundTripRepresenter::represent_tagged_scalar));
  add_representer(ValueKind::Timestamp, bind(&RoundTripRepresenter::represent_rt_datetime));
}

bool RoundTripRepresenter::ignore_aliases(const Value &data) const {
  if (data.anchor()) {
    return false;
  }
  return SafeRepresenter::ignore_aliases(data);
}

NodePtr RoundTripRepresenter::represent_none(const Value &) {
  if (represented_objects_.empty() && !options_.explicit_start) {
    return represent_scalar(kNullTag, "null");
  }
  return represent_scalar(kNullTag, "");
}

NodePtr RoundTripRepresenter::represent_scalar_string(const Value &data) {
  const ScalarString &s = data.asScalarString();
  const Anchor *anchor = data.anchor();
  switch (s.style) {
  case ScalarStyle::Literal:
    return represent_scalar(kStrTag, s.value, ScalarStyle::Literal, anchor, s.comment);
  case ScalarStyle::Folded: {
    std::string value = s.value;
    for (auto it = s.fold_pos.rbegin(); it != s.fold_pos.rend(); ++it) {
      std::size_t pos = *it;
      if (pos > 0 && pos + 1 < value.size() && value[pos] == ' ' && !is_space(value[pos - 1]) &&
          !is_space(value[pos + 1])) {
        value.insert(pos, 1, '\a');
      }
    }
    return represent_scalar(kStrTag, std::move(value), ScalarStyle::Folded, anchor, s.comment);
  }
  case ScalarStyle::SingleQuoted:
  case ScalarStyle::DoubleQuoted:
    return represent_scalar(kStrTag, s.value, s.style, anchor);
  default:
    if (anchor) {
      return represent_scalar(kStrTag, s.value, ScalarStyle::Plain, anchor);
    }
    return represent_str(data);
  }
}

NodePtr RoundTripRepresenter::represent_scalar_bool(const Value &data) {
  return represent_scalar(kBoolTag, options_.boolean_representation[data.asBool() ? 1 : 0], std::nullopt,
                          data.anchor());
}

NodePtr RoundTripRepresenter::insert_underscore(const std::string &prefix, std::string digits,
                                                const std::optional<Underscore> &underscore, const Anchor *anchor) {
  if (underscore) {
    if (underscore->group > 0) {
      auto pos = static_cast<std::ptrdiff_t>(digits.size()) - underscore->group;
      while (pos > 0) {
        digits.insert(static_cast<std::size_t>(pos), 1, '_');
        pos -= underscore->group;
      }
    }
    if (underscore->leading) {
      digits.insert(0, 1, '_');
    }
    if (underscore->trailing) {
      digits += '_';
    }
  }
  return represent_scalar(kIntTag, prefix + digits, std::nullopt, anchor);
}

NodePtr RoundTripRepresenter::represent_scalar_int(const Value &data) {
  const ScalarInt &si = data.asScalarInt();
  const bool negative = si.value < 0;
  const std::uint64_t magnitude =
      negative ? static_cast<std::uint64_t>(-(si.value + 1)) + 1 : static_cast<std::uint64_t>(si.value);
  std::string sign = negative ? "-" : "";
  std::string prefix;
  std::string digits;
  std::optional<int> width = si.width;
  auto padded = [&](int base, bool caps) {
    if (!si.is_big()) {
      return zero_padded(magnitude, base, caps, width);
    }
    std::string big = convert_digits(si.big, 10, base, caps);
    if (width && static_cast<int>(big.size()) < *width) {
      big.insert(0, static_cast<std::size_t>(*width) - big.size(), '0');
    }
    return big;
  };
  switch (si.base) {
  case IntBase::Binary:
    prefix = "0b";
    digits = padded(2, false);
    break;
  case IntBase::Octal:
    prefix = use_version_1_1() ? "0" : "0o";
    digits = padded(8, false);
    break;
  case IntBase::Hex:
    prefix = "0x";
    digits = padded(16, false);
    break;
  case IntBase::HexCaps:
    prefix = "0x";
    digits = padded(16, true);
    break;
  default:
    // the sign counts toward the width of a decimal
    if (width && negative) {
      *width -= 1;
    }
    digits = padded(10, false);
    break;
  }
  return insert_underscore(sign + prefix, std::move(digits), si.underscore, data.anchor());
}

NodePtr RoundTripRepresenter::represent_scalar_float(const Value &data) {
  const ScalarFloat &f = data.asScalarFloat();
  const Anchor *anchor = data.anchor();
  const double v = f.value;
  if (!f.source.empty()) {
    return represent_scalar(kFloatTag, f.source, std::nullopt, anchor);
  }
  if (std::isnan(v) || std::isinf(v) || !f.width) {
    return represent_scalar(kFloatTag, float_text(v), std::nullopt, anchor);
  }
  const int width = *f.width;
  const std::string ms = f.m_sign ? std::string(1, f.m_sign) : "";
  std::string value;
  char buf[512];
  if (!f.exp && f.prec > 0 && f.prec == width - 1) {
    // trailing dot
    std::snprintf(buf, sizeof(buf), "%lld.", std::llabs(static_cast<long long>(std::trunc(v))));
    value = ms + buf;
  } else if (!f.exp) {
    const int w = std::max(0, width - static_cast<int>(ms.size()));
    if (f.prec < 0) {
      std::snprintf(buf, sizeof(buf), "%0*lld", w, std::llabs(static_cast<long long>(std::trunc(v))));
      value = ms + buf;
    } else {
      std::snprintf(buf, sizeof(buf), "%0*.*f", w, std::max(0, width - f.prec - 1), std::fabs(v));
      value = ms + buf;
      if (f.prec == 0 || (f.prec == 1 && !ms.empty())) {
        if (auto pos = value.find("0."); pos != std::string::npos) {
          value.erase(pos, 1);
        }
      }
    }
    while (static_cast<int>(value.size()) < width) {
      value += '0';
    }
  } else {
    std::snprintf(buf, sizeof(buf), "%*.*e", width, width + (f.m_sign ? 1 : 0), v);
    std::string formatted = buf;
    std::size_t epos = formatted.find('e');
    std::string m = formatted.substr(0, epos);
    int e = std::atoi(formatted.c_str() + epos + 1);
    std::size_t w = static_cast<std::size_t>(f.prec > 0 ? width : width + 1);
    if (v < 0) {
      w += 1;
    }
    m = m.substr(0, w);
    std::size_t dot = m.find('.');
    std::string m1 = m.substr(0, dot);
    std::string m2 = dot == std::string::npos ? "" : m.substr(dot + 1);
    while (static_cast<int>(m1.size() + m2.size()) < width - (f.prec >= 0 ? 1 : 0)) {
      m2 += '0';
    }
    if (f.m_sign && v > 0) {
      m1 = "+" + m1;
    }
    const std::string exp(1, f.exp);
    if (f.prec < 0) {
      // mantissa without dot
      if (m2 != "0") {
        e -= static_cast<int>(m2.size());
      } else {
        m2.clear();
      }
      while (static_cast<int>(m1.size() + m2.size()) - (f.m_sign ? 1 : 0) < width) {
        m2 += '0';
        e -= 1;
      }
      value = m1 + m2 + exp + format_exponent(e, f.e_sign, f.e_width);
    } else if (f.prec == 0) {
      // mantissa with trailing dot
      e -= static_cast<int>(m2.size());
      value = m1 + m2 + "." + exp + format_exponent(e, f.e_sign, f.e_width);
    } else {
      if (f.m_lead0 > 0) {
        m2 = std::string(static_cast<std::size_t>(f.m_lead0 - 1), '0') + m1 + m2;
        m1 = "0";
        const auto lead0 = static_cast<std::size_t>(f.m_lead0);
        m2 = m2.size() > lead0 ? m2.substr(0, m2.size() - lead0) : "";
        e += f.m_lead0;
      }
      while (static_cast<int>(m1.size()) < f.prec) {
        m1 += m2.empty() ? '0' : m2[0];
        if (!m2.empty()) {
          m2.erase(0, 1);
        }
        e -= 1;
      }
      value = m1 + "." + m2 + exp + format_exponent(e, f.e_sign, f.e_width);
    }
  }
  return represent_scalar(kFloatTag, value, std::nullopt, anchor);
}

NodePtr RoundTripRepresenter::represent_rt_datetime(const Value &data) {
  return represent_scalar(kTimestampTag, data.asTimestamp().str());
}

NodePtr RoundTripRepresenter::represent_tagged_scalar(const Value &data) {
  const TaggedScalar &t = data.asTagged();
  return represent_scalar(t.tag().value(), t.value(), t.style(), t.yaml_anchor());
}

Tag RoundTripRepresenter::collection_tag(const std::optional<Tag> &tag, std::string_view standard) {
  if (!tag || tag->empty()) {
    return Tag(yaml_tag(standard));
  }
  // tags read from a document are expanded already, `!!x` arrives as `tag:yaml.org,2002:x`
  return Tag(tag->value());
}

NodePtr RoundTripRepresenter::represent_rt_list(const Value &data) {
  return represent_sequence(collection_tag(data.asSequence().tag(), "seq"), data);
}

NodePtr RoundTripRepresenter::represent_rt_dict(const Value &data) {
  if (data.IsOrderedMap()) {
    return represent_omap(collection_tag(data.asMap().tag(), "omap"), data);
  }
  return represent_mapping(collection_tag(data.asMap().tag(), "map"), data);
}

void RoundTripRepresenter::merge_comments(Node &node, CommentSlots comments) {
  for (std::size_t idx = 0; idx < comments.size() && idx < node.comment.size(); ++idx) {
    if (!node.comment[idx].empty()) {
      comments[idx] = node.comment[idx];
    }
  }
  node.comment = std::move(comments);
}

NodePtr RoundTripRepresenter::represent_key(const Value &data) {
  if (data.IsSequence() && data.asSequence().frozen()) {
    alias_key_ = nullptr;
    return represent_sequence(Tag(kSeqTag), data, true);
  }
  if (data.IsMap() && data.asMap().frozen()) {
    alias_key_ = nullptr;
    return represent_mapping(Tag(kMapTag), data, true);
  }
  return SafeRepresenter::represent_key(data);
}

NodePtr RoundTripRepresenter::represent_sequence(const Tag &tag, const Value &sequence,
                                                 std::optional<bool> flow_style) {
  const CommentedSeq &seq = sequence.asSequence();
  flow_style = seq.fa().flow_style(flow_style);
  NodePtr node = Node::sequence(tag, flow_style);
  set_anchor(*node, seq.yaml_anchor());
  remember(node);
  node->comment = node_comments(seq);
  bool best_style = true;
  for (std::size_t idx = 0; idx < seq.size(); ++idx) {
    NodePtr node_item = represent_data(seq[idx]);
    if (auto it = seq.ca().items.find(idx); it != seq.ca().items.end()) {
      merge_comments(*node_item, it->second);
    }
    if (!plain_scalar_node(node_item)) {
      best_style = false;
    }
    node->items.push_back(node_item);
  }
  if (!flow_style) {
    if (!seq.empty() && options_.default_flow_style) {
      node->flow_style = options_.default_flow_style;
    } else {
      node->flow_style = best_style;
    }
  }
  return node;
}

NodePtr RoundTripRepresenter::represent_mapping(const Tag &tag, const Value &mapping,
                                                std::optional<bool> flow_style) {
  const CommentedMap &map = mapping.asMap();
  flow_style = map.fa().flow_style(flow_style);
  NodePtr node = Node::mapping(tag, flow_style);
  set_anchor(*node, map.yaml_anchor());
  remember(node);
  node->comment = node_comments(map);
  const auto &item_comments = map.ca().items;

  const auto &merge = map.merge();
  std::vector<std::pair<Value, Value>> items;
  if (!merge.empty()) {
    items = map.non_merged_items();
  } else {
    for (const auto &entry : map) {
      items.emplace_back(entry.key, entry.value);
    }
  }
  bool best_style = true;
  for (const auto &[key, value] : items) {
    NodePtr node_key = represent_key(key);
    NodePtr node_value = represent_data(value);
    if (auto it = item_comments.find(key); it != item_comments.end()) {
      const CommentSlots &ic = it->second;
      node_key->comment = {comment_slot(ic, 0), comment_slot(ic, 1)};
      if (!node_value->comment.empty()) {
        node_value->comment.resize(std::max<std::size_t>(node_value->comment.size(), 2));
        node_value->comment[0] = comment_slot(ic, 2);
        // a block scalar keeps its header comment unless the item has comments after the value
        const CommentGroup &post = comment_slot(ic, 3);
        const CommentRef header = comment_at(node_value->comment, 1);
        if (!post.empty() || !header || !header->block_header) {
          node_value->comment[1] = post;
        }
      } else {
        node_value->comment = {comment_slot(ic, 2), comment_slot(ic, 3)};
      }
    }
    if (!plain_scalar_node(node_key) || !plain_scalar_node(node_value)) {
      best_style = false;
    }
    node->pairs.emplace_back(node_key, node_value);
  }
  if (!flow_style) {
    if ((!items.empty() || !merge.empty()) && options_.default_flow_style) {
      node->flow_style = options_.default_flow_style;
    } else {
      node->flow_style = best_style;
    }
  }
  if (!merge.empty()) {
    // representing the merged maps here marks their anchors as used
    NodePtr arg;
    if (merge.size() == 1) {
      arg = represent_data(Value(merge.front().map));
    } else {
      Value maps = Value::seq();
      for (const auto &m : merge) {
        maps.asSequence().push_back(Value(m.map));
      }
      arg = represent_data(maps);
      arg->flow_style = true;
    }
    std::size_t pos = std::min(merge.front().position, node->pairs.size());
    node->pairs.insert(node->pairs.begin() + static_cast<std::ptrdiff_t>(pos),
                       NodePair{Node::scalar(Tag(kMergeTag), "<<"), arg});
  }
  return node;
}

NodePtr RoundTripRepresenter::represent_omap(const Tag &tag, const Value &omap, std::optional<bool> flow_style) {
  const CommentedMap &map = omap.asMap();
  flow_style = map.fa().flow_style(flow_style);
  NodePtr node = Node::sequence(tag, flow_style);
  set_anchor(*node, map.yaml_anchor());
  remember(node);
  node->comment = node_comments(map);
  for (const auto &entry : map) {
    alias_key_ = nullptr;
    NodePtr node_key = represent_key(entry.key);
    NodePtr node_value = represent_data(entry.value);
    NodePtr node_item = Node::mapping(Tag(kMapTag));
    node_item->flow_style = best_flow_style(plain_scalar_node(node_key) && plain_scalar_node(node_value));
    if (auto it = map.ca().items.find(entry.key); it != map.ca().items.end()) {
      const CommentSlots &ic = it->second;
      if (!comment_slot(ic, 1).empty()) {
        node_item->comment = {{}, comment_slot(ic, 1)};
      }
      node_key->comment = {comment_slot(ic, 0), {}};
      if (!node_value->comment.empty()) {
        node_value->comment.resize(std::max<std::size_t>(node_value->comment.size(), 2));
        node_value->comment[0] = comment_slot(ic, 2);
        node_value->comment[1] = comment_slot(ic, 3);
      } else {
        node_value->comment = {comment_slot(ic, 2), comment_slot(ic, 3)};
      }
    }
    node_item->pairs.emplace_back(node_key, node_value);
    node->items.push_back(node_item);
  }
  if (!flow_style) {
    node->flow_style = best_flow_style(true);
  }
  return node;
}

NodePtr RoundTripRepresenter::represent_rt_set(const Value &data) {
  const CommentedSet &setting = data.asSet();
  const std::optional<bool> flow_style = setting.fa().flow_style(false);
  NodePtr node = Node::mapping(Tag(kSetTag), flow_style);
  set_anchor(*node, setting.yaml_anchor());
  remember(node);
  node->comment = node_comments(setting);
  for (const auto &member : setting.members()) {
    NodePtr node_key = represent_key(member);
    NodePtr node_value = represent_data(Value());
    if (auto it = setting.ca().items.find(member); it != setting.ca().items.end()) {
      node_key->comment = {comment_slot(it->second, 0), comment_slot(it->second, 1)};
    }
    node_key->style = ScalarStyle::ExplicitKey;
    node_value->style = flow_style.value_or(false) ? ScalarStyle::SetValue : ScalarStyle::ExplicitKey;
    node->pairs.emplace_back(node_key, node_value);
  }
  return node;
}

} // namespace rtyaml
