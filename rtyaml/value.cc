#include "rtyaml/value.hh"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace rtyaml {

const char *value_kind_name(ValueKind kind) noexcept {
  switch (kind) {
  case ValueKind::Null:
    return "null";
  case ValueKind::Bool:
    return "bool";
  case ValueKind::Int:
    return "integer";
  case ValueKind::Float:
    return "float";
  case ValueKind::String:
    return "string";
  case ValueKind::Timestamp:
    return "timestamp";
  case ValueKind::Binary:
    return "binary";
  case ValueKind::Sequence:
    return "sequence";
  case ValueKind::Mapping:
    return "map";
  case ValueKind::Set:
    return "set";
  case ValueKind::Tagged:
    return "tagged scalar";
  case ValueKind::Object:
    return "object";
  }
  return "unknown";
}

std::string convert_digits(std::string_view digits, int from_radix, int to_radix, bool caps) {
  std::vector<int> number;
  for (char c : digits) {
    int d = -1;
    if (c >= '0' && c <= '9') {
      d = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      d = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      d = c - 'A' + 10;
    }
    if (d < 0 || d >= from_radix) {
      throw RangeError("invalid digit '" + std::string(1, c) + "' in base " + std::to_string(from_radix));
    }
    if (!number.empty() || d != 0) {
      number.push_back(d);
    }
  }
  // long division by the target radix, one output digit per pass
  std::string out;
  while (!number.empty()) {
    std::vector<int> quotient;
    int remainder = 0;
    for (int d : number) {
      remainder = remainder * from_radix + d;
      int q = remainder / to_radix;
      remainder %= to_radix;
      if (!quotient.empty() || q != 0) {
        quotient.push_back(q);
      }
    }
    out += static_cast<char>(remainder < 10 ? '0' + remainder : (caps ? 'A' : 'a') + remainder - 10);
    number = std::move(quotient);
  }
  if (out.empty()) {
    return "0";
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::string ScalarInt::decimal() const {
  if (big.empty()) {
    return std::to_string(value);
  }
  return value < 0 ? "-" + big : big;
}

std::string float_repr(double d) {
  if (std::isnan(d))
    return ".nan";
  if (std::isinf(d))
    return d > 0 ? ".inf" : "-.inf";
  // shortest round-trip digits, laid out fixed for exponents in [-4, 16) and scientific otherwise
  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
  if (ec != std::errc())
    return "0.0";
  std::string sci(buf, end);
  std::size_t e = sci.find('e');
  int exponent = std::stoi(sci.substr(e + 1));
  std::string sign;
  std::string digits;
  for (std::size_t i = 0; i < e; ++i) {
    if (sci[i] == '-')
      sign = "-";
    else if (sci[i] != '.')
      digits += sci[i];
  }
  if (exponent < -4 || exponent >= 16) {
    std::string s = sign + digits.substr(0, 1);
    if (digits.size() > 1) {
      s += '.';
      s += digits.substr(1);
    }
    char ebuf[16];
    std::snprintf(ebuf, sizeof(ebuf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
    return s + ebuf;
  }
  if (exponent < 0) {
    return sign + "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
  }
  const std::size_t int_digits = static_cast<std::size_t>(exponent) + 1;
  if (digits.size() <= int_digits) {
    return sign + digits + std::string(int_digits - digits.size(), '0') + ".0";
  }
  return sign + digits.substr(0, int_digits) + "." + digits.substr(int_digits);
}

std::string TimeStamp::str() const {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  std::string s(buf);
  if (!has_time)
    return s;
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", hour, minute, second);
  s += separator;
  s += buf;
  if (!fraction.empty()) {
    s += '.';
    s += fraction;
  }
  if (!tz.empty()) {
    s += tz_separator;
    s += tz;
  }
  return s;
}

int TimeStamp::microsecond() const noexcept {
  int us = 0;
  for (std::size_t i = 0; i < 6; ++i) {
    us = us * 10 + (i < fraction.size() ? fraction[i] - '0' : 0);
  }
  if (fraction.size() > 6 && fraction[6] > '4' && us < 999999) {
    ++us;
  }
  return us;
}

Value::Value(std::shared_ptr<CommentedSeq> v) : data_(std::move(v)) {}
Value::Value(std::shared_ptr<CommentedMap> v) : data_(std::move(v)) {}
Value::Value(std::shared_ptr<CommentedSet> v) : data_(std::move(v)) {}
Value::Value(std::shared_ptr<TaggedScalar> v) : data_(std::move(v)) {}

Value Value::seq() { return Value(std::make_shared<CommentedSeq>()); }
Value Value::map() { return Value(std::make_shared<CommentedMap>()); }
Value Value::omap() { return Value(std::make_shared<CommentedMap>(true)); }
Value Value::set() { return Value(std::make_shared<CommentedSet>()); }

bool Value::IsOrderedMap() const noexcept {
  auto m = std::get_if<std::shared_ptr<CommentedMap>>(&data_);
  return m && (*m)->ordered();
}

std::size_t Value::size() const noexcept {
  switch (kind()) {
  case ValueKind::Sequence:
    return std::get<std::shared_ptr<CommentedSeq>>(data_)->size();
  case ValueKind::Mapping:
    return std::get<std::shared_ptr<CommentedMap>>(data_)->size();
  case ValueKind::Set:
    return std::get<std::shared_ptr<CommentedSet>>(data_)->size();
  default:
    return 0;
  }
}

bool Value::asBool() const { return asScalarBool().value; }
std::int64_t Value::asInt64() const {
  const ScalarInt &si = asScalarInt();
  if (si.is_big()) {
    throw RangeError("integer " + si.decimal() + " does not fit in 64 bits");
  }
  return si.value;
}

std::uint64_t Value::asUInt64() const {
  const ScalarInt &si = asScalarInt();
  if (si.value < 0) {
    throw RangeError("negative integer " + si.decimal() + " is not unsigned");
  }
  if (!si.is_big()) {
    return static_cast<std::uint64_t>(si.value);
  }
  std::uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(si.big.data(), si.big.data() + si.big.size(), v);
  if (ec != std::errc() || ptr != si.big.data() + si.big.size()) {
    throw RangeError("integer " + si.big + " does not fit in 64 bits");
  }
  return v;
}
double Value::asDouble() const { return asScalarFloat().value; }
const std::string &Value::asString() const { return asScalarString().value; }

namespace {

template <typename T> const T &scalar_as(const Value::Data &data, ValueKind kind, const char *expected) {
  if (auto v = std::get_if<T>(&data)) {
    return *v;
  }
  throw TypeError(std::string("Expected ") + expected + " value, got " + value_kind_name(kind));
}

template <typename T> T &shared_as(const Value::Data &data, ValueKind kind, const char *expected) {
  if (auto v = std::get_if<std::shared_ptr<T>>(&data)) {
    return **v;
  }
  throw TypeError(std::string("Expected ") + expected + " value, got " + value_kind_name(kind));
}

void hash_combine(std::size_t &seed, std::size_t h) { seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2); }

} // namespace

const ScalarBool &Value::asScalarBool() const { return scalar_as<ScalarBool>(data_, kind(), "bool"); }
const ScalarInt &Value::asScalarInt() const { return scalar_as<ScalarInt>(data_, kind(), "integer"); }
const ScalarFloat &Value::asScalarFloat() const { return scalar_as<ScalarFloat>(data_, kind(), "float"); }
const ScalarString &Value::asScalarString() const { return scalar_as<ScalarString>(data_, kind(), "string"); }
const TimeStamp &Value::asTimestamp() const { return scalar_as<TimeStamp>(data_, kind(), "timestamp"); }
const Binary &Value::asBinary() const { return scalar_as<Binary>(data_, kind(), "binary"); }

CommentedSeq &Value::asSequence() const { return shared_as<CommentedSeq>(data_, kind(), "sequence"); }
CommentedMap &Value::asMap() const { return shared_as<CommentedMap>(data_, kind(), "map"); }
CommentedSet &Value::asSet() const { return shared_as<CommentedSet>(data_, kind(), "set"); }
TaggedScalar &Value::asTagged() const { return shared_as<TaggedScalar>(data_, kind(), "tagged"); }

const Value &Value::operator[](const char *key) const { return (*this)[Value(std::string_view(key))]; }

const Value &Value::operator[](const std::string &key) const { return (*this)[Value(std::string_view(key))]; }

const Value &Value::operator[](std::string_view key) const { return (*this)[Value(key)]; }

const Value &Value::operator[](const Value &key) const { return asMap().at(key); }

const Value &Value::item(std::size_t index) const { return asSequence()[index]; }

bool Value::contains(const Value &key) const {
  switch (kind()) {
  case ValueKind::Mapping:
    return asMap().get(key) != nullptr;
  case ValueKind::Set:
    return asSet().contains(key);
  default:
    throw TypeError(std::string("Expected map value, got ") + value_kind_name(kind()));
  }
}

const Anchor *Value::anchor() const noexcept {
  auto of = [](const AnchorRef &a) -> const Anchor * { return a && !a->empty() ? a.get() : nullptr; };
  switch (kind()) {
  case ValueKind::Bool:
    return of(std::get<ScalarBool>(data_).anchor);
  case ValueKind::Int:
    return of(std::get<ScalarInt>(data_).anchor);
  case ValueKind::Float:
    return of(std::get<ScalarFloat>(data_).anchor);
  case ValueKind::String:
    return of(std::get<ScalarString>(data_).anchor);
  case ValueKind::Sequence:
    return std::get<std::shared_ptr<CommentedSeq>>(data_)->yaml_anchor();
  case ValueKind::Mapping:
    return std::get<std::shared_ptr<CommentedMap>>(data_)->yaml_anchor();
  case ValueKind::Set:
    return std::get<std::shared_ptr<CommentedSet>>(data_)->yaml_anchor();
  case ValueKind::Tagged:
    return std::get<std::shared_ptr<TaggedScalar>>(data_)->yaml_anchor();
  case ValueKind::Object:
    return of(std::get<HostObject>(data_).anchor);
  default:
    return nullptr;
  }
}

void Value::yaml_set_anchor(std::string name, bool always_dump) {
  auto anchor = std::make_shared<Anchor>(Anchor{std::move(name), always_dump});
  switch (kind()) {
  case ValueKind::Bool:
    std::get<ScalarBool>(data_).anchor = anchor;
    break;
  case ValueKind::Int:
    std::get<ScalarInt>(data_).anchor = anchor;
    break;
  case ValueKind::Float:
    std::get<ScalarFloat>(data_).anchor = anchor;
    break;
  case ValueKind::String:
    std::get<ScalarString>(data_).anchor = anchor;
    break;
  case ValueKind::Sequence:
    asSequence().yaml_set_anchor(anchor->value, always_dump);
    break;
  case ValueKind::Mapping:
    asMap().yaml_set_anchor(anchor->value, always_dump);
    break;
  case ValueKind::Set:
    asSet().yaml_set_anchor(anchor->value, always_dump);
    break;
  case ValueKind::Tagged:
    asTagged().yaml_set_anchor(anchor->value, always_dump);
    break;
  case ValueKind::Object:
    std::get<HostObject>(data_).anchor = anchor;
    break;
  default:
    throw TypeError(std::string("Cannot anchor a ") + value_kind_name(kind()) + " value");
  }
}

const void *Value::identity() const noexcept {
  switch (kind()) {
  case ValueKind::Bool:
    return std::get<ScalarBool>(data_).anchor.get();
  case ValueKind::Int:
    return std::get<ScalarInt>(data_).anchor.get();
  case ValueKind::Float:
    return std::get<ScalarFloat>(data_).anchor.get();
  case ValueKind::String:
    return std::get<ScalarString>(data_).anchor.get();
  case ValueKind::Sequence:
    return std::get<std::shared_ptr<CommentedSeq>>(data_).get();
  case ValueKind::Mapping:
    return std::get<std::shared_ptr<CommentedMap>>(data_).get();
  case ValueKind::Set:
    return std::get<std::shared_ptr<CommentedSet>>(data_).get();
  case ValueKind::Tagged:
    return std::get<std::shared_ptr<TaggedScalar>>(data_).get();
  case ValueKind::Object:
    return std::get<HostObject>(data_).ptr.get();
  default:
    return nullptr;
  }
}

bool Value::operator==(const Value &other) const {
  if (kind() != other.kind())
    return false;
  switch (kind()) {
  case ValueKind::Null:
    return true;
  case ValueKind::Bool:
    return asBool() == other.asBool();
  case ValueKind::Int:
    return asScalarInt().value == other.asScalarInt().value && asScalarInt().big == other.asScalarInt().big;
  case ValueKind::Float:
    return asDouble() == other.asDouble();
  case ValueKind::String:
    return asString() == other.asString();
  case ValueKind::Timestamp: {
    const TimeStamp &a = asTimestamp(), &b = other.asTimestamp();
    return a.year == b.year && a.month == b.month && a.day == b.day && a.has_time == b.has_time && a.hour == b.hour &&
           a.minute == b.minute && a.second == b.second && a.microsecond() == b.microsecond() && a.tz == b.tz;
  }
  case ValueKind::Binary:
    return asBinary().bytes == other.asBinary().bytes;
  case ValueKind::Sequence: {
    if (identity() == other.identity())
      return true;
    const CommentedSeq &a = asSequence(), &b = other.asSequence();
    return a.items() == b.items();
  }
  case ValueKind::Mapping: {
    if (identity() == other.identity())
      return true;
    const CommentedMap &a = asMap(), &b = other.asMap();
    if (a.size() != b.size())
      return false;
    if (a.ordered() && b.ordered()) {
      return std::equal(a.begin(), a.end(), b.begin(),
                        [](const auto &x, const auto &y) { return x.key == y.key && x.value == y.value; });
    }
    for (const auto &e : a) {
      auto it = b.find_entry(e.key);
      if (!it || !(*it == e.value))
        return false;
    }
    return true;
  }
  case ValueKind::Set: {
    if (identity() == other.identity())
      return true;
    const CommentedSet &a = asSet(), &b = other.asSet();
    if (a.size() != b.size())
      return false;
    for (const auto &m : a.members()) {
      if (!b.contains(m))
        return false;
    }
    return true;
  }
  case ValueKind::Tagged: {
    const TaggedScalar &a = asTagged(), &b = other.asTagged();
    return a.tag() == b.tag() && a.value() == b.value();
  }
  case ValueKind::Object:
    return identity() == other.identity();
  }
  return false;
}

std::size_t Value::hash() const {
  std::size_t seed = static_cast<std::size_t>(kind());
  switch (kind()) {
  case ValueKind::Null:
    break;
  case ValueKind::Bool:
    hash_combine(seed, std::hash<bool>{}(asBool()));
    break;
  case ValueKind::Int:
    hash_combine(seed, std::hash<std::int64_t>{}(asScalarInt().value));
    hash_combine(seed, std::hash<std::string>{}(asScalarInt().big));
    break;
  case ValueKind::Float:
    hash_combine(seed, std::hash<double>{}(asDouble()));
    break;
  case ValueKind::String:
    hash_combine(seed, std::hash<std::string>{}(asString()));
    break;
  case ValueKind::Timestamp:
    hash_combine(seed, std::hash<std::string>{}(asTimestamp().str()));
    break;
  case ValueKind::Binary:
    hash_combine(seed, std::hash<std::string>{}(asBinary().bytes));
    break;
  case ValueKind::Sequence:
    for (const auto &v : asSequence()) {
      hash_combine(seed, v.hash());
    }
    break;
  case ValueKind::Mapping: {
    // order independent
    std::size_t sum = 0;
    for (const auto &e : asMap()) {
      std::size_t h = e.key.hash();
      hash_combine(h, e.value.hash());
      sum += h;
    }
    hash_combine(seed, sum);
    break;
  }
  case ValueKind::Set: {
    std::size_t sum = 0;
    for (const auto &m : asSet().members()) {
      sum += m.hash();
    }
    hash_combine(seed, sum);
    break;
  }
  case ValueKind::Tagged:
    hash_combine(seed, std::hash<std::string>{}(asTagged().value()));
    break;
  case ValueKind::Object:
    hash_combine(seed, std::hash<const void *>{}(identity()));
    break;
  }
  return seed;
}

std::string Value::str() const {
  switch (kind()) {
  case ValueKind::Null:
    return "None";
  case ValueKind::Bool:
    return asBool() ? "True" : "False";
  case ValueKind::Int:
    return asScalarInt().decimal();
  case ValueKind::Float:
    return float_repr(asDouble());
  case ValueKind::String:
    return asString();
  case ValueKind::Timestamp:
    return asTimestamp().str();
  case ValueKind::Binary:
    return "<binary of " + std::to_string(asBinary().bytes.size()) + " bytes>";
  case ValueKind::Sequence: {
    std::string s = "[";
    for (const auto &v : asSequence()) {
      if (s.size() > 1)
        s += ", ";
      s += v.str();
    }
    return s + "]";
  }
  case ValueKind::Mapping: {
    std::string s = "{";
    for (const auto &e : asMap()) {
      if (s.size() > 1)
        s += ", ";
      s += e.key.str() + ": " + e.value.str();
    }
    return s + "}";
  }
  case ValueKind::Set: {
    std::string s = "{";
    for (const auto &m : asSet().members()) {
      if (s.size() > 1)
        s += ", ";
      s += m.str();
    }
    return s + "}";
  }
  case ValueKind::Tagged:
    return asTagged().value();
  case ValueKind::Object:
    return "<object>";
  }
  return "";
}

// CommentedSeq

std::shared_ptr<CommentedSeq> CommentedSeq::frozen_copy() const {
  auto copy = std::make_shared<CommentedSeq>(items_);
  copy_attributes(*copy);
  copy->frozen_ = true;
  return copy;
}

namespace {

// A plain string assigned over a styled one takes over its style
Value keep_string_style(const Value &old, Value v) {
  if (old.IsString() && v.IsString()) {
    const ScalarString &o = old.asScalarString();
    const ScalarString &n = v.asScalarString();
    if (n.style == ScalarStyle::Plain && !n.anchor && o.style != ScalarStyle::Plain) {
      return Value::string(n.value, o.style);
    }
  }
  return v;
}

} // namespace

void CommentedSeq::set(std::size_t idx, Value v) {
  check_mutable();
  if (idx >= items_.size())
    throw RangeError("Index out of range");
  items_[idx] = keep_string_style(items_[idx], std::move(v));
}

void CommentedSeq::insert(std::size_t idx, Value v) {
  check_mutable();
  if (idx > items_.size()) {
    idx = items_.size();
  }
  items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(idx), std::move(v));
  std::map<std::size_t, CommentSlots> moved;
  for (auto &[i, slots] : ca_.items) {
    moved.emplace(i >= idx ? i + 1 : i, std::move(slots));
  }
  ca_.items = std::move(moved);
}

void CommentedSeq::erase(std::size_t idx) {
  check_mutable();
  if (idx >= items_.size())
    throw RangeError("Index out of range");
  items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(idx));
  ca_.items.erase(idx);
  std::map<std::size_t, CommentSlots> moved;
  for (auto &[i, slots] : ca_.items) {
    moved.emplace(i > idx ? i - 1 : i, std::move(slots));
  }
  ca_.items = std::move(moved);
}

void CommentedSeq::sort(const std::function<bool(const Value &, const Value &)> &less) {
  check_mutable();
  std::vector<std::size_t> order(items_.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) { return less(items_[a], items_[b]); });
  std::vector<Value> sorted;
  sorted.reserve(items_.size());
  std::map<std::size_t, CommentSlots> moved;
  for (std::size_t i = 0; i < order.size(); ++i) {
    sorted.push_back(items_[order[i]]);
    auto it = ca_.items.find(order[i]);
    if (it != ca_.items.end()) {
      moved.emplace(i, it->second);
    }
  }
  items_ = std::move(sorted);
  ca_.items = std::move(moved);
}

std::optional<std::size_t> CommentedSeq::comment_column(std::size_t idx) const {
  std::optional<std::size_t> sel;
  if (idx > 0 && ca_.items.count(idx - 1)) {
    sel = idx - 1;
  } else if (ca_.items.count(idx + 1)) {
    sel = idx + 1;
  } else {
    for (std::size_t i = 0; i < idx && i < items_.size(); ++i) {
      if (ca_.items.count(i)) {
        sel = i;
      }
    }
  }
  if (!sel)
    return std::nullopt;
  CommentRef c = comment_at(ca_.items.at(*sel), 0);
  return c ? c->column() : 0;
}

void CommentedSeq::yaml_add_eol_comment(std::string comment, std::size_t idx, std::optional<std::size_t> column) {
  if (!column) {
    column = comment_column(idx);
  }
  item_slots(idx)[0] = {eol_comment(std::move(comment), column)};
}

// CommentedMap

std::shared_ptr<CommentedMap> CommentedMap::frozen_copy() const {
  auto copy = std::make_shared<CommentedMap>(ordered_);
  copy->items_ = items_;
  copy->own_ = own_;
  copy->merge_ = merge_;
  copy_attributes(*copy);
  copy->frozen_ = true;
  return copy;
}

const Value *CommentedMap::find_entry(const Value &key) const {
  auto it = items_.find(key);
  return it == items_.end() ? nullptr : &it->value;
}

const Value *CommentedMap::get(const Value &key) const {
  if (const Value *v = find_entry(key))
    return v;
  for (const auto &m : merge_) {
    if (const Value *v = m.map->get(key))
      return v;
  }
  return nullptr;
}

const Value &CommentedMap::at(const Value &key) const {
  if (const Value *v = get(key))
    return *v;
  throw KeyError("Key not found: " + key.str());
}

void CommentedMap::set(Value key, Value value) {
  check_mutable();
  if (const Value *old = find_entry(key)) {
    value = keep_string_style(*old, std::move(value));
  }
  own_.insert(key);
  items_.insert_or_assign(key, std::move(value));
  notify_referents(key);
}

void CommentedMap::insert(std::size_t pos, Value key, Value value, std::string comment) {
  check_mutable();
  own_.insert(key);
  items_.insert(pos, key, std::move(value));
  notify_referents(key);
  if (!comment.empty()) {
    yaml_add_eol_comment(std::move(comment), key);
  }
}

bool CommentedMap::erase(const Value &key) {
  check_mutable();
  if (!items_.contains(key))
    return false;
  own_.erase(key);
  update_key_value(key);
  notify_referents(key);
  return true;
}

std::vector<std::pair<Value, Value>> CommentedMap::non_merged_items() const {
  std::vector<std::pair<Value, Value>> out;
  for (const auto &e : items_) {
    if (own_.count(e.key)) {
      out.emplace_back(e.key, e.value);
    }
  }
  return out;
}

void CommentedMap::add_yaml_merge(const std::vector<MergeEntry> &maps) {
  for (const auto &m : maps) {
    m.map->add_referent(shared_from_this());
    for (const auto &e : *m.map) {
      if (!items_.contains(e.key)) {
        items_.insert_or_assign(e.key, e.value);
      }
    }
  }
  merge_.insert(merge_.end(), maps.begin(), maps.end());
}

void CommentedMap::add_referent(const std::shared_ptr<CommentedMap> &map) {
  for (const auto &r : ref_) {
    if (r.lock() == map)
      return;
  }
  ref_.push_back(map);
}

void CommentedMap::update_key_value(const Value &key) {
  if (own_.count(key))
    return;
  for (const auto &m : merge_) {
    if (const Value *v = m.map->get(key)) {
      items_.insert_or_assign(key, *v);
      return;
    }
  }
  items_.erase(key);
}

void CommentedMap::notify_referents(const Value &key) {
  for (const auto &r : ref_) {
    if (auto map = r.lock()) {
      map->update_key_value(key);
    }
  }
}

std::optional<std::size_t> CommentedMap::comment_column(const Value &key) const {
  const std::size_t pos = items_.position(key);
  std::optional<Value> sel;
  if (pos > 0 && pos <= items_.size() && ca_.items.count(items_.nth_entry(pos - 1).key)) {
    sel = items_.nth_entry(pos - 1).key;
  } else if (pos + 1 < items_.size() && ca_.items.count(items_.nth_entry(pos + 1).key)) {
    sel = items_.nth_entry(pos + 1).key;
  } else {
    for (std::size_t i = 0; i < pos && i < items_.size(); ++i) {
      if (ca_.items.count(items_.nth_entry(i).key)) {
        sel = items_.nth_entry(i).key;
      }
    }
  }
  if (!sel)
    return std::nullopt;
  CommentRef c = comment_at(ca_.items.at(*sel), 2);
  return c ? c->column() : 0;
}

void CommentedMap::yaml_add_eol_comment(std::string comment, const Value &key, std::optional<std::size_t> column) {
  if (!column) {
    column = comment_column(key);
  }
  item_slots(key)[2] = {eol_comment(std::move(comment), column)};
}

// CommentedSet

std::vector<Value> CommentedSet::members() const {
  std::vector<Value> out;
  out.reserve(items_.size());
  for (const auto &e : items_) {
    out.push_back(e.key);
  }
  return out;
}

// dump_comments

namespace {

void dump_slots(std::ostream &os, const CommentSlots &slots) {
  os << "[";
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (i)
      os << ", ";
    if (slots[i].empty()) {
      os << "None";
      continue;
    }
    os << "[";
    for (std::size_t j = 0; j < slots[i].size(); ++j) {
      if (j)
        os << ", ";
      const std::string &text = slots[i][j]->value;
      os << "'";
      for (char c : text) {
        if (c == '\n')
          os << "\\n";
        else
          os << c;
      }
      os << "'@" << slots[i][j]->column();
    }
    os << "]";
  }
  os << "]";
}

template <typename K> void dump_ca(std::ostream &os, const Comment<K> &ca) {
  os << "Comment(comment=";
  dump_slots(os, ca.comment);
  os << ", items={";
  bool first = true;
  for (const auto &[k, slots] : ca.items) {
    if (!first)
      os << ", ";
    first = false;
    if constexpr (std::is_same_v<K, Value>) {
      os << k.str();
    } else {
      os << k;
    }
    os << ": ";
    dump_slots(os, slots);
  }
  os << "}";
  if (!ca.end.empty()) {
    os << ", end=";
    dump_slots(os, CommentSlots{ca.end});
  }
  os << ")\n";
}

} // namespace

void dump_comments(std::ostream &os, const Value &v, const std::string &name) {
  if (v.IsMap()) {
    const CommentedMap &m = v.asMap();
    if (!name.empty())
      os << name << " map\n";
    dump_ca(os, m.ca());
    for (const auto &e : m) {
      dump_comments(os, e.value, name.empty() ? e.key.str() : name + "." + e.key.str());
    }
  } else if (v.IsSequence()) {
    const CommentedSeq &s = v.asSequence();
    if (!name.empty())
      os << name << " seq\n";
    dump_ca(os, s.ca());
    for (std::size_t i = 0; i < s.size(); ++i) {
      dump_comments(os, s[i], name.empty() ? std::to_string(i) : name + "." + std::to_string(i));
    }
  }
}

} // namespace rtyaml
