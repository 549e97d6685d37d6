#pragma once

#include "./comment.hh"
#include "./iopd.hh"
#include "./tag.hh"
#include "./tokens.hh"

#include <array>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace rtyaml {

class TypeError : public Exception {
public:
  using Exception::Exception;
};

class RangeError : public Exception {
public:
  using Exception::Exception;
};

class KeyError : public Exception {
public:
  using Exception::Exception;
};

// Anchor name to write on dump, `always_dump` writes it even when nothing aliases the value
struct Anchor {
  std::string value;
  bool always_dump = false;

  bool empty() const noexcept { return value.empty(); }
};

// Copies of an anchored scalar share the Anchor, which is what makes them one value for aliasing
using AnchorRef = std::shared_ptr<Anchor>;

// Digit grouping of an integer as written: a group size counted from the right, plus a leading
// and/or trailing underscore
struct Underscore {
  int group = 0;
  bool leading = false;
  bool trailing = false;

  bool operator==(const Underscore &) const = default;
};

struct ScalarBool {
  bool value = false;
  AnchorRef anchor;
};

enum class IntBase { Decimal, Binary, Octal, Hex, HexCaps };

struct ScalarInt {
  std::int64_t value = 0;
  IntBase base = IntBase::Decimal;
  std::optional<int> width; // zero padded digit count
  std::optional<Underscore> underscore;
  AnchorRef anchor;
  // Decimal digits of the magnitude when the integer is beyond the int64 range, `value` then
  // holds the int64 bound on the same side
  std::string big;

  bool is_big() const noexcept { return !big.empty(); }
  // Signed decimal text
  std::string decimal() const;
};

// Digits of a non-negative integer of any size, converted between radixes 2 to 16.
// Leading zeros are dropped, zero comes out as "0".
std::string convert_digits(std::string_view digits, int from_radix, int to_radix, bool caps = false);

// A float with the shape it was written in, a plain float has no width
struct ScalarFloat {
  double value = 0.0;
  std::optional<int> width; // mantissa characters without the sign
  int prec = 0;             // position of the dot in the mantissa, -1 without dot
  char m_sign = '\0';       // '+' or '-' when written
  int m_lead0 = 0;          // leading zeros of the mantissa
  char exp = '\0';          // 'e' or 'E' when an exponent was written
  int e_width = 0;          // exponent digits including its sign
  bool e_sign = false;      // exponent written with a sign
  std::optional<Underscore> underscore;
  AnchorRef anchor;
  std::string source;       // text of a literal beyond the double range, written back as is
};

// A string with its presentation: plain, quoted, literal or folded
struct ScalarString {
  std::string value;
  ScalarStyle style = ScalarStyle::Plain;
  CommentRef comment;                // block scalar header comment
  std::vector<std::size_t> fold_pos; // folded: where the source folded a space into a line break
  AnchorRef anchor;
};

// A timestamp as written, no timezone conversion is applied
struct TimeStamp {
  int year = 0;
  int month = 1;
  int day = 1;
  bool has_time = false;
  int hour = 0;
  int minute = 0;
  int second = 0;
  std::string fraction;         // digits after the dot, as written
  std::string separator = "T";  // "T", "t" or the blanks between date and time
  std::string tz;               // "Z", "+01:00", "-5", or empty
  std::string tz_separator;     // blanks between time and tz

  // ISO-ish text that reads back into the same fields
  std::string str() const;
  int microsecond() const noexcept;
};

struct Binary {
  std::string bytes;
};

class Value;
class CommentedSeq;
class CommentedMap;
class CommentedSet;
class TaggedScalar;

// A host object of a registered class, dumped through its registered representer
struct HostObject {
  std::type_index type;
  std::shared_ptr<void> ptr;
  AnchorRef anchor;
};

enum class ValueKind { Null, Bool, Int, Float, String, Timestamp, Binary, Sequence, Mapping, Set, Tagged, Object };

const char *value_kind_name(ValueKind kind) noexcept;

// Shortest text that reads back as `d`: `.inf`, `-.inf`, `.nan`, else always with a dot or exponent
std::string float_repr(double d);

// A loaded value, or one to be dumped
//
// Scalars are held by value. Collections, tagged scalars and host objects are shared: copying a
// Value copies the handle, so a document that aliases one node yields the same collection at each
// path, and a dump of it writes one anchor and aliases for the rest. A collection that contains
// itself is a reference cycle and is not freed until one of its edges is removed.
//
// Equality and hashing look at the data only, never at comments, styles, anchors or positions.
// Booleans never equal integers, integers never equal floats.
class Value {
public:
  using Data = std::variant<std::monostate, ScalarBool, ScalarInt, ScalarFloat, ScalarString, TimeStamp, Binary,
                            std::shared_ptr<CommentedSeq>, std::shared_ptr<CommentedMap>,
                            std::shared_ptr<CommentedSet>, std::shared_ptr<TaggedScalar>, HostObject>;

private:
  Data data_;

public:
  Value() = default;
  Value(std::nullptr_t) {}
  explicit Value(bool b) : data_(ScalarBool{b, nullptr}) {}
  explicit Value(int i) : data_(ScalarInt{i}) {}
  explicit Value(std::int64_t i) : data_(ScalarInt{i}) {}
  explicit Value(double d) : data_(ScalarFloat{d}) {}
  Value(std::string s) : data_(ScalarString{std::move(s)}) {}
  Value(std::string_view s) : data_(ScalarString{std::string(s)}) {}
  Value(const char *s) : data_(ScalarString{std::string(s)}) {}

  explicit Value(ScalarBool v) : data_(std::move(v)) {}
  explicit Value(ScalarInt v) : data_(std::move(v)) {}
  explicit Value(ScalarFloat v) : data_(std::move(v)) {}
  explicit Value(ScalarString v) : data_(std::move(v)) {}
  explicit Value(TimeStamp v) : data_(std::move(v)) {}
  explicit Value(Binary v) : data_(std::move(v)) {}
  explicit Value(std::shared_ptr<CommentedSeq> v);
  explicit Value(std::shared_ptr<CommentedMap> v);
  explicit Value(std::shared_ptr<CommentedSet> v);
  explicit Value(std::shared_ptr<TaggedScalar> v);
  explicit Value(HostObject v) : data_(std::move(v)) {}

  // Fresh empty collections
  static Value seq();
  static Value map();
  static Value omap();
  static Value set();

  // A string with a presentation, e.g. Value::string("text\n", ScalarStyle::Literal)
  static Value string(std::string s, ScalarStyle style) { return Value(ScalarString{std::move(s), style}); }

  template <typename T> static Value object(std::shared_ptr<T> obj) {
    return Value(HostObject{std::type_index(typeid(T)), std::static_pointer_cast<void>(std::move(obj)), nullptr});
  }

  const Data &data() const noexcept { return data_; }
  ValueKind kind() const noexcept { return static_cast<ValueKind>(data_.index()); }

  bool IsNull() const noexcept { return kind() == ValueKind::Null; }
  bool IsBool() const noexcept { return kind() == ValueKind::Bool; }
  bool IsInt() const noexcept { return kind() == ValueKind::Int; }
  bool IsFloat() const noexcept { return kind() == ValueKind::Float; }
  bool IsString() const noexcept { return kind() == ValueKind::String; }
  bool IsTimestamp() const noexcept { return kind() == ValueKind::Timestamp; }
  bool IsBinary() const noexcept { return kind() == ValueKind::Binary; }
  bool IsSequence() const noexcept { return kind() == ValueKind::Sequence; }
  bool IsMap() const noexcept { return kind() == ValueKind::Mapping; }
  bool IsSet() const noexcept { return kind() == ValueKind::Set; }
  bool IsTagged() const noexcept { return kind() == ValueKind::Tagged; }
  bool IsObject() const noexcept { return kind() == ValueKind::Object; }
  bool IsScalar() const noexcept { return !IsNull() && kind() <= ValueKind::Binary; }
  bool IsOrderedMap() const noexcept;

  // Number of items of a collection, 0 for anything else
  std::size_t size() const noexcept;

  bool asBool() const;
  // Throws RangeError for an integer beyond the int64 range
  std::int64_t asInt64() const;
  // Throws RangeError for a negative integer or one beyond the uint64 range
  std::uint64_t asUInt64() const;
  int asInt() const { return static_cast<int>(asInt64()); }
  double asDouble() const;
  const std::string &asString() const;

  const ScalarBool &asScalarBool() const;
  const ScalarInt &asScalarInt() const;
  const ScalarFloat &asScalarFloat() const;
  const ScalarString &asScalarString() const;
  const TimeStamp &asTimestamp() const;
  const Binary &asBinary() const;

  // Collections are shared, so these hand out the mutable collection even from a const handle
  CommentedSeq &asSequence() const;
  CommentedMap &asMap() const;
  CommentedSet &asSet() const;
  TaggedScalar &asTagged() const;

  template <typename T> T &asObject() const {
    if (auto o = std::get_if<HostObject>(&data_); o && o->type == std::type_index(typeid(T))) {
      return *static_cast<T *>(o->ptr.get());
    }
    throw TypeError(std::string("Expected object of registered class, got ") + value_kind_name(kind()));
  }

  // Mapping lookup, merged keys included. Throws KeyError when absent.
  const Value &operator[](const char *key) const;
  const Value &operator[](const std::string &key) const;
  const Value &operator[](std::string_view key) const;
  const Value &operator[](const Value &key) const;
  // Sequence indexing. Throws RangeError when out of range or negative.
  template <typename I, typename = std::enable_if_t<std::is_integral_v<I> && !std::is_same_v<I, bool>>>
  const Value &operator[](I index) const {
    if constexpr (std::is_signed_v<I>) {
      if (index < 0) {
        throw RangeError("Index out of range");
      }
    }
    return item(static_cast<std::size_t>(index));
  }
  const Value &item(std::size_t index) const;

  bool contains(const Value &key) const;

  // Anchor of this value, null when it has none
  const Anchor *anchor() const noexcept;
  // Set the anchor name, for scalars this gives the value an identity shared by its copies
  void yaml_set_anchor(std::string name, bool always_dump = false);

  // Address shared by all handles of the same collection, anchored scalar or host object,
  // null for values without identity
  const void *identity() const noexcept;

  bool operator==(const Value &other) const;

  std::size_t hash() const;

  // Short text for messages: scalars as their text, collections in flow notation
  std::string str() const;
};

struct ValueHash {
  std::size_t operator()(const Value &v) const { return v.hash(); }
};

using ValueSet = std::unordered_set<Value, ValueHash>;

// Container for comment items: per-index for sequences, per-key for mappings and sets
template <typename K, typename T> struct item_map {
  using type = std::map<K, T>;
};
template <typename T> struct item_map<Value, T> {
  using type = std::unordered_map<Value, T, ValueHash>;
};

// Comments attached to a collection
//
// `comment` holds the collection's own [eol, pre] slots, `items` the slots of each item
// (mappings: [key-eol, key-pre, value-eol, value-post], sequences: [eol, pre]) and `end` the
// comments following the last item.
template <typename K> struct Comment {
  CommentSlots comment;
  typename item_map<K, CommentSlots>::type items;
  CommentGroup end;

  // Whether `text` occurs in any attached comment
  bool contains(std::string_view text) const {
    auto in_group = [&](const CommentGroup &group) {
      for (const auto &c : group) {
        if (c && c->value.find(text) != std::string::npos)
          return true;
      }
      return false;
    };
    for (const auto &group : comment) {
      if (in_group(group))
        return true;
    }
    for (const auto &[_, slots] : items) {
      for (const auto &group : slots) {
        if (in_group(group))
          return true;
      }
    }
    return in_group(end);
  }
};

// Flow or block style requested for a collection
class Format {
private:
  std::optional<bool> flow_style_;

public:
  void set_flow_style() noexcept { flow_style_ = true; }
  void set_block_style() noexcept { flow_style_ = false; }

  // The requested style, or `fallback` when none was set
  std::optional<bool> flow_style(std::optional<bool> fallback = std::nullopt) const noexcept {
    return flow_style_ ? flow_style_ : fallback;
  }
};

// Source positions of a collection and its items, 0-based
template <typename K> struct LineCol {
  std::optional<std::size_t> line;
  std::optional<std::size_t> col;
  // mappings: key line, key col, value line, value col; sequences: line, col
  typename item_map<K, std::array<std::size_t, 4>>::type data;

  using Position = std::pair<std::size_t, std::size_t>;

  std::optional<Position> key(const K &k) const { return at(k, 0); }
  std::optional<Position> value(const K &k) const { return at(k, 2); }
  std::optional<Position> item(const K &k) const { return at(k, 0); }

private:
  std::optional<Position> at(const K &k, std::size_t pos) const {
    auto it = data.find(k);
    if (it == data.end())
      return std::nullopt;
    return Position{it->second[pos], it->second[pos + 1]};
  }
};

// Side tables shared by all round-trip collections
//
// None of them take part in equality.
template <typename K> class CommentedBase {
protected:
  Comment<K> ca_;
  Format fa_;
  LineCol<K> lc_;
  Anchor anchor_;
  std::optional<Tag> tag_;

  // Comment for a new eol comment on `key`: '# ' is prefixed when missing
  static CommentRef eol_comment(std::string comment, std::optional<std::size_t> column) {
    if (comment.empty() || comment[0] != '#') {
      comment = "# " + comment;
    }
    if (!column) {
      comment = " " + comment;
      column = 0;
    }
    return make_comment(std::move(comment), Mark::at_column(*column));
  }

public:
  Comment<K> &ca() noexcept { return ca_; }
  const Comment<K> &ca() const noexcept { return ca_; }
  Format &fa() noexcept { return fa_; }
  const Format &fa() const noexcept { return fa_; }
  LineCol<K> &lc() noexcept { return lc_; }
  const LineCol<K> &lc() const noexcept { return lc_; }

  const Anchor *yaml_anchor() const noexcept { return anchor_.empty() ? nullptr : &anchor_; }
  void yaml_set_anchor(std::string value, bool always_dump = false) {
    anchor_.value = std::move(value);
    anchor_.always_dump = always_dump;
  }

  const std::optional<Tag> &tag() const noexcept { return tag_; }
  void yaml_set_tag(Tag tag) { tag_ = std::move(tag); }

  void yaml_end_comment_extend(const CommentGroup &comment, bool clear = false) {
    if (clear) {
      ca_.end.clear();
    }
    ca_.end.insert(ca_.end.end(), comment.begin(), comment.end());
  }

  // Key slots of `key` from [eol, pre] of `comment`
  void yaml_key_comment_extend(const K &key, const CommentSlots &comment, bool clear = false) {
    CommentSlots &r = item_slots(key);
    if (clear || r[1].empty()) {
      r[1] = comment_slot(comment, 1);
    } else {
      const CommentGroup &eol = comment_slot(comment, 0);
      r[1].insert(r[1].end(), eol.begin(), eol.end());
    }
    r[0] = comment_slot(comment, 0);
  }

  // Value slots of `key` from [eol, post] of `comment`
  void yaml_value_comment_extend(const K &key, const CommentSlots &comment, bool clear = false) {
    CommentSlots &r = item_slots(key);
    if (clear || r[3].empty()) {
      r[3] = comment_slot(comment, 1);
    } else {
      const CommentGroup &eol = comment_slot(comment, 0);
      r[3].insert(r[3].end(), eol.begin(), eol.end());
    }
    r[2] = comment_slot(comment, 0);
  }

  // Replace the comment lines before the collection, one `# ` prefixed line per line of `comment`
  void yaml_set_start_comment(std::string comment, std::size_t indent = 0) {
    if (ca_.comment.size() < 2) {
      ca_.comment.resize(2);
    }
    CommentGroup &pre = ca_.comment[1];
    pre.clear();
    if (!comment.empty() && comment.back() == '\n') {
      comment.pop_back();
    }
    std::size_t start = 0;
    while (true) {
      std::size_t nl = comment.find('\n', start);
      std::string line = comment.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
      std::size_t first = line.find_first_not_of(" \t");
      if (first != std::string::npos && line[first] != '#') {
        line = "# " + line;
      }
      pre.push_back(make_comment(line + "\n", Mark::at_column(indent)));
      if (nl == std::string::npos)
        break;
      start = nl + 1;
    }
  }

  // Comment lines before `key` at `indent`, and after its key line at `after_indent`
  // (indent + 2 by default). A `before` of "\n" inserts a blank line.
  void yaml_set_comment_before_after_key(const K &key, std::optional<std::string> before = std::nullopt,
                                         std::size_t indent = 0, std::optional<std::string> after = std::nullopt,
                                         std::optional<std::size_t> after_indent = std::nullopt) {
    auto comment_token = [](const std::string &s, std::size_t column) {
      return make_comment((s.empty() ? "" : "# ") + s + "\n", Mark::at_column(column));
    };
    auto lines = [](std::string s) {
      std::vector<std::string> out;
      std::size_t start = 0;
      while (true) {
        std::size_t nl = s.find('\n', start);
        out.push_back(s.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
        if (nl == std::string::npos)
          return out;
        start = nl + 1;
      }
    };
    if (!after_indent) {
      after_indent = indent + 2;
    }
    if (before && before->size() > 1 && before->back() == '\n') {
      before->pop_back();
    }
    if (after && !after->empty() && after->back() == '\n') {
      after->pop_back();
    }
    CommentSlots &c = item_slots(key);
    if (before) {
      if (*before == "\n") {
        c[1].push_back(comment_token("", indent));
      } else {
        for (const auto &line : lines(*before)) {
          c[1].push_back(comment_token(line, indent));
        }
      }
    }
    if (after && !after->empty()) {
      for (const auto &line : lines(*after)) {
        c[3].push_back(comment_token(line, *after_indent));
      }
    }
  }

protected:
  CommentSlots &item_slots(const K &key) {
    CommentSlots &r = ca_.items[key];
    if (r.size() < 4) {
      r.resize(4);
    }
    return r;
  }

  void copy_attributes(CommentedBase &to) const {
    to.ca_ = ca_;
    to.fa_ = fa_;
    to.lc_ = lc_;
    to.anchor_ = anchor_;
    to.tag_ = tag_;
  }
};

// A round-trip sequence
//
// A frozen sequence stands for a sequence used as a mapping key and refuses mutation.
class CommentedSeq : public CommentedBase<std::size_t> {
private:
  std::vector<Value> items_;
  bool frozen_ = false;

  void check_mutable() const {
    if (frozen_)
      throw TypeError("CommentedKeySeq objects are immutable");
  }

public:
  CommentedSeq() = default;
  explicit CommentedSeq(std::vector<Value> items) : items_(std::move(items)) {}

  bool frozen() const noexcept { return frozen_; }
  // An immutable copy with the same side tables
  std::shared_ptr<CommentedSeq> frozen_copy() const;

  std::size_t size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }
  auto begin() const noexcept { return items_.begin(); }
  auto end() const noexcept { return items_.end(); }
  const std::vector<Value> &items() const noexcept { return items_; }

  const Value &operator[](std::size_t idx) const {
    if (idx >= items_.size())
      throw RangeError("Index out of range");
    return items_[idx];
  }

  void push_back(Value v) {
    check_mutable();
    items_.push_back(std::move(v));
  }

  // Replace an item, a plain string keeps the presentation of the string it replaces
  void set(std::size_t idx, Value v);

  // Comments of the items at and after `idx` move along
  void insert(std::size_t idx, Value v);
  void erase(std::size_t idx);

  // Stable sort by `less`, item comments follow their items
  void sort(const std::function<bool(const Value &, const Value &)> &less);

  // Add an eol comment to item `idx`, aligned with a neighbouring item's comment unless `column` is given
  void yaml_add_eol_comment(std::string comment, std::size_t idx, std::optional<std::size_t> column = std::nullopt);

private:
  std::optional<std::size_t> comment_column(std::size_t idx) const;
};

// A mapping position and the map that a `<<` merge key pulled in
struct MergeEntry {
  std::size_t position;
  std::shared_ptr<CommentedMap> map;
};

// A round-trip mapping
//
// Keys keep their document order. Keys pulled in by `<<` merges live in the same order but are
// not own keys: they are skipped by non_merged_items(), and removing an own key that shadows a
// merged one brings the merged value back. Maps merged into others know their referents, so
// changes to them show in the maps that merged them.
//
// An ordered map (`!!omap`) dumps as a sequence of single-pair mappings. A frozen map stands for
// a mapping used as a key and refuses mutation.
class CommentedMap : public CommentedBase<Value>, public std::enable_shared_from_this<CommentedMap> {
public:
  using Storage = iopd<Value, Value, ValueHash>;

private:
  Storage items_;
  ValueSet own_;
  std::vector<MergeEntry> merge_;
  std::vector<std::weak_ptr<CommentedMap>> ref_;
  bool ordered_ = false;
  bool frozen_ = false;

  void check_mutable() const {
    if (frozen_)
      throw TypeError("CommentedKeyMap objects are immutable");
  }

public:
  CommentedMap() = default;
  explicit CommentedMap(bool ordered) : ordered_(ordered) {}

  bool ordered() const noexcept { return ordered_; }
  bool frozen() const noexcept { return frozen_; }
  std::shared_ptr<CommentedMap> frozen_copy() const;

  std::size_t size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }
  Storage::const_iterator begin() const noexcept { return items_.begin(); }
  Storage::const_iterator end() const noexcept { return items_.end(); }

  bool contains(const Value &key) const { return items_.contains(key); }
  bool contains_own(const Value &key) const { return own_.count(key) > 0; }

  // The stored value of `key` without the merge fallback, null when absent
  const Value *find_entry(const Value &key) const;
  // The value of `key`, falling back to merged maps, null when absent
  const Value *get(const Value &key) const;
  // As get() but throws KeyError
  const Value &at(const Value &key) const;

  // Set an own key, a plain string keeps the presentation of the string it replaces
  void set(Value key, Value value);

  // Insert at `pos`, with an eol comment when `comment` is not empty
  void insert(std::size_t pos, Value key, Value value, std::string comment = "");

  // Remove an own key; a merged value for it comes back. Returns false when `key` was absent.
  bool erase(const Value &key);

  // Own keys and their values, in order
  std::vector<std::pair<Value, Value>> non_merged_items() const;

  const std::vector<MergeEntry> &merge() const noexcept { return merge_; }

  // Pull in the keys of `maps` that are not present yet
  void add_yaml_merge(const std::vector<MergeEntry> &maps);
  void add_referent(const std::shared_ptr<CommentedMap> &map);
  // Re-derive a non-own key from the merged maps after a change
  void update_key_value(const Value &key);

  // Add an eol comment to the value of `key`, aligned with a neighbouring comment unless `column` is given
  void yaml_add_eol_comment(std::string comment, const Value &key, std::optional<std::size_t> column = std::nullopt);

private:
  std::optional<std::size_t> comment_column(const Value &key) const;
  void notify_referents(const Value &key);
};

// A round-trip `!!set`, members keep their order
class CommentedSet : public CommentedBase<Value> {
private:
  iopd<Value, bool, ValueHash> items_;

public:
  std::size_t size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }

  bool contains(const Value &v) const { return items_.contains(v); }
  void add(Value v) { items_.insert_or_assign(std::move(v), true); }
  void discard(const Value &v) { items_.erase(v); }

  std::vector<Value> members() const;

  void yaml_add_eol_comment(std::string comment, const Value &key, std::optional<std::size_t> column = std::nullopt) {
    yaml_value_comment_extend(key, {{eol_comment(std::move(comment), column)}, {}});
  }
};

// A scalar with a tag that has no constructor
class TaggedScalar {
private:
  std::string value_;
  ScalarStyle style_;
  Tag tag_;
  Anchor anchor_;

public:
  TaggedScalar(std::string value, ScalarStyle style, Tag tag)
      : value_(std::move(value)), style_(style), tag_(std::move(tag)) {}

  const std::string &value() const noexcept { return value_; }
  ScalarStyle style() const noexcept { return style_; }
  const Tag &tag() const noexcept { return tag_; }

  const Anchor *yaml_anchor() const noexcept { return anchor_.empty() ? nullptr : &anchor_; }
  void yaml_set_anchor(std::string value, bool always_dump = false) {
    anchor_.value = std::move(value);
    anchor_.always_dump = always_dump;
  }
};

// Indented dump of a value with its attached comments, for debugging
void dump_comments(std::ostream &os, const Value &v, const std::string &name = "");

} // namespace rtyaml
