#pragma once

#include "./tag.hh"
#include "./tokens.hh"

#include <array>
#include <optional>
#include <string>

namespace rtyaml {

enum class EventKind {
  StreamStart,
  StreamEnd,
  DocumentStart,
  DocumentEnd,
  Alias,
  Scalar,
  SequenceStart,
  SequenceEnd,
  MappingStart,
  MappingEnd,
};

const char *event_name(EventKind kind) noexcept;

// Implicit flags of a scalar event
//
// `plain`: the tag may be omitted when the scalar is written plain; `quoted`: the tag may be
// omitted when it is written quoted; `standard`: the tag is one of the `tag:yaml.org,2002:` tags.
struct ScalarImplicit {
  bool plain = false;
  bool quoted = false;
  bool standard = true;

  bool operator==(const ScalarImplicit &) const = default;
};

// One parse event, fields not used by an event kind keep their defaults
struct Event {
  EventKind kind;
  Mark start_mark;
  Mark end_mark;
  CommentSlots comment;

  // Alias, Scalar, SequenceStart, MappingStart
  std::optional<std::string> anchor;
  // Scalar, SequenceStart, MappingStart
  std::optional<Tag> tag;
  // SequenceStart, MappingStart
  bool implicit = false;
  std::optional<bool> flow_style;
  std::optional<std::size_t> nr_items;
  // Scalar
  ScalarImplicit scalar_implicit;
  std::string value;
  ScalarStyle style = ScalarStyle::Plain;
  // DocumentStart, DocumentEnd
  bool explicit_ = false;
  // DocumentStart
  std::optional<VersionInfo> version;
  TagHandles tags;
  // StreamStart
  std::string encoding;

  Event(EventKind kind, Mark start_mark = Mark(), Mark end_mark = Mark(), CommentSlots comment = {})
      : kind(kind), start_mark(std::move(start_mark)), end_mark(std::move(end_mark)), comment(std::move(comment)) {}

  bool is(EventKind k) const noexcept { return kind == k; }
  bool is_collection_start() const noexcept {
    return kind == EventKind::SequenceStart || kind == EventKind::MappingStart;
  }
  bool is_node() const noexcept {
    return kind == EventKind::Alias || kind == EventKind::Scalar || is_collection_start();
  }

  // One line in the notation of the YAML test suite, e.g. `=VAL &a <tag> :text` or `+MAP {}`
  std::string compact_repr() const;

  static Event stream_start(Mark start_mark, Mark end_mark, std::string encoding = "") {
    Event ev(EventKind::StreamStart, std::move(start_mark), std::move(end_mark));
    ev.encoding = std::move(encoding);
    return ev;
  }

  static Event document_start(Mark start_mark, Mark end_mark, bool explicit_start,
                              std::optional<VersionInfo> version = std::nullopt, TagHandles tags = {},
                              CommentSlots comment = {}) {
    Event ev(EventKind::DocumentStart, std::move(start_mark), std::move(end_mark), std::move(comment));
    ev.explicit_ = explicit_start;
    ev.version = version;
    ev.tags = std::move(tags);
    return ev;
  }

  static Event document_end(Mark start_mark, Mark end_mark, bool explicit_end, CommentSlots comment = {}) {
    Event ev(EventKind::DocumentEnd, std::move(start_mark), std::move(end_mark), std::move(comment));
    ev.explicit_ = explicit_end;
    return ev;
  }

  static Event alias(std::string anchor, Mark start_mark, Mark end_mark, CommentSlots comment = {}) {
    Event ev(EventKind::Alias, std::move(start_mark), std::move(end_mark), std::move(comment));
    ev.anchor = std::move(anchor);
    return ev;
  }

  static Event scalar(std::optional<std::string> anchor, std::optional<Tag> tag, ScalarImplicit implicit,
                      std::string value, Mark start_mark, Mark end_mark, ScalarStyle style = ScalarStyle::Plain,
                      CommentSlots comment = {}) {
    Event ev(EventKind::Scalar, std::move(start_mark), std::move(end_mark), std::move(comment));
    ev.anchor = std::move(anchor);
    ev.tag = std::move(tag);
    ev.scalar_implicit = implicit;
    ev.value = std::move(value);
    ev.style = style;
    return ev;
  }

  static Event collection_start(EventKind kind, std::optional<std::string> anchor, std::optional<Tag> tag,
                                bool implicit, Mark start_mark, Mark end_mark, std::optional<bool> flow_style,
                                CommentSlots comment = {}, std::optional<std::size_t> nr_items = std::nullopt) {
    Event ev(kind, std::move(start_mark), std::move(end_mark), std::move(comment));
    ev.anchor = std::move(anchor);
    ev.tag = std::move(tag);
    ev.implicit = implicit;
    ev.flow_style = flow_style;
    ev.nr_items = nr_items;
    return ev;
  }
};

} // namespace rtyaml
