#include "rtyaml/events.hh"

namespace rtyaml {

const char *event_name(EventKind kind) noexcept {
  switch (kind) {
  case EventKind::StreamStart:
    return "StreamStartEvent";
  case EventKind::StreamEnd:
    return "StreamEndEvent";
  case EventKind::DocumentStart:
    return "DocumentStartEvent";
  case EventKind::DocumentEnd:
    return "DocumentEndEvent";
  case EventKind::Alias:
    return "AliasEvent";
  case EventKind::Scalar:
    return "ScalarEvent";
  case EventKind::SequenceStart:
    return "SequenceStartEvent";
  case EventKind::SequenceEnd:
    return "SequenceEndEvent";
  case EventKind::MappingStart:
    return "MappingStartEvent";
  case EventKind::MappingEnd:
    return "MappingEndEvent";
  }
  return "Event";
}

std::string Event::compact_repr() const {
  switch (kind) {
  case EventKind::StreamStart:
    return "+STR";
  case EventKind::StreamEnd:
    return "-STR";
  case EventKind::DocumentStart:
    return explicit_ ? "+DOC ---" : "+DOC";
  case EventKind::DocumentEnd:
    return explicit_ ? "-DOC ..." : "-DOC";
  case EventKind::Alias:
    return "=ALI *" + anchor.value_or("");
  case EventKind::SequenceEnd:
    return "-SEQ";
  case EventKind::MappingEnd:
    return "-MAP";
  case EventKind::SequenceStart:
  case EventKind::MappingStart: {
    std::string s = kind == EventKind::SequenceStart ? "+SEQ" : "+MAP";
    if (flow_style.value_or(false))
      s += kind == EventKind::SequenceStart ? " []" : " {}";
    if (anchor && !anchor->empty())
      s += " &" + *anchor;
    if (tag && !tag->empty())
      s += " <" + tag->value() + ">";
    return s;
  }
  case EventKind::Scalar: {
    std::string s = "=VAL ";
    if (anchor && !anchor->empty())
      s += "&" + *anchor + " ";
    if (tag && !tag->empty())
      s += "<" + tag->value() + "> ";
    s += style == ScalarStyle::Plain ? ':' : static_cast<char>(style);
    for (char ch : value) {
      switch (ch) {
      case '\\':
        s += "\\\\";
        break;
      case '\t':
        s += "\\t";
        break;
      case '\n':
        s += "\\n";
        break;
      case '\a':
        break;
      case '\r':
        s += "\\r";
        break;
      case '\b':
        s += "\\b";
        break;
      default:
        s += ch;
      }
    }
    return s;
  }
  }
  return "";
}

} // namespace rtyaml
