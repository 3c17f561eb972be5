#include "entente/core/JsonWriter.h"

#include <cmath>
#include <cstdio>

namespace entente::core {

JsonWriter::JsonWriter(std::ostream& out, bool pretty) : out_(out), pretty_(pretty) {}

std::string JsonWriter::escape(std::string_view s) {
  std::string r;
  r.reserve(s.size() + 2);
  for (const char ch : s) {
    const unsigned char c = (unsigned char)ch;
    switch (c) {
      case '"': r += "\\\""; break;
      case '\\': r += "\\\\"; break;
      case '\n': r += "\\n"; break;
      case '\r': r += "\\r"; break;
      case '\t': r += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)c);
          r += buf;
        } else {
          r.push_back(ch);
        }
        break;
    }
  }
  return r;
}

void JsonWriter::newlineIndent() {
  if (!pretty_) return;
  out_ << '\n';
  for (std::size_t i = 0; i < stack_.size(); ++i) out_ << "  ";
}

void JsonWriter::beforeValue() {
  if (afterKey_) {
    afterKey_ = false;
    return;
  }
  if (stack_.empty()) return;
  Frame& f = stack_.back();
  if (f.count > 0) out_ << ',';
  ++f.count;
  newlineIndent();
}

void JsonWriter::beginObject() {
  beforeValue();
  out_ << '{';
  stack_.push_back(Frame{true, 0});
}

void JsonWriter::endObject() {
  const bool hadItems = !stack_.empty() && stack_.back().count > 0;
  if (!stack_.empty()) stack_.pop_back();
  if (hadItems) newlineIndent();
  out_ << '}';
}

void JsonWriter::beginArray() {
  beforeValue();
  out_ << '[';
  stack_.push_back(Frame{false, 0});
}

void JsonWriter::endArray() {
  const bool hadItems = !stack_.empty() && stack_.back().count > 0;
  if (!stack_.empty()) stack_.pop_back();
  if (hadItems) newlineIndent();
  out_ << ']';
}

void JsonWriter::key(std::string_view k) {
  beforeValue();
  out_ << '"' << escape(k) << '"' << (pretty_ ? ": " : ":");
  afterKey_ = true;
}

void JsonWriter::value(std::string_view s) {
  beforeValue();
  out_ << '"' << escape(s) << '"';
}

void JsonWriter::value(bool b) {
  beforeValue();
  out_ << (b ? "true" : "false");
}

void JsonWriter::value(int v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(unsigned long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(double v) {
  beforeValue();
  // JSON has no NaN/Inf.
  if (!std::isfinite(v)) {
    out_ << "null";
    return;
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.10g", v);
  out_ << buf;
}

void JsonWriter::null() {
  beforeValue();
  out_ << "null";
}

void JsonWriter::value(const std::vector<std::string>& list) {
  beginArray();
  for (const auto& s : list) value(std::string_view(s));
  endArray();
}

void JsonWriter::finish() {
  if (stack_.empty()) out_ << '\n';
  out_.flush();
}

} // namespace entente::core
