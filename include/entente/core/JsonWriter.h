#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace entente::core {

// Streaming JSON writer used by the tool's --json output.
//
// Usage:
//   JsonWriter j(std::cout, /*pretty=*/true);
//   j.beginObject();
//   j.key("a"); j.value(1.0);
//   j.endObject();
//
// The writer tracks nesting to place commas and indentation; it does not
// validate that keys are only written inside objects.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = false);

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  void key(std::string_view k);

  void value(std::string_view s);
  void value(const std::string& s) { value(std::string_view(s)); }
  void value(const char* s) { value(std::string_view(s ? s : "")); }
  void value(bool b);
  void value(int v);
  void value(long long v);
  void value(unsigned long long v);
  void value(double v);
  void null();

  // Array of strings as one value.
  void value(const std::vector<std::string>& list);

  // Flushes a trailing newline once the top-level value closed.
  void finish();

  static std::string escape(std::string_view s);

private:
  struct Frame {
    bool isObject{false};
    int count{0};
  };

  void beforeValue();
  void newlineIndent();

  std::ostream& out_;
  bool pretty_{false};
  bool afterKey_{false};
  std::vector<Frame> stack_;
};

} // namespace entente::core
