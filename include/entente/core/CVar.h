#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace entente::core {

// Console variables: named, typed runtime overrides.
//
// Every diplomacy calibration constant has a cvar ("diplo.*") whose default is
// the parameter struct's default. Tools read a config file and command-line
// assignments into the registry, then build the params from it once.
//
// Config file lines are "name = value" (or "name value"); '#' and '//' start
// comments. Assignments to names nobody defined yet are held back and applied
// when the name is defined, so a config file can be loaded before the
// subsystem that owns the variables.

enum class CVarType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

enum CVarFlags : std::uint32_t {
  CVar_None     = 0u,
  CVar_Archive  = 1u << 0, // written by writeTo()
  CVar_ReadOnly = 1u << 1, // only the definition may change it
};

inline constexpr std::uint32_t operator|(CVarFlags a, CVarFlags b) {
  return (std::uint32_t)a | (std::uint32_t)b;
}

using CVarValue = std::variant<bool, std::int64_t, double, std::string>;
using CVarListener = std::function<void(const struct CVar&)>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};
  std::uint32_t flags{CVar_None};

  CVarValue value{};
  CVarValue defaultValue{};

  // Inclusive, Int/Float only.
  std::optional<double> minValue;
  std::optional<double> maxValue;

  // Where the current value came from: empty for the default, "path:line"
  // for a config file, "set" for a runtime assignment.
  std::string origin;

  std::vector<CVarListener> listeners; // run after every successful change
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Redefining a name with the same type updates help/flags/bounds and keeps
  // the current value; a different type is refused (nullptr).
  CVar* defineBool(std::string_view name, bool defaultValue,
                   std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineInt(std::string_view name, std::int64_t defaultValue,
                  std::uint32_t flags = CVar_Archive, std::string_view help = {},
                  std::optional<double> minValue = std::nullopt,
                  std::optional<double> maxValue = std::nullopt);
  CVar* defineFloat(std::string_view name, double defaultValue,
                    std::uint32_t flags = CVar_Archive, std::string_view help = {},
                    std::optional<double> minValue = std::nullopt,
                    std::optional<double> maxValue = std::nullopt);
  CVar* defineString(std::string_view name, std::string defaultValue,
                     std::uint32_t flags = CVar_Archive, std::string_view help = {});

  // Unknown names and type mismatches return `fallback`.
  bool        getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double      getFloat(std::string_view name, double fallback = 0.0) const;
  std::string getString(std::string_view name, std::string_view fallback = {}) const;

  bool setBool(std::string_view name, bool v, std::string* outError = nullptr);
  bool setInt(std::string_view name, std::int64_t v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);
  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);

  // Parses `value` by the variable's type (strings may be quoted).
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  bool reset(std::string_view name, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener cb, std::string* outError = nullptr);

  // Name-sorted copies without listeners. A non-empty `filter` keeps names
  // containing it (case-insensitive).
  std::vector<CVar> list(std::string_view filter = {}) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVarValue& v);
  static std::string valueToString(const CVar& v) { return valueToString(v.value); }

  // Every bad line is reported as "path:line: message" (one per line of
  // *outError); good lines are applied regardless.
  bool loadFile(const std::string& path, std::string* outError = nullptr);

  // Archived variables in loadFile() format, help text as a trailing comment.
  void writeTo(std::ostream& out) const;

  bool hasPending(std::string_view name) const;
  std::optional<std::string> pendingValue(std::string_view name) const;

private:
  struct Pending {
    std::string text;
    std::string origin;
  };

  CVar* define(std::string_view name, CVarType type, CVarValue def, std::uint32_t flags,
               std::string_view help, std::optional<double> minValue, std::optional<double> maxValue);

  bool assign(std::string_view name, CVarValue v, std::string_view origin, std::string* outError);
  bool assignText(std::string_view name, std::string_view text, std::string_view origin, std::string* outError);

  template <class T>
  T read(std::string_view name, T fallback) const;

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, Pending, std::less<>> pending_;
};

// Process-wide registry used by the tools.
CVarRegistry& cvars();

// Defines log.level (wired to setLogLevel). Safe to call more than once.
void installDefaultCVars(CVarRegistry& registry);

} // namespace entente::core
