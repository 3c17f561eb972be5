#include "entente/core/CVar.h"

#include "entente/core/Log.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace entente::core {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

std::string lower(std::string_view s) {
  std::string out(s);
  for (char& c : out) c = (char)std::tolower((unsigned char)c);
  return out;
}

// Drops matching outer quotes and resolves \\ \" \' escapes.
std::string unquote(std::string_view s) {
  s = trim(s);
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    s = s.substr(1, s.size() - 2);
  }
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size() && (s[i + 1] == '\\' || s[i + 1] == '"' || s[i + 1] == '\'')) ++i;
    out.push_back(s[i]);
  }
  return out;
}

bool parseAs(CVarType type, std::string_view text, CVarValue& out, std::string* outError) {
  const std::string_view t = trim(text);
  auto fail = [&](const char* what) {
    if (outError) *outError = std::string("expected ") + what + ", got '" + std::string(t) + "'";
    return false;
  };

  switch (type) {
    case CVarType::Bool: {
      const std::string k = lower(t);
      if (k == "1" || k == "true" || k == "on" || k == "yes") { out = true; return true; }
      if (k == "0" || k == "false" || k == "off" || k == "no") { out = false; return true; }
      return fail("a bool");
    }
    case CVarType::Int: {
      std::int64_t v = 0;
      const char* end = t.data() + t.size();
      const auto res = std::from_chars(t.data(), end, v, 10);
      if (t.empty() || res.ec != std::errc{} || res.ptr != end) return fail("an integer");
      out = v;
      return true;
    }
    case CVarType::Float: {
      const std::string buf(t);
      char* end = nullptr;
      const double v = std::strtod(buf.c_str(), &end);
      if (buf.empty() || end != buf.c_str() + buf.size() || !std::isfinite(v)) return fail("a finite number");
      out = v;
      return true;
    }
    case CVarType::String:
      out = unquote(t);
      return true;
  }
  return fail("a known type");
}

bool typeMatches(CVarType type, const CVarValue& v) {
  switch (type) {
    case CVarType::Bool: return std::holds_alternative<bool>(v);
    case CVarType::Int: return std::holds_alternative<std::int64_t>(v);
    case CVarType::Float: return std::holds_alternative<double>(v);
    case CVarType::String: return std::holds_alternative<std::string>(v);
  }
  return false;
}

// Type and bounds check of a candidate value.
bool acceptable(const CVar& var, const CVarValue& v, std::string* outError) {
  if (!typeMatches(var.type, v)) {
    if (outError) *outError = var.name + " is " + CVarRegistry::typeName(var.type);
    return false;
  }

  double d = 0.0;
  if (const auto* i = std::get_if<std::int64_t>(&v)) {
    d = (double)*i;
  } else if (const auto* f = std::get_if<double>(&v)) {
    d = *f;
  } else {
    return true;
  }

  if ((var.minValue && d < *var.minValue) || (var.maxValue && d > *var.maxValue)) {
    if (outError) {
      std::ostringstream ss;
      ss << var.name << ": " << d << " out of range [";
      if (var.minValue) ss << *var.minValue; else ss << "-inf";
      ss << ", ";
      if (var.maxValue) ss << *var.maxValue; else ss << "+inf";
      ss << "]";
      *outError = ss.str();
    }
    return false;
  }
  return true;
}

// "name = value", "name value"; comments already stripped. False for blank lines.
bool splitAssignment(std::string_view line, std::string_view& name, std::string_view& value) {
  std::size_t cut = line.find('#');
  const std::size_t slashes = line.find("//");
  if (slashes < cut) cut = slashes;
  line = trim(line.substr(0, cut));
  if (line.empty()) return false;

  std::size_t sep = line.find('=');
  std::size_t skip = 1;
  if (sep == std::string_view::npos) {
    sep = 0;
    while (sep < line.size() && !std::isspace((unsigned char)line[sep])) ++sep;
    skip = 0;
  }
  name = trim(line.substr(0, sep));
  value = trim(sep + skip < line.size() ? line.substr(sep + skip) : std::string_view{});
  return !name.empty();
}

} // namespace

// ---------------------------------------------------------------------------
// Definition
// ---------------------------------------------------------------------------

CVar* CVarRegistry::define(std::string_view name, CVarType type, CVarValue def, std::uint32_t flags,
                           std::string_view help, std::optional<double> minValue,
                           std::optional<double> maxValue) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = vars_.find(name);
  if (it == vars_.end()) {
    CVar fresh;
    fresh.name = std::string(name);
    fresh.type = type;
    fresh.value = def;
    it = vars_.emplace(fresh.name, std::move(fresh)).first;
  } else if (it->second.type != type) {
    return nullptr;
  }

  CVar& var = it->second;
  var.flags = flags;
  if (!help.empty()) var.help = std::string(help);
  var.defaultValue = std::move(def);
  var.minValue = minValue;
  var.maxValue = maxValue;

  const auto pit = pending_.find(name);
  if (pit != pending_.end()) {
    CVarValue parsed;
    std::string err;
    if (parseAs(type, pit->second.text, parsed, &err) && acceptable(var, parsed, &err)) {
      var.value = std::move(parsed);
      var.origin = pit->second.origin;
    } else {
      ENTENTE_LOG_WARN("cvar " + var.name + ": ignoring value from " + pit->second.origin + ": " + err);
    }
    pending_.erase(pit);
  }
  return &var;
}

CVar* CVarRegistry::defineBool(std::string_view name, bool defaultValue, std::uint32_t flags,
                               std::string_view help) {
  return define(name, CVarType::Bool, defaultValue, flags, help, std::nullopt, std::nullopt);
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue, std::uint32_t flags,
                              std::string_view help, std::optional<double> minValue,
                              std::optional<double> maxValue) {
  return define(name, CVarType::Int, defaultValue, flags, help, minValue, maxValue);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue, std::uint32_t flags,
                                std::string_view help, std::optional<double> minValue,
                                std::optional<double> maxValue) {
  return define(name, CVarType::Float, defaultValue, flags, help, minValue, maxValue);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue, std::uint32_t flags,
                                 std::string_view help) {
  return define(name, CVarType::String, std::move(defaultValue), flags, help, std::nullopt, std::nullopt);
}

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? &it->second : nullptr;
}

// ---------------------------------------------------------------------------
// Assignment
// ---------------------------------------------------------------------------

bool CVarRegistry::assign(std::string_view name, CVarValue v, std::string_view origin, std::string* outError) {
  CVar changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "unknown cvar " + std::string(name);
      return false;
    }
    CVar& var = it->second;
    if ((var.flags & CVar_ReadOnly) != 0u) {
      if (outError) *outError = var.name + " is read-only";
      return false;
    }
    if (!acceptable(var, v, outError)) return false;

    var.value = std::move(v);
    var.origin = std::string(origin);
    changed = var;
  }

  // Listeners may read the registry; run them unlocked.
  for (const auto& cb : changed.listeners) {
    if (cb) cb(changed);
  }
  return true;
}

bool CVarRegistry::assignText(std::string_view name, std::string_view text, std::string_view origin,
                              std::string* outError) {
  const CVar* var = find(name);
  if (!var) {
    if (outError) *outError = "unknown cvar " + std::string(name);
    return false;
  }
  CVarValue parsed;
  if (!parseAs(var->type, text, parsed, outError)) {
    if (outError) *outError = std::string(name) + ": " + *outError;
    return false;
  }
  return assign(name, std::move(parsed), origin, outError);
}

bool CVarRegistry::setBool(std::string_view name, bool v, std::string* outError) {
  return assign(name, v, "set", outError);
}

bool CVarRegistry::setInt(std::string_view name, std::int64_t v, std::string* outError) {
  return assign(name, v, "set", outError);
}

bool CVarRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  return assign(name, v, "set", outError);
}

bool CVarRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return assign(name, std::move(v), "set", outError);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  return assignText(name, value, "set", outError);
}

bool CVarRegistry::reset(std::string_view name, std::string* outError) {
  const CVar* var = find(name);
  if (!var) {
    if (outError) *outError = "unknown cvar " + std::string(name);
    return false;
  }
  return assign(name, var->defaultValue, {}, outError);
}

bool CVarRegistry::addListener(std::string_view name, CVarListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "unknown cvar " + std::string(name);
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

template <class T>
T CVarRegistry::read(std::string_view name, T fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  if (const T* v = std::get_if<T>(&it->second.value)) return *v;
  return fallback;
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  return read<bool>(name, fallback);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  return read<std::int64_t>(name, fallback);
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  return read<double>(name, fallback);
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  return read<std::string>(name, std::string(fallback));
}

std::vector<CVar> CVarRegistry::list(std::string_view filter) const {
  const std::string needle = lower(filter);
  std::vector<CVar> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [name, var] : vars_) {
    if (!needle.empty() && lower(name).find(needle) == std::string::npos) continue;
    out.push_back(var);
    out.back().listeners.clear();
  }
  return out;
}

bool CVarRegistry::hasPending(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(name) != pending_.end();
}

std::optional<std::string> CVarRegistry::pendingValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second.text;
}

const char* CVarRegistry::typeName(CVarType t) {
  switch (t) {
    case CVarType::Bool: return "bool";
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string CVarRegistry::valueToString(const CVarValue& v) {
  if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
  if (const auto* i = std::get_if<std::int64_t>(&v)) return std::to_string(*i);
  if (const auto* s = std::get_if<std::string>(&v)) return *s;

  // Enough digits that a written config reloads to the same double.
  std::ostringstream ss;
  ss << std::setprecision(17) << std::get<double>(v);
  return ss.str();
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "cannot open config file " + path;
    return false;
  }

  std::string errors;
  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    std::string_view name;
    std::string_view value;
    if (!splitAssignment(line, name, value)) continue;

    const std::string origin = path + ":" + std::to_string(lineNo);
    if (!exists(name)) {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_[std::string(name)] = Pending{std::string(value), origin};
      continue;
    }

    std::string err;
    if (!assignText(name, value, origin, &err)) errors += origin + ": " + err + "\n";
  }

  if (!errors.empty()) {
    ENTENTE_LOG_WARN("cvar: rejected lines in " + path);
    if (outError) *outError = errors;
    return false;
  }
  return true;
}

void CVarRegistry::writeTo(std::ostream& out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [name, var] : vars_) {
    if ((var.flags & CVar_Archive) == 0u) continue;
    out << name << " = ";
    if (var.type == CVarType::String) {
      out << '"' << std::get<std::string>(var.value) << '"';
    } else {
      out << valueToString(var.value);
    }
    if (!var.help.empty()) out << "  # " << var.help;
    out << "\n";
  }
}

CVarRegistry& cvars() {
  static CVarRegistry registry;
  return registry;
}

void installDefaultCVars(CVarRegistry& registry) {
  if (registry.exists("log.level")) return;

  registry.defineString("log.level", std::string(logLevelName(getLogLevel())), CVar_Archive,
                        "trace|debug|info|warn|error|off");
  registry.addListener("log.level", [](const CVar& cv) {
    LogLevel level = LogLevel::Info;
    if (parseLogLevel(std::get<std::string>(cv.value), level)) {
      setLogLevel(level);
    } else {
      ENTENTE_LOG_WARN("cvar log.level: unknown level '" + std::get<std::string>(cv.value) + "'");
    }
  });
}

} // namespace entente::core
