#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace entente::core {

// Command-line parser for the entente tools.
//
//   --json                      flag
//   --seed 7 / --seed=7         one value (the default arity)
//   --evaluate 3 7              fixed arity, see setArity()
//   --negotiate 1 2 3 ...       greedy, see setGreedy(): values up to the next switch
//   -hv                         short flags h and v
//   anything else               positional, as is everything after "--"
//
// Numbers such as -2.5 or -1 are values, never switches. Repeating an option
// appends to its values; last() is the most recent one.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void setArity(std::string_view key, int valueCount) {
    if (valueCount > 0) arity_[std::string(key)] = valueCount;
  }

  void setGreedy(std::string_view key) { greedy_.insert(std::string(key)); }

  void parse(int argc, char** argv) {
    program_ = (argc > 0 && argv && argv[0]) ? argv[0] : "";
    options_.clear();
    flags_.clear();
    positional_.clear();

    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
      if (argv[i] && *argv[i]) tokens.emplace_back(argv[i]);
    }

    for (std::size_t i = 0; i < tokens.size(); ++i) {
      const std::string& tok = tokens[i];

      if (tok == "--") {
        positional_.insert(positional_.end(), tokens.begin() + (std::ptrdiff_t)i + 1, tokens.end());
        return;
      }

      if (tok.rfind("--", 0) == 0) {
        const std::size_t eq = tok.find('=');
        if (eq != std::string::npos) {
          options_[tok.substr(2, eq - 2)].push_back(tok.substr(eq + 1));
          continue;
        }

        const std::string key = tok.substr(2);
        std::size_t want = 1;
        if (greedy_.count(key)) {
          want = tokens.size();
        } else if (const auto it = arity_.find(key); it != arity_.end()) {
          want = (std::size_t)it->second;
        }

        std::size_t took = 0;
        while (took < want && i + 1 < tokens.size() && !isSwitch(tokens[i + 1])) {
          options_[key].push_back(tokens[++i]);
          ++took;
        }
        if (took == 0) flags_.push_back(key);
        continue;
      }

      if (isSwitch(tok)) {
        for (const char c : std::string_view(tok).substr(1)) {
          if (std::isalnum((unsigned char)c) || c == '_') flags_.emplace_back(1, c);
        }
        continue;
      }

      positional_.push_back(tok);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    return std::find(flags_.begin(), flags_.end(), key) != flags_.end();
  }

  bool has(std::string_view key) const { return hasFlag(key) || options_.find(key) != options_.end(); }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = options_.find(key);
    if (it == options_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = options_.find(key);
    return (it == options_.end()) ? std::vector<std::string>{} : it->second;
  }

  const std::vector<std::string>& flags() const { return flags_; }
  const std::vector<std::string>& positional() const { return positional_; }

  // Options and flags given on the command line that are not in `known`,
  // in name order.
  std::vector<std::string> unknownOptions(std::initializer_list<std::string_view> known) const {
    std::set<std::string> seen;
    for (const auto& [key, vals] : options_) seen.insert(key);
    seen.insert(flags_.begin(), flags_.end());

    std::vector<std::string> out;
    for (const auto& key : seen) {
      if (std::find(known.begin(), known.end(), key) == known.end()) out.push_back(key);
    }
    return out;
  }

  // The typed getters succeed only when the key is present and its last
  // value parses completely.
  bool getU64(std::string_view key, unsigned long long& out) const {
    const auto v = last(key);
    return v && parseU64(*v, out);
  }

  // False as soon as one value is not an unsigned number.
  bool getU64List(std::string_view key, std::vector<unsigned long long>& out) const {
    out.clear();
    for (const auto& v : values(key)) {
      unsigned long long id = 0;
      if (!parseU64(v, id)) return false;
      out.push_back(id);
    }
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    return v && parseDouble(*v, out);
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (v) out = *v;
    return v.has_value();
  }

  static bool parseU64(const std::string& s, unsigned long long& out) {
    if (s.empty() || !std::isdigit((unsigned char)s.front())) return false;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size()) return false;
    out = v;
    return true;
  }

  static bool parseDouble(const std::string& s, double& out) {
    if (s.empty() || std::isspace((unsigned char)s.front())) return false;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return false;
    out = v;
    return true;
  }

private:
  // "-x", "--x"; a lone "-" and negative numbers are values.
  static bool isSwitch(const std::string& s) {
    if (s.size() < 2 || s[0] != '-') return false;
    double ignored = 0.0;
    return !parseDouble(s, ignored);
  }

  std::string program_;
  std::map<std::string, int, std::less<>> arity_;
  std::set<std::string, std::less<>> greedy_;
  std::map<std::string, std::vector<std::string>, std::less<>> options_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace entente::core
