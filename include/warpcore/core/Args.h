#pragma once

#include "warpcore/core/Log.h"

#include <cstdlib>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warpcore::core {

// Command-line options for the tools.
//
//  --name value | --name=value   option with a value
//  --name                        switch (also when the next token is a switch)
//  -abc                          switches a, b and c
//  anything else                 positional
//
// Typed getters accept a value only if the whole token parses; a malformed
// value is logged and leaves the output untouched.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void parse(int argc, char** argv) {
    program_.clear();
    options_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view();
      if (a.empty()) continue;

      if (a.substr(0, 2) == "--" && a.size() > 2) {
        const std::string_view body = a.substr(2);
        const auto eq = body.find('=');
        if (eq != std::string_view::npos) {
          options_[std::string(body.substr(0, eq))] = std::string(body.substr(eq + 1));
        } else if (i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          options_[std::string(body)] = std::string(argv[++i]);
        } else {
          options_[std::string(body)] = std::nullopt;
        }
      } else if (isSwitch(a)) {
        for (char c : a.substr(1)) options_[std::string(1, c)] = std::nullopt;
      } else {
        positional_.emplace_back(a);
      }
    }
  }

  const std::string& program() const { return program_; }
  const std::vector<std::string>& positional() const { return positional_; }

  // True for a bare switch. An option given a value is not a flag.
  bool hasFlag(std::string_view name) const {
    const auto it = options_.find(name);
    return it != options_.end() && !it->second;
  }

  std::optional<std::string> get(std::string_view name) const {
    const auto it = options_.find(name);
    if (it == options_.end() || !it->second) return std::nullopt;
    return it->second;
  }

  bool getString(std::string_view name, std::string& out) const {
    const auto v = get(name);
    if (!v) return false;
    out = *v;
    return true;
  }

  bool getU64(std::string_view name, unsigned long long& out) const {
    return getNumber(name, out, [](const char* s, char** end) { return std::strtoull(s, end, 10); });
  }

  bool getInt(std::string_view name, int& out) const {
    long v = 0;
    if (!getNumber(name, v, [](const char* s, char** end) { return std::strtol(s, end, 10); })) return false;
    out = (int)v;
    return true;
  }

  bool getDouble(std::string_view name, double& out) const {
    return getNumber(name, out, [](const char* s, char** end) { return std::strtod(s, end); });
  }

  // Options given on the command line that are not in `known`.
  std::vector<std::string> unknownOptions(std::initializer_list<std::string_view> known) const {
    std::vector<std::string> out;
    for (const auto& [name, value] : options_) {
      bool found = false;
      for (std::string_view k : known) found = found || (k == name);
      if (!found) out.push_back(name);
    }
    return out;
  }

private:
  template <typename T, typename Parse>
  bool getNumber(std::string_view name, T& out, Parse parse) const {
    const auto v = get(name);
    if (!v) return false;
    char* end = nullptr;
    const auto parsed = parse(v->c_str(), &end);
    if (v->empty() || end != v->c_str() + v->size()) {
      log(LogLevel::Warn, "Args: bad value for --" + std::string(name) + ": '" + *v + "'");
      return false;
    }
    out = (T)parsed;
    return true;
  }

  // Negative numbers are values, not switches.
  static bool isSwitch(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    return !((s[1] >= '0' && s[1] <= '9') || s[1] == '.');
  }

  std::string program_;
  std::map<std::string, std::optional<std::string>, std::less<>> options_;
  std::vector<std::string> positional_;
};

} // namespace warpcore::core
