#pragma once

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ryml.hpp>
#include <ryml_std.hpp>

namespace devinv {
namespace core {
namespace common {
namespace config {

// Flat key/value view over layered configuration sources. Nested YAML maps
// become dotted keys ("store.timeout_ms"). Each layer overrides the previous
// one: YAML file, then environment, then explicit Set() calls.
class ConfigManager {
public:
  // Environment variable name -> config key.
  using EnvBinding = std::pair<std::string, std::string>;

  struct Entry {
    std::string value;
    // Where the value came from, for diagnostics ("app.yaml", "env SERVER_PORT").
    std::string origin;
  };

  bool LoadYamlFile(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file) {
      last_error_ = "cannot open " + file_path;
      return false;
    }

    std::string contents((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return LoadYamlStringMerge(contents, file_path);
  }

  bool LoadYamlStringMerge(const std::string& contents, const std::string& origin = "yaml") {
    if (contents.empty()) {
      last_error_ = "empty document";
      return false;
    }
    ThrowingYamlErrors guard;
    try {
      ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(contents));
      const ryml::ConstNodeRef root = tree.rootref();
      if (!root.valid() || !root.is_map()) {
        last_error_ = "top level must be a mapping";
        return false;
      }
      FlattenYaml(root, std::string(), origin);
      return true;
    } catch (const std::exception& e) {
      last_error_ = origin + ": " + e.what();
      return false;
    }
  }

  // Returns the number of variables that were set.
  std::size_t MergeEnvironment(const std::vector<EnvBinding>& bindings) {
    std::size_t n = 0;
    for (const auto& b : bindings) {
      const char* v = std::getenv(b.first.c_str());
      if (v == nullptr) continue;
      entries_[b.second] = Entry{v, "env " + b.first};
      ++n;
    }
    return n;
  }

  void Set(const std::string& key, std::string value, std::string origin = "command line") {
    entries_[key] = Entry{std::move(value), std::move(origin)};
  }

  bool Has(const std::string& key) const {
    return entries_.find(key) != entries_.end();
  }

  bool GetString(const std::string& key, std::string& out) const {
    const auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    out = it->second.value;
    return true;
  }

  std::string GetStringOr(const std::string& key, std::string default_value) const {
    std::string out;
    if (GetString(key, out)) return out;
    return default_value;
  }

  bool GetInt64(const std::string& key, std::int64_t& out) const {
    std::string s;
    if (!GetString(key, s)) return false;
    return ParseInt64(s, out);
  }

  std::string Origin(const std::string& key) const {
    const auto it = entries_.find(key);
    return it == entries_.end() ? std::string() : it->second.origin;
  }

  const std::string& LastError() const { return last_error_; }

private:
  // rapidyaml aborts on a parse error by default. While alive, parse errors
  // throw std::runtime_error instead; the previous callbacks come back after.
  class ThrowingYamlErrors {
  public:
    ThrowingYamlErrors() : saved_(ryml::get_callbacks()) {
      ryml::Callbacks cb = saved_;
      cb.m_error = &ThrowOnError;
      ryml::set_callbacks(cb);
    }
    ~ThrowingYamlErrors() { ryml::set_callbacks(saved_); }

    ThrowingYamlErrors(const ThrowingYamlErrors&) = delete;
    ThrowingYamlErrors& operator=(const ThrowingYamlErrors&) = delete;

  private:
    [[noreturn]] static void ThrowOnError(const char* msg, std::size_t len, ryml::Location loc,
                                          void* /*user_data*/) {
      std::string what(msg, len);
      if (loc.line > 0) what += " (line " + std::to_string(loc.line) + ")";
      throw std::runtime_error(what);
    }

    ryml::Callbacks saved_;
  };

  static bool ParseInt64(const std::string& s, std::int64_t& out) {
    if (s.empty()) return false;
    const bool negative = s[0] == '-';
    std::size_t i = negative ? 1 : 0;
    if (i >= s.size()) return false;

    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    std::int64_t v = 0;
    for (; i < s.size(); ++i) {
      const char c = s[i];
      if (c < '0' || c > '9') return false;
      const int d = c - '0';
      if (v > (kMax - d) / 10) return false;
      v = v * 10 + d;
    }
    out = negative ? -v : v;
    return true;
  }

  static std::string ToStdString(c4::csubstr s) {
    return std::string(s.str, s.len);
  }

  // Scalars under maps only; sequences have no meaning in this configuration
  // and are skipped.
  void FlattenYaml(const ryml::ConstNodeRef& node, const std::string& prefix,
                   const std::string& origin) {
    if (!node.valid()) return;

    if (node.has_val()) {
      if (!prefix.empty()) entries_[prefix] = Entry{ToStdString(node.val()), origin};
      return;
    }

    if (!node.is_map()) return;
    for (ryml::ConstNodeRef child : node.children()) {
      if (!child.has_key()) continue;
      const std::string ks = ToStdString(child.key());
      FlattenYaml(child, prefix.empty() ? ks : (prefix + "." + ks), origin);
    }
  }

private:
  std::unordered_map<std::string, Entry> entries_;
  std::string last_error_;
};

}  // namespace config
}  // namespace common
}  // namespace core
}  // namespace devinv
