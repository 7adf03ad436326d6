#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rxmap/util/Parse.hpp"

namespace rxmap {

// Run configuration in INI form:
//   [section]
//   key = value        ; '#' or ';' starts a comment line
// Values keep their text; one pair of surrounding quotes is removed.
// Lists separate items by commas and/or whitespace.
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    std::ifstream ifs(file_);
    if (!ifs) throw std::runtime_error(where_() + "failed to open config");
    parse_(ifs);
  }

  // In-memory config; `base_dir` anchors relative paths.
  static IniConfig from_string(const std::string& text, const std::filesystem::path& base_dir = ".") {
    std::istringstream iss(text);
    return IniConfig(iss, base_dir / "<string>");
  }

  std::filesystem::path base_dir() const { return file_.parent_path(); }

  std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    for (const auto& kv : sections_) out.push_back(kv.first);
    return out;
  }

  bool has_key(const std::string& section, const std::string& key) const { return find_(section, key) != nullptr; }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (const Entry* e = find_(section, key)) return e->value;
    if (def) return *def;
    throw missing_(section, key);
  }

  int get_int(const std::string& section, const std::string& key, const std::optional<int>& def = std::nullopt) const {
    const Entry* e = find_(section, key);
    if (!e) {
      if (def) return *def;
      throw missing_(section, key);
    }
    std::int64_t v = 0;
    if (!parse_int(e->value, v) || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
      throw std::runtime_error(where_(e->line) + section + "." + key + " is not an integer: '" + e->value + "'");
    }
    return static_cast<int>(v);
  }

  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    const Entry* e = find_(section, key);
    if (!e) {
      if (def) return *def;
      throw missing_(section, key);
    }
    std::string s = e->value;
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw std::runtime_error(where_(e->line) + section + "." + key + " is not a boolean: '" + e->value + "'");
  }

  std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                    const std::optional<std::string>& def = std::nullopt) const {
    std::vector<std::string> out;
    std::string cur;
    for (const char ch : get_string(section, key, def)) {
      if (ch == ',' || ch == ' ' || ch == '\t') {
        if (!cur.empty()) out.push_back(std::move(cur));
        cur.clear();
      } else {
        cur.push_back(ch);
      }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
  }

  // Atom ids ("1, 2 5"). A missing key yields `def`.
  std::vector<std::int64_t> get_id_list(const std::string& section, const std::string& key,
                                        const std::vector<std::int64_t>& def = {}) const {
    const Entry* e = find_(section, key);
    if (!e) return def;
    std::vector<std::int64_t> out;
    for (const auto& item : get_list(section, key)) {
      std::int64_t v = 0;
      if (!parse_int(item, v)) {
        throw std::runtime_error(where_(e->line) + "bad atom id '" + item + "' in " + section + "." + key);
      }
      out.push_back(v);
    }
    return out;
  }

  // "section.key" entries not in `known`, sorted.
  std::vector<std::string> unknown_keys(const std::set<std::string>& known) const {
    std::vector<std::string> out;
    for (const auto& [sec, entries] : sections_) {
      for (const auto& kv : entries) {
        std::string full = sec + "." + kv.first;
        if (!known.count(full)) out.push_back(std::move(full));
      }
    }
    return out;
  }

private:
  struct Entry {
    std::string value;
    std::size_t line = 0;
  };

  std::filesystem::path file_;
  std::map<std::string, std::map<std::string, Entry>> sections_;

  IniConfig(std::istream& is, std::filesystem::path file) : file_(std::move(file)) { parse_(is); }

  std::string where_(std::size_t line = 0) const {
    std::string s = "IniConfig[" + file_.string();
    if (line) s += ":" + std::to_string(line);
    return s + "]: ";
  }

  std::runtime_error missing_(const std::string& section, const std::string& key) const {
    return std::runtime_error(where_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  const Entry* find_(const std::string& section, const std::string& key) const {
    const auto it = sections_.find(section);
    if (it == sections_.end()) return nullptr;
    const auto jt = it->second.find(key);
    return jt == it->second.end() ? nullptr : &jt->second;
  }

  static std::string unquote_(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
      return s.substr(1, s.size() - 2);
    }
    return s;
  }

  void parse_(std::istream& is) {
    std::string section;
    std::string raw;
    std::size_t lineno = 0;
    while (std::getline(is, raw)) {
      ++lineno;
      const std::string s = trim(raw);
      if (s.empty() || s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[' && s.back() == ']') {
        section = trim(s.substr(1, s.size() - 2));
        if (section.empty()) throw std::runtime_error(where_(lineno) + "empty section header");
        sections_[section];
        continue;
      }

      const auto eq = s.find('=');
      if (eq == std::string::npos) throw std::runtime_error(where_(lineno) + "expected key = value: " + s);
      const std::string key = trim(s.substr(0, eq));
      if (key.empty()) throw std::runtime_error(where_(lineno) + "empty key");
      if (section.empty()) throw std::runtime_error(where_(lineno) + "key '" + key + "' outside any section");
      sections_[section][key] = Entry{unquote_(trim(s.substr(eq + 1))), lineno};
    }
  }
};

} // namespace rxmap
