#pragma once

#include <cctype>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace sysvet::util {

// Minimal TOML subset: [sections], key = scalar, key = ["a", "b"] on one line,
// '#' comments. Enough for sysvet's config file; anything else is skipped.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (key.empty()) continue;
      ensure_section(current_section).set(key, unquote(val));
    }
    return true;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    try { return std::stoi(val); } catch (...) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // key = ["a", "b"]; a bare scalar yields a one-element list
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return out;
    auto raw = s->get(key, "");
    std::string_view sv = trim(raw);
    if (sv.size() < 2 || sv.front() != '[' || sv.back() != ']') {
      if (!sv.empty()) out.emplace_back(sv);
      return out;
    }
    sv = sv.substr(1, sv.size() - 2);
    size_t start = 0;
    while (start <= sv.size()) {
      size_t comma = sv.find(',', start);
      auto item = trim(sv.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
      if (!item.empty()) out.push_back(unquote(std::string(item)));
      if (comma == std::string_view::npos) break;
      start = comma + 1;
    }
    return out;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Drop a trailing '#' comment that is not inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool in_str = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') in_str = !in_str;
      else if (sv[i] == '#' && !in_str) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string unquote(const std::string& val) {
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
      return val.substr(1, val.size() - 2);
    return val;
  }
};

} // namespace sysvet::util
