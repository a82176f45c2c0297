#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace fmsim::detail {

inline std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

// Simple CSV: no quoted fields.
inline std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

inline double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

inline int to_int_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    int v = std::stoi(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0;
  }
}

inline bool to_bool_safe(const std::string& s, bool& ok) {
  const auto v = lower(s);
  ok = true;
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  ok = false;
  return false;
}

// Blank lines and '#' comments are skipped by callers through this.
inline bool is_skippable(const std::string& raw) {
  return raw.empty() || raw[0] == '#';
}

} // namespace fmsim::detail
