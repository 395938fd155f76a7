#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <string>

namespace bluos
{

inline std::string trim(const std::string &s)
{
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    end--;
  return s.substr(start, end - start);
}

inline std::string to_lower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string to_upper(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

inline bool starts_with(const std::string &s, const std::string &prefix)
{
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Whole-string base 10 parse; surrounding whitespace is allowed.
inline bool parse_long(const std::string &text, long &out)
{
  std::string t = trim(text);
  if (t.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  long value = std::strtol(t.c_str(), &end, 10);
  if (errno != 0 || end == t.c_str() || *end != '\0')
    return false;
  out = value;
  return true;
}

inline bool parse_double(const std::string &text, double &out)
{
  std::string t = trim(text);
  if (t.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(t.c_str(), &end);
  if (errno != 0 || end == t.c_str() || *end != '\0')
    return false;
  out = value;
  return true;
}

} // namespace bluos
