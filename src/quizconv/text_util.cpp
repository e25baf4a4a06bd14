#include "quizconv/text_util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace quizconv::text {

std::string Trim(const std::string& value) {
  std::size_t start = 0;
  std::size_t end = value.size();
  while (start < value.size() &&
         std::isspace(static_cast<unsigned char>(value[start])) != 0) {
    ++start;
  }
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(start, end - start);
}

std::string TrimRight(const std::string& value) {
  std::size_t end = value.size();
  while (end > 0 && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(0, end);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::size_t IndentOf(const std::string& value) {
  std::size_t indent = 0;
  while (indent < value.size() && value[indent] == ' ') {
    ++indent;
  }
  return indent;
}

std::vector<std::string> SplitLines(const std::string& content) {
  std::vector<std::string> lines;
  std::string current;
  std::istringstream stream(content);
  while (std::getline(stream, current)) {
    if (!current.empty() && current.back() == '\r') {
      current.pop_back();
    }
    lines.push_back(current);
  }
  return lines;
}

std::string JoinLines(const std::vector<std::string>& lines) {
  std::string joined;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      joined.push_back('\n');
    }
    joined.append(lines[i]);
  }
  return joined;
}

std::optional<double> ParseNumber(const std::string& value) {
  const std::string trimmed = Trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  for (const char ch : trimmed) {
    const bool allowed = std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '.' ||
                         ch == '-' || ch == '+' || ch == 'e' || ch == 'E';
    if (!allowed) {
      return std::nullopt;
    }
  }
  char* end = nullptr;
  const double parsed = std::strtod(trimmed.c_str(), &end);
  if (end == trimmed.c_str() || *end != '\0' || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::string FormatNumber(double value) {
  if (value == 0.0) {
    return "0";
  }
  if (std::nearbyint(value) == value && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.15g", value);
  if (std::strtod(buffer, nullptr) != value) {
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  }
  return buffer;
}

}  // namespace quizconv::text
