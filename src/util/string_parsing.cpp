#include "util/string_parsing.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace dropnet {
namespace util {

// std::sto* accept leading whitespace; we do not
static bool HasLeadingSpace(const std::string& str) {
  return !str.empty() && std::isspace(static_cast<unsigned char>(str[0]));
}

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  if (str.empty() || HasLeadingSpace(str)) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int64_t>(value);
  } catch (const std::logic_error&) {
    // invalid_argument or out_of_range
    return std::nullopt;
  }
}

std::optional<uint64_t> SafeParseUInt64(const std::string& str) {
  if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(value);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<double> SafeParseDouble(const std::string& str, double min, double max) {
  if (str.empty() || HasLeadingSpace(str)) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    double value = std::stod(str, &pos);
    if (pos != str.size() || !std::isfinite(value)) {
      return std::nullopt;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<std::pair<std::string, std::string>> SplitOnce(const std::string& str, char sep) {
  auto pos = str.find(sep);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return std::make_pair(str.substr(0, pos), str.substr(pos + 1));
}

} // namespace util
} // namespace dropnet
