// pattern.cpp

#include "pattern.h"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "address.h"

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return char(std::tolower(c)); });
  return s;
}

PatternSpec makePattern(const std::string& prefix,
                        const std::optional<std::string>& suffix,
                        const std::string& tag) {
  PatternSpec spec;
  spec.tag = toLower(tag);
  spec.prefix = toLower(prefix);
  if (suffix) spec.suffix = toLower(*suffix);
  return spec;
}

// address[pos, pos + lower.size()) equals lower, ignoring the address's case
static bool equalsLowered(const std::string& address, size_t pos,
                          const std::string& lower) {
  for (size_t i = 0; i < lower.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(address[pos + i]);
    if (char(std::tolower(c)) != lower[i]) return false;
  }
  return true;
}

bool matchesPattern(const std::string& address, const PatternSpec& spec) {
  const size_t t = spec.tag.size();
  if (address.size() <= t || !equalsLowered(address, 0, spec.tag))
    return false;

  const std::string& p = spec.prefix;
  if (address.size() - t < p.size() || !equalsLowered(address, t, p))
    return false;

  if (!spec.suffix) return true;
  const std::string& s = *spec.suffix;
  return address.size() >= s.size() &&
         equalsLowered(address, address.size() - s.size(), s);
}

bool isBech32Pattern(const std::string& s) {
  for (char c : s) {
    char l = char(std::tolower(static_cast<unsigned char>(c)));
    if (l == '\0' || !std::strchr(BECH32_CHARSET, l)) return false;
  }
  return true;
}
