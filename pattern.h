// pattern.h

#ifndef SEGVANITY_PATTERN_H
#define SEGVANITY_PATTERN_H

#include <optional>
#include <string>

// Match criteria. prefix and suffix are stored lowercased.
struct PatternSpec {
  std::string tag;
  std::string prefix;
  std::optional<std::string> suffix;
};

PatternSpec makePattern(const std::string& prefix,
                        const std::optional<std::string>& suffix,
                        const std::string& tag);

// True if address starts with spec.tag, continues with spec.prefix and,
// when a suffix is set, ends with it. Safe to call from any thread.
bool matchesPattern(const std::string& address, const PatternSpec& spec);

// Every character is in the bech32 data charset (case-insensitive).
bool isBech32Pattern(const std::string& s);

std::string toLower(std::string s);

#endif // SEGVANITY_PATTERN_H
