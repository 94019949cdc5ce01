// options.h

#ifndef SEGVANITY_OPTIONS_H
#define SEGVANITY_OPTIONS_H

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "address.h"

#define SEGVANITY_VERSION "0.3.0"

// Bad command line.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct Options {
  std::string pattern;
  std::optional<std::string> suffix;
  unsigned threads = 0;          // 0: all hardware threads
  unsigned stats_interval = 5;   // seconds
  size_t batch_size = 1000;
  const Network* network = &kMainnet;
  bool quiet = false;
  bool help = false;
  bool version = false;
};

// Throws ConfigError. With help or version set the remaining fields are not
// validated.
Options parseOptions(int argc, char** argv);

// Options::threads, or the hardware thread count (at least 1) when unset.
unsigned resolveThreads(const Options& opts);

void printUsage(std::ostream& out, const char* prog);

#endif // SEGVANITY_OPTIONS_H
