// options.cpp

#include "options.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <thread>

#include <getopt.h>

#include "pattern.h"

// characters after the 4-char tag of a witness v0 keyhash address
static constexpr size_t P2WPKH_DATA_CHARS = 38;

enum { OPT_TESTNET = 256 };

static unsigned long long parseCount(const char* flag, const char* arg,
                                     unsigned long long max) {
  if (!arg || !std::isdigit(static_cast<unsigned char>(arg[0])))
    throw ConfigError(std::string("invalid value for ") + flag + ": '" + (arg ? arg : "") + "'");
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(arg, &end, 10);
  if (errno == ERANGE || *end != '\0' || v > max)
    throw ConfigError(std::string("invalid value for ") + flag + ": '" + arg + "'");
  return v;
}

static void checkPattern(const char* what, const std::string& s) {
  if (!isBech32Pattern(s))
    throw ConfigError(std::string(what) + " '" + s +
                      "' has characters outside the bech32 set (" +
                      BECH32_CHARSET + ") and can never match");
  if (s.size() > P2WPKH_DATA_CHARS)
    throw ConfigError(std::string(what) + " '" + s + "' is longer than the " +
                      std::to_string(P2WPKH_DATA_CHARS) + " data characters of an address");
}

Options parseOptions(int argc, char** argv) {
  static const struct option long_options[] = {
    {"pattern",        required_argument, nullptr, 'p'},
    {"suffix",         required_argument, nullptr, 'x'},
    {"threads",        required_argument, nullptr, 't'},
    {"stats-interval", required_argument, nullptr, 's'},
    {"batch-size",     required_argument, nullptr, 'b'},
    {"testnet",        no_argument,       nullptr, OPT_TESTNET},
    {"quiet",          no_argument,       nullptr, 'q'},
    {"help",           no_argument,       nullptr, 'h'},
    {"version",        no_argument,       nullptr, 'V'},
    {nullptr, 0, nullptr, 0}
  };

  Options opts;
  bool have_pattern = false;

  opterr = 0;
  optind = 0;   // glibc: full rescan, parseOptions may run more than once
  int opt;
  while ((opt = getopt_long(argc, argv, ":p:x:t:s:b:qhV", long_options, nullptr)) != -1) {
    switch (opt) {
      case 'p':
        opts.pattern = optarg;
        have_pattern = true;
        break;
      case 'x':
        opts.suffix = std::string(optarg);
        break;
      case 't':
        opts.threads = unsigned(parseCount("--threads", optarg,
                                           std::numeric_limits<unsigned>::max()));
        if (opts.threads == 0)
          throw ConfigError("thread count must be at least 1");
        break;
      case 's':
        opts.stats_interval = unsigned(parseCount("--stats-interval", optarg,
                                                  std::numeric_limits<unsigned>::max()));
        break;
      case 'b':
        opts.batch_size = size_t(parseCount("--batch-size", optarg,
                                            std::numeric_limits<size_t>::max()));
        if (opts.batch_size == 0)
          throw ConfigError("batch size must be at least 1");
        break;
      case OPT_TESTNET:
        opts.network = &kTestnet;
        break;
      case 'q':
        opts.quiet = true;
        break;
      case 'h':
        opts.help = true;
        break;
      case 'V':
        opts.version = true;
        break;
      case ':':
        if (optopt > 0 && optopt < OPT_TESTNET)
          throw ConfigError(std::string("missing value for -") + char(optopt));
        throw ConfigError(std::string("missing value for ") + argv[optind - 1]);
      default:
        if (optopt > 0 && optopt < OPT_TESTNET)
          throw ConfigError(std::string("unknown option -") + char(optopt));
        throw ConfigError(std::string("unknown option ") + argv[optind - 1]);
    }
  }

  if (opts.help || opts.version) return opts;

  if (optind < argc)
    throw ConfigError(std::string("unexpected argument '") + argv[optind] + "'");
  if (!have_pattern)
    throw ConfigError("--pattern is required");

  checkPattern("pattern", opts.pattern);
  if (opts.suffix) checkPattern("suffix", *opts.suffix);
  return opts;
}

unsigned resolveThreads(const Options& opts) {
  if (opts.threads) return opts.threads;
  unsigned n = std::thread::hardware_concurrency();
  return n ? n : 1;
}

void printUsage(std::ostream& out, const char* prog) {
  out << "Bitcoin bc1q vanity address generator\n\n"
      << "Usage: " << prog << " -p PATTERN [options]\n\n"
      << "Options:\n"
      << "  -p, --pattern STR         Pattern to search for after the bc1q prefix\n"
      << "  -x, --suffix STR          Pattern that the address should end with\n"
      << "  -t, --threads NUM         Number of threads to use (default: all available)\n"
      << "  -s, --stats-interval SEC  Print stats every SEC seconds (default: 5)\n"
      << "  -b, --batch-size NUM      Candidates per thread between counter updates (default: 1000)\n"
      << "      --testnet             Search tb1q testnet addresses\n"
      << "  -q, --quiet               Do not print per-thread completion lines\n"
      << "  -h, --help                Show this help message\n"
      << "  -V, --version             Show version\n"
      << "\nExample:\n"
      << "  " << prog << " -p 0000 -x q -t 8\n";
}
