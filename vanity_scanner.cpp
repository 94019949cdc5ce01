// vanity_scanner.cpp

#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "address.h"
#include "keygen.h"
#include "options.h"
#include "pattern.h"
#include "search.h"

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);

  Options opts;
  try {
    opts = parseOptions(argc, argv);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    printUsage(std::cerr, argv[0]);
    return 1;
  }
  if (opts.help) { printUsage(std::cout, argv[0]); return 0; }
  if (opts.version) { std::cout << "vanity_scanner " << SEGVANITY_VERSION << "\n"; return 0; }

  const Network& net = *opts.network;

  SearchConfig cfg;
  cfg.pattern = makePattern(opts.pattern, opts.suffix, net.tag);
  cfg.threads = resolveThreads(opts);
  cfg.stats_interval = std::chrono::seconds(opts.stats_interval);
  cfg.batch_size = opts.batch_size;
  cfg.report_threads = !opts.quiet;

  std::cout << "[*] Starting Bitcoin " << net.tag << " vanity address generator ("
            << net.name << ")\n";
  std::cout << "[*] Looking for pattern: '" << cfg.pattern.prefix << "' (after "
            << net.tag << ")\n";
  if (cfg.pattern.suffix)
    std::cout << "[*] And ending with: '" << *cfg.pattern.suffix << "'\n";
  std::cout << "[*] Using " << cfg.threads << " threads\n";
  std::cout << "[*] Press Ctrl+C to stop..." << std::endl;

  SearchReport report;
  try {
    report = runSearch(cfg, [&net](unsigned) {
      return std::make_unique<P2wpkhOracle>(net);
    }, std::cout);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[!] Fatal: " << e.what() << "\n";
    return 2;
  }

  if (!report.match) {
    std::cerr << "[!] Search ended without a match\n";
    return 2;
  }

  const MatchResult& m = *report.match;
  double secs = std::chrono::duration<double>(report.elapsed).count();
  std::cout << "\n[+] Found matching address after " << report.attempts
            << " attempts in " << std::fixed << std::setprecision(2) << secs << "s!\n";
  std::cout << "Address:     " << m.address << "\n";
  std::cout << "Private key: " << m.private_key << "\n";
  std::cout << "WIF:         " << encodeWif(m.secret.data(), net) << "\n";
  std::cout.flush();
  return 0;
}
