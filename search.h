// search.h

#ifndef SEGVANITY_SEARCH_H
#define SEGVANITY_SEARCH_H

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include "keygen.h"
#include "pattern.h"

using Clock = std::chrono::steady_clock;

// The one published match of a run.
struct MatchResult {
  std::array<unsigned char,32> secret;
  std::string private_key;   // lowercase hex
  std::string address;
};

struct SearchConfig {
  PatternSpec pattern;
  unsigned threads = 1;
  Clock::duration stats_interval = std::chrono::seconds(5);
  size_t batch_size = 1000;
  bool report_threads = true;   // "Thread N finished" lines
};

struct SearchReport {
  std::optional<MatchResult> match;
  uint64_t attempts = 0;
  Clock::duration elapsed{};
};

// Builds the oracle for worker `id`. Called on the worker's own thread.
using OracleFactory = std::function<std::unique_ptr<CandidateOracle>(unsigned id)>;

// State shared by all workers of one run. Each slot has its own guard and no
// method holds more than one of them.
class SearchState {
public:
  SearchState(Clock::duration stats_interval, std::ostream& out);

  SearchState(const SearchState&) = delete;
  SearchState& operator=(const SearchState&) = delete;

  // Set once a match is published or a worker failed; never cleared.
  bool finished() const {
    return found_.load(std::memory_order_acquire) ||
           failed_.load(std::memory_order_acquire);
  }

  // First publish wins and returns true. Later calls drop their result.
  bool publish(MatchResult r);
  std::optional<MatchResult> result() const;

  // Keeps the first error only.
  void fail(std::exception_ptr e);
  std::exception_ptr error() const;

  void addAttempts(uint64_t n) { attempts_.fetch_add(n, std::memory_order_relaxed); }
  uint64_t attempts() const { return attempts_.load(std::memory_order_relaxed); }

  // True for the caller that should print the next stats line; resets the
  // timestamp when it does.
  bool claimStats(Clock::time_point now);

  Clock::time_point startedAt() const { return started_; }

  // Writes one whole line to the run's output.
  void emit(const std::string& line);

private:
  const Clock::time_point started_;
  const Clock::duration interval_;

  mutable std::mutex match_mutex_;
  std::optional<MatchResult> match_;
  std::atomic<bool> found_{false};

  std::atomic<uint64_t> attempts_{0};

  std::mutex stats_mutex_;
  Clock::time_point last_stats_;

  mutable std::mutex error_mutex_;
  std::exception_ptr error_;
  std::atomic<bool> failed_{false};

  std::mutex console_mutex_;
  std::ostream& out_;
};

// "Attempts: N, Time: Ss, Rate: R addr/s". Prints nothing and returns false
// until at least one whole second has elapsed.
bool printStats(std::ostream& out, uint64_t attempts, Clock::duration elapsed);

// Worker loop: batches of candidates until the state reports finished.
// Exceptions from the oracle propagate to the caller.
void searchWorker(unsigned id, const SearchConfig& cfg,
                  CandidateOracle& oracle, SearchState& state);

// Runs cfg.threads workers to completion. Throws std::invalid_argument for a
// zero thread count or batch size, and rethrows the first worker failure.
SearchReport runSearch(const SearchConfig& cfg, const OracleFactory& makeOracle,
                       std::ostream& out);

#endif // SEGVANITY_SEARCH_H
