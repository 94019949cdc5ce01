// search.cpp

#include "search.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "address.h"

SearchState::SearchState(Clock::duration stats_interval, std::ostream& out)
  : started_(Clock::now()), interval_(stats_interval),
    last_stats_(started_), out_(out) {}

bool SearchState::publish(MatchResult r) {
  std::lock_guard<std::mutex> g(match_mutex_);
  if (match_) return false;
  match_ = std::move(r);
  found_.store(true, std::memory_order_release);
  return true;
}

std::optional<MatchResult> SearchState::result() const {
  std::lock_guard<std::mutex> g(match_mutex_);
  return match_;
}

void SearchState::fail(std::exception_ptr e) {
  std::lock_guard<std::mutex> g(error_mutex_);
  if (!error_) error_ = std::move(e);
  failed_.store(true, std::memory_order_release);
}

std::exception_ptr SearchState::error() const {
  std::lock_guard<std::mutex> g(error_mutex_);
  return error_;
}

bool SearchState::claimStats(Clock::time_point now) {
  std::lock_guard<std::mutex> g(stats_mutex_);
  if (now - last_stats_ < interval_) return false;
  last_stats_ = now;
  return true;
}

void SearchState::emit(const std::string& line) {
  std::lock_guard<std::mutex> g(console_mutex_);
  out_ << line << std::endl;
}

bool printStats(std::ostream& out, uint64_t attempts, Clock::duration elapsed) {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
  if (secs <= 0) return false;
  double rate = double(attempts) / double(secs);
  out << "Attempts: " << attempts
      << ", Time: " << secs << "s"
      << ", Rate: " << std::fixed << std::setprecision(2) << rate << " addr/s";
  return true;
}

void searchWorker(unsigned id, const SearchConfig& cfg,
                  CandidateOracle& oracle, SearchState& state) {
  while (!state.finished()) {
    uint64_t checked = 0;
    for (size_t i = 0; i < cfg.batch_size; ++i) {
      Candidate c = oracle.next();
      ++checked;
      if (matchesPattern(c.address, cfg.pattern)) {
        MatchResult r{c.secret, toHex(c.secret.data(), c.secret.size()),
                      std::move(c.address)};
        // losing the race just drops r
        state.publish(std::move(r));
        break;
      }
    }
    state.addAttempts(checked);

    Clock::time_point now = Clock::now();
    if (state.claimStats(now)) {
      std::ostringstream line;
      if (printStats(line, state.attempts(), now - state.startedAt()))
        state.emit(line.str());
    }
  }

  if (cfg.report_threads)
    state.emit("Thread " + std::to_string(id) + " finished");
}

// Thread entry: any failure ends the whole run.
static void workerThread(unsigned id, const SearchConfig& cfg,
                         const OracleFactory& makeOracle, SearchState& state) {
  try {
    std::unique_ptr<CandidateOracle> oracle = makeOracle(id);
    if (!oracle) throw OracleError("no oracle for worker " + std::to_string(id));
    searchWorker(id, cfg, *oracle, state);
  } catch (...) {
    state.fail(std::current_exception());
  }
}

SearchReport runSearch(const SearchConfig& cfg, const OracleFactory& makeOracle,
                       std::ostream& out) {
  if (cfg.threads == 0)
    throw std::invalid_argument("thread count must be at least 1");
  if (cfg.batch_size == 0)
    throw std::invalid_argument("batch size must be at least 1");

  SearchState state(cfg.stats_interval, out);

  std::vector<std::thread> threads;
  threads.reserve(cfg.threads);
  try {
    for (unsigned i = 0; i < cfg.threads; ++i)
      threads.emplace_back(workerThread, i, std::cref(cfg),
                           std::cref(makeOracle), std::ref(state));
  } catch (const std::system_error&) {
    // stop the ones already running, then report
    state.fail(std::current_exception());
  }
  for (auto& t : threads) t.join();

  if (std::exception_ptr err = state.error())
    std::rethrow_exception(err);

  SearchReport report;
  report.match = state.result();
  report.attempts = state.attempts();
  report.elapsed = Clock::now() - state.startedAt();
  return report;
}
