// keygen.h

#ifndef SEGVANITY_KEYGEN_H
#define SEGVANITY_KEYGEN_H

#include <array>
#include <stdexcept>
#include <string>

#include <secp256k1.h>

#include "address.h"

// One generated key pair: raw secret and its address text.
struct Candidate {
  std::array<unsigned char,32> secret;
  std::string address;
};

// Candidate generation cannot proceed (entropy source, library setup).
class OracleError : public std::runtime_error {
public:
  explicit OracleError(const std::string& what) : std::runtime_error(what) {}
};

// Source of fresh candidates. One instance per worker thread; next() throws
// OracleError when it cannot produce a candidate.
class CandidateOracle {
public:
  virtual ~CandidateOracle() = default;
  virtual Candidate next() = 0;
};

// Random secp256k1 keys rendered as witness v0 keyhash addresses.
class P2wpkhOracle : public CandidateOracle {
public:
  explicit P2wpkhOracle(const Network& net);
  ~P2wpkhOracle() override;

  P2wpkhOracle(const P2wpkhOracle&) = delete;
  P2wpkhOracle& operator=(const P2wpkhOracle&) = delete;

  Candidate next() override;

  // Deterministic derivation for a given secret; throws OracleError if the
  // secret is not a valid secp256k1 scalar.
  std::string addressFor(const std::array<unsigned char,32>& secret) const;

private:
  const Network& net_;
  secp256k1_context* ctx_;
};

#endif // SEGVANITY_KEYGEN_H
