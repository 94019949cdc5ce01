// keygen_test.cpp

#include <gtest/gtest.h>

#include <array>

#include "keygen.h"
#include "pattern.h"

TEST(P2wpkhOracle, DerivesKnownAddress) {
  std::array<unsigned char,32> one{};
  one[31] = 1;
  P2wpkhOracle mainnet(kMainnet);
  P2wpkhOracle testnet(kTestnet);
  EXPECT_EQ("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", mainnet.addressFor(one));
  EXPECT_EQ("tb1qw508d6qejxtdg4y5r3zarvary0c5xw7kxpjzsx", testnet.addressFor(one));
}

TEST(P2wpkhOracle, RejectsZeroSecret) {
  std::array<unsigned char,32> zero{};
  P2wpkhOracle oracle(kMainnet);
  EXPECT_THROW(oracle.addressFor(zero), OracleError);
}

TEST(P2wpkhOracle, RandomCandidatesAreWellFormed) {
  P2wpkhOracle oracle(kMainnet);
  Candidate a = oracle.next();
  Candidate b = oracle.next();

  for (const Candidate* c : {&a, &b}) {
    ASSERT_EQ(42u, c->address.size());
    EXPECT_EQ(0u, c->address.find("bc1q"));
    EXPECT_TRUE(isBech32Pattern(c->address.substr(4)));
    EXPECT_EQ(c->address, oracle.addressFor(c->secret));
  }
  EXPECT_NE(a.secret, b.secret);
  EXPECT_NE(a.address, b.address);
}
