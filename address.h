// address.h

#ifndef SEGVANITY_ADDRESS_H
#define SEGVANITY_ADDRESS_H

#include <cstddef>
#include <string>

// Address flavour of a chain: bech32 HRP, the fixed "<hrp>1q" tag every
// witness v0 address starts with, and the WIF version byte.
struct Network {
  const char* name;
  const char* hrp;
  const char* tag;
  unsigned char wif_prefix;
};

extern const Network kMainnet;
extern const Network kTestnet;

// bech32 data alphabet, index = 5-bit value
extern const char BECH32_CHARSET[];

// SHA256 then RIPEMD160
void hash160(const unsigned char* data, size_t len, unsigned char out[20]);

std::string toHex(const unsigned char* data, size_t len);

std::string base58Check(const unsigned char* data, size_t len);

// Witness v0 keyhash address, e.g. bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4
std::string encodeP2wpkh(const char* hrp, const unsigned char h160[20]);

// Compressed-key WIF
std::string encodeWif(const unsigned char priv[32], const Network& net);

#endif // SEGVANITY_ADDRESS_H
