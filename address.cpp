// address.cpp

#include "address.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <vector>

#include <openssl/sha.h>
#include <openssl/ripemd.h>

const Network kMainnet{"mainnet", "bc", "bc1q", 0x80};
const Network kTestnet{"testnet", "tb", "tb1q", 0xef};

static const char* BASE58_ALPHABET =
  "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const char BECH32_CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

void hash160(const unsigned char* data, size_t len, unsigned char out[20]) {
  unsigned char sha[SHA256_DIGEST_LENGTH];
  SHA256(data, len, sha);
  RIPEMD160(sha, SHA256_DIGEST_LENGTH, out);
}

std::string toHex(const unsigned char* data, size_t len) {
  static const char* hexmap = "0123456789abcdef";
  std::string res(len * 2, '0');
  for (size_t i = 0; i < len; ++i) {
    res[2*i]   = hexmap[(data[i] >> 4) & 0xF];
    res[2*i+1] = hexmap[data[i] & 0xF];
  }
  return res;
}

// Base58Check encode from raw byte buffer
std::string base58Check(const unsigned char* data, size_t len) {
  std::vector<unsigned char> buf(data, data+len);
  unsigned char h1[SHA256_DIGEST_LENGTH], h2[SHA256_DIGEST_LENGTH];
  SHA256(buf.data(), buf.size(), h1);
  SHA256(h1, SHA256_DIGEST_LENGTH, h2);
  buf.insert(buf.end(), h2, h2+4);

  size_t zeros = 0;
  while (zeros < buf.size() && buf[zeros] == 0) ++zeros;

  std::string res; res.reserve(buf.size()*138/100 + 1);
  size_t start = zeros;
  while (start < buf.size()) {
    int carry = 0;
    for (size_t i = start; i < buf.size(); ++i) {
      int v = (carry << 8) + buf[i];
      buf[i] = v / 58;
      carry = v % 58;
    }
    res.push_back(BASE58_ALPHABET[carry]);
    while (start < buf.size() && buf[start] == 0) ++start;
  }
  for (size_t i = 0; i < zeros; ++i) res.push_back('1');
  std::reverse(res.begin(), res.end());
  return res;
}

// BIP173 checksum generator
static uint32_t bech32Polymod(const std::vector<uint8_t>& values) {
  static const uint32_t GEN[5] = {
    0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
  };
  uint32_t chk = 1;
  for (uint8_t v : values) {
    uint32_t top = chk >> 25;
    chk = ((chk & 0x1ffffff) << 5) ^ v;
    for (int i = 0; i < 5; ++i)
      if ((top >> i) & 1) chk ^= GEN[i];
  }
  return chk;
}

std::string encodeP2wpkh(const char* hrp, const unsigned char h160[20]) {
  // witness version 0, then the program regrouped 8 -> 5 bits (160 bits, no padding)
  std::vector<uint8_t> data;
  data.reserve(33 + 6);
  data.push_back(0);
  uint32_t acc = 0;
  int bits = 0;
  for (int i = 0; i < 20; ++i) {
    acc = (acc << 8) | h160[i];
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      data.push_back((acc >> bits) & 31);
    }
  }

  size_t hlen = std::strlen(hrp);
  std::vector<uint8_t> chk;
  chk.reserve(hlen * 2 + 1 + data.size() + 6);
  for (size_t i = 0; i < hlen; ++i) chk.push_back(uint8_t(hrp[i]) >> 5);
  chk.push_back(0);
  for (size_t i = 0; i < hlen; ++i) chk.push_back(uint8_t(hrp[i]) & 31);
  chk.insert(chk.end(), data.begin(), data.end());
  chk.insert(chk.end(), 6, 0);
  uint32_t mod = bech32Polymod(chk) ^ 1;

  std::string res(hrp);
  res.reserve(hlen + 1 + data.size() + 6);
  res.push_back('1');
  for (uint8_t d : data) res.push_back(BECH32_CHARSET[d]);
  for (int i = 0; i < 6; ++i)
    res.push_back(BECH32_CHARSET[(mod >> (5 * (5 - i))) & 31]);
  return res;
}

// version byte + priv + 0x01
std::string encodeWif(const unsigned char priv[32], const Network& net) {
  unsigned char wifd[34];
  wifd[0] = net.wif_prefix;
  std::memcpy(wifd+1, priv, 32);
  wifd[33] = 0x01;
  return base58Check(wifd, 34);
}
