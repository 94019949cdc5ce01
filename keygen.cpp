// keygen.cpp

#include "keygen.h"

#include <openssl/err.h>
#include <openssl/rand.h>

P2wpkhOracle::P2wpkhOracle(const Network& net)
  : net_(net), ctx_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN)) {
  if (!ctx_) throw OracleError("secp256k1_context_create failed");
}

P2wpkhOracle::~P2wpkhOracle() {
  secp256k1_context_destroy(ctx_);
}

std::string P2wpkhOracle::addressFor(const std::array<unsigned char,32>& secret) const {
  secp256k1_pubkey pub;
  if (!secp256k1_ec_pubkey_create(ctx_, &pub, secret.data()))
    throw OracleError("secret key out of range");

  unsigned char pubc[33]; size_t plen = 33;
  secp256k1_ec_pubkey_serialize(ctx_, pubc, &plen, &pub, SECP256K1_EC_COMPRESSED);

  unsigned char h160[20];
  hash160(pubc, plen, h160);
  return encodeP2wpkh(net_.hrp, h160);
}

Candidate P2wpkhOracle::next() {
  Candidate c;
  // zero or >= n is rejected; redraw
  do {
    if (RAND_bytes(c.secret.data(), int(c.secret.size())) != 1) {
      char err[256];
      ERR_error_string_n(ERR_get_error(), err, sizeof(err));
      throw OracleError(std::string("RAND_bytes failed: ") + err);
    }
  } while (!secp256k1_ec_seckey_verify(ctx_, c.secret.data()));
  c.address = addressFor(c.secret);
  return c;
}
