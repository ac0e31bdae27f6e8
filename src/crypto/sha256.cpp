/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/crypto/sha256.hpp>

#include <memory>

#include <openssl/evp.h>

namespace peerscout::crypto {

  outcome::result<common::Hash256> sha256(BytesIn input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{
        EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (ctx == nullptr
        or 1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
      return HashError::FAILED_INITIALIZE_CONTEXT;
    }
    if (1 != EVP_DigestUpdate(ctx.get(), input.data(), input.size())) {
      return HashError::FAILED_UPDATE_DIGEST;
    }
    common::Hash256 digest{};
    if (1 != EVP_DigestFinal_ex(ctx.get(), digest.data(), nullptr)) {
      return HashError::FAILED_FINALIZE_DIGEST;
    }
    return digest;
  }

}  // namespace peerscout::crypto
