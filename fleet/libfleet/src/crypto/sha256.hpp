/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file sha256.hpp
 * @brief Incremental SHA-256 over OpenSSL EVP, plus hex and base64 encoding of digests.
 **/

#ifndef _FLEET_SHA256_HPP_
#define _FLEET_SHA256_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/buffer.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <string>

namespace fleet
{

using Sha256Digest = std::array<uint8_t, 32>;

class Sha256 final
{
public:
    static Expected<Sha256> create();

    Sha256(Sha256 &&other) = default;
    Sha256(const Sha256 &) = delete;
    Sha256 &operator=(const Sha256 &) = delete;
    Sha256 &operator=(Sha256 &&) = default;

    fleet_status update(const MemoryView &data);
    fleet_status update(const uint8_t *data, size_t size);
    // The object must be reset() before being updated again
    Expected<Sha256Digest> finalize();
    fleet_status reset();

    // One shot digest of @a data
    static Expected<Sha256Digest> digest(const MemoryView &data);

    static std::string to_hex(const Sha256Digest &digest, bool uppercase = false);
    static std::string to_hex(const uint8_t *data, size_t size, bool uppercase = false);
    static Expected<Sha256Digest> from_hex(const std::string &hex);
    static Expected<std::string> to_base64(const Sha256Digest &digest);

private:
    struct ContextDeleter {
        void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using ContextPtr = std::unique_ptr<EVP_MD_CTX, ContextDeleter>;

    explicit Sha256(ContextPtr &&context);

    ContextPtr m_context;
};

} /* namespace fleet */

#endif /* _FLEET_SHA256_HPP_ */
