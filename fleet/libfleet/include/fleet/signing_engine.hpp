/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file signing_engine.hpp
 * @brief Signs verified binaries with a local Ed25519 private key.
 **/

#ifndef _FLEET_SIGNING_ENGINE_HPP_
#define _FLEET_SIGNING_ENGINE_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/binary.hpp"
#include "fleet/admin_api.hpp"

#include <string>

/** fleet namespace */
namespace fleet
{

class FLEETAPI SigningEngine final
{
public:
    explicit SigningEngine(AdminApi &api);

    /**
     * Signs the uppercase hex encoding of @a content_hash with the PKCS#8 PEM Ed25519 key at
     * @a private_key_path. Ed25519 is deterministic, so the same key and hash always give the same signature.
     *
     * @return Uppercase hex signature, or FLEET_INVALID_KEY if the key cannot be read or parsed.
     */
    static Expected<std::string> sign_digest(const std::string &private_key_path, const std::string &content_hash);

    /**
     * Signs the verified hash of @a binary and submits the signature. Once accepted the binary is marked signed.
     * Returns FLEET_SIGNATURE_REJECTED when the remote service refuses the signature (unknown key, conflicting
     * signature).
     */
    Expected<BinarySignature> sign_binary(const Binary &binary, const SigningKeyPair &key_pair);

private:
    AdminApi &m_api;
};

} /* namespace fleet */

#endif /* _FLEET_SIGNING_ENGINE_HPP_ */
