/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file signing_engine.cpp
 * @brief Ed25519 signing of verified binaries
 **/

#include "fleet/signing_engine.hpp"

#include "common/utils.hpp"

#include "crypto/sha256.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cctype>
#include <memory>
#include <vector>

namespace fleet
{

struct BioDeleter {
    void operator()(BIO *bio) const { BIO_free(bio); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY *pkey) const { EVP_PKEY_free(pkey); }
};
struct MdContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdContextPtr = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

static std::string pop_openssl_errors()
{
    std::string errors;
    unsigned long error = 0;
    while (0 != (error = ERR_get_error())) {
        char buffer[256] = {};
        ERR_error_string_n(error, buffer, sizeof(buffer));
        if (!errors.empty()) {
            errors += "; ";
        }
        errors += buffer;
    }
    return errors.empty() ? "no details" : errors;
}

static Expected<PkeyPtr> load_private_key(const std::string &private_key_path)
{
    BioPtr bio(BIO_new_file(private_key_path.c_str(), "r"));
    CHECK_AS_EXPECTED(nullptr != bio, FLEET_INVALID_KEY, "Failed opening private key {} ({})", private_key_path,
        pop_openssl_errors());

    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    CHECK_AS_EXPECTED(nullptr != pkey, FLEET_INVALID_KEY, "Failed parsing private key {} ({})", private_key_path,
        pop_openssl_errors());
    CHECK_AS_EXPECTED(EVP_PKEY_ED25519 == EVP_PKEY_id(pkey.get()), FLEET_INVALID_KEY,
        "Private key {} is not an Ed25519 key", private_key_path);

    return pkey;
}

SigningEngine::SigningEngine(AdminApi &api) :
    m_api(api)
{}

Expected<std::string> SigningEngine::sign_digest(const std::string &private_key_path, const std::string &content_hash)
{
    // Validates the digest, then normalizes it to the uppercase form that is signed
    TRY(const auto digest, Sha256::from_hex(content_hash), "Invalid content hash '{}'", content_hash);
    const auto message = Sha256::to_hex(digest, true);

    TRY(auto pkey, load_private_key(private_key_path));

    MdContextPtr context(EVP_MD_CTX_new());
    CHECK_NOT_NULL_AS_EXPECTED(context, FLEET_OUT_OF_HOST_MEMORY);
    // Ed25519 hashes internally, so no message digest is given
    CHECK_AS_EXPECTED(1 == EVP_DigestSignInit(context.get(), nullptr, nullptr, nullptr, pkey.get()),
        FLEET_INVALID_KEY, "EVP_DigestSignInit failed ({})", pop_openssl_errors());

    const auto message_data = reinterpret_cast<const unsigned char*>(message.data());
    size_t signature_size = 0;
    CHECK_AS_EXPECTED(1 == EVP_DigestSign(context.get(), nullptr, &signature_size, message_data, message.size()),
        FLEET_CRYPTO_FAILURE, "EVP_DigestSign failed ({})", pop_openssl_errors());

    std::vector<uint8_t> signature(signature_size);
    CHECK_AS_EXPECTED(1 == EVP_DigestSign(context.get(), signature.data(), &signature_size, message_data,
        message.size()), FLEET_CRYPTO_FAILURE, "EVP_DigestSign failed ({})", pop_openssl_errors());

    return Sha256::to_hex(signature.data(), signature_size, true);
}

Expected<BinarySignature> SigningEngine::sign_binary(const Binary &binary, const SigningKeyPair &key_pair)
{
    CHECK_AS_EXPECTED(BinaryStateUtils::is_verified(binary.state), FLEET_INVALID_OPERATION,
        "Binary {} cannot be signed in state {}", binary.id, BinaryStateUtils::to_string(binary.state));
    CHECK_AS_EXPECTED(!key_pair.signing_key_id.empty(), FLEET_INVALID_ARGUMENT,
        "Signing key pair '{}' has no signing key id", key_pair.name);

    TRY(const auto signature, sign_digest(key_pair.private_key_path, binary.hash));

    auto submitted = m_api.create_binary_signature(binary.id, key_pair.signing_key_id, signature);
    switch (submitted.status()) {
    case FLEET_CONFLICT:
    case FLEET_NOT_FOUND:
    case FLEET_INVALID_REQUEST:
        LOGGER__ERROR("Signature of binary {} with signing key {} was rejected (status {})", binary.id,
            key_pair.signing_key_id, submitted.status());
        return make_unexpected(FLEET_SIGNATURE_REJECTED);
    default:
        break;
    }
    CHECK_EXPECTED(submitted, "Failed submitting signature of binary {}", binary.id);
    LOGGER__INFO("Binary {} signed with signing key {}", binary.id, key_pair.signing_key_id);

    if (BinaryState::SIGNED != binary.state) {
        TRY(const auto signed_binary, m_api.mark_binary_signed(binary.id), "Failed marking binary {} signed",
            binary.id);
        LOGGER__DEBUG("Binary {} is now {}", binary.id, BinaryStateUtils::to_string(signed_binary.state));
    }

    return submitted;
}

} /* namespace fleet */
