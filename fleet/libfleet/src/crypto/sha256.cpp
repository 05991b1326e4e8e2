/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file sha256.cpp
 * @brief Incremental SHA-256 over OpenSSL EVP
 **/

#include "crypto/sha256.hpp"

#include "common/utils.hpp"

#include <cctype>

namespace fleet
{

Sha256::Sha256(ContextPtr &&context) :
    m_context(std::move(context))
{}

Expected<Sha256> Sha256::create()
{
    ContextPtr context(EVP_MD_CTX_new());
    CHECK_NOT_NULL_AS_EXPECTED(context, FLEET_OUT_OF_HOST_MEMORY);
    CHECK_AS_EXPECTED(1 == EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr), FLEET_CRYPTO_FAILURE,
        "EVP_DigestInit_ex failed");
    return Sha256(std::move(context));
}

fleet_status Sha256::update(const MemoryView &data)
{
    return update(data.data(), data.size());
}

fleet_status Sha256::update(const uint8_t *data, size_t size)
{
    if (0 == size) {
        return FLEET_SUCCESS;
    }
    CHECK_ARG_NOT_NULL(data);
    CHECK(1 == EVP_DigestUpdate(m_context.get(), data, size), FLEET_CRYPTO_FAILURE, "EVP_DigestUpdate failed");
    return FLEET_SUCCESS;
}

Expected<Sha256Digest> Sha256::finalize()
{
    Sha256Digest digest{};
    unsigned int digest_size = 0;
    CHECK_AS_EXPECTED(1 == EVP_DigestFinal_ex(m_context.get(), digest.data(), &digest_size), FLEET_CRYPTO_FAILURE,
        "EVP_DigestFinal_ex failed");
    CHECK_AS_EXPECTED(digest.size() == digest_size, FLEET_CRYPTO_FAILURE, "Unexpected digest size {}", digest_size);
    return digest;
}

fleet_status Sha256::reset()
{
    CHECK(1 == EVP_DigestInit_ex(m_context.get(), EVP_sha256(), nullptr), FLEET_CRYPTO_FAILURE,
        "EVP_DigestInit_ex failed");
    return FLEET_SUCCESS;
}

Expected<Sha256Digest> Sha256::digest(const MemoryView &data)
{
    TRY(auto sha, create());
    CHECK_SUCCESS_AS_EXPECTED(sha.update(data));
    return sha.finalize();
}

std::string Sha256::to_hex(const Sha256Digest &digest, bool uppercase)
{
    return to_hex(digest.data(), digest.size(), uppercase);
}

std::string Sha256::to_hex(const uint8_t *data, size_t size, bool uppercase)
{
    static const char LOWER_DIGITS[] = "0123456789abcdef";
    static const char UPPER_DIGITS[] = "0123456789ABCDEF";
    const char *digits = uppercase ? UPPER_DIGITS : LOWER_DIGITS;

    std::string hex;
    hex.reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

static int hex_digit_value(char c)
{
    if (('0' <= c) && (c <= '9')) {
        return c - '0';
    }
    const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (('a' <= lower) && (lower <= 'f')) {
        return lower - 'a' + 10;
    }
    return -1;
}

Expected<Sha256Digest> Sha256::from_hex(const std::string &hex)
{
    Sha256Digest digest{};
    CHECK_AS_EXPECTED(hex.size() == (digest.size() * 2), FLEET_INVALID_ARGUMENT,
        "Invalid SHA-256 hex digest length {}", hex.size());
    for (size_t i = 0; i < digest.size(); i++) {
        const auto high = hex_digit_value(hex[2 * i]);
        const auto low = hex_digit_value(hex[(2 * i) + 1]);
        CHECK_AS_EXPECTED((high >= 0) && (low >= 0), FLEET_INVALID_ARGUMENT, "Invalid SHA-256 hex digest '{}'", hex);
        digest[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return digest;
}

Expected<std::string> Sha256::to_base64(const Sha256Digest &digest)
{
    // 4 output chars per 3 input bytes, plus a null terminator
    std::array<unsigned char, (((sizeof(Sha256Digest) + 2) / 3) * 4) + 1> encoded{};
    const auto encoded_size = EVP_EncodeBlock(encoded.data(), digest.data(), static_cast<int>(digest.size()));
    CHECK_AS_EXPECTED(encoded_size > 0, FLEET_CRYPTO_FAILURE, "EVP_EncodeBlock failed");
    return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(encoded_size));
}

} /* namespace fleet */
