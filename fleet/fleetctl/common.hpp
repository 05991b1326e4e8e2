/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file common.hpp
 * @brief Common functions.
 **/

#ifndef _FLEET_FLEETCTL_COMMON_HPP_
#define _FLEET_FLEETCTL_COMMON_HPP_

#include "fleet/binary.hpp"
#include "fleet/resumability_ledger.hpp"
#include "fleet/binary_pipeline.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

using namespace fleet;
using ordered_json = nlohmann::ordered_json;

// http://www.climagic.org/mirrors/VT100_Escape_Codes.html
#define FORMAT_CLEAR_LINE "\033[2K\r"
#define FORMAT_GREEN_PRINT "\x1B[1;32m"
#define FORMAT_NORMAL_PRINT "\x1B[0m"

class CliCommon final
{
public:
    CliCommon() = delete;

    static std::string duration_to_string(std::chrono::seconds secs);
    // Human readable size, e.g. "5.00 MiB"
    static std::string bytes_to_string(uint64_t bytes);
    static std::string status_to_message(fleet_status status);
    // Writes @a result as indented JSON to stdout
    static void print_json(const ordered_json &result);
};

// Based on NLOHMANN_JSON_SERIALIZE_ENUM (json/include/nlohmann/json.hpp)
// Accepts a static array instead of building one in the function
#define NLOHMANN_JSON_SERIALIZE_ENUM2(ENUM_TYPE, _pair_arr)\
    template<typename BasicJsonType>                                                            \
    inline void to_json(BasicJsonType& j, const ENUM_TYPE& e)                                   \
    {                                                                                           \
        static_assert(std::is_enum<ENUM_TYPE>::value, #ENUM_TYPE " must be an enum!");          \
        auto it = std::find_if(std::begin(_pair_arr), std::end(_pair_arr),                      \
                               [e](const std::pair<ENUM_TYPE, BasicJsonType>& ej_pair) -> bool  \
        {                                                                                       \
            return ej_pair.first == e;                                                          \
        });                                                                                     \
        j = ((it != std::end(_pair_arr)) ? it : std::begin(_pair_arr))->second;                 \
    }                                                                                           \
    template<typename BasicJsonType>                                                            \
    inline void from_json(const BasicJsonType& j, ENUM_TYPE& e)                                 \
    {                                                                                           \
        static_assert(std::is_enum<ENUM_TYPE>::value, #ENUM_TYPE " must be an enum!");          \
        auto it = std::find_if(std::begin(_pair_arr), std::end(_pair_arr),                      \
                               [&j](const std::pair<ENUM_TYPE, BasicJsonType>& ej_pair) -> bool \
        {                                                                                       \
            return ej_pair.second == j;                                                         \
        });                                                                                     \
        e = ((it != std::end(_pair_arr)) ? it : std::begin(_pair_arr))->first;                  \
    }

/* Serializers live in the namespace of the serialized types so that nlohmann::json finds them */
namespace fleet
{

static std::pair<BinaryState, std::string> binary_state_mapping[] = {
    {BinaryState::UNKNOWN, "unknown"},
    {BinaryState::PENDING, "pending"},
    {BinaryState::CREATED, "created"},
    {BinaryState::UPLOADING, "uploading"},
    {BinaryState::HASHABLE, "hashable"},
    {BinaryState::HASHING, "hashing"},
    {BinaryState::HASHED, "hashed"},
    {BinaryState::HASH_FAILED, "hash_failed"},
    {BinaryState::SIGNABLE, "signable"},
    {BinaryState::SIGNED, "signed"},
};

NLOHMANN_JSON_SERIALIZE_ENUM2(BinaryState, binary_state_mapping);

void to_json(ordered_json &j, const Binary &binary);
void to_json(ordered_json &j, const BinarySignature &signature);
void to_json(ordered_json &j, const ResumabilityRecord &record);
void to_json(ordered_json &j, const PipelineResult &result);

} /* namespace fleet */

#endif /* _FLEET_FLEETCTL_COMMON_HPP_ */
