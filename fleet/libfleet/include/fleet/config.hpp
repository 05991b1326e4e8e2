/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file config.hpp
 * @brief Local configuration: profiles, credentials and signing key pairs.
 *
 * The configuration directory holds config.json (format version 2) and credentials.json:
 *
 *   config.json:      {"version": 2,
 *                      "profiles": {"<name>": {"base_url": "...", "ca_path": "..."}},
 *                      "signing_key_pairs": {"<name>": {"signing_key_prn": "...",
 *                                                        "signing_key_private_path": "..."}}}
 *   credentials.json: {"<profile>": {"api_key": "..."}}
 *
 * Both files are optional. Settings resolve in order: explicit override, environment variable, selected profile.
 **/

#ifndef _FLEET_CONFIG_HPP_
#define _FLEET_CONFIG_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/binary.hpp"
#include "fleet/admin_api.hpp"

#include <map>
#include <string>

/** fleet namespace */
namespace fleet
{

/*! Values given explicitly (command line). Empty strings mean "not given". */
struct ConfigOverrides {
    std::string profile;
    std::string config_directory;
    std::string api_key;
    std::string base_url;
    std::string ca_path;
};

struct ProfileConfig {
    std::string base_url;
    std::string ca_path;
    std::string api_key;
};

class FLEETAPI Config final
{
public:
    static const std::string CONFIG_FILE_NAME;
    static const std::string CREDENTIALS_FILE_NAME;
    static const std::string DEFAULT_PROFILE_NAME;

    // Reads the configuration directory once. Missing files are treated as empty.
    static Expected<Config> load(const ConfigOverrides &overrides);

    // Builds a configuration from file contents, an empty string stands for a missing file
    static Expected<Config> parse(const std::string &config_json, const std::string &credentials_json,
        const ConfigOverrides &overrides);

    static std::string default_config_directory();
    static std::string default_cache_directory();

    // Returns FLEET_INVALID_CONFIG when no api key or base url could be resolved
    Expected<ApiConfig> api_config() const;

    // Returns FLEET_NOT_FOUND when no key pair named @a name is configured
    Expected<SigningKeyPair> signing_key_pair(const std::string &name) const;

    const std::string &profile_name() const { return m_profile_name; }
    const std::string &cache_directory() const { return m_cache_directory; }
    std::string ledger_directory() const;

private:
    Config() = default;

    std::string m_profile_name;
    ProfileConfig m_profile;
    std::map<std::string, SigningKeyPair> m_signing_key_pairs;
    ConfigOverrides m_overrides;
    std::string m_cache_directory;
};

} /* namespace fleet */

#endif /* _FLEET_CONFIG_HPP_ */
