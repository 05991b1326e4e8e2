/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file config.cpp
 * @brief Profiles, credentials and signing key pairs read from the configuration directory
 **/

#include "fleet/config.hpp"

#include "common/utils.hpp"
#include "common/env_vars.hpp"
#include "common/file_utils.hpp"
#include "common/filesystem.hpp"

#include <nlohmann/json.hpp>

namespace fleet
{

using json = nlohmann::json;

const std::string Config::CONFIG_FILE_NAME = "config.json";
const std::string Config::CREDENTIALS_FILE_NAME = "credentials.json";
const std::string Config::DEFAULT_PROFILE_NAME = "default";

static const std::string APP_DIRECTORY_NAME = "fleetctl";
static const std::string LEDGER_DIRECTORY_NAME = "uploads";

// Returns the first non empty value
static std::string first_of(std::initializer_list<std::string> values)
{
    for (const auto &value : values) {
        if (!value.empty()) {
            return value;
        }
    }
    return "";
}

static std::string env_or_empty(const char *name)
{
    auto value = get_env_variable(name);
    return value ? value.release() : "";
}

// A missing file reads as empty
static Expected<std::string> read_optional_file(const std::string &path)
{
    auto content = read_text_file(path);
    if (FLEET_NOT_FOUND == content.status()) {
        LOGGER__DEBUG("{} does not exist, using defaults", path);
        return std::string();
    }
    CHECK_EXPECTED(content, "Failed reading {}", path);
    return content;
}

static Expected<json> parse_json_document(const std::string &content, const std::string &name)
{
    if (content.empty()) {
        return json::object();
    }
    try {
        auto document = json::parse(content);
        CHECK_AS_EXPECTED(document.is_object(), FLEET_INVALID_CONFIG, "{} must contain a JSON object", name);
        return document;
    } catch (const json::exception &e) {
        LOGGER__ERROR("Failed parsing {}: {}", name, e.what());
        return make_unexpected(FLEET_INVALID_CONFIG);
    }
}

static std::string string_field(const json &object, const std::string &key)
{
    const auto it = object.find(key);
    return ((object.end() != it) && it->is_string()) ? it->get<std::string>() : "";
}

std::string Config::default_config_directory()
{
    auto directory = get_env_variable(FLEET_CONFIG_DIR_ENV_VAR);
    if (directory) {
        return directory.release();
    }
    auto xdg_config = get_env_variable(XDG_CONFIG_HOME_ENV_VAR);
    if (xdg_config) {
        return Filesystem::join(xdg_config.value(), APP_DIRECTORY_NAME);
    }
    return Filesystem::join(Filesystem::join(Filesystem::get_home_directory(), ".config"), APP_DIRECTORY_NAME);
}

std::string Config::default_cache_directory()
{
    auto directory = get_env_variable(FLEET_CACHE_DIR_ENV_VAR);
    if (directory) {
        return directory.release();
    }
    auto xdg_cache = get_env_variable(XDG_CACHE_HOME_ENV_VAR);
    if (xdg_cache) {
        return Filesystem::join(xdg_cache.value(), APP_DIRECTORY_NAME);
    }
    return Filesystem::join(Filesystem::join(Filesystem::get_home_directory(), ".cache"), APP_DIRECTORY_NAME);
}

Expected<Config> Config::load(const ConfigOverrides &overrides)
{
    const auto directory = overrides.config_directory.empty() ? default_config_directory() :
        overrides.config_directory;

    TRY(const auto config_json, read_optional_file(Filesystem::join(directory, CONFIG_FILE_NAME)));
    TRY(const auto credentials_json, read_optional_file(Filesystem::join(directory, CREDENTIALS_FILE_NAME)));
    return parse(config_json, credentials_json, overrides);
}

Expected<Config> Config::parse(const std::string &config_json, const std::string &credentials_json,
    const ConfigOverrides &overrides)
{
    TRY(const auto config_document, parse_json_document(config_json, CONFIG_FILE_NAME));
    TRY(const auto credentials_document, parse_json_document(credentials_json, CREDENTIALS_FILE_NAME));

    Config config;
    config.m_overrides = overrides;
    config.m_cache_directory = default_cache_directory();

    const auto env_profile = env_or_empty(FLEET_PROFILE_ENV_VAR);
    const bool is_profile_explicit = !overrides.profile.empty() || !env_profile.empty();
    config.m_profile_name = first_of({overrides.profile, env_profile, DEFAULT_PROFILE_NAME});

    try {
        if (!config_document.empty()) {
            const auto version = config_document.at("version").get<uint32_t>();
            CHECK_AS_EXPECTED(FLEET_CONFIG_FORMAT_VERSION == version, FLEET_INVALID_CONFIG,
                "Unsupported {} version {} (expected {})", CONFIG_FILE_NAME, version, FLEET_CONFIG_FORMAT_VERSION);
        }

        const auto profiles = config_document.find("profiles");
        const bool has_profile = (config_document.end() != profiles) && profiles->contains(config.m_profile_name);
        if (has_profile) {
            const auto &profile = profiles->at(config.m_profile_name);
            config.m_profile.base_url = string_field(profile, "base_url");
            config.m_profile.ca_path = string_field(profile, "ca_path");
        } else {
            CHECK_AS_EXPECTED(!is_profile_explicit, FLEET_INVALID_CONFIG, "Profile '{}' is not configured",
                config.m_profile_name);
        }

        if (credentials_document.contains(config.m_profile_name)) {
            config.m_profile.api_key = string_field(credentials_document.at(config.m_profile_name), "api_key");
        }

        const auto key_pairs = config_document.find("signing_key_pairs");
        if (config_document.end() != key_pairs) {
            for (const auto &key_pair : key_pairs->items()) {
                SigningKeyPair pair{};
                pair.name = key_pair.key();
                pair.signing_key_id = key_pair.value().at("signing_key_prn").get<std::string>();
                pair.private_key_path = key_pair.value().at("signing_key_private_path").get<std::string>();
                config.m_signing_key_pairs.emplace(pair.name, pair);
            }
        }
    } catch (const json::exception &e) {
        LOGGER__ERROR("Malformed configuration: {}", e.what());
        return make_unexpected(FLEET_INVALID_CONFIG);
    }

    return config;
}

Expected<ApiConfig> Config::api_config() const
{
    ApiConfig api_config{};
    api_config.api_key = first_of({m_overrides.api_key, env_or_empty(FLEET_API_KEY_ENV_VAR), m_profile.api_key});
    api_config.base_url = first_of({m_overrides.base_url, env_or_empty(FLEET_BASE_URL_ENV_VAR), m_profile.base_url});
    api_config.ca_path = first_of({m_overrides.ca_path, env_or_empty(FLEET_CA_PATH_ENV_VAR), m_profile.ca_path});

    CHECK_AS_EXPECTED(!api_config.api_key.empty(), FLEET_INVALID_CONFIG,
        "No api key for profile '{}', pass --api-key or set {}", m_profile_name, FLEET_API_KEY_ENV_VAR);
    CHECK_AS_EXPECTED(!api_config.base_url.empty(), FLEET_INVALID_CONFIG,
        "No base url for profile '{}', pass --base-url or set {}", m_profile_name, FLEET_BASE_URL_ENV_VAR);
    return api_config;
}

Expected<SigningKeyPair> Config::signing_key_pair(const std::string &name) const
{
    const auto it = m_signing_key_pairs.find(name);
    CHECK_AS_EXPECTED(m_signing_key_pairs.end() != it, FLEET_NOT_FOUND, "Signing key pair '{}' is not configured",
        name);
    return Expected<SigningKeyPair>(it->second);
}

std::string Config::ledger_directory() const
{
    return Filesystem::join(m_cache_directory, LEDGER_DIRECTORY_NAME);
}

} /* namespace fleet */
