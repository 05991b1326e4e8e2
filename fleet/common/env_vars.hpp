/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file env_vars.hpp
 * @brief: defines a set of environment variables used by fleet
 * **/

#ifndef _FLEET_ENV_VARS_HPP_
#define _FLEET_ENV_VARS_HPP_


namespace fleet
{

#define FLEET_LOGGER_PATH_ENV_VAR ("FLEET_LOGGER_PATH")

#define FLEET_CONSOLE_LOGGER_LEVEL_ENV_VAR ("FLEET_CONSOLE_LOGGER_LEVEL")

#define FLEET_CONFIG_DIR_ENV_VAR ("FLEET_CONFIG_DIR")
#define FLEET_CACHE_DIR_ENV_VAR ("FLEET_CACHE_DIR")
#define FLEET_PROFILE_ENV_VAR ("FLEET_PROFILE")
#define FLEET_API_KEY_ENV_VAR ("FLEET_API_KEY")
#define FLEET_BASE_URL_ENV_VAR ("FLEET_BASE_URL")
#define FLEET_CA_PATH_ENV_VAR ("FLEET_CA_PATH")

#define XDG_CONFIG_HOME_ENV_VAR ("XDG_CONFIG_HOME")
#define XDG_CACHE_HOME_ENV_VAR ("XDG_CACHE_HOME")

} /* namespace fleet */

#endif /* _FLEET_ENV_VARS_HPP_ */
