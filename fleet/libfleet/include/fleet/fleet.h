/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file fleet.h
 * @brief C definitions for the fleet library.
 *
 * Status codes and default values shared by the fleet ingestion library and the fleetctl command line tool.
 **/

#ifndef _FLEET_H_
#define _FLEET_H_

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>
#include <limits.h>

#if defined(_MSC_VER)
#define FLEETAPI
#else
#define FLEETAPI __attribute__ ((visibility ("default")))
#endif

/** @defgroup group_defines fleet API definitions
 *  @{
 */

#define FLEET_MAX_ENUM (INT_MAX)
#define FLEET_INFINITE (UINT32_MAX)

#define FLEET_DEFAULT_PART_SIZE (5 * 1024 * 1024)
#define FLEET_MAX_DEFAULT_CONCURRENCY (16)
#define FLEET_DEFAULT_REQUEST_TIMEOUT_MS (60000)
#define FLEET_DEFAULT_POLL_INTERVAL_MS (10000)
#define FLEET_DEFAULT_POLL_TIMEOUT_MS (300000)
#define FLEET_DEFAULT_MAX_UPLOAD_ATTEMPTS (5)
#define FLEET_DEFAULT_BACKOFF_BASE_MS (500)
#define FLEET_DEFAULT_BACKOFF_CAP_MS (30000)

#define FLEET_CONFIG_FORMAT_VERSION (2)
#define FLEET_LEDGER_FORMAT_VERSION (1)

/* FLEET_MAJOR_VERSION, FLEET_MINOR_VERSION and FLEET_REVISION_VERSION are defined by the build */
#define _FLEET_STRINGIFY(x) #x
#define FLEET_STRINGIFY(x) _FLEET_STRINGIFY(x)
#define FLEET_VERSION_STRING \
    FLEET_STRINGIFY(FLEET_MAJOR_VERSION) "." FLEET_STRINGIFY(FLEET_MINOR_VERSION) "." FLEET_STRINGIFY(FLEET_REVISION_VERSION)

/** @} */ // end of group_defines

/** @defgroup group_enums fleet API enums
 *  @{
 */

#define FLEET_STATUS_VARIABLES\
    FLEET_STATUS__X(0,  FLEET_SUCCESS                                 /*!< Success - No error */)\
    FLEET_STATUS__X(1,  FLEET_UNINITIALIZED                           /*!< No error code was initialized */)\
    FLEET_STATUS__X(2,  FLEET_INVALID_ARGUMENT                        /*!< Invalid argument passed to function */)\
    FLEET_STATUS__X(3,  FLEET_OUT_OF_HOST_MEMORY                      /*!< Cannot allocate more memory at host */)\
    FLEET_STATUS__X(4,  FLEET_TIMEOUT                                 /*!< Received a timeout */)\
    FLEET_STATUS__X(5,  FLEET_INVALID_OPERATION                       /*!< Invalid operation */)\
    FLEET_STATUS__X(6,  FLEET_NOT_IMPLEMENTED                         /*!< Code has not been implemented */)\
    FLEET_STATUS__X(7,  FLEET_INTERNAL_FAILURE                        /*!< Unexpected internal failure */)\
    FLEET_STATUS__X(8,  FLEET_OPEN_FILE_FAILURE                       /*!< Failed to open file */)\
    FLEET_STATUS__X(9,  FLEET_FILE_OPERATION_FAILURE                  /*!< File operation failure */)\
    FLEET_STATUS__X(10, FLEET_FILE_READ_FAILURE                       /*!< File disappeared or shrank while being read */)\
    FLEET_STATUS__X(11, FLEET_SIZE_MISMATCH                           /*!< File size differs from a previously recorded plan */)\
    FLEET_STATUS__X(12, FLEET_NOT_FOUND                               /*!< Remote or local resource was not found */)\
    FLEET_STATUS__X(13, FLEET_CONFLICT                                /*!< Remote resource disagrees with local content */)\
    FLEET_STATUS__X(14, FLEET_UPLOAD_FAILED                           /*!< Part upload failed after all retries */)\
    FLEET_STATUS__X(15, FLEET_HASH_VERIFICATION_FAILED                /*!< Remote integrity verification failed */)\
    FLEET_STATUS__X(16, FLEET_INVALID_KEY                             /*!< Private key could not be parsed */)\
    FLEET_STATUS__X(17, FLEET_SIGNATURE_REJECTED                      /*!< Remote service rejected the signature */)\
    FLEET_STATUS__X(18, FLEET_COMMUNICATION_FAILURE                   /*!< Transport level failure */)\
    FLEET_STATUS__X(19, FLEET_SERVER_UNAVAILABLE                      /*!< Remote service reported a transient error */)\
    FLEET_STATUS__X(20, FLEET_UNAUTHORIZED                            /*!< Remote service refused the credentials */)\
    FLEET_STATUS__X(21, FLEET_INVALID_REQUEST                         /*!< Remote service refused the request */)\
    FLEET_STATUS__X(22, FLEET_INVALID_RESPONSE                        /*!< Remote service response could not be parsed */)\
    FLEET_STATUS__X(23, FLEET_OPERATION_ABORTED                       /*!< Operation was cancelled by the user */)\
    FLEET_STATUS__X(24, FLEET_INVALID_CONFIG                          /*!< Local configuration is invalid */)\
    FLEET_STATUS__X(25, FLEET_LEDGER_CORRUPTED                        /*!< Resumability record could not be parsed */)\
    FLEET_STATUS__X(26, FLEET_SHUTDOWN_EVENT_SIGNALED                 /*!< Queue or worker was shut down */)\
    FLEET_STATUS__X(27, FLEET_CRYPTO_FAILURE                          /*!< Cryptographic library failure */)\

typedef enum {
#define FLEET_STATUS__X(value, name) name = value,
    FLEET_STATUS_VARIABLES
#undef FLEET_STATUS__X

    /** Must be last! */
    FLEET_STATUS_COUNT,

    /** Max enum value to maintain ABI Integrity */
    FLEET_STATUS_MAX_ENUM                       = FLEET_MAX_ENUM
} fleet_status;

/** Console log level */
typedef enum {
    FLEET_LOG_LEVEL_TRACE,
    FLEET_LOG_LEVEL_DEBUG,
    FLEET_LOG_LEVEL_INFO,
    FLEET_LOG_LEVEL_WARNING,
    FLEET_LOG_LEVEL_ERROR,
    FLEET_LOG_LEVEL_CRITICAL,

    /** Max enum value to maintain ABI Integrity */
    FLEET_LOG_LEVEL_MAX_ENUM = FLEET_MAX_ENUM
} fleet_log_level_t;

/** @} */ // end of group_enums

/** @defgroup group_functions fleet API functions
 *  @{
 */

/**
 * Returns a string format of @a status.
 *
 * @param[in] status        A ::fleet_status to be converted to string format.
 * @return Upon success, returns @a status as a string format. Otherwise, returns @a nullptr.
 **/
FLEETAPI const char* fleet_get_status_message(fleet_status status);

/**
 * Installs the library logger as the default logger: a colored console sink on stderr and a rotating log file
 * under the cache directory (or the directory named by FLEET_LOGGER_PATH). The FLEET_CONSOLE_LOGGER_LEVEL
 * environment variable takes precedence over @a console_level.
 *
 * @param[in] console_level     Minimal level printed to stderr.
 * @return Upon success, returns ::FLEET_SUCCESS. Otherwise, returns a ::fleet_status error.
 **/
FLEETAPI fleet_status fleet_init_logger(fleet_log_level_t console_level);

/** @} */ // end of group_functions

#ifdef __cplusplus
}
#endif

#endif /* _FLEET_H_ */
