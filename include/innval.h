// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef INNVAL_H
#define INNVAL_H

#ifdef __cplusplus
#include <cstddef>

namespace innval{
class validator;
} // namespace innval

using innval_handle = innval::validator *;

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum INNVAL_CATEGORY
 *
 * Taxpayer category of an INN, derived from its length. The values are
 * bit flags so they can be combined in innval_config.categories.
 **/
typedef enum
{
    INNVAL_CATEGORY_INVALID      = 0,
    // 10 digits, one control digit
    INNVAL_CATEGORY_ORGANIZATION = 0x01,
    // 12 digits, two control digits
    INNVAL_CATEGORY_INDIVIDUAL   = 0x02,
} INNVAL_CATEGORY;

/**
 * @enum INNVAL_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    INNVAL_LOG_TRACE,
    INNVAL_LOG_DEBUG,
    INNVAL_LOG_INFO,
    INNVAL_LOG_WARN,
    INNVAL_LOG_ERROR,
    INNVAL_LOG_OFF,
} INNVAL_LOG_LEVEL;

#ifndef __cplusplus
typedef struct _innval_handle* innval_handle;
#endif

typedef struct _innval_config innval_config;

/**
 * @struct innval_config
 *
 * Configuration of a validator handle, all fields are optional.
 **/
struct _innval_config
{
    /** Bitmask of INNVAL_CATEGORY values accepted by the handle, 0 accepts all */
    uint32_t categories;
    /** Regular expression used by innval_search to locate candidates within
     *  free text, NULL selects the default pattern. The string is owned by the
     *  caller. */
    const char *search_regex;
};

/**
 * @typedef innval_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*innval_log_cb)(
    INNVAL_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * innval_validate
 *
 * Validates the control digits of an INN. Surrounding whitespace is ignored,
 * any other non-digit character invalidates the number.
 *
 * @param inn The candidate INN, not necessarily NUL-terminated. (nullable)
 * @param length Length of the candidate in bytes.
 *
 * @return true if the INN is well formed and its control digits match.
 **/
bool innval_validate(const char *inn, size_t length);

/**
 * innval_classify
 *
 * Determines the taxpayer category of a candidate INN from its trimmed length.
 * The digits themselves are not inspected.
 *
 * @param inn The candidate INN. (nullable)
 * @param length Length of the candidate in bytes.
 *
 * @return The category, or INNVAL_CATEGORY_INVALID.
 **/
INNVAL_CATEGORY innval_classify(const char *inn, size_t length);

/**
 * innval_init
 *
 * Creates a validator handle from the given configuration.
 *
 * @param config Optional configuration, NULL selects the defaults. (nullable)
 *
 * @return Handle to the validator or NULL on error.
 **/
innval_handle innval_init(const innval_config *config);

/**
 * innval_handle_validate
 *
 * Validates an INN, additionally rejecting categories which are not accepted
 * by the handle configuration.
 *
 * @param handle Validator handle. (nonnull)
 * @param inn The candidate INN. (nullable)
 * @param length Length of the candidate in bytes.
 *
 * @return true if the INN is valid and of an accepted category.
 **/
bool innval_handle_validate(innval_handle handle, const char *inn, size_t length);

/**
 * innval_search
 *
 * Finds the first valid INN of an accepted category within free text.
 *
 * @param handle Validator handle. (nonnull)
 * @param text Text to scan. (nullable)
 * @param length Length of the text in bytes.
 * @param offset Offset of the match within text, only written on success. (nullable)
 * @param match_length Length of the match, only written on success. (nullable)
 *
 * @return true if a valid INN was found.
 **/
bool innval_search(innval_handle handle, const char *text, size_t length, size_t *offset,
    size_t *match_length);

/**
 * innval_destroy
 *
 * Destroys a validator handle.
 *
 * @param handle Handle to destroy. (nullable)
 **/
void innval_destroy(innval_handle handle);

/**
 * innval_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *innval_get_version();

/**
 * innval_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool innval_set_log_cb(innval_log_cb cb, INNVAL_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*INNVAL_H */
