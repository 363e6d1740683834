// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef CONFSCRUB_H
#define CONFSCRUB_H

#ifdef __cplusplus
namespace confscrub {
class instance;
} // namespace confscrub

using confscrub_handle = confscrub::instance *;

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum CONFSCRUB_RET_CODE
 *
 * Codes returned by confscrub_redact.
 **/
typedef enum
{
    CONFSCRUB_ERR_INTERNAL         = -2,
    CONFSCRUB_ERR_INVALID_ARGUMENT = -1,
    CONFSCRUB_OK                   = 0,
    CONFSCRUB_MATCH                = 1,
} CONFSCRUB_RET_CODE;

/**
 * @enum CONFSCRUB_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    CONFSCRUB_LOG_TRACE,
    CONFSCRUB_LOG_DEBUG,
    CONFSCRUB_LOG_INFO,
    CONFSCRUB_LOG_WARN,
    CONFSCRUB_LOG_ERROR,
    CONFSCRUB_LOG_OFF,
} CONFSCRUB_LOG_LEVEL;

/**
 * @enum CONFSCRUB_REASON
 *
 * Which check flagged a line as sensitive.
 **/
typedef enum
{
    CONFSCRUB_REASON_NONE          = 0,
    // The key name matched the sensitive vocabulary
    CONFSCRUB_REASON_KEY_NAME      = 1,
    // The value matched a known secret shape
    CONFSCRUB_REASON_VALUE_PATTERN = 2,
} CONFSCRUB_REASON;

#ifndef __cplusplus
typedef struct _confscrub_handle* confscrub_handle;
#endif

typedef struct _confscrub_config confscrub_config;
typedef struct _confscrub_finding confscrub_finding;
typedef struct _confscrub_result confscrub_result;

/**
 * @struct confscrub_config
 *
 * Configuration to be provided to confscrub_init. Unlike passing NULL to
 * confscrub_init, a zero-initialised structure disables value inspection.
 **/
struct _confscrub_config
{
    struct {
        /** Text replacing sensitive values, NULL for ***REDACTED*** **/
        const char *marker;
    } redaction;

    struct {
        /** Additional sensitive key regex (re2 syntax), NULL for none **/
        const char *key_regex;
        /** Additional key exclusion regex (re2 syntax), NULL for none **/
        const char *exclusion_regex;
        /** Additional sensitive value regex (re2 syntax), NULL for none **/
        const char *value_regex;
    } patterns;

    /** Inspect values in addition to key names **/
    bool check_values;
    /** Parse and classify commented-out key/value lines **/
    bool include_comments;
    /** Drop comment lines from the redacted output **/
    bool remove_comments;
};

/**
 * @struct confscrub_finding
 *
 * A line flagged as sensitive.
 **/
struct _confscrub_finding
{
    /** 1-based line number **/
    uint64_t line;
    /** Section in effect, NULL at the top level **/
    const char *section;
    /** Key as written in the document **/
    const char *key;
    /** Vocabulary term or value shape which matched **/
    const char *pattern;
    CONFSCRUB_REASON reason;
    /** Whether the line was commented out **/
    bool commented;
};

/**
 * @struct confscrub_result
 *
 * Output of confscrub_redact, must be released with confscrub_result_free.
 **/
struct _confscrub_result
{
    /** Redacted document, nul-terminated **/
    char *text;
    /** Length of the redacted document, excluding the terminator **/
    uint64_t length;
    /** Findings in ascending line order **/
    confscrub_finding *findings;
    /** Number of findings **/
    uint32_t size;
};

/**
 * confscrub_init
 *
 * Validate the configuration and compile the classification tables.
 *
 * @param config Optional configuration, NULL selects the defaults.
 *
 * @return Handle to the instance or NULL if the configuration is invalid.
 **/
confscrub_handle confscrub_init(const confscrub_config *config);

/**
 * confscrub_destroy
 *
 * Destroy an instance.
 *
 * @param handle Handle to the instance, may be NULL.
 **/
void confscrub_destroy(confscrub_handle handle);

/**
 * confscrub_redact
 *
 * Scan a document and produce its redacted copy and findings.
 *
 * @param handle Instance created by confscrub_init. (nonnull)
 * @param document Document text, need not be nul-terminated.
 * @param length Length of the document.
 * @param result Structure to fill, owned by the caller after the call. (nonnull)
 *
 * @return CONFSCRUB_OK when nothing is sensitive, CONFSCRUB_MATCH when at
 *         least one finding was produced, or an error code.
 **/
CONFSCRUB_RET_CODE confscrub_redact(confscrub_handle handle, const char *document,
    size_t length, confscrub_result *result);

/**
 * confscrub_result_free
 *
 * Release the memory held by a result. The structure is reset.
 *
 * @param result Result to release, may be NULL.
 **/
void confscrub_result_free(confscrub_result *result);

/**
 * confscrub_reason_to_str
 *
 * @return Static string naming the reason.
 **/
const char *confscrub_reason_to_str(CONFSCRUB_REASON reason);

/**
 * confscrub_get_version
 *
 * @return The library version as a nul-terminated string.
 **/
const char *confscrub_get_version(void);

/**
 * @typedef confscrub_log_cb
 *
 * Callback that receives library log messages.
 **/
typedef void (*confscrub_log_cb)(CONFSCRUB_LOG_LEVEL level, const char *function,
    const char *file, unsigned line, const char *message, uint64_t message_len);

/**
 * confscrub_set_log_cb
 *
 * Set the callback receiving log messages.
 *
 * @param cb The callback, NULL disables logging.
 * @param min_level The minimum level reported.
 *
 * @return Whether the operation succeeded.
 **/
bool confscrub_set_log_cb(confscrub_log_cb cb, CONFSCRUB_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* CONFSCRUB_H */
