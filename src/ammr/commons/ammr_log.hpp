/**
 * @file ammr_log.hpp
 * @brief Logger facility with pluggable sink
 *
 * Pretty standard logging with log_info(), log_debug() macros and so on.
 *
 * Features to mention:
 * - the output of the logging is delegated to a sink callable, which is
 *   injected by the host with log_register_sink(). The Python extension
 *   module injects a wrapper around a Python callable.
 * - single-branch runtime triggering of log statements
 * - remove (not minimize) runtime impact of log statement parameter
 *   evaluation when log is not triggered
 * - uses boost::format, so placeholders are %1%, %2% ...
 */

#pragma once

#include "ammr_common.hpp"
#include <functional>

typedef enum {
    log_level_trace,
    log_level_debug,
    log_level_info,
    log_level_warning,
    log_level_error,
} log_level;

typedef std::function<void(log_level, const char *)> log_sink_t;

/**
 * @brief returns true if the specified log @p lvl triggers the currently set log threshold
 */
bool log_trigger(log_level lvl);

/**
 * @brief returns the currently set log level threshold
 */
log_level log_get_level();

/**
 * @brief sets the log level threshold
 */
void log_set_level(log_level lvl);

/**
 * @brief Injects the log data sink. An empty sink drops all records.
 */
void log_register_sink(log_sink_t sink);


void log_emit_ll(log_level lvl, const std::string &msg);


// the whole argument list (format included) only gets evaluated
// past the trigger check
#define log_emit(lvl, ...)  do { if(log_trigger(lvl)) log_emit_ll(lvl, ::ammr::strfmt(__VA_ARGS__)); } while (0)

// here, use these:
#define log_trace(...)   log_emit(log_level_trace  , __VA_ARGS__)
#define log_debug(...)   log_emit(log_level_debug  , __VA_ARGS__)
#define log_info(...)    log_emit(log_level_info   , __VA_ARGS__)
#define log_warning(...) log_emit(log_level_warning, __VA_ARGS__)
#define log_error(...)   log_emit(log_level_error  , __VA_ARGS__)
