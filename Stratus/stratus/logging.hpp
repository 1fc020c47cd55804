// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace stratus {

// Matches the order of frantic::logging::logging_level.
enum logging_level_t { LOG_NONE = 0, LOG_ERRORS, LOG_WARNINGS, LOG_PROGRESS, LOG_STATS, LOG_DEBUG };

/**
 * Receives every log line Stratus produces once installed with set_global_logging_interface().
 *
 * Example Usage:
 * @code
 *     class my_logger : public stratus::logging_interface {
 *     public:
 *         virtual void write_log_line( const char* line, stratus::logging_level_t level ) {
 *             std::cout << "Fog: " << line << std::endl;
 *         }
 *     };
 * @endcode
 */
class logging_interface {
  public:
    virtual ~logging_interface();
    virtual void write_log_line( const char* line, logging_level_t level ) = 0;
};

//! Sets how verbose the library is. Stats and debug output can slow down rendering.
void set_global_logging_level( logging_level_t level );

//! The level last passed to set_global_logging_level(), LOG_WARNINGS if it was never called.
logging_level_t get_global_logging_level();

//! Routes all log streams to 'logger', or back to standard out when 'logger' is NULL. The logger must outlive any
//! rendering done while it is installed.
void set_global_logging_interface( logging_interface* logger );

} // namespace stratus
