// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/logging.hpp>

#include <frantic/logging/logging_level.hpp>
#include <frantic/strings/tstring.hpp>

namespace stratus {

namespace {

logging_interface* g_loggingInterface = NULL;
logging_level_t g_loggingLevel = LOG_WARNINGS;

// Forwards one stream's lines to the installed logging_interface.
class global_logging_interface_functor {
    logging_level_t m_level;

  public:
    global_logging_interface_functor( logging_level_t level )
        : m_level( level ) {}
    void operator()( const frantic::tchar* str ) {
        if( g_loggingInterface )
            g_loggingInterface->write_log_line( frantic::strings::to_string( str ).c_str(), m_level );
    }
};

global_logging_interface_functor g_debugFunctor( LOG_DEBUG );
global_logging_interface_functor g_statFunctor( LOG_STATS );
global_logging_interface_functor g_progressFunctor( LOG_PROGRESS );
global_logging_interface_functor g_warningFunctor( LOG_WARNINGS );
global_logging_interface_functor g_errorFunctor( LOG_ERRORS );

frantic::logging::ffstreambuf<global_logging_interface_functor> g_debugStream( g_debugFunctor );
frantic::logging::ffstreambuf<global_logging_interface_functor> g_statStream( g_statFunctor );
frantic::logging::ffstreambuf<global_logging_interface_functor> g_progressStream( g_progressFunctor );
frantic::logging::ffstreambuf<global_logging_interface_functor> g_warningStream( g_warningFunctor );
frantic::logging::ffstreambuf<global_logging_interface_functor> g_errorStream( g_errorFunctor );

} // anonymous namespace

void set_global_logging_level( logging_level_t level ) {
    frantic::logging::set_logging_level( (frantic::logging::logging_level)level );
    g_loggingLevel = level;
}

logging_level_t get_global_logging_level() { return g_loggingLevel; }

void set_global_logging_interface( logging_interface* logger ) {
    g_loggingInterface = logger;

    if( !logger ) {
        frantic::logging::reset_default_streams();
    } else {
        frantic::logging::redirect_stream( frantic::logging::debug, &g_debugStream );
        frantic::logging::redirect_stream( frantic::logging::stats, &g_statStream );
        frantic::logging::redirect_stream( frantic::logging::progress, &g_progressStream );
        frantic::logging::redirect_stream( frantic::logging::warning, &g_warningStream );
        frantic::logging::redirect_stream( frantic::logging::error, &g_errorStream );
    }
}

logging_interface::~logging_interface() {
    // Don't leave the streams pointing at a destroyed logger.
    if( g_loggingInterface == this ) {
        frantic::logging::reset_default_streams();
        g_loggingInterface = NULL;
    }
}

} // namespace stratus
