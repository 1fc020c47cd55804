// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <frantic/logging/progress_logger.hpp>

#include <boost/thread.hpp>

#include <atomic>

namespace stratus {

/**
 * Collects row completion from every render thread and forwards it to a progress_logger. Only the thread that created
 * the master talks to the logger, so loggers need not be thread safe and a cancellation exception is raised on a thread
 * the caller controls.
 */
class parallel_progress_master {
    boost::thread::id m_loggingThreadId;
    std::atomic<std::size_t> m_curTicks;

    frantic::logging::progress_logger* m_delegateLogger;

    std::size_t m_totalTicks;

  public:
    parallel_progress_master( frantic::logging::progress_logger* delegateLogger, std::size_t totalTicks )
        : m_loggingThreadId( boost::this_thread::get_id() )
        , m_curTicks( 0 )
        , m_delegateLogger( delegateLogger )
        , m_totalTicks( totalTicks ) {}

    void update_progress( std::size_t tickCount ) {
        const std::size_t curTicks = tickCount + m_curTicks.fetch_add( tickCount );

        if( m_delegateLogger && boost::this_thread::get_id() == m_loggingThreadId )
            m_delegateLogger->update_progress( (long long)curTicks, (long long)m_totalTicks );
    }

    std::size_t completed() const { return m_curTicks.load(); }
};

} // namespace stratus
