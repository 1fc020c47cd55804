// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include "stratus/threading_functions.hpp"

#include <frantic/logging/logging_level.hpp>

#include <boost/algorithm/clamp.hpp>
#include <boost/thread.hpp>

std::size_t stratus::get_render_thread_count( std::size_t height, int threadCap ) {
    // Get the number of logical threads supported by hardware.
    const std::size_t numLogicalThreads = static_cast<std::size_t>( boost::thread::hardware_concurrency() );

    // If the supplied thread cap is less than one we ignore it.
    const std::size_t actualThreadCap =
        threadCap < 1 ? std::numeric_limits<std::size_t>::max() : static_cast<std::size_t>( threadCap );

    // hardware_concurrency() returns 0 when it can't tell, and an empty image still gets one thread.
    const std::size_t numThreads = boost::algorithm::clamp( std::min( numLogicalThreads, height ),
                                                            static_cast<std::size_t>( 1 ), actualThreadCap );

    FF_LOG( stats ) << "Rendering fog with " << numThreads << " threads because..." << std::endl;
    FF_LOG( stats ) << "\tNumber of rows: " << height << std::endl;
    FF_LOG( stats ) << "\tEffective user thread cap: " << actualThreadCap << std::endl;
    FF_LOG( stats ) << "\tNumber of logical threads detected " << numLogicalThreads << std::endl;

    return numThreads;
}
