// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdlib>

namespace stratus {

/**
 *	Gets the number of threads the fog pass should use for an image. Rows are the unit of parallel work, so there is
 *	never any benefit to more threads than rows.
 *	@param	height		the number of rows in the output image
 *	@param	threadCap	the maximum number of threads that can be used in the render. Values below 1 mean no cap
 *	@return				the number of threads to render with, at least 1
 */
std::size_t get_render_thread_count( std::size_t height, int threadCap );

} // namespace stratus
