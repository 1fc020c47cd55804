// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <frantic/graphics/vector3f.hpp>

namespace stratus {

/**
 * The horizontal region between two Y planes that contains all of the fog.
 */
struct fog_volume_bounds {
    float minY;
    float maxY;

    fog_volume_bounds()
        : minY( -40.f )
        , maxY( 4.4f ) {}

    fog_volume_bounds( float minY_, float maxY_ )
        : minY( minY_ )
        , maxY( maxY_ ) {}
};

/**
 * Clips the segment [start,end] to the fog slab in place.
 *
 * The min plane is processed first and the max plane second, using the start point produced by the first clip. Any
 * endpoint that is moved lands exactly on its plane so clipping an already clipped segment leaves it unchanged. A plane
 * is ignored when the segment is parallel to it.
 *
 * @param inoutStart The segment start, typically the camera position.
 * @param inoutEnd The segment end, typically the reconstructed depth buffer position.
 * @param bounds The fog slab.
 * @return false if the segment lies entirely above or below the slab. In that case start is set equal to end.
 */
bool clip_segment_to_slab( frantic::graphics::vector3f& inoutStart, frantic::graphics::vector3f& inoutEnd,
                           const fog_volume_bounds& bounds );

} // namespace stratus
