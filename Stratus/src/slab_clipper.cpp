// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/slab_clipper.hpp>

using frantic::graphics::vector3f;

namespace stratus {

namespace {

// Moves whichever endpoint lies on the outside of the plane onto it. 'belowIsOutside' selects the min plane.
void clip_to_plane( vector3f& start, vector3f& end, float planeY, bool belowIsOutside ) {
    const vector3f dir = end - start;
    if( dir.y == 0.f )
        return;

    const bool startOutside = belowIsOutside ? start.y < planeY : start.y > planeY;
    const bool endOutside = belowIsOutside ? end.y < planeY : end.y > planeY;
    if( !startOutside && !endOutside )
        return;

    const float t = -( start.y - planeY ) / dir.y;
    vector3f hit = start + dir * t;
    hit.y = planeY;

    if( startOutside )
        start = hit;
    else
        end = hit;
}

} // anonymous namespace

bool clip_segment_to_slab( vector3f& inoutStart, vector3f& inoutEnd, const fog_volume_bounds& bounds ) {
    if( ( inoutStart.y < bounds.minY && inoutEnd.y < bounds.minY ) ||
        ( inoutStart.y > bounds.maxY && inoutEnd.y > bounds.maxY ) ) {
        inoutStart = inoutEnd;
        return false;
    }

    clip_to_plane( inoutStart, inoutEnd, bounds.minY, true );
    clip_to_plane( inoutStart, inoutEnd, bounds.maxY, false );

    return true;
}

} // namespace stratus
