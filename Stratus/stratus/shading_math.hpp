// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cmath>

#include <boost/algorithm/clamp.hpp>

#include <frantic/graphics/color3f.hpp>
#include <frantic/graphics/vector3f.hpp>

namespace stratus {

/**
 * Hermite interpolation between 0 and 1 as x moves from edge0 to edge1, matching the GLSL built-in. When the edges
 * coincide the result is a hard step at edge0.
 */
inline float smoothstep( float edge0, float edge1, float x ) {
    if( edge1 == edge0 )
        return x < edge0 ? 0.f : 1.f;

    const float t = boost::algorithm::clamp( ( x - edge0 ) / ( edge1 - edge0 ), 0.f, 1.f );
    return t * t * ( 3.f - 2.f * t );
}

inline float mix( float a, float b, float t ) { return a + t * ( b - a ); }

inline frantic::graphics::color3f mix( const frantic::graphics::color3f& a, const frantic::graphics::color3f& b,
                                       float t ) {
    return frantic::graphics::color3f( mix( a.r, b.r, t ), mix( a.g, b.g, t ), mix( a.b, b.b, t ) );
}

inline frantic::graphics::color3f clamp_color( const frantic::graphics::color3f& c, float lo, float hi ) {
    return frantic::graphics::color3f( boost::algorithm::clamp( c.r, lo, hi ), boost::algorithm::clamp( c.g, lo, hi ),
                                       boost::algorithm::clamp( c.b, lo, hi ) );
}

/**
 * Raises |x| to the given power and restores the sign of x. Unlike std::pow this is defined for negative bases with a
 * fractional exponent, and it is identical to std::pow for non-negative bases.
 */
inline float signed_pow( float x, float exponent ) {
    if( x < 0.f )
        return -std::pow( -x, exponent );
    return std::pow( x, exponent );
}

/**
 * Positive modulo, used for wrapping texel indices of tileable textures.
 */
inline int wrap_index( int i, int period ) {
    const int r = i % period;
    return r < 0 ? r + period : r;
}

} // namespace stratus
