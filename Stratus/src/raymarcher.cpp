// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/raymarcher.hpp>
#include <stratus/shading_math.hpp>

#include <boost/algorithm/clamp.hpp>

using frantic::graphics::color3f;
using frantic::graphics::vector3f;

namespace stratus {

namespace {
// Samples thinner than this contribute nothing.
const float DENSITY_THRESHOLD = 0.01f;
// Marching stops this close to the maximum density.
const float SATURATION_EPSILON = 0.01f;
// Long rays get part of their length added to the base maximum, up to this much.
const float LONG_RAY_FRACTION = 0.2f;
const float LONG_RAY_MAX_EXTENSION = 1500.f;
const float STEP_JITTER_SCALE = 0.2f;
} // anonymous namespace

const char* to_string( raymarch_status_t status ) {
    switch( status ) {
    case RAYMARCH_EMPTY:
        return "empty";
    case RAYMARCH_SATURATED:
        return "saturated";
    case RAYMARCH_EXHAUSTED:
        return "exhausted";
    case RAYMARCH_ITERATION_CAPPED:
        return "iteration capped";
    default:
        return "unknown";
    }
}

integration_params::integration_params()
    : baseRaymarchStepCount( 80 )
    , maxRaymarchStepCount( 400 )
    , baseMaxRayLength( 300.f )
    , minStepLength( 0.2f )
    , maxDensity( 1.f )
    , fogDensityMultiplier( 0.086f )
    , postDensityMultiplier( 1.2f )
    , postDensityPow( 1.f )
    , normalMode( SHADING_NORMAL_UP )
    , gradientEpsilon( 0.5f )
    , debugIterationCapSentinel( false ) {}

fog_raymarcher::fog_raymarcher( const integration_params& params, const density_field_interface& field,
                                const fog_color_model& colorModel, float timeSeconds )
    : m_params( params )
    , m_field( &field )
    , m_colorModel( &colorModel )
    , m_timeSeconds( timeSeconds ) {}

vector3f fog_raymarcher::shading_normal( const vector3f& worldPos ) const {
    if( m_params.normalMode == SHADING_NORMAL_DENSITY_GRADIENT )
        return compute_gradient_normal( *m_field, worldPos, m_timeSeconds, m_params.gradientEpsilon );
    return vector3f( 0.f, 1.f, 0.f );
}

raymarch_result fog_raymarcher::march( const vector3f& cameraPos, const vector3f& surfacePos,
                                       float jitter ) const {
    raymarch_result result;

    vector3f start = cameraPos, end = surfacePos;
    if( !clip_segment_to_slab( start, end, m_params.bounds ) )
        return result;

    vector3f dir = end - start;
    float rayLength = dir.get_magnitude();
    if( !( rayLength > 0.f ) )
        return result;
    dir = vector3f::normalize( dir );

    const float unclippedLength = vector3f::distance( cameraPos, surfacePos );
    const float maxRayLength =
        m_params.baseMaxRayLength + std::min( unclippedLength * LONG_RAY_FRACTION, LONG_RAY_MAX_EXTENSION );
    rayLength = std::min( rayLength, maxRayLength );

    const float baseStepLength = rayLength / static_cast<float>( m_params.baseRaymarchStepCount );
    const float stepLength = std::max( std::max( baseStepLength, m_params.minStepLength ) + jitter * STEP_JITTER_SCALE,
                                       m_params.minStepLength );

    vector3f pos = start + dir * jitter;

    color3f accumColor = color3f::black();
    float accumDensity = 0.f;

    result.status = RAYMARCH_EXHAUSTED;

    while( result.distanceTraveled < rayLength ) {
        if( result.iterations >= m_params.maxRaymarchStepCount ) {
            result.status = RAYMARCH_ITERATION_CAPPED;
            break;
        }
        ++result.iterations;

        const float rawDensity = m_field->sample( pos, m_timeSeconds );
        if( rawDensity > DENSITY_THRESHOLD ) {
            const float density = rawDensity * stepLength * m_params.fogDensityMultiplier;
            const float remaining = 1.f - accumDensity;

            // The gradient costs six extra field lookups, so only pay for it when the light is used.
            const vector3f normal =
                m_colorModel->lighting_enabled() ? shading_normal( pos ) : vector3f( 0.f, 1.f, 0.f );

            color3f contribution = m_colorModel->evaluate( pos, rawDensity, normal );
            contribution *= density * remaining;
            accumColor += contribution;

            accumDensity = std::min( accumDensity + density * remaining, m_params.maxDensity );
        }

        pos += dir * stepLength;
        result.distanceTraveled += stepLength;

        if( accumDensity >= m_params.maxDensity - SATURATION_EPSILON ) {
            result.status = RAYMARCH_SATURATED;
            break;
        }
    }

    result.accumulatedDensity = accumDensity;

    if( result.status == RAYMARCH_ITERATION_CAPPED && m_params.debugIterationCapSentinel ) {
        result.color = color3f( 1.f, 0.f, 1.f );
        result.alpha = 1.f;
        return result;
    }

    result.color = clamp_color( accumColor, 0.f, 1.f );
    result.alpha = boost::algorithm::clamp(
        std::pow( accumDensity * m_params.postDensityMultiplier, m_params.postDensityPow ), 0.f, 1.f );

    return result;
}

} // namespace stratus
