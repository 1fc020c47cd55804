// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/color_model.hpp>
#include <stratus/shading_math.hpp>

#include <boost/algorithm/clamp.hpp>

using frantic::graphics::color3f;
using frantic::graphics::vector3f;

namespace stratus {

fog_color_params::fog_color_params()
    : lowDensityColor( 0.9f, 0.9f, 0.9f )
    , highDensityColor( 0.32f, 0.35f, 0.38f )
    , densityColorMultiplier( 12.f )
    , enableLighting( false )
    , lightColor( 1.f, 0.f, 0.76f )
    , lightIntensity( 7.5f )
    , lightFalloffDistance( 110.f ) {}

fog_color_model::fog_color_model( const fog_color_params& params, const vector3f& lightPosition,
                                  const color3f& ambient )
    : m_params( params )
    , m_lightPosition( lightPosition )
    , m_ambient( ambient ) {}

color3f fog_color_model::base_color( float rawDensity ) const {
    const float t = boost::algorithm::clamp( rawDensity * m_params.densityColorMultiplier, 0.f, 1.f );
    return mix( m_params.lowDensityColor, m_params.highDensityColor, t );
}

color3f fog_color_model::incident_light( const vector3f& worldPos, const vector3f& normal ) const {
    color3f result = m_ambient;

    const vector3f toLight = m_lightPosition - worldPos;
    const float distance = toLight.get_magnitude();
    if( distance > 0.f ) {
        const float cosTheta = std::max( 0.f, vector3f::dot( normal, toLight ) / distance );
        const float falloff = 1.f - smoothstep( 0.f, m_params.lightFalloffDistance, distance );

        color3f diffuse = m_params.lightColor;
        diffuse *= m_params.lightIntensity * cosTheta * falloff;
        result += diffuse;
    }

    return result;
}

color3f fog_color_model::evaluate( const vector3f& worldPos, float rawDensity, const vector3f& normal ) const {
    color3f result = base_color( rawDensity );
    if( m_params.enableLighting )
        result *= incident_light( worldPos, normal );
    return result;
}

} // namespace stratus
