// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/density_field.hpp>
#include <stratus/shading_math.hpp>

#include <boost/algorithm/clamp.hpp>
#include <boost/lexical_cast.hpp>

using frantic::graphics::vector3f;

namespace stratus {

octave_table default_octave_table() {
    octave_table result;
    result.push_back( noise_octave( 1.f, 0.1f ) );
    result.push_back( noise_octave( 0.5f, 0.3f ) );
    result.push_back( noise_octave( 0.25f, 0.7f ) );
    result.push_back( noise_octave( 0.125f, 1.3f ) );
    result.push_back( noise_octave( 0.07f, 2.3f ) );
    result.push_back( noise_octave( 0.035f, 4.1f ) );
    return result;
}

void validate_octave_table( const octave_table& octaves ) {
    if( octaves.empty() )
        throw std::invalid_argument( "validate_octave_table: At least one octave is required" );

    for( std::size_t i = 0; i < octaves.size(); ++i ) {
        if( !( octaves[i].weight > 0.f ) )
            throw std::invalid_argument( "validate_octave_table: Octave " + boost::lexical_cast<std::string>( i ) +
                                         " has a non-positive weight" );
        if( i > 0 && !( octaves[i].weight < octaves[i - 1].weight ) )
            throw std::invalid_argument( "validate_octave_table: Octave weights must strictly decrease, octave " +
                                         boost::lexical_cast<std::string>( i ) + " does not" );
        if( i > 0 && !( octaves[i].scale > octaves[i - 1].scale ) )
            throw std::invalid_argument( "validate_octave_table: Octave scales must strictly increase, octave " +
                                         boost::lexical_cast<std::string>( i ) + " does not" );
    }
}

density_params::density_params()
    : noiseBias( 0.485f )
    , noisePow( 3.f )
    , octaves( default_octave_table() )
    , heightFogStartY( -10.f )
    , heightFogEndY( 8.f )
    , heightFogFactor( 0.1852f )
    , fogMaxY( 4.4f )
    , fadeOutRangeY( 1.5f )
    , fadeOutPow( 1.f )
    , windDrift( 1.2f, 0.f, 0.8f )
    , globalScale( 1.f ) {}

noise_density_field::noise_density_field( const density_params& params, noise_volume_interface_ptr noise )
    : m_params( params )
    , m_noise( noise ) {
    if( !m_noise )
        throw std::invalid_argument( "noise_density_field: The noise volume must not be null" );
    validate_octave_table( m_params.octaves );
}

float noise_density_field::noise_term( const vector3f& worldPos, float timeSeconds ) const {
    const vector3f p = worldPos + m_params.windDrift * timeSeconds;

    float noise = m_params.noiseBias;
    for( octave_table::const_iterator it = m_params.octaves.begin(), itEnd = m_params.octaves.end(); it != itEnd;
         ++it )
        noise += it->weight * m_noise->sample( p * ( it->scale * m_params.globalScale ) );

    noise = boost::algorithm::clamp( noise * 0.5f + 0.5f, -1.f, 1.f );

    // The clamp above allows negative values, which std::pow turns into NaN for fractional exponents.
    return signed_pow( noise, m_params.noisePow );
}

float noise_density_field::height_fog_term( float y ) const {
    if( y > m_params.heightFogEndY )
        return 0.f;
    return m_params.heightFogFactor * ( 1.f - smoothstep( m_params.heightFogStartY, m_params.heightFogEndY, y ) );
}

float noise_density_field::fade_out_factor( float y ) const {
    const float fade = smoothstep( m_params.fogMaxY - m_params.fadeOutRangeY, m_params.fogMaxY, y );
    return 1.f - std::pow( fade, m_params.fadeOutPow );
}

float noise_density_field::sample( const vector3f& worldPos, float timeSeconds ) const {
    float density = noise_term( worldPos, timeSeconds );
    density += height_fog_term( worldPos.y );
    return density * fade_out_factor( worldPos.y );
}

vector3f compute_gradient_normal( const density_field_interface& field, const vector3f& worldPos, float timeSeconds,
                                  float epsilon ) {
    const vector3f dx( epsilon, 0.f, 0.f ), dy( 0.f, epsilon, 0.f ), dz( 0.f, 0.f, epsilon );

    const vector3f gradient( field.sample( worldPos + dx, timeSeconds ) - field.sample( worldPos - dx, timeSeconds ),
                             field.sample( worldPos + dy, timeSeconds ) - field.sample( worldPos - dy, timeSeconds ),
                             field.sample( worldPos + dz, timeSeconds ) - field.sample( worldPos - dz, timeSeconds ) );

    const float magnitude = gradient.get_magnitude();
    if( !( magnitude > 1e-8f ) )
        return vector3f( 0.f, 1.f, 0.f );

    return gradient * ( -1.f / magnitude );
}

} // namespace stratus
