// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/noise_volume.hpp>
#include <stratus/shading_math.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>

using frantic::graphics::vector3f;

namespace stratus {

const int tiled_noise_volume::DEFAULT_RESOLUTION;

tiled_noise_volume::tiled_noise_volume( int resolution, const std::vector<boost::uint8_t>& texels )
    : m_resolution( resolution )
    , m_texels( texels ) {
    if( resolution <= 0 )
        throw std::invalid_argument( "tiled_noise_volume: The resolution must be positive, got " +
                                     boost::lexical_cast<std::string>( resolution ) );

    const std::size_t expected = static_cast<std::size_t>( resolution ) * resolution * resolution;
    if( texels.size() != expected )
        throw std::invalid_argument( "tiled_noise_volume: Expected " + boost::lexical_cast<std::string>( expected ) +
                                     " texels but got " + boost::lexical_cast<std::string>( texels.size() ) );
}

tiled_noise_volume::ptr_type tiled_noise_volume::create_random( boost::uint32_t seed, int resolution ) {
    if( resolution <= 0 )
        throw std::invalid_argument( "tiled_noise_volume::create_random: The resolution must be positive, got " +
                                     boost::lexical_cast<std::string>( resolution ) );

    boost::random::mt19937 rng( seed );
    boost::random::uniform_int_distribution<int> dist( 0, 255 );

    std::vector<boost::uint8_t> texels( static_cast<std::size_t>( resolution ) * resolution * resolution );
    for( std::size_t i = 0; i < texels.size(); ++i )
        texels[i] = static_cast<boost::uint8_t>( dist( rng ) );

    return ptr_type( new tiled_noise_volume( resolution, texels ) );
}

float tiled_noise_volume::get_texel( int x, int y, int z ) const {
    const std::size_t index =
        ( static_cast<std::size_t>( wrap_index( z, m_resolution ) ) * m_resolution + wrap_index( y, m_resolution ) ) *
            m_resolution +
        wrap_index( x, m_resolution );
    return m_texels[index] * ( 2.f / 255.f ) - 1.f;
}

float tiled_noise_volume::sample( const vector3f& uvw ) const {
    const float res = static_cast<float>( m_resolution );

    // Shift by half a texel so integer coordinates land on texel centers.
    const float tx = uvw.x * res - 0.5f;
    const float ty = uvw.y * res - 0.5f;
    const float tz = uvw.z * res - 0.5f;

    const float fx = std::floor( tx ), fy = std::floor( ty ), fz = std::floor( tz );
    const float ax = tx - fx, ay = ty - fy, az = tz - fz;

    // Wrap the base index once here to keep the int conversion in range for large coordinates.
    const int x0 = wrap_index( static_cast<int>( std::fmod( fx, res ) ), m_resolution );
    const int y0 = wrap_index( static_cast<int>( std::fmod( fy, res ) ), m_resolution );
    const int z0 = wrap_index( static_cast<int>( std::fmod( fz, res ) ), m_resolution );

    const float c00 = mix( get_texel( x0, y0, z0 ), get_texel( x0 + 1, y0, z0 ), ax );
    const float c10 = mix( get_texel( x0, y0 + 1, z0 ), get_texel( x0 + 1, y0 + 1, z0 ), ax );
    const float c01 = mix( get_texel( x0, y0, z0 + 1 ), get_texel( x0 + 1, y0, z0 + 1 ), ax );
    const float c11 = mix( get_texel( x0, y0 + 1, z0 + 1 ), get_texel( x0 + 1, y0 + 1, z0 + 1 ), ax );

    return mix( mix( c00, c10, ay ), mix( c01, c11, ay ), az );
}

} // namespace stratus
