// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/blue_noise.hpp>
#include <stratus/shading_math.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>

namespace stratus {

const int screen_noise_texture::DEFAULT_RESOLUTION;

screen_noise_texture::screen_noise_texture( int resolution, const std::vector<boost::uint8_t>& texels )
    : m_resolution( resolution )
    , m_texels( texels ) {
    if( resolution <= 0 )
        throw std::invalid_argument( "screen_noise_texture: The resolution must be positive, got " +
                                     boost::lexical_cast<std::string>( resolution ) );

    const std::size_t expected = static_cast<std::size_t>( resolution ) * resolution;
    if( texels.size() != expected )
        throw std::invalid_argument( "screen_noise_texture: Expected " + boost::lexical_cast<std::string>( expected ) +
                                     " texels but got " + boost::lexical_cast<std::string>( texels.size() ) );
}

screen_noise_texture::ptr_type screen_noise_texture::create_random( boost::uint32_t seed, int resolution ) {
    if( resolution <= 0 )
        throw std::invalid_argument( "screen_noise_texture::create_random: The resolution must be positive, got " +
                                     boost::lexical_cast<std::string>( resolution ) );

    boost::random::mt19937 rng( seed );
    boost::random::uniform_int_distribution<int> dist( 0, 255 );

    std::vector<boost::uint8_t> texels( static_cast<std::size_t>( resolution ) * resolution );
    for( std::size_t i = 0; i < texels.size(); ++i )
        texels[i] = static_cast<boost::uint8_t>( dist( rng ) );

    return ptr_type( new screen_noise_texture( resolution, texels ) );
}

screen_noise_texture::ptr_type screen_noise_texture::create_constant( boost::uint8_t value, int resolution ) {
    if( resolution <= 0 )
        throw std::invalid_argument( "screen_noise_texture::create_constant: The resolution must be positive, got " +
                                     boost::lexical_cast<std::string>( resolution ) );

    return ptr_type( new screen_noise_texture(
        resolution, std::vector<boost::uint8_t>( static_cast<std::size_t>( resolution ) * resolution, value ) ) );
}

float screen_noise_texture::sample( int x, int y ) const {
    const std::size_t index = static_cast<std::size_t>( wrap_index( y, m_resolution ) ) * m_resolution +
                              wrap_index( x, m_resolution );
    return m_texels[index] / 255.f;
}

} // namespace stratus
