// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include <stratus/blue_noise.hpp>
#include <stratus/noise_volume.hpp>

using frantic::graphics::vector3f;
using stratus::screen_noise_texture;
using stratus::tiled_noise_volume;

namespace {

// A 2^3 volume with distinct texel values.
tiled_noise_volume make_small_volume() {
    std::vector<boost::uint8_t> texels;
    for( int i = 0; i < 8; ++i )
        texels.push_back( static_cast<boost::uint8_t>( i * 30 ) );
    return tiled_noise_volume( 2, texels );
}

} // anonymous namespace

TEST( TiledNoiseVolume, TexelCentersReturnTexelValues ) {
    const tiled_noise_volume volume = make_small_volume();

    for( int z = 0; z < 2; ++z ) {
        for( int y = 0; y < 2; ++y ) {
            for( int x = 0; x < 2; ++x ) {
                const vector3f uvw( ( x + 0.5f ) / 2.f, ( y + 0.5f ) / 2.f, ( z + 0.5f ) / 2.f );
                EXPECT_NEAR( volume.get_texel( x, y, z ), volume.sample( uvw ), 1e-6f );
            }
        }
    }

    EXPECT_FLOAT_EQ( -1.f, volume.get_texel( 0, 0, 0 ) );
    EXPECT_NEAR( 210.f * 2.f / 255.f - 1.f, volume.get_texel( 1, 1, 1 ), 1e-6f );
}

TEST( TiledNoiseVolume, InterpolatesBetweenTexels ) {
    const tiled_noise_volume volume = make_small_volume();

    // Halfway between texel (0,0,0) and (1,0,0) along X.
    const float expected = 0.5f * ( volume.get_texel( 0, 0, 0 ) + volume.get_texel( 1, 0, 0 ) );
    EXPECT_NEAR( expected, volume.sample( vector3f( 0.5f, 0.25f, 0.25f ) ), 1e-6f );
}

TEST( TiledNoiseVolume, WrapsAroundEveryAxis ) {
    tiled_noise_volume::ptr_type volume = tiled_noise_volume::create_random( 7 );

    const vector3f samples[] = { vector3f( 0.1f, 0.2f, 0.3f ), vector3f( 0.99f, 0.01f, 0.5f ),
                                 vector3f( 0.f, 0.f, 0.f ), vector3f( 0.75f, 0.4f, 0.999f ) };
    const vector3f offsets[] = { vector3f( 1.f, 0.f, 0.f ), vector3f( 0.f, -2.f, 0.f ), vector3f( 0.f, 0.f, 3.f ),
                                 vector3f( -4.f, 5.f, -6.f ) };

    for( std::size_t i = 0; i < sizeof( samples ) / sizeof( samples[0] ); ++i ) {
        for( std::size_t j = 0; j < sizeof( offsets ) / sizeof( offsets[0] ); ++j )
            EXPECT_NEAR( volume->sample( samples[i] ), volume->sample( samples[i] + offsets[j] ), 1e-3f );
    }
}

TEST( TiledNoiseVolume, SamplesStayInRange ) {
    tiled_noise_volume::ptr_type volume = tiled_noise_volume::create_random( 99 );
    for( int i = 0; i < 1000; ++i ) {
        const float v = volume->sample( vector3f( i * 0.0137f, i * -0.0291f, i * 0.0073f ) );
        EXPECT_GE( v, -1.f );
        EXPECT_LE( v, 1.f );
    }
}

TEST( TiledNoiseVolume, SeedDeterminesContents ) {
    tiled_noise_volume::ptr_type a = tiled_noise_volume::create_random( 42 );
    tiled_noise_volume::ptr_type b = tiled_noise_volume::create_random( 42 );
    tiled_noise_volume::ptr_type c = tiled_noise_volume::create_random( 43 );

    EXPECT_EQ( tiled_noise_volume::DEFAULT_RESOLUTION, a->resolution() );

    int differences = 0;
    for( int i = 0; i < 64; ++i ) {
        EXPECT_EQ( a->get_texel( i, i / 2, i / 3 ), b->get_texel( i, i / 2, i / 3 ) );
        if( a->get_texel( i, i / 2, i / 3 ) != c->get_texel( i, i / 2, i / 3 ) )
            ++differences;
    }
    EXPECT_GT( differences, 0 );
}

TEST( TiledNoiseVolume, RejectsWrongTexelCount ) {
    EXPECT_THROW( tiled_noise_volume( 4, std::vector<boost::uint8_t>( 63 ) ), std::invalid_argument );
    EXPECT_THROW( tiled_noise_volume( 0, std::vector<boost::uint8_t>() ), std::invalid_argument );
}

TEST( ScreenNoiseTexture, WrapsPixelCoordinates ) {
    screen_noise_texture::ptr_type noise = screen_noise_texture::create_random( 3, 16 );

    EXPECT_EQ( noise->sample( 5, 9 ), noise->sample( 5 + 16, 9 ) );
    EXPECT_EQ( noise->sample( 5, 9 ), noise->sample( 5, 9 + 32 ) );
    EXPECT_EQ( noise->sample( 15, 15 ), noise->sample( -1, -1 ) );
}

TEST( ScreenNoiseTexture, ValuesAreNormalized ) {
    std::vector<boost::uint8_t> texels;
    texels.push_back( 0 );
    texels.push_back( 255 );
    texels.push_back( 51 );
    texels.push_back( 102 );
    const screen_noise_texture noise( 2, texels );

    EXPECT_FLOAT_EQ( 0.f, noise.sample( 0, 0 ) );
    EXPECT_FLOAT_EQ( 1.f, noise.sample( 1, 0 ) );
    EXPECT_FLOAT_EQ( 0.2f, noise.sample( 0, 1 ) );
    EXPECT_FLOAT_EQ( 0.4f, noise.sample( 1, 1 ) );
}

TEST( ScreenNoiseTexture, ConstantTexture ) {
    screen_noise_texture::ptr_type noise = screen_noise_texture::create_constant( 255, 4 );
    for( int y = 0; y < 8; ++y )
        for( int x = 0; x < 8; ++x )
            EXPECT_EQ( 1.f, noise->sample( x, y ) );
}

TEST( ScreenNoiseTexture, RejectsWrongTexelCount ) {
    EXPECT_THROW( screen_noise_texture( 4, std::vector<boost::uint8_t>( 15 ) ), std::invalid_argument );
}
