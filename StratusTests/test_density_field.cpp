// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include "test_helpers.hpp"

#include <stratus/density_field.hpp>

#include <boost/make_shared.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include <cmath>

using frantic::graphics::vector3f;
using stratus::density_params;
using stratus::noise_density_field;

namespace {

density_params no_height_fog_params() {
    density_params params;
    params.heightFogFactor = 0.f;
    return params;
}

stratus::noise_volume_interface_ptr zero_noise() { return boost::make_shared<stratus_test::zero_noise_volume>(); }

} // anonymous namespace

TEST( DensityField, DefaultOctaveTable ) {
    const stratus::octave_table octaves = stratus::default_octave_table();
    ASSERT_EQ( 6u, octaves.size() );
    EXPECT_FLOAT_EQ( 1.f, octaves.front().weight );
    EXPECT_FLOAT_EQ( 0.035f, octaves.back().weight );
    EXPECT_FLOAT_EQ( 0.1f, octaves.front().scale );
    EXPECT_FLOAT_EQ( 4.1f, octaves.back().scale );
    EXPECT_NO_THROW( stratus::validate_octave_table( octaves ) );
}

TEST( DensityField, OctaveTableValidation ) {
    stratus::octave_table octaves;
    EXPECT_THROW( stratus::validate_octave_table( octaves ), std::invalid_argument );

    octaves.push_back( stratus::noise_octave( 1.f, 0.1f ) );
    octaves.push_back( stratus::noise_octave( 1.f, 0.3f ) );
    EXPECT_THROW( stratus::validate_octave_table( octaves ), std::invalid_argument );

    octaves[1] = stratus::noise_octave( 0.5f, 0.1f );
    EXPECT_THROW( stratus::validate_octave_table( octaves ), std::invalid_argument );

    octaves[1] = stratus::noise_octave( 0.5f, 0.2f );
    EXPECT_NO_THROW( stratus::validate_octave_table( octaves ) );

    density_params params;
    params.octaves = stratus::octave_table();
    EXPECT_THROW( noise_density_field( params, zero_noise() ), std::invalid_argument );
    EXPECT_THROW( noise_density_field( density_params(), stratus::noise_volume_interface_ptr() ),
                  std::invalid_argument );
}

TEST( DensityField, BiasOnlyDensityIsShapedByNoisePow ) {
    const noise_density_field field( no_height_fog_params(), zero_noise() );

    // (0.485 * 0.5 + 0.5)^3
    const float expected = std::pow( 0.7425f, 3.f );
    EXPECT_NEAR( expected, field.sample( vector3f( 3.f, -20.f, 7.f ), 0.f ), 1e-6f );
    EXPECT_NEAR( expected, field.sample( vector3f( -300.f, 0.f, 12.f ), 55.f ), 1e-6f );
}

TEST( DensityField, NegativeNoiseNeverProducesNaN ) {
    density_params params = no_height_fog_params();
    params.noiseBias = -5.f;
    params.noisePow = 2.5f;
    const noise_density_field field( params, zero_noise() );

    const float density = field.sample( vector3f( 0.f, -10.f, 0.f ), 0.f );
    EXPECT_TRUE( ( boost::math::isfinite )( density ) );
    EXPECT_FLOAT_EQ( -1.f, density );
}

TEST( DensityField, HeightFogAddsDensityBelowItsEnd ) {
    density_params params;
    const noise_density_field field( params, zero_noise() );

    EXPECT_FLOAT_EQ( params.heightFogFactor, field.height_fog_term( params.heightFogStartY ) );
    EXPECT_FLOAT_EQ( params.heightFogFactor, field.height_fog_term( -30.f ) );
    EXPECT_FLOAT_EQ( 0.5f * params.heightFogFactor,
                     field.height_fog_term( 0.5f * ( params.heightFogStartY + params.heightFogEndY ) ) );
    EXPECT_FLOAT_EQ( 0.f, field.height_fog_term( params.heightFogEndY ) );
    EXPECT_FLOAT_EQ( 0.f, field.height_fog_term( params.heightFogEndY + 1.f ) );

    const float base = field.noise_term( vector3f( 0.f, -30.f, 0.f ), 0.f );
    EXPECT_NEAR( base + params.heightFogFactor, field.sample( vector3f( 0.f, -30.f, 0.f ), 0.f ), 1e-6f );
}

TEST( DensityField, FadesOutToZeroAtTheTop ) {
    density_params params = no_height_fog_params();
    const noise_density_field field( params, zero_noise() );

    EXPECT_FLOAT_EQ( 1.f, field.fade_out_factor( params.fogMaxY - params.fadeOutRangeY - 0.1f ) );
    EXPECT_FLOAT_EQ( 0.f, field.fade_out_factor( params.fogMaxY ) );
    EXPECT_FLOAT_EQ( 0.f, field.sample( vector3f( 1.f, params.fogMaxY, 1.f ), 0.f ) );
    EXPECT_NEAR( 0.5f, field.fade_out_factor( params.fogMaxY - 0.5f * params.fadeOutRangeY ), 1e-5f );
}

TEST( DensityField, ContinuousAcrossFadeOutStart ) {
    density_params params;
    params.fadeOutPow = 0.5f;
    const noise_density_field field( params, stratus::tiled_noise_volume::create_random( 11 ) );

    const float edge = params.fogMaxY - params.fadeOutRangeY;
    const float eps = 1e-3f;
    const float below = field.sample( vector3f( 12.3f, edge - eps, -4.5f ), 2.f );
    const float above = field.sample( vector3f( 12.3f, edge + eps, -4.5f ), 2.f );
    EXPECT_NEAR( below, above, 1e-2f );

    // The fade factor itself is exactly 1 at the edge.
    EXPECT_FLOAT_EQ( 1.f, field.fade_out_factor( edge ) );
}

TEST( DensityField, WindDriftShiftsTheField ) {
    density_params params;
    params.windDrift = vector3f( 1.2f, 0.f, 0.8f );
    const noise_density_field field( params, stratus::tiled_noise_volume::create_random( 5 ) );

    const vector3f pos( 4.f, -12.f, 9.f );
    const float t = 2.5f;
    EXPECT_NEAR( field.sample( pos + params.windDrift * t, 0.f ), field.sample( pos, t ), 1e-4f );
}

TEST( DensityField, GradientNormalPointsAwayFromDenserFog ) {
    const stratus_test::linear_density_field denserBelow( vector3f( 0.f, -1.f, 0.f ) );
    const vector3f up = stratus::compute_gradient_normal( denserBelow, vector3f( 1.f, 2.f, 3.f ), 0.f, 0.5f );
    EXPECT_NEAR( 0.f, up.x, 1e-5f );
    EXPECT_NEAR( 1.f, up.y, 1e-5f );
    EXPECT_NEAR( 0.f, up.z, 1e-5f );

    const stratus_test::linear_density_field denserAlongX( vector3f( 2.f, 0.f, 0.f ) );
    const vector3f minusX = stratus::compute_gradient_normal( denserAlongX, vector3f( 0.f, 0.f, 0.f ), 0.f, 0.5f );
    EXPECT_NEAR( -1.f, minusX.x, 1e-5f );

    const stratus_test::constant_density_field flat( 0.3f );
    const vector3f fallback = stratus::compute_gradient_normal( flat, vector3f( 0.f, 0.f, 0.f ), 0.f, 0.5f );
    EXPECT_EQ( 1.f, fallback.y );
}
