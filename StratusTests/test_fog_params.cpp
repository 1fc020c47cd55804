// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include <stratus/fog_params.hpp>
#include <stratus/frame_context.hpp>

#include <limits>
#include <utility>
#include <string>

using frantic::graphics::color3f;
using stratus::fog_params;
using stratus::fog_params_overrides;

namespace {

// Runs validate() and returns the exception message, or an empty string if it passed.
std::string validation_error( const fog_params& params ) {
    try {
        params.validate();
    } catch( const std::invalid_argument& e ) {
        return e.what();
    }
    return std::string();
}

bool starts_with( const std::string& s, const std::string& prefix ) {
    return s.compare( 0, prefix.size(), prefix ) == 0;
}

} // anonymous namespace

TEST( FogParams, DefaultsAreValid ) {
    const fog_params params;
    EXPECT_NO_THROW( params.validate() );

    EXPECT_FLOAT_EQ( -40.f, params.fogMinY );
    EXPECT_FLOAT_EQ( 4.4f, params.fogMaxY );
    EXPECT_EQ( 80, params.baseRaymarchStepCount );
    EXPECT_EQ( 400, params.maxRaymarchStepCount );
    EXPECT_FLOAT_EQ( 0.086f, params.fogDensityMultiplier );
    EXPECT_FALSE( params.enableLighting );
    EXPECT_FALSE( params.ambientLightColor );
    EXPECT_FALSE( params.ambientLightIntensity );
    EXPECT_EQ( stratus::SHADING_NORMAL_UP, params.normalMode );
    EXPECT_FALSE( params.debugIterationCapSentinel );
}

TEST( FogParams, DemoPresetIsValid ) {
    const fog_params params = fog_params::demo_preset();
    EXPECT_NO_THROW( params.validate() );
    EXPECT_FLOAT_EQ( -100.f, params.fogMinY );
    EXPECT_FLOAT_EQ( 240.f, params.fogMaxY );
    EXPECT_EQ( 5000, params.maxRaymarchStepCount );
}

TEST( FogParams, ResetRestoresDefaults ) {
    fog_params params = fog_params::demo_preset();
    params.ambientLightIntensity = 3.f;
    stratus::reset_fog_params( params );

    const fog_params defaults;
    EXPECT_EQ( defaults.fogMinY, params.fogMinY );
    EXPECT_EQ( defaults.noisePow, params.noisePow );
    EXPECT_FALSE( params.ambientLightIntensity );
}

TEST( FogParams, InvalidSettingsAreNamed ) {
    fog_params params;
    params.fogMinY = 10.f;
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: fogMinY" ) )
        << validation_error( params );

    params = fog_params();
    params.fogMinY = std::numeric_limits<float>::quiet_NaN();
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: fogMinY" ) );

    params = fog_params();
    params.maxRaymarchStepCount = params.baseRaymarchStepCount - 1;
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: maxRaymarchStepCount" ) );

    params = fog_params();
    params.baseRaymarchStepCount = 0;
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: baseRaymarchStepCount" ) );

    params = fog_params();
    params.maxDensity = 1.5f;
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: maxDensity" ) );

    params = fog_params();
    params.minStepLength = 0.f;
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: minStepLength" ) );

    params = fog_params();
    params.heightFogStartY = 20.f;
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: heightFogStartY" ) );

    params = fog_params();
    params.fogColorHighDensity = color3f( 0.5f, -0.1f, 0.5f );
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: fogColorHighDensity" ) );

    params = fog_params();
    params.ambientLightIntensity = -1.f;
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: ambientLightIntensity" ) );

    params = fog_params();
    params.blueNoiseResolution = 0;
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: blueNoiseResolution" ) );
}

TEST( FogParams, BrokenOctaveTableIsRejected ) {
    fog_params params;
    params.octaves.clear();
    EXPECT_THROW( params.validate(), std::invalid_argument );

    params = fog_params();
    std::swap( params.octaves[0], params.octaves[1] );
    EXPECT_TRUE( starts_with( validation_error( params ), "fog_params::validate: octaves" ) );
}

TEST( FogParams, OverridesOnlyTouchSetFields ) {
    const fog_params base;

    fog_params_overrides overrides;
    overrides.fogMaxY = 10.f;
    overrides.enableLighting = true;
    overrides.ambientLightIntensity = 2.f;

    const fog_params result = stratus::apply_overrides( base, overrides );
    EXPECT_FLOAT_EQ( 10.f, result.fogMaxY );
    EXPECT_TRUE( result.enableLighting );
    ASSERT_TRUE( result.ambientLightIntensity );
    EXPECT_FLOAT_EQ( 2.f, *result.ambientLightIntensity );

    EXPECT_EQ( base.fogMinY, result.fogMinY );
    EXPECT_EQ( base.noiseBias, result.noiseBias );
    EXPECT_EQ( base.lightIntensity, result.lightIntensity );
    EXPECT_EQ( base.octaves.size(), result.octaves.size() );
    EXPECT_FALSE( result.ambientLightColor );
}

TEST( FogParams, EmptyOverridesAreIdentity ) {
    const fog_params base = fog_params::demo_preset();
    const fog_params result = stratus::apply_overrides( base, fog_params_overrides() );
    EXPECT_EQ( base.fogMinY, result.fogMinY );
    EXPECT_EQ( base.fogMaxY, result.fogMaxY );
    EXPECT_EQ( base.globalScale, result.globalScale );
    EXPECT_EQ( base.fogColorLowDensity.r, result.fogColorLowDensity.r );
}

TEST( FogParams, InvalidOverrideThrows ) {
    fog_params_overrides overrides;
    overrides.fogMinY = 100.f;
    EXPECT_THROW( stratus::apply_overrides( fog_params(), overrides ), std::invalid_argument );
}

TEST( FogParams, DerivedParameterBlocks ) {
    fog_params params;
    params.fogMinY = -12.f;
    params.fogFadeOutRangeY = 3.f;
    params.enableLighting = true;
    params.debugIterationCapSentinel = true;

    const stratus::density_params density = params.get_density_params();
    EXPECT_FLOAT_EQ( 1.2f, density.windDrift.x );
    EXPECT_FLOAT_EQ( 0.f, density.windDrift.y );
    EXPECT_FLOAT_EQ( 0.8f, density.windDrift.z );
    EXPECT_FLOAT_EQ( params.fogMaxY, density.fogMaxY );
    EXPECT_FLOAT_EQ( 3.f, density.fadeOutRangeY );

    const stratus::integration_params integration = params.get_integration_params();
    EXPECT_FLOAT_EQ( -12.f, integration.bounds.minY );
    EXPECT_FLOAT_EQ( params.fogMaxY, integration.bounds.maxY );
    EXPECT_TRUE( integration.debugIterationCapSentinel );

    EXPECT_TRUE( params.get_color_params().enableLighting );
}

TEST( AmbientLight, OverrideBeatsScene ) {
    fog_params params;
    params.ambientLightColor = color3f( 0.f, 0.5f, 1.f );
    params.ambientLightIntensity = 2.f;

    stratus::frame_context frame;
    frame.sceneAmbientLight = stratus::ambient_light( color3f( 1.f, 0.f, 0.f ), 5.f );

    const color3f ambient = stratus::resolve_ambient_light( params, frame );
    EXPECT_FLOAT_EQ( 0.f, ambient.r );
    EXPECT_FLOAT_EQ( 1.f, ambient.g );
    EXPECT_FLOAT_EQ( 2.f, ambient.b );
}

TEST( AmbientLight, PartialOverrideMixesWithScene ) {
    fog_params params;
    params.ambientLightIntensity = 0.5f;

    stratus::frame_context frame;
    frame.sceneAmbientLight = stratus::ambient_light( color3f( 1.f, 0.f, 0.4f ), 5.f );

    const color3f ambient = stratus::resolve_ambient_light( params, frame );
    EXPECT_FLOAT_EQ( 0.5f, ambient.r );
    EXPECT_FLOAT_EQ( 0.f, ambient.g );
    EXPECT_FLOAT_EQ( 0.2f, ambient.b );
}

TEST( AmbientLight, SceneLightUsedWithoutOverride ) {
    stratus::frame_context frame;
    frame.sceneAmbientLight = stratus::ambient_light( color3f( 0.8f, 0.8f, 0.8f ), 2.f );

    const color3f ambient = stratus::resolve_ambient_light( fog_params(), frame );
    EXPECT_FLOAT_EQ( 1.6f, ambient.r );
    EXPECT_FLOAT_EQ( 1.6f, ambient.b );
}

TEST( AmbientLight, NoLightIsBlack ) {
    const color3f ambient = stratus::resolve_ambient_light( fog_params(), stratus::frame_context() );
    EXPECT_EQ( 0.f, ambient.r );
    EXPECT_EQ( 0.f, ambient.g );
    EXPECT_EQ( 0.f, ambient.b );
}
