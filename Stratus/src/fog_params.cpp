// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/fog_params.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

using frantic::graphics::color3f;
using frantic::graphics2d::vector2f;

namespace stratus {

namespace {

void require( bool condition, const char* name, const std::string& requirement ) {
    if( !condition )
        throw std::invalid_argument( std::string( "fog_params::validate: " ) + name + " " + requirement );
}

void require_finite( float value, const char* name ) {
    require( ( boost::math::isfinite )( value ), name,
             "must be finite, got " + boost::lexical_cast<std::string>( value ) );
}

void require_positive( float value, const char* name ) {
    require_finite( value, name );
    require( value > 0.f, name, "must be positive, got " + boost::lexical_cast<std::string>( value ) );
}

void require_non_negative( float value, const char* name ) {
    require_finite( value, name );
    require( value >= 0.f, name, "must not be negative, got " + boost::lexical_cast<std::string>( value ) );
}

void require_color( const color3f& c, const char* name ) {
    require_non_negative( c.r, name );
    require_non_negative( c.g, name );
    require_non_negative( c.b, name );
}

template <class T>
void apply( const boost::optional<T>& value, T& dest ) {
    if( value )
        dest = *value;
}

} // anonymous namespace

void reset_fog_params( fog_params& params ) {
    params.fogMinY = -40.f;
    params.fogMaxY = 4.4f;
    params.fogFadeOutRangeY = 1.5f;
    params.fogFadeOutPow = 1.f;

    params.baseRaymarchStepCount = 80;
    params.maxRaymarchStepCount = 400;
    params.baseMaxRayLength = 300.f;
    params.minStepLength = 0.2f;
    params.maxDensity = 1.f;
    params.fogDensityMultiplier = 0.086f;
    params.postDensityMultiplier = 1.2f;
    params.postDensityPow = 1.f;

    params.noiseBias = 0.485f;
    params.noisePow = 3.f;
    params.noiseMovementPerSecond = vector2f( 1.2f, 0.8f );
    params.globalScale = 1.f;
    params.heightFogStartY = -10.f;
    params.heightFogEndY = 8.f;
    params.heightFogFactor = 0.1852f;
    params.octaves = default_octave_table();

    params.fogColorLowDensity.set( 0.9f, 0.9f, 0.9f );
    params.fogColorHighDensity.set( 0.32f, 0.35f, 0.38f );
    params.densityColorMultiplier = 12.f;

    params.enableLighting = false;
    params.lightColor.set( 1.f, 0.f, 0.76f );
    params.lightIntensity = 7.5f;
    params.lightFalloffDistance = 110.f;
    params.ambientLightColor = boost::none;
    params.ambientLightIntensity = boost::none;
    params.normalMode = SHADING_NORMAL_UP;
    params.gradientEpsilon = 0.5f;

    params.blueNoiseResolution = 256;

    params.debugIterationCapSentinel = false;
}

fog_params::fog_params() { reset_fog_params( *this ); }

fog_params fog_params::demo_preset() {
    fog_params result;
    result.fogMinY = -100.f;
    result.fogMaxY = 240.f;
    result.fogFadeOutRangeY = 70.f;
    result.fogFadeOutPow = 0.5f;
    result.baseMaxRayLength = 1600.f;
    result.baseRaymarchStepCount = 280;
    result.maxRaymarchStepCount = 5000;
    result.noiseBias = 0.2f;
    result.noisePow = 6.f;
    result.heightFogFactor = 0.1f;
    result.heightFogStartY = 0.f;
    result.heightFogEndY = 190.f;
    result.globalScale = 0.38f;
    result.fogColorLowDensity.set( 250.f / 255.f, 132.f / 255.f, 201.f / 255.f );
    result.fogColorHighDensity.set( 0.32f, 0.35f, 0.38f );
    result.noiseMovementPerSecond = vector2f( 20.f, 20.f );
    return result;
}

void fog_params::validate() const {
    require_finite( fogMinY, "fogMinY" );
    require_finite( fogMaxY, "fogMaxY" );
    require( fogMinY < fogMaxY, "fogMinY", "must be below fogMaxY" );
    require_non_negative( fogFadeOutRangeY, "fogFadeOutRangeY" );
    require_positive( fogFadeOutPow, "fogFadeOutPow" );

    require( baseRaymarchStepCount >= 1, "baseRaymarchStepCount", "must be at least 1" );
    require( maxRaymarchStepCount >= baseRaymarchStepCount, "maxRaymarchStepCount",
             "must not be below baseRaymarchStepCount" );
    require_positive( baseMaxRayLength, "baseMaxRayLength" );
    require_positive( minStepLength, "minStepLength" );
    require_positive( maxDensity, "maxDensity" );
    require( maxDensity <= 1.f, "maxDensity", "must not exceed 1" );
    require_non_negative( fogDensityMultiplier, "fogDensityMultiplier" );
    require_non_negative( postDensityMultiplier, "postDensityMultiplier" );
    require_positive( postDensityPow, "postDensityPow" );

    require_finite( noiseBias, "noiseBias" );
    require_positive( noisePow, "noisePow" );
    require_finite( noiseMovementPerSecond.x, "noiseMovementPerSecond" );
    require_finite( noiseMovementPerSecond.y, "noiseMovementPerSecond" );
    require_positive( globalScale, "globalScale" );
    require_finite( heightFogStartY, "heightFogStartY" );
    require_finite( heightFogEndY, "heightFogEndY" );
    require( heightFogStartY <= heightFogEndY, "heightFogStartY", "must not be above heightFogEndY" );
    require_non_negative( heightFogFactor, "heightFogFactor" );

    try {
        validate_octave_table( octaves );
    } catch( const std::invalid_argument& e ) {
        throw std::invalid_argument( std::string( "fog_params::validate: octaves are invalid. " ) + e.what() );
    }

    require_color( fogColorLowDensity, "fogColorLowDensity" );
    require_color( fogColorHighDensity, "fogColorHighDensity" );
    require_non_negative( densityColorMultiplier, "densityColorMultiplier" );

    require_color( lightColor, "lightColor" );
    require_non_negative( lightIntensity, "lightIntensity" );
    require_positive( lightFalloffDistance, "lightFalloffDistance" );
    if( ambientLightColor )
        require_color( *ambientLightColor, "ambientLightColor" );
    if( ambientLightIntensity )
        require_non_negative( *ambientLightIntensity, "ambientLightIntensity" );
    require( normalMode == SHADING_NORMAL_UP || normalMode == SHADING_NORMAL_DENSITY_GRADIENT, "normalMode",
             "is not a known shading normal mode" );
    require_positive( gradientEpsilon, "gradientEpsilon" );

    require( blueNoiseResolution >= 1, "blueNoiseResolution", "must be at least 1" );
}

fog_volume_bounds fog_params::get_bounds() const { return fog_volume_bounds( fogMinY, fogMaxY ); }

density_params fog_params::get_density_params() const {
    density_params result;
    result.noiseBias = noiseBias;
    result.noisePow = noisePow;
    result.octaves = octaves;
    result.heightFogStartY = heightFogStartY;
    result.heightFogEndY = heightFogEndY;
    result.heightFogFactor = heightFogFactor;
    result.fogMaxY = fogMaxY;
    result.fadeOutRangeY = fogFadeOutRangeY;
    result.fadeOutPow = fogFadeOutPow;
    result.windDrift = frantic::graphics::vector3f( noiseMovementPerSecond.x, 0.f, noiseMovementPerSecond.y );
    result.globalScale = globalScale;
    return result;
}

fog_color_params fog_params::get_color_params() const {
    fog_color_params result;
    result.lowDensityColor = fogColorLowDensity;
    result.highDensityColor = fogColorHighDensity;
    result.densityColorMultiplier = densityColorMultiplier;
    result.enableLighting = enableLighting;
    result.lightColor = lightColor;
    result.lightIntensity = lightIntensity;
    result.lightFalloffDistance = lightFalloffDistance;
    return result;
}

integration_params fog_params::get_integration_params() const {
    integration_params result;
    result.bounds = get_bounds();
    result.baseRaymarchStepCount = baseRaymarchStepCount;
    result.maxRaymarchStepCount = maxRaymarchStepCount;
    result.baseMaxRayLength = baseMaxRayLength;
    result.minStepLength = minStepLength;
    result.maxDensity = maxDensity;
    result.fogDensityMultiplier = fogDensityMultiplier;
    result.postDensityMultiplier = postDensityMultiplier;
    result.postDensityPow = postDensityPow;
    result.normalMode = normalMode;
    result.gradientEpsilon = gradientEpsilon;
    result.debugIterationCapSentinel = debugIterationCapSentinel;
    return result;
}

fog_params apply_overrides( const fog_params& base, const fog_params_overrides& overrides ) {
    fog_params result = base;

    apply( overrides.fogMinY, result.fogMinY );
    apply( overrides.fogMaxY, result.fogMaxY );
    apply( overrides.fogFadeOutRangeY, result.fogFadeOutRangeY );
    apply( overrides.fogFadeOutPow, result.fogFadeOutPow );

    apply( overrides.baseRaymarchStepCount, result.baseRaymarchStepCount );
    apply( overrides.maxRaymarchStepCount, result.maxRaymarchStepCount );
    apply( overrides.baseMaxRayLength, result.baseMaxRayLength );
    apply( overrides.minStepLength, result.minStepLength );
    apply( overrides.maxDensity, result.maxDensity );
    apply( overrides.fogDensityMultiplier, result.fogDensityMultiplier );
    apply( overrides.postDensityMultiplier, result.postDensityMultiplier );
    apply( overrides.postDensityPow, result.postDensityPow );

    apply( overrides.noiseBias, result.noiseBias );
    apply( overrides.noisePow, result.noisePow );
    apply( overrides.noiseMovementPerSecond, result.noiseMovementPerSecond );
    apply( overrides.globalScale, result.globalScale );
    apply( overrides.heightFogStartY, result.heightFogStartY );
    apply( overrides.heightFogEndY, result.heightFogEndY );
    apply( overrides.heightFogFactor, result.heightFogFactor );
    apply( overrides.octaves, result.octaves );

    apply( overrides.fogColorLowDensity, result.fogColorLowDensity );
    apply( overrides.fogColorHighDensity, result.fogColorHighDensity );
    apply( overrides.densityColorMultiplier, result.densityColorMultiplier );

    apply( overrides.enableLighting, result.enableLighting );
    apply( overrides.lightColor, result.lightColor );
    apply( overrides.lightIntensity, result.lightIntensity );
    apply( overrides.lightFalloffDistance, result.lightFalloffDistance );
    if( overrides.ambientLightColor )
        result.ambientLightColor = overrides.ambientLightColor;
    if( overrides.ambientLightIntensity )
        result.ambientLightIntensity = overrides.ambientLightIntensity;
    apply( overrides.normalMode, result.normalMode );
    apply( overrides.gradientEpsilon, result.gradientEpsilon );

    apply( overrides.blueNoiseResolution, result.blueNoiseResolution );

    apply( overrides.debugIterationCapSentinel, result.debugIterationCapSentinel );

    result.validate();
    return result;
}

} // namespace stratus
