// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratus/color_model.hpp>
#include <stratus/density_field.hpp>
#include <stratus/raymarcher.hpp>

#include <boost/optional.hpp>

#include <frantic/graphics/color3f.hpp>
#include <frantic/graphics2d/vector2f.hpp>

namespace stratus {

/**
 * Every setting of the volumetric fog pass. A default constructed instance holds the reference configuration.
 */
struct fog_params {
    // slab
    float fogMinY;
    float fogMaxY;
    float fogFadeOutRangeY;
    float fogFadeOutPow;

    // integration
    int baseRaymarchStepCount;
    // Only checked against baseRaymarchStepCount. Negative jitter shortens steps, so a ray can need up to
    // baseRaymarchStepCount * (1 + 0.01 / minStepLength) + 1 steps, and any lower value caps some rays. Equal to
    // baseRaymarchStepCount it caps nearly every ray, which is useful for exercising the cap reporting.
    int maxRaymarchStepCount;
    float baseMaxRayLength;
    float minStepLength;
    float maxDensity;
    float fogDensityMultiplier;
    float postDensityMultiplier;
    float postDensityPow;

    // density
    float noiseBias;
    float noisePow;
    frantic::graphics2d::vector2f noiseMovementPerSecond; // x drifts along world X, y along world Z
    float globalScale;
    float heightFogStartY;
    float heightFogEndY;
    float heightFogFactor;
    octave_table octaves;

    // color
    frantic::graphics::color3f fogColorLowDensity;
    frantic::graphics::color3f fogColorHighDensity;
    float densityColorMultiplier;

    // lighting
    bool enableLighting;
    frantic::graphics::color3f lightColor;
    float lightIntensity;
    float lightFalloffDistance;
    // When unset, the scene's ambient light is used, and failing that white at intensity 0.
    boost::optional<frantic::graphics::color3f> ambientLightColor;
    boost::optional<float> ambientLightIntensity;
    shading_normal_mode_t normalMode;
    float gradientEpsilon;

    int blueNoiseResolution;

    bool debugIterationCapSentinel;

    fog_params();

    /**
     * The look used by the bundled demo scene: a tall, pink tinted cloud layer seen from far above.
     */
    static fog_params demo_preset();

    /**
     * Throws std::invalid_argument naming the first offending setting.
     */
    void validate() const;

    fog_volume_bounds get_bounds() const;
    density_params get_density_params() const;
    fog_color_params get_color_params() const;
    integration_params get_integration_params() const;
};

void reset_fog_params( fog_params& params );

/**
 * A partial set of changes to fog_params. Unset fields leave the existing value alone.
 */
struct fog_params_overrides {
    boost::optional<float> fogMinY;
    boost::optional<float> fogMaxY;
    boost::optional<float> fogFadeOutRangeY;
    boost::optional<float> fogFadeOutPow;

    boost::optional<int> baseRaymarchStepCount;
    boost::optional<int> maxRaymarchStepCount;
    boost::optional<float> baseMaxRayLength;
    boost::optional<float> minStepLength;
    boost::optional<float> maxDensity;
    boost::optional<float> fogDensityMultiplier;
    boost::optional<float> postDensityMultiplier;
    boost::optional<float> postDensityPow;

    boost::optional<float> noiseBias;
    boost::optional<float> noisePow;
    boost::optional<frantic::graphics2d::vector2f> noiseMovementPerSecond;
    boost::optional<float> globalScale;
    boost::optional<float> heightFogStartY;
    boost::optional<float> heightFogEndY;
    boost::optional<float> heightFogFactor;
    boost::optional<octave_table> octaves;

    boost::optional<frantic::graphics::color3f> fogColorLowDensity;
    boost::optional<frantic::graphics::color3f> fogColorHighDensity;
    boost::optional<float> densityColorMultiplier;

    boost::optional<bool> enableLighting;
    boost::optional<frantic::graphics::color3f> lightColor;
    boost::optional<float> lightIntensity;
    boost::optional<float> lightFalloffDistance;
    boost::optional<frantic::graphics::color3f> ambientLightColor;
    boost::optional<float> ambientLightIntensity;
    boost::optional<shading_normal_mode_t> normalMode;
    boost::optional<float> gradientEpsilon;

    boost::optional<int> blueNoiseResolution;

    boost::optional<bool> debugIterationCapSentinel;
};

/**
 * Returns base with every set override applied. The result is validated before it is returned.
 */
fog_params apply_overrides( const fog_params& base, const fog_params_overrides& overrides );

} // namespace stratus
