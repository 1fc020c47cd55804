// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratus/color_model.hpp>
#include <stratus/density_field.hpp>
#include <stratus/slab_clipper.hpp>

#include <frantic/graphics/color3f.hpp>
#include <frantic/graphics/vector3f.hpp>

namespace stratus {

enum raymarch_status_t {
    // The ray never entered the fog slab.
    RAYMARCH_EMPTY = 0,
    // Accumulated density reached the maximum before the end of the ray.
    RAYMARCH_SATURATED,
    // The whole ray was marched.
    RAYMARCH_EXHAUSTED,
    // Marching stopped at the iteration limit with a partial result.
    RAYMARCH_ITERATION_CAPPED,
    RAYMARCH_STATUS_COUNT
};

const char* to_string( raymarch_status_t status );

enum shading_normal_mode_t {
    SHADING_NORMAL_UP = 0,
    SHADING_NORMAL_DENSITY_GRADIENT
};

struct integration_params {
    fog_volume_bounds bounds;

    int baseRaymarchStepCount;
    int maxRaymarchStepCount;
    float baseMaxRayLength;
    float minStepLength;
    float maxDensity;
    float fogDensityMultiplier;

    // Applied once to the final accumulated density.
    float postDensityMultiplier;
    float postDensityPow;

    shading_normal_mode_t normalMode;
    float gradientEpsilon;

    // Replaces the output of iteration capped rays with opaque magenta.
    bool debugIterationCapSentinel;

    integration_params();
};

struct raymarch_result {
    frantic::graphics::color3f color;
    float alpha;

    // Before post shaping.
    float accumulatedDensity;
    int iterations;
    float distanceTraveled;
    raymarch_status_t status;

    raymarch_result()
        : alpha( 0.f )
        , accumulatedDensity( 0.f )
        , iterations( 0 )
        , distanceTraveled( 0.f )
        , status( RAYMARCH_EMPTY ) {}
};

/**
 * Converts a blue noise sample in [0,1] into the signed offset applied to a ray's start and to every step.
 */
inline float jitter_from_noise( float noiseSample ) { return ( noiseSample - 0.5f ) * 0.1f; }

/**
 * Integrates fog along camera rays. One instance is built per frame and is safe to share between threads since
 * marching a ray does not modify it.
 */
class fog_raymarcher {
    integration_params m_params;
    const density_field_interface* m_field;
    const fog_color_model* m_colorModel;
    float m_timeSeconds;

  public:
    /**
     * The density field and color model are borrowed and must outlive the raymarcher.
     */
    fog_raymarcher( const integration_params& params, const density_field_interface& field,
                    const fog_color_model& colorModel, float timeSeconds );

    const integration_params& get_params() const { return m_params; }

    /**
     * Marches the segment from the camera to a scene surface.
     * @param cameraPos The ray origin.
     * @param surfacePos The world position reconstructed from the depth buffer.
     * @param jitter The per pixel offset from jitter_from_noise().
     */
    raymarch_result march( const frantic::graphics::vector3f& cameraPos,
                           const frantic::graphics::vector3f& surfacePos, float jitter ) const;

  private:
    frantic::graphics::vector3f shading_normal( const frantic::graphics::vector3f& worldPos ) const;
};

} // namespace stratus
