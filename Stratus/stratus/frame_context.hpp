// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratus/fog_params.hpp>

#include <boost/optional.hpp>

#include <frantic/graphics/color3f.hpp>
#include <frantic/graphics/transform4f.hpp>
#include <frantic/graphics/vector3f.hpp>

namespace stratus {

struct ambient_light {
    frantic::graphics::color3f color;
    float intensity;

    ambient_light()
        : color( 1.f, 1.f, 1.f )
        , intensity( 0.f ) {}

    ambient_light( const frantic::graphics::color3f& color_, float intensity_ )
        : color( color_ )
        , intensity( intensity_ ) {}
};

/**
 * Everything about the current frame that the fog pass reads but does not own.
 */
struct frame_context {
    frantic::graphics::vector3f cameraPosition;
    frantic::graphics::transform4f projectionInverse;
    frantic::graphics::transform4f cameraToWorld;
    float timeSeconds;

    // The scene's own ambient light, if it has one.
    boost::optional<ambient_light> sceneAmbientLight;

    frantic::graphics::vector3f lightPosition;

    frame_context()
        : timeSeconds( 0.f ) {
        projectionInverse.set_to_identity();
        cameraToWorld.set_to_identity();
    }
};

/**
 * Picks the ambient light for a frame. Each of color and intensity comes from the configured override if present,
 * otherwise from the scene's ambient light, otherwise white and 0.
 * @return The ambient color multiplied by its intensity.
 */
frantic::graphics::color3f resolve_ambient_light( const fog_params& params, const frame_context& frame );

} // namespace stratus
