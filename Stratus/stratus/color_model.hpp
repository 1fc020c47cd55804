// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <frantic/graphics/color3f.hpp>
#include <frantic/graphics/vector3f.hpp>

namespace stratus {

struct fog_color_params {
    frantic::graphics::color3f lowDensityColor;
    frantic::graphics::color3f highDensityColor;

    // Raw density is scaled by this before blending, so thin fog already reaches the high density color.
    float densityColorMultiplier;

    bool enableLighting;
    frantic::graphics::color3f lightColor;
    float lightIntensity;
    float lightFalloffDistance;

    fog_color_params();
};

/**
 * Produces the color emitted by a fog sample. The base color is a blend of the low and high density colors. When
 * lighting is enabled the base color is modulated by an ambient term plus one point light with a smooth distance
 * falloff.
 */
class fog_color_model {
    fog_color_params m_params;
    frantic::graphics::vector3f m_lightPosition;
    frantic::graphics::color3f m_ambient;

  public:
    /**
     * @param params The color configuration.
     * @param lightPosition The world position of the point light for this frame.
     * @param ambient The ambient light color, already multiplied by its intensity.
     */
    fog_color_model( const fog_color_params& params, const frantic::graphics::vector3f& lightPosition,
                     const frantic::graphics::color3f& ambient );

    const fog_color_params& get_params() const { return m_params; }

    bool lighting_enabled() const { return m_params.enableLighting; }

    frantic::graphics::color3f base_color( float rawDensity ) const;

    // The light arriving at a point with the given shading normal, ambient included.
    frantic::graphics::color3f incident_light( const frantic::graphics::vector3f& worldPos,
                                               const frantic::graphics::vector3f& normal ) const;

    /**
     * @param worldPos The sample position.
     * @param rawDensity The unscaled density at worldPos.
     * @param normal The unit shading normal. Ignored unless lighting is enabled.
     */
    frantic::graphics::color3f evaluate( const frantic::graphics::vector3f& worldPos, float rawDensity,
                                         const frantic::graphics::vector3f& normal ) const;
};

} // namespace stratus
