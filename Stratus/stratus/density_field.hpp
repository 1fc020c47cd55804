// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratus/noise_volume.hpp>

#include <boost/shared_ptr.hpp>

#include <frantic/graphics/vector3f.hpp>

#include <vector>

namespace stratus {

/**
 * One layer of the fractal noise sum.
 */
struct noise_octave {
    float weight;
    float scale;

    noise_octave()
        : weight( 0.f )
        , scale( 0.f ) {}

    noise_octave( float weight_, float scale_ )
        : weight( weight_ )
        , scale( scale_ ) {}
};

typedef std::vector<noise_octave> octave_table;

/**
 * The six octave table used unless another is configured. Weights fall from 1 to 0.035 while scales rise from 0.1 to
 * 4.1.
 */
octave_table default_octave_table();

/**
 * Throws std::invalid_argument unless the table is non-empty, every weight is positive, weights strictly decrease and
 * scales strictly increase.
 */
void validate_octave_table( const octave_table& octaves );

/**
 * Everything that shapes the procedural density, minus the time which is supplied per sample.
 */
struct density_params {
    float noiseBias;
    float noisePow;
    octave_table octaves;

    float heightFogStartY;
    float heightFogEndY;
    float heightFogFactor;

    // Top of the fog slab. Density fades to zero over the fadeOutRangeY units below it.
    float fogMaxY;
    float fadeOutRangeY;
    float fadeOutPow;

    // World units per second. The reference configuration only drifts along X and Z.
    frantic::graphics::vector3f windDrift;
    float globalScale;

    density_params();
};

/**
 * A scalar density defined over world space and time.
 */
class density_field_interface {
  public:
    typedef boost::shared_ptr<density_field_interface> ptr_type;

  public:
    virtual ~density_field_interface() {}

    /**
     * @param worldPos The world space sample position.
     * @param timeSeconds The elapsed scene time, used for animating the field.
     * @return The raw density. May be negative where there is no fog.
     */
    virtual float sample( const frantic::graphics::vector3f& worldPos, float timeSeconds ) const = 0;
};

typedef density_field_interface::ptr_type density_field_interface_ptr;

/**
 * Fog density built from a weighted sum of tiled noise lookups, boosted near the ground by a linear height term and
 * faded out just below the top of the slab.
 */
class noise_density_field : public density_field_interface {
    density_params m_params;
    noise_volume_interface_ptr m_noise;

  public:
    /**
     * @param params The shaping parameters. The octave table is validated here.
     * @param noise The tiled noise to sum. Must not be null.
     */
    noise_density_field( const density_params& params, noise_volume_interface_ptr noise );

    const density_params& get_params() const { return m_params; }

    virtual float sample( const frantic::graphics::vector3f& worldPos, float timeSeconds ) const;

    // Individual terms, exposed so they can be inspected separately.
    float noise_term( const frantic::graphics::vector3f& worldPos, float timeSeconds ) const;
    float height_fog_term( float y ) const;
    float fade_out_factor( float y ) const;
};

/**
 * Estimates a shading normal from the density gradient by central differences. The normal points away from denser
 * fog. Falls back to +Y where the gradient vanishes.
 */
frantic::graphics::vector3f compute_gradient_normal( const density_field_interface& field,
                                                     const frantic::graphics::vector3f& worldPos, float timeSeconds,
                                                     float epsilon );

} // namespace stratus
