// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/cstdint.hpp>
#include <boost/shared_ptr.hpp>

#include <frantic/graphics/vector3f.hpp>

#include <vector>

namespace stratus {

/**
 * A tileable scalar noise field in three dimensions. Coordinates are texture coordinates, so the field repeats with a
 * period of 1 along each axis.
 */
class noise_volume_interface {
  public:
    typedef boost::shared_ptr<noise_volume_interface> ptr_type;

  public:
    virtual ~noise_volume_interface() {}

    /**
     * @param uvw The lookup coordinate. Any value is valid, the field wraps around.
     * @return The field value in [-1,1].
     */
    virtual float sample( const frantic::graphics::vector3f& uvw ) const = 0;
};

typedef noise_volume_interface::ptr_type noise_volume_interface_ptr;

/**
 * A cube of 8-bit texels sampled with trilinear filtering and repeat wrapping. Texel centers sit at (i+0.5)/resolution.
 */
class tiled_noise_volume : public noise_volume_interface {
    int m_resolution;
    std::vector<boost::uint8_t> m_texels;

  public:
    typedef boost::shared_ptr<tiled_noise_volume> ptr_type;

    static const int DEFAULT_RESOLUTION = 64;

    /**
     * Wraps texel data supplied by the caller, stored x fastest then y then z.
     * @param resolution The edge length of the cube.
     * @param texels resolution^3 texel values. Throws if the count is wrong.
     */
    tiled_noise_volume( int resolution, const std::vector<boost::uint8_t>& texels );

    /**
     * Fills a cube with uniformly distributed random bytes. The same seed always produces the same volume.
     */
    static ptr_type create_random( boost::uint32_t seed, int resolution = DEFAULT_RESOLUTION );

    int resolution() const { return m_resolution; }

    /**
     * The value of a single texel remapped to [-1,1]. Indices wrap.
     */
    float get_texel( int x, int y, int z ) const;

    virtual float sample( const frantic::graphics::vector3f& uvw ) const;
};

typedef tiled_noise_volume::ptr_type tiled_noise_volume_ptr;

} // namespace stratus
