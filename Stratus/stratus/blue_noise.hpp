// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/cstdint.hpp>
#include <boost/shared_ptr.hpp>

#include <vector>

namespace stratus {

/**
 * A square, tileable, single channel texture used to jitter ray start positions per pixel. Lookups are by integer
 * pixel coordinate, wrapped modulo the texture resolution, with no filtering.
 */
class screen_noise_texture {
    int m_resolution;
    std::vector<boost::uint8_t> m_texels;

  public:
    typedef boost::shared_ptr<screen_noise_texture> ptr_type;

    static const int DEFAULT_RESOLUTION = 256;

    /**
     * @param resolution The edge length of the texture.
     * @param texels resolution^2 values, row major. Throws if the count is wrong.
     */
    screen_noise_texture( int resolution, const std::vector<boost::uint8_t>& texels );

    // Seeded white noise stand-in for when no precomputed blue noise image is supplied.
    static ptr_type create_random( boost::uint32_t seed, int resolution = DEFAULT_RESOLUTION );

    // A texture where every texel has the same value. Mostly useful for disabling jitter.
    static ptr_type create_constant( boost::uint8_t value, int resolution = 1 );

    int resolution() const { return m_resolution; }

    /**
     * @return The texel at (x mod resolution, y mod resolution), in [0,1].
     */
    float sample( int x, int y ) const;
};

typedef screen_noise_texture::ptr_type screen_noise_texture_ptr;

} // namespace stratus
