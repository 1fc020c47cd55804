// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratus/blue_noise.hpp>
#include <stratus/fog_params.hpp>
#include <stratus/frame_context.hpp>
#include <stratus/noise_volume.hpp>
#include <stratus/raymarcher.hpp>

#include <boost/cstdint.hpp>
#include <boost/shared_ptr.hpp>

#include <frantic/graphics/color3f.hpp>
#include <frantic/graphics2d/framebuffer.hpp>
#include <frantic/logging/progress_logger.hpp>

namespace stratus {

/**
 * One pixel of fog output. The color is not premultiplied.
 */
struct fog_pixel {
    frantic::graphics::color3f color;
    float alpha;

    fog_pixel()
        : alpha( 0.f ) {}

    fog_pixel( const frantic::graphics::color3f& color_, float alpha_ )
        : color( color_ )
        , alpha( alpha_ ) {}
};

struct render_statistics {
    std::size_t statusCounts[RAYMARCH_STATUS_COUNT];
    std::size_t totalIterations;
    std::size_t threadCount;

    render_statistics();

    std::size_t pixel_count() const;
};

/**
 * Renders volumetric fog for a frame given the frame's depth buffer. The fog pass owns its configuration and the two
 * noise textures, which are generated once and then shared read-only by all render threads.
 *
 * Framebuffer row 0 is the bottom of the image, matching normalized screen coordinates.
 */
class volumetric_pass {
  public:
    typedef boost::shared_ptr<volumetric_pass> ptr_type;
    typedef frantic::graphics2d::framebuffer<float> depth_buffer_type;
    typedef frantic::graphics2d::framebuffer<fog_pixel> fog_buffer_type;
    typedef frantic::graphics2d::framebuffer<frantic::graphics::color3f> color_buffer_type;

  private:
    fog_params m_params;

    boost::uint32_t m_noiseSeed;
    tiled_noise_volume_ptr m_noiseVolume;
    screen_noise_texture_ptr m_blueNoise;

    bool m_disableThreading;
    int m_threadCap;

    boost::shared_ptr<frantic::logging::progress_logger> m_progress;

  public:
    /**
     * @param params The configuration, validated here.
     * @param noiseSeed Seeds both noise textures.
     */
    explicit volumetric_pass( const fog_params& params = fog_params(), boost::uint32_t noiseSeed = 0 );

    const fog_params& get_params() const { return m_params; }

    /**
     * Throws std::invalid_argument and leaves the current parameters in place if 'params' is invalid. A change of
     * blueNoiseResolution regenerates the blue noise texture from the current seed at the new size.
     */
    void set_params( const fog_params& params );

    void apply_overrides( const fog_params_overrides& overrides );

    /**
     * Regenerates the 3D noise volume and the blue noise texture from a new seed.
     */
    void reset_noise( boost::uint32_t seed );

    // Replace a generated texture with one supplied by the caller.
    void set_noise_volume( tiled_noise_volume_ptr noiseVolume );

    // blueNoiseResolution is set to the resolution of the supplied texture.
    void set_blue_noise( screen_noise_texture_ptr blueNoise );

    tiled_noise_volume_ptr get_noise_volume() const { return m_noiseVolume; }
    screen_noise_texture_ptr get_blue_noise() const { return m_blueNoise; }

    void set_disable_threading( bool disableThreading ) { m_disableThreading = disableThreading; }
    void set_thread_cap( int threadCap ) { m_threadCap = threadCap; }

    /**
     * Progress is reported from the calling thread. A logger that throws frantic::logging::progress_cancel_exception
     * cancels the render, and the exception propagates out of render().
     */
    void set_progress_logger( boost::shared_ptr<frantic::logging::progress_logger> progress ) {
        m_progress = progress;
    }

    /**
     * Renders fog for every pixel of the depth buffer.
     * @param frame The camera and time for this frame.
     * @param depth Normalized depth samples in [0,1].
     * @param outFog Receives one fog pixel per depth sample. It is resized to match the depth buffer.
     */
    render_statistics render( const frame_context& frame, const depth_buffer_type& depth, fog_buffer_type& outFog );

    /**
     * Renders fog and blends it over an existing image with mix(sceneColor, fogColor, fogAlpha).
     * @param sceneColor The already rendered image. Must be the same size as depth.
     * @param outColor Receives the composited image. It may alias sceneColor.
     */
    render_statistics render_composited( const frame_context& frame, const depth_buffer_type& depth,
                                         const color_buffer_type& sceneColor, color_buffer_type& outColor );

    /**
     * Fog for a single pixel, exactly as render() computes it.
     */
    raymarch_result render_pixel( const frame_context& frame, const fog_raymarcher& raymarcher,
                                  const depth_buffer_type& depth, int x, int y ) const;

  private:
    void regenerate_blue_noise();
};

typedef volumetric_pass::ptr_type volumetric_pass_ptr;

/**
 * Blends fog over a scene color.
 */
frantic::graphics::color3f composite_fog( const frantic::graphics::color3f& sceneColor, const fog_pixel& fog );

} // namespace stratus
