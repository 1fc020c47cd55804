// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/parallel_progress.hpp>
#include <stratus/ray_reconstruction.hpp>
#include <stratus/shading_math.hpp>
#include <stratus/threading_functions.hpp>
#include <stratus/volumetric_pass.hpp>

#include <frantic/graphics2d/size2.hpp>
#include <frantic/graphics2d/vector2f.hpp>
#include <frantic/logging/logging_level.hpp>

#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>
#include <tbb/task_arena.h>

#include <boost/lexical_cast.hpp>

#include <atomic>

using frantic::graphics::color3f;
using frantic::graphics::vector3f;

namespace stratus {

render_statistics::render_statistics()
    : totalIterations( 0 )
    , threadCount( 1 ) {
    for( int i = 0; i < RAYMARCH_STATUS_COUNT; ++i )
        statusCounts[i] = 0;
}

std::size_t render_statistics::pixel_count() const {
    std::size_t result = 0;
    for( int i = 0; i < RAYMARCH_STATUS_COUNT; ++i )
        result += statusCounts[i];
    return result;
}

color3f composite_fog( const color3f& sceneColor, const fog_pixel& fog ) {
    return mix( sceneColor, fog.color, fog.alpha );
}

namespace {

class fog_render_body {
    const volumetric_pass* m_pass;
    const frame_context* m_frame;
    const fog_raymarcher* m_raymarcher;
    const volumetric_pass::depth_buffer_type* m_depth;
    volumetric_pass::fog_buffer_type* m_outFog;
    parallel_progress_master* m_progress;
    std::atomic<bool>* m_capWarningIssued;

  public:
    render_statistics stats;

    fog_render_body( const volumetric_pass& pass, const frame_context& frame, const fog_raymarcher& raymarcher,
                     const volumetric_pass::depth_buffer_type& depth, volumetric_pass::fog_buffer_type& outFog,
                     parallel_progress_master& progress, std::atomic<bool>& capWarningIssued )
        : m_pass( &pass )
        , m_frame( &frame )
        , m_raymarcher( &raymarcher )
        , m_depth( &depth )
        , m_outFog( &outFog )
        , m_progress( &progress )
        , m_capWarningIssued( &capWarningIssued ) {}

    fog_render_body( fog_render_body& rhs, tbb::split )
        : m_pass( rhs.m_pass )
        , m_frame( rhs.m_frame )
        , m_raymarcher( rhs.m_raymarcher )
        , m_depth( rhs.m_depth )
        , m_outFog( rhs.m_outFog )
        , m_progress( rhs.m_progress )
        , m_capWarningIssued( rhs.m_capWarningIssued ) {}

    void operator()( const tbb::blocked_range<int>& range ) {
        for( int y = range.begin(); y != range.end(); ++y ) {
            for( int x = 0, xEnd = m_depth->width(); x < xEnd; ++x ) {
                const raymarch_result result = m_pass->render_pixel( *m_frame, *m_raymarcher, *m_depth, x, y );

                m_outFog->set_pixel( x, y, fog_pixel( result.color, result.alpha ) );

                ++stats.statusCounts[result.status];
                stats.totalIterations += static_cast<std::size_t>( result.iterations );

                if( result.status == RAYMARCH_ITERATION_CAPPED ) {
                    bool expected = false;
                    if( m_capWarningIssued->compare_exchange_strong( expected, true ) )
                        FF_LOG( warning ) << "Fog ray at pixel (" << x << ", " << y << ") stopped after "
                                          << result.iterations << " steps after marching "
                                          << result.distanceTraveled
                                          << " units. Further occurrences this frame are only counted." << std::endl;
                }
            }
        }

        m_progress->update_progress( range.size() );
    }

    void join( const fog_render_body& rhs ) {
        for( int i = 0; i < RAYMARCH_STATUS_COUNT; ++i )
            stats.statusCounts[i] += rhs.stats.statusCounts[i];
        stats.totalIterations += rhs.stats.totalIterations;
    }
};

void log_render_statistics( const render_statistics& stats, const integration_params& params ) {
    const std::size_t pixelCount = stats.pixel_count();

    FF_LOG( stats ) << "Fog render statistics:" << std::endl;
    FF_LOG( stats ) << "\tThreads: " << stats.threadCount << std::endl;
    FF_LOG( stats ) << "\tPixels: " << pixelCount << std::endl;
    for( int i = 0; i < RAYMARCH_STATUS_COUNT; ++i )
        FF_LOG( stats ) << "\t" << to_string( static_cast<raymarch_status_t>( i ) ) << ": " << stats.statusCounts[i]
                        << std::endl;
    if( pixelCount > 0 )
        FF_LOG( stats ) << "\tAverage steps per pixel: " << (double)stats.totalIterations / (double)pixelCount
                        << std::endl;

    const std::size_t cappedCount = stats.statusCounts[RAYMARCH_ITERATION_CAPPED];
    if( cappedCount > 0 )
        FF_LOG( warning ) << cappedCount << " fog rays hit the limit of " << params.maxRaymarchStepCount
                          << " steps this frame. Consider raising maxRaymarchStepCount or minStepLength." << std::endl;
}

} // anonymous namespace

volumetric_pass::volumetric_pass( const fog_params& params, boost::uint32_t noiseSeed )
    : m_params( params )
    , m_noiseSeed( noiseSeed )
    , m_disableThreading( false )
    , m_threadCap( -1 ) {
    m_params.validate();
    reset_noise( noiseSeed );
}

void volumetric_pass::set_params( const fog_params& params ) {
    params.validate();

    const bool blueNoiseResized = params.blueNoiseResolution != m_params.blueNoiseResolution;
    m_params = params;
    if( blueNoiseResized )
        regenerate_blue_noise();
}

void volumetric_pass::apply_overrides( const fog_params_overrides& overrides ) {
    set_params( stratus::apply_overrides( m_params, overrides ) );
}

void volumetric_pass::reset_noise( boost::uint32_t seed ) {
    m_noiseSeed = seed;
    m_noiseVolume = tiled_noise_volume::create_random( seed );
    regenerate_blue_noise();

    FF_LOG( debug ) << "Generated fog noise textures with seed " << seed << std::endl;
}

void volumetric_pass::regenerate_blue_noise() {
    // A different stream from the noise volume so the two are not correlated.
    m_blueNoise = screen_noise_texture::create_random( m_noiseSeed ^ 0x9e3779b9u, m_params.blueNoiseResolution );

    FF_LOG( debug ) << "Generated a " << m_params.blueNoiseResolution << "x" << m_params.blueNoiseResolution
                    << " blue noise texture" << std::endl;
}

void volumetric_pass::set_noise_volume( tiled_noise_volume_ptr noiseVolume ) {
    if( !noiseVolume )
        throw std::invalid_argument( "volumetric_pass::set_noise_volume: The noise volume must not be null" );
    m_noiseVolume = noiseVolume;
}

void volumetric_pass::set_blue_noise( screen_noise_texture_ptr blueNoise ) {
    if( !blueNoise )
        throw std::invalid_argument( "volumetric_pass::set_blue_noise: The blue noise texture must not be null" );
    m_blueNoise = blueNoise;
    m_params.blueNoiseResolution = blueNoise->resolution();
}

raymarch_result volumetric_pass::render_pixel( const frame_context& frame, const fog_raymarcher& raymarcher,
                                               const depth_buffer_type& depth, int x, int y ) const {
    const frantic::graphics2d::vector2f screenCoord( ( (float)x + 0.5f ) / (float)depth.width(),
                                                     ( (float)y + 0.5f ) / (float)depth.height() );

    const vector3f surfacePos = reconstruct_world_position( depth.get_pixel( x, y ), screenCoord,
                                                            frame.projectionInverse, frame.cameraToWorld );

    const int noiseRes = m_blueNoise->resolution();
    const float jitter =
        jitter_from_noise( m_blueNoise->sample( wrap_index( x, noiseRes ), wrap_index( y, noiseRes ) ) );

    return raymarcher.march( frame.cameraPosition, surfacePos, jitter );
}

render_statistics volumetric_pass::render( const frame_context& frame, const depth_buffer_type& depth,
                                           fog_buffer_type& outFog ) {
    const int width = depth.width();
    const int height = depth.height();

    if( outFog.width() != width || outFog.height() != height )
        outFog.set_size( frantic::graphics2d::size2( width, height ) );

    const noise_density_field densityField( m_params.get_density_params(), m_noiseVolume );
    const fog_color_model colorModel( m_params.get_color_params(), frame.lightPosition,
                                      resolve_ambient_light( m_params, frame ) );
    const fog_raymarcher raymarcher( m_params.get_integration_params(), densityField, colorModel,
                                     frame.timeSeconds );

    parallel_progress_master progress( m_progress.get(), static_cast<std::size_t>( height ) );
    std::atomic<bool> capWarningIssued( false );

    fog_render_body body( *this, frame, raymarcher, depth, outFog, progress, capWarningIssued );

    std::size_t threadCount = 1;
    if( m_disableThreading || height <= 1 ) {
        body( tbb::blocked_range<int>( 0, height ) );
    } else {
        threadCount = get_render_thread_count( static_cast<std::size_t>( height ), m_threadCap );

        tbb::task_arena arena( static_cast<int>( threadCount ) );
        arena.execute( [&]() { tbb::parallel_reduce( tbb::blocked_range<int>( 0, height, 1 ), body ); } );
    }

    // Rows finished by other threads were only counted, so report completion from here.
    if( m_progress )
        m_progress->update_progress( (long long)height, (long long)height );

    render_statistics stats = body.stats;
    stats.threadCount = threadCount;

    log_render_statistics( stats, raymarcher.get_params() );

    return stats;
}

render_statistics volumetric_pass::render_composited( const frame_context& frame, const depth_buffer_type& depth,
                                                      const color_buffer_type& sceneColor,
                                                      color_buffer_type& outColor ) {
    if( sceneColor.width() != depth.width() || sceneColor.height() != depth.height() )
        throw std::runtime_error( "volumetric_pass::render_composited: The scene color buffer is " +
                                  boost::lexical_cast<std::string>( sceneColor.width() ) + "x" +
                                  boost::lexical_cast<std::string>( sceneColor.height() ) +
                                  " but the depth buffer is " + boost::lexical_cast<std::string>( depth.width() ) +
                                  "x" + boost::lexical_cast<std::string>( depth.height() ) );

    fog_buffer_type fog;
    const render_statistics stats = render( frame, depth, fog );

    if( &outColor != &sceneColor && ( outColor.width() != depth.width() || outColor.height() != depth.height() ) )
        outColor.set_size( frantic::graphics2d::size2( depth.width(), depth.height() ) );

    for( int y = 0, yEnd = depth.height(); y < yEnd; ++y ) {
        for( int x = 0, xEnd = depth.width(); x < xEnd; ++x )
            outColor.set_pixel( x, y, composite_fog( sceneColor.get_pixel( x, y ), fog.get_pixel( x, y ) ) );
    }

    return stats;
}

} // namespace stratus
