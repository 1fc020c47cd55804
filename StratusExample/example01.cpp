// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
/*
Stratus example file.

EXAMPLE 1
-Uses set_global_logging_level to stats
-Builds the demo cloud layer preset
-Ray casts a ground plane below the clouds to produce a depth buffer and a scene image
-Renders the fog on its own and composited over the scene
-exr output
*/

#include <stratus/image_writer.hpp>
#include <stratus/logging.hpp>
#include <stratus/ray_reconstruction.hpp>
#include <stratus/volumetric_pass.hpp>

#include <frantic/graphics2d/size2.hpp>
#include <frantic/graphics2d/vector2f.hpp>
#include <frantic/logging/progress_logger.hpp>

#include <boost/make_shared.hpp>

#include <iostream>

using frantic::graphics::color3f;
using frantic::graphics::transform4f;
using frantic::graphics::vector3f;

int main( int argc, char* argv[] ) {
    try {
        // Stats shows the thread count and the per status ray histogram after each render.
        stratus::set_global_logging_level( stratus::LOG_STATS );

        const std::string outputPrefix = argc > 1 ? argv[1] : "example01";

        const int width = 640;
        const int height = 360;

        // High above the origin, looking down into the cloud layer.
        const float fovY = 75.f, nearZ = 0.5f, farZ = 50000.f;
        const float aspect = (float)width / (float)height;
        const vector3f eye( 120.f, 200.f, 120.f );
        const transform4f cameraToWorld =
            stratus::make_look_at_camera_to_world( eye, vector3f( 0.f, 0.f, 0.f ), vector3f( 0.f, 1.f, 0.f ) );
        const transform4f worldToCamera = cameraToWorld.to_inverse();
        const transform4f projection = stratus::make_perspective_projection( fovY, aspect, nearZ, farZ );

        stratus::frame_context frame;
        frame.cameraPosition = eye;
        frame.cameraToWorld = cameraToWorld;
        frame.projectionInverse = stratus::make_perspective_projection_inverse( fovY, aspect, nearZ, farZ );
        frame.timeSeconds = 10.f;
        frame.lightPosition = vector3f( 40.f, 24.f, 40.f );
        frame.sceneAmbientLight = stratus::ambient_light( color3f( 0.8f, 0.8f, 0.8f ), 1.2f * 3.14159265f );

        // A flat ground below the fog. Pixels that miss it see the far plane.
        const float groundY = -150.f;
        stratus::volumetric_pass::depth_buffer_type depth( frantic::graphics2d::size2( width, height ) );
        stratus::volumetric_pass::color_buffer_type scene( frantic::graphics2d::size2( width, height ) );
        for( int y = 0; y < height; ++y ) {
            for( int x = 0; x < width; ++x ) {
                const frantic::graphics2d::vector2f uv( ( x + 0.5f ) / width, ( y + 0.5f ) / height );
                const vector3f farPos =
                    stratus::reconstruct_world_position( 1.f, uv, frame.projectionInverse, frame.cameraToWorld );
                const vector3f dir = vector3f::normalize( farPos - eye );

                float d = 1.f;
                color3f c( 0.25f + 0.5f * uv.y, 0.45f + 0.4f * uv.y, 0.85f );
                if( dir.y < 0.f ) {
                    const vector3f hit = eye + dir * ( ( groundY - eye.y ) / dir.y );
                    d = stratus::project_world_position( hit, projection, worldToCamera ).z;
                    // checkerboard so the fog's effect on the ground is easy to see
                    const bool odd = ( ( (int)std::floor( hit.x / 40.f ) + (int)std::floor( hit.z / 40.f ) ) & 1 ) != 0;
                    c = odd ? color3f( 0.35f, 0.3f, 0.25f ) : color3f( 0.2f, 0.22f, 0.18f );
                }
                depth.set_pixel( x, y, d );
                scene.set_pixel( x, y, c );
            }
        }

        stratus::volumetric_pass pass( stratus::fog_params::demo_preset(), 1234 );
        pass.set_progress_logger( boost::make_shared<frantic::logging::null_progress_logger>() );

        stratus::volumetric_pass::fog_buffer_type fog;
        pass.render( frame, depth, fog );
        stratus::save_fog_exr( outputPrefix + "_fog.exr", fog );

        // The same frame again with lighting enabled, composited over the scene.
        stratus::fog_params_overrides overrides;
        overrides.enableLighting = true;
        overrides.normalMode = stratus::SHADING_NORMAL_DENSITY_GRADIENT;
        overrides.lightFalloffDistance = 400.f;
        pass.apply_overrides( overrides );

        stratus::volumetric_pass::color_buffer_type composited;
        const stratus::render_statistics stats = pass.render_composited( frame, depth, scene, composited );
        stratus::save_color_exr( outputPrefix + "_composited.exr", composited, stratus::BIT_DEPTH_FLOAT );

        std::cout << "Rendered " << stats.pixel_count() << " pixels with " << stats.threadCount << " threads"
                  << std::endl;
    } catch( std::exception& e ) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
