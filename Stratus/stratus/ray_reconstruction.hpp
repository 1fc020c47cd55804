// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <frantic/graphics/transform4f.hpp>
#include <frantic/graphics/vector3f.hpp>
#include <frantic/graphics2d/vector2f.hpp>

namespace stratus {

/**
 * Reconstructs the world-space position that produced a depth buffer sample.
 *
 * The depth sample is converted to a clip-space z in [-1,1], combined with the screen coordinate to form a clip-space
 * position, transformed by the inverse projection, divided by w, and finally transformed into world space. The depth
 * convention (forward or reversed) must match the one used to build the projection matrix.
 *
 * @param depth The normalized depth sample in [0,1].
 * @param screenCoord The normalized screen coordinate of the sample in [0,1]^2, with (0,0) at the bottom left.
 * @param projectionInverse The inverse of the camera's projection matrix.
 * @param cameraToWorld The camera's world transform.
 * @return The world-space position of the sample.
 */
frantic::graphics::vector3f reconstruct_world_position( float depth, const frantic::graphics2d::vector2f& screenCoord,
                                                        const frantic::graphics::transform4f& projectionInverse,
                                                        const frantic::graphics::transform4f& cameraToWorld );

/**
 * Projects a world position to the screen coordinate and depth sample that reconstruct_world_position() inverts.
 * @return (u, v, depth) with u and v in [0,1] for points inside the view and depth in [0,1] between the clip planes.
 */
frantic::graphics::vector3f project_world_position( const frantic::graphics::vector3f& worldPos,
                                                    const frantic::graphics::transform4f& projection,
                                                    const frantic::graphics::transform4f& worldToCamera );

// OpenGL style perspective projection, the camera looks down -Z and depth maps to [-1,1] in clip space.
frantic::graphics::transform4f make_perspective_projection( float fovYDegrees, float aspect, float nearZ, float farZ );

// The exact inverse of make_perspective_projection(), built analytically rather than by a general 4x4 inversion.
frantic::graphics::transform4f make_perspective_projection_inverse( float fovYDegrees, float aspect, float nearZ,
                                                                    float farZ );

/**
 * Builds the world transform of a camera at 'eye' looking at 'target'. The up vector must not be parallel to the
 * viewing direction.
 */
frantic::graphics::transform4f make_look_at_camera_to_world( const frantic::graphics::vector3f& eye,
                                                             const frantic::graphics::vector3f& target,
                                                             const frantic::graphics::vector3f& up );

} // namespace stratus
