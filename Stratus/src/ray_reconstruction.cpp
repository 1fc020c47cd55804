// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/ray_reconstruction.hpp>

#include <boost/math/constants/constants.hpp>

using frantic::graphics::transform4f;
using frantic::graphics::vector3f;

namespace stratus {

namespace {

// Full four component product with the homogeneous point (x,y,z,w). Element (row,col) is at index col*4+row.
void transform_homogeneous( const transform4f& tm, float x, float y, float z, float w, float outResult[4] ) {
    for( int row = 0; row < 4; ++row )
        outResult[row] = tm[row] * x + tm[4 + row] * y + tm[8 + row] * z + tm[12 + row] * w;
}

} // anonymous namespace

vector3f reconstruct_world_position( float depth, const frantic::graphics2d::vector2f& screenCoord,
                                     const transform4f& projectionInverse, const transform4f& cameraToWorld ) {
    const float clipZ = depth * 2.f - 1.f;

    float viewPos[4];
    transform_homogeneous( projectionInverse, screenCoord.x * 2.f - 1.f, screenCoord.y * 2.f - 1.f, clipZ, 1.f,
                           viewPos );

    // Perspective divide. A zero w only comes from a malformed projection, which is the caller's problem.
    const float invW = 1.f / viewPos[3];

    float worldPos[4];
    transform_homogeneous( cameraToWorld, viewPos[0] * invW, viewPos[1] * invW, viewPos[2] * invW, 1.f, worldPos );

    return vector3f( worldPos[0], worldPos[1], worldPos[2] );
}

vector3f project_world_position( const vector3f& worldPos, const transform4f& projection,
                                 const transform4f& worldToCamera ) {
    float viewPos[4];
    transform_homogeneous( worldToCamera, worldPos.x, worldPos.y, worldPos.z, 1.f, viewPos );

    float clipPos[4];
    transform_homogeneous( projection, viewPos[0], viewPos[1], viewPos[2], viewPos[3], clipPos );

    const float invW = 1.f / clipPos[3];
    return vector3f( clipPos[0] * invW * 0.5f + 0.5f, clipPos[1] * invW * 0.5f + 0.5f,
                     clipPos[2] * invW * 0.5f + 0.5f );
}

transform4f make_perspective_projection( float fovYDegrees, float aspect, float nearZ, float farZ ) {
    if( !( nearZ > 0.f ) || !( farZ > nearZ ) || !( aspect > 0.f ) )
        throw std::invalid_argument( "make_perspective_projection: Requires 0 < near < far and a positive aspect" );

    const float f = 1.f / std::tan( fovYDegrees * 0.5f * boost::math::constants::pi<float>() / 180.f );
    const float a = ( farZ + nearZ ) / ( nearZ - farZ );
    const float b = 2.f * farZ * nearZ / ( nearZ - farZ );

    // Column major.
    return transform4f( f / aspect, 0.f, 0.f, 0.f, 0.f, f, 0.f, 0.f, 0.f, 0.f, a, -1.f, 0.f, 0.f, b, 0.f );
}

transform4f make_perspective_projection_inverse( float fovYDegrees, float aspect, float nearZ, float farZ ) {
    if( !( nearZ > 0.f ) || !( farZ > nearZ ) || !( aspect > 0.f ) )
        throw std::invalid_argument(
            "make_perspective_projection_inverse: Requires 0 < near < far and a positive aspect" );

    const float f = 1.f / std::tan( fovYDegrees * 0.5f * boost::math::constants::pi<float>() / 180.f );
    const float c = ( nearZ - farZ ) / ( 2.f * farZ * nearZ );
    const float d = ( farZ + nearZ ) / ( 2.f * farZ * nearZ );

    return transform4f( aspect / f, 0.f, 0.f, 0.f, 0.f, 1.f / f, 0.f, 0.f, 0.f, 0.f, 0.f, c, 0.f, 0.f, -1.f, d );
}

transform4f make_look_at_camera_to_world( const vector3f& eye, const vector3f& target, const vector3f& up ) {
    const vector3f zAxis = vector3f::normalize( eye - target );
    const vector3f xAxisUnnormalized = vector3f::cross( up, zAxis );
    if( !( xAxisUnnormalized.get_magnitude() > 1e-6f ) )
        throw std::invalid_argument( "make_look_at_camera_to_world: The up vector is parallel to the view direction" );

    const vector3f xAxis = vector3f::normalize( xAxisUnnormalized );
    const vector3f yAxis = vector3f::cross( zAxis, xAxis );

    return transform4f( xAxis.x, xAxis.y, xAxis.z, 0.f, yAxis.x, yAxis.y, yAxis.z, 0.f, zAxis.x, zAxis.y, zAxis.z,
                        0.f, eye.x, eye.y, eye.z, 1.f );
}

} // namespace stratus
