// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/frame_context.hpp>

using frantic::graphics::color3f;

namespace stratus {

color3f resolve_ambient_light( const fog_params& params, const frame_context& frame ) {
    const ambient_light fallback = frame.sceneAmbientLight ? *frame.sceneAmbientLight : ambient_light();

    color3f result = params.ambientLightColor ? *params.ambientLightColor : fallback.color;
    result *= params.ambientLightIntensity ? *params.ambientLightIntensity : fallback.intensity;
    return result;
}

} // namespace stratus
