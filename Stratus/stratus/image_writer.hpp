// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stratus/volumetric_pass.hpp>

#include <string>

namespace stratus {

enum exr_bit_depth_t { BIT_DEPTH_HALF = 0, BIT_DEPTH_FLOAT };

// Values match Imf::Compression.
enum exr_compression_t {
    COMPRESSION_NONE = 0,
    COMPRESSION_RLE,
    COMPRESSION_ZIPS,
    COMPRESSION_ZIP,
    COMPRESSION_PIZ,
    COMPRESSION_PXR24,
    COMPRESSION_B44,
    COMPRESSION_B44A
};

/// Saves fog output as an RGBA exr file. The color channels are not premultiplied.
void save_fog_exr( const std::string& filename, const volumetric_pass::fog_buffer_type& fog,
                   exr_bit_depth_t bitDepth = BIT_DEPTH_HALF, exr_compression_t compression = COMPRESSION_ZIP );

/// Saves a composited image as an RGB exr file.
void save_color_exr( const std::string& filename, const volumetric_pass::color_buffer_type& image,
                     exr_bit_depth_t bitDepth = BIT_DEPTH_HALF, exr_compression_t compression = COMPRESSION_ZIP );

} // namespace stratus
