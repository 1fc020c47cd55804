// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <stratus/image_writer.hpp>

#include <frantic/logging/logging_level.hpp>
#include <frantic/strings/tstring.hpp>

#pragma warning( push, 3 )
#pragma warning( disable : 4996 )
#include <ImfChannelList.h>
#include <ImfFrameBuffer.h>
#include <ImfHeader.h>
#include <ImfOutputFile.h>
#include <half.h>
#pragma warning( pop )

#include <list>

using frantic::graphics::color3f;

namespace stratus {

namespace {

inline void convert_to_exr_datatype( float inData, float& outData ) { outData = inData; }
inline void convert_to_exr_datatype( float inData, half& outData ) { outData = (half)inData; }

inline float get_component( const fog_pixel& pixel, int component ) {
    switch( component ) {
    case 0:
        return pixel.color.r;
    case 1:
        return pixel.color.g;
    case 2:
        return pixel.color.b;
    default:
        return pixel.alpha;
    }
}

inline float get_component( const color3f& pixel, int component ) {
    return component == 0 ? pixel.r : ( component == 1 ? pixel.g : pixel.b );
}

// Adds one channel to the header and frame buffer. The channel data lives in a new entry of 'exrBuffers', which must
// outlive the write. Exr files are stored top row first so rows are flipped here.
template <typename T, typename PixelType>
void add_exr_channel( const std::string& channelName, const frantic::graphics2d::framebuffer<PixelType>& image,
                      int component, Imf::PixelType pixelType, Imf::Header& exrHeader, Imf::FrameBuffer& exrData,
                      std::list<std::vector<char>>& exrBuffers ) {
    const int width = image.width();
    const int height = image.height();

    exrBuffers.push_back( std::vector<char>() );
    std::vector<char>& buffer = exrBuffers.back();
    buffer.resize( static_cast<std::size_t>( width ) * height * sizeof( T ) );
    T* rawBuffer = (T*)&buffer[0];

    std::size_t index = 0;
    for( int y = 0; y < height; ++y ) {
        for( int x = 0; x < width; ++x ) {
            convert_to_exr_datatype( get_component( image.get_pixel( x, height - y - 1 ), component ),
                                     rawBuffer[index] );
            ++index;
        }
    }

    exrHeader.channels().insert( channelName.c_str(), Imf::Channel( pixelType ) );
    exrData.insert( channelName.c_str(),
                    Imf::Slice( pixelType, (char*)&rawBuffer[0], sizeof( T ), width * sizeof( T ) ) );
}

template <typename PixelType>
void save_exr( const std::string& filename, const frantic::graphics2d::framebuffer<PixelType>& image,
               const char* const* channelNames, int channelCount, exr_bit_depth_t bitDepth,
               exr_compression_t compression ) {
    const int width = image.width();
    const int height = image.height();
    if( width <= 0 || height <= 0 )
        throw std::runtime_error( "save_exr: Cannot save an empty image to \"" + filename + "\"" );

    Imf::Header exrHeader( width, height, 1.0f, Imath::V2f( 0, 0 ), 1.0f, Imf::INCREASING_Y,
                           Imf::Compression( compression ) );
    Imf::FrameBuffer exrData;

    // these hold the memory used until the exr file is written.
    std::list<std::vector<char>> exrBuffers;

    for( int i = 0; i < channelCount; ++i ) {
        if( bitDepth == BIT_DEPTH_HALF )
            add_exr_channel<half>( channelNames[i], image, i, Imf::HALF, exrHeader, exrData, exrBuffers );
        else if( bitDepth == BIT_DEPTH_FLOAT )
            add_exr_channel<float>( channelNames[i], image, i, Imf::FLOAT, exrHeader, exrData, exrBuffers );
        else
            throw std::runtime_error( "save_exr: Unknown EXR bit depth" );
    }

    Imf::OutputFile out( filename.c_str(), exrHeader );
    out.setFrameBuffer( exrData );
    out.writePixels( height );
    FF_LOG( stats ) << "Image file written: " << frantic::strings::to_tstring( filename ) << std::endl;
}

} // anonymous namespace

void save_fog_exr( const std::string& filename, const volumetric_pass::fog_buffer_type& fog, exr_bit_depth_t bitDepth,
                   exr_compression_t compression ) {
    static const char* const channelNames[] = { "R", "G", "B", "A" };
    save_exr( filename, fog, channelNames, 4, bitDepth, compression );
}

void save_color_exr( const std::string& filename, const volumetric_pass::color_buffer_type& image,
                     exr_bit_depth_t bitDepth, exr_compression_t compression ) {
    static const char* const channelNames[] = { "R", "G", "B" };
    save_exr( filename, image, channelNames, 3, bitDepth, compression );
}

} // namespace stratus
