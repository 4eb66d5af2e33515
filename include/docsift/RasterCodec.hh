// Copyright (c) 2026 The docsift authors
//
// This file is part of docsift.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef RASTERCODEC_HH
#define RASTERCODEC_HH

#include <docsift/DLL.h>

#include <string>

// An uncompressed raster with 8 bits per sample. Rows are stored top to bottom without padding,
// so pixels.size() is width * height * channels. A channel count of 1 is grey, 3 is RGB and 4 is
// CMYK.
struct Raster
{
    unsigned int width{0};
    unsigned int height{0};
    int channels{0};
    std::string pixels;
};

// Raster encoding and decoding through libpng, libjpeg and OpenJPEG. Failures from any of them
// throw SiftExc with code docsift_e_unsupported.
namespace RasterCodec
{
    // Encode a grey or RGB raster as PNG. CMYK rasters must be converted with toRGB first.
    DOCSIFT_DLL
    std::string encodePNG(Raster const&);

    // Decode PNG data. The result is grey or RGB; 16-bit samples are reduced, palettes and
    // low-depth grey are expanded, and alpha is dropped.
    DOCSIFT_DLL
    Raster decodePNG(std::string const& data);

    // Decode JPEG data with libjpeg. The result is grey, RGB, or CMYK for four-component
    // images. CMYK data written by Adobe applications is un-inverted.
    DOCSIFT_DLL
    Raster decodeJPEG(std::string const& data);

    // Decode a JPEG 2000 codestream or JP2 file with OpenJPEG. Samples are scaled to 8 bits. The
    // result is grey for one or two components, CMYK for four CMYK components, and RGB otherwise,
    // with YCC converted to RGB and extra components dropped.
    DOCSIFT_DLL
    Raster decodeJPX(std::string const& data);

    // Convert grey or CMYK to RGB. An RGB raster is returned unchanged.
    DOCSIFT_DLL
    Raster toRGB(Raster const&);

    // Convert to a single grey channel using Rec. 601 luma weights.
    DOCSIFT_DLL
    Raster toGreyscale(Raster const&);

    // Linearly stretch sample values so that the darkest and lightest percentile of the image
    // span the full 0 to 255 range. Images with no contrast are left alone.
    DOCSIFT_DLL
    void stretchContrast(Raster&);

    // Identify an encoded image by its signature. Returns one of "png", "jpeg", "gif", "webp",
    // "tiff", "bmp", "jp2", "j2k", or the empty string.
    DOCSIFT_DLL
    std::string detectFormat(std::string const& data);
} // namespace RasterCodec

#endif // RASTERCODEC_HH
