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

#ifndef IMAGESTREAMDECODER_HH
#define IMAGESTREAMDECODER_HH

#include <docsift/DLL.h>

#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <memory>
#include <optional>
#include <string>
#include <vector>

// Turns image XObjects into PNG data suitable for text recognition. Images whose last filter is
// /DCTDecode or /JPXDecode have any earlier filters removed by qpdf and are then decoded with
// libjpeg or OpenJPEG. Other images with 8 bits per component are decoded by qpdf and read
// directly after their color space is resolved. Everything else is skipped with a message to the
// info channel of the logger.
class ImageStreamDecoder
{
  public:
    // An image XObject reachable from a page
    struct PageImage
    {
        // The image's key in the /XObject dictionary that refers to it
        std::string name;
        QPDFObjectHandle image;
        // The resource dictionary in effect where the image is used
        QPDFObjectHandle resources;
    };

    struct DecodedImage
    {
        std::string png;
        unsigned int width{0};
        unsigned int height{0};
    };

    // The result of resolving a color space down to a device space.
    struct ColorSpace
    {
        // Components per pixel of the device space: 1 (grey), 3 (RGB) or 4 (CMYK)
        int channels{0};
        // For /Indexed spaces, each sample is an index into lookup, which holds hival + 1 entries
        // of channels bytes.
        bool indexed{false};
        int hival{0};
        std::string lookup;
    };

    // Color spaces that refer to other color spaces more deeply than this are rejected.
    static int const max_color_space_depth = 8;

    DOCSIFT_DLL
    ImageStreamDecoder(std::shared_ptr<QPDFLogger> logger = nullptr);

    // Decode an image. resources is the resource dictionary that applies to the image and is used
    // to look up named color spaces. description identifies the image in log messages. Returns
    // std::nullopt for images that are not supported. Throws SiftExc if the JPEG or JPEG 2000 data
    // is damaged and QPDFExc if the stream data can't be read.
    DOCSIFT_DLL
    std::optional<DecodedImage> decode(
        QPDFObjectHandle image, QPDFObjectHandle resources, std::string const& description);

    // Find the images used by a page, including those inside form XObjects, searched depth first
    // in key order. Each image is returned once. A form without its own /Resources uses the
    // resources of whatever uses it.
    DOCSIFT_DLL
    static std::vector<PageImage> findImages(QPDFPageObjectHelper& page);

    // Resolve a /ColorSpace value. Names are looked up in resources' /ColorSpace dictionary
    // unless they are device or calibrated spaces. /ICCBased spaces use /N, falling back to
    // /Alternate. Returns std::nullopt for unsupported or malformed spaces.
    DOCSIFT_DLL
    static std::optional<ColorSpace>
    resolveColorSpace(QPDFObjectHandle cs, QPDFObjectHandle resources);

  private:
    static std::optional<ColorSpace>
    resolveColorSpaceInternal(QPDFObjectHandle cs, QPDFObjectHandle resources, int depth);
    std::optional<DecodedImage> decodeCodec(
        QPDFObjectHandle image,
        std::vector<QPDFObjectHandle> const& filters,
        std::vector<QPDFObjectHandle> const& parms,
        std::string const& description);

    void skip(std::string const& description, std::string const& reason);

    std::shared_ptr<QPDFLogger> logger;
};

#endif // IMAGESTREAMDECODER_HH
