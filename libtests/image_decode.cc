#include <docsift/assert_test.h>

#include "pdf_builder.hh"

#include <docsift/ImageStreamDecoder.hh>
#include <docsift/RasterCodec.hh>
#include <docsift/SiftExc.hh>

#include <qpdf/Pl_DCT.hh>
#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <openjpeg.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>

typedef QPDFObjectHandle OH;

namespace
{
    struct j2k_output
    {
        std::string data;
        size_t pos{0};
    };
} // namespace

static OPJ_SIZE_T
j2k_write(void* buffer, OPJ_SIZE_T nbytes, void* user_data)
{
    auto* out = static_cast<j2k_output*>(user_data);
    if (out->pos + nbytes > out->data.size()) {
        out->data.resize(out->pos + nbytes);
    }
    memcpy(&out->data[out->pos], buffer, nbytes);
    out->pos += nbytes;
    return nbytes;
}

static OPJ_OFF_T
j2k_skip(OPJ_OFF_T nbytes, void* user_data)
{
    auto* out = static_cast<j2k_output*>(user_data);
    out->pos += static_cast<size_t>(nbytes);
    if (out->pos > out->data.size()) {
        out->data.resize(out->pos);
    }
    return nbytes;
}

static OPJ_BOOL
j2k_seek(OPJ_OFF_T offset, void* user_data)
{
    auto* out = static_cast<j2k_output*>(user_data);
    out->pos = static_cast<size_t>(offset);
    return OPJ_TRUE;
}

// Losslessly encode 8-bit grey or RGB pixels as a JPEG 2000 codestream.
static std::string
encode_j2k(
    unsigned int width, unsigned int height, unsigned int numcomps, std::string const& pixels)
{
    opj_image_cmptparm_t cmptparm[3];
    memset(cmptparm, 0, sizeof(cmptparm));
    for (unsigned int c = 0; c < numcomps; ++c) {
        cmptparm[c].dx = 1;
        cmptparm[c].dy = 1;
        cmptparm[c].w = width;
        cmptparm[c].h = height;
        cmptparm[c].prec = 8;
        cmptparm[c].sgnd = 0;
    }
    auto* image =
        opj_image_create(numcomps, cmptparm, numcomps == 1 ? OPJ_CLRSPC_GRAY : OPJ_CLRSPC_SRGB);
    assert(image);
    image->x0 = 0;
    image->y0 = 0;
    image->x1 = width;
    image->y1 = height;
    for (size_t i = 0; i < static_cast<size_t>(width) * height; ++i) {
        for (unsigned int c = 0; c < numcomps; ++c) {
            image->comps[c].data[i] = static_cast<unsigned char>(pixels.at(i * numcomps + c));
        }
    }

    opj_cparameters_t parameters;
    opj_set_default_encoder_parameters(&parameters);
    parameters.numresolution = 1;
    parameters.tcp_numlayers = 1;
    parameters.tcp_rates[0] = 0;
    parameters.cp_disto_alloc = 1;
    auto* codec = opj_create_compress(OPJ_CODEC_J2K);
    assert(codec);
    assert(opj_setup_encoder(codec, &parameters, image));

    j2k_output out;
    auto* stream = opj_stream_create(OPJ_J2K_STREAM_CHUNK_SIZE, OPJ_FALSE);
    assert(stream);
    opj_stream_set_user_data(stream, &out, nullptr);
    opj_stream_set_write_function(stream, j2k_write);
    opj_stream_set_skip_function(stream, j2k_skip);
    opj_stream_set_seek_function(stream, j2k_seek);
    assert(opj_start_compress(codec, image, stream));
    assert(opj_encode(codec, stream));
    assert(opj_end_compress(codec, stream));
    opj_stream_destroy(stream);
    opj_destroy_codec(codec);
    opj_image_destroy(image);
    return out.data;
}

static std::string
encode_jpeg(unsigned int width, unsigned int height, std::string const& grey)
{
    std::string jpeg;
    Pl_String out("jpeg", nullptr, jpeg);
    Pl_DCT dct("compress", &out, width, height, 1, JCS_GRAYSCALE);
    dct.writeString(grey);
    dct.finish();
    return jpeg;
}

static Raster
make_raster(unsigned int width, unsigned int height, int channels, std::string const& pixels)
{
    Raster r;
    r.width = width;
    r.height = height;
    r.channels = channels;
    r.pixels = pixels;
    return r;
}

static OH
image_stream(
    QPDF& pdf,
    int width,
    int height,
    OH color_space,
    std::string const& data,
    std::map<std::string, OH> extra = {})
{
    extra.emplace("/Type", OH::newName("/XObject"));
    extra.emplace("/Subtype", OH::newName("/Image"));
    extra.emplace("/Width", OH::newInteger(width));
    extra.emplace("/Height", OH::newInteger(height));
    extra.emplace("/BitsPerComponent", OH::newInteger(8));
    if (color_space.isInitialized()) {
        extra["/ColorSpace"] = color_space;
    }
    auto stream = OH::newStream(&pdf, data);
    for (auto const& item: extra) {
        stream.getDict().replaceKey(item.first, item.second);
    }
    return stream;
}

static void
test_png()
{
    auto grey = make_raster(3, 2, 1, std::string("\x00\x40\x80\xc0\xff\x10", 6));
    auto png = RasterCodec::encodePNG(grey);
    assert(RasterCodec::detectFormat(png) == "png");
    auto decoded = RasterCodec::decodePNG(png);
    assert(decoded.width == 3 && decoded.height == 2 && decoded.channels == 1);
    assert(decoded.pixels == grey.pixels);

    auto rgb = make_raster(1, 2, 3, std::string("\xff\x00\x00\x00\x00\xff", 6));
    decoded = RasterCodec::decodePNG(RasterCodec::encodePNG(rgb));
    assert(decoded.channels == 3 && decoded.pixels == rgb.pixels);

    try {
        RasterCodec::decodePNG("\x89PNG\r\n\x1a\nbroken");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_unsupported);
    }
}

static void
test_jpeg()
{
    auto jpeg = encode_jpeg(8, 8, std::string(64, '\x80'));
    assert(RasterCodec::detectFormat(jpeg) == "jpeg");
    auto decoded = RasterCodec::decodeJPEG(jpeg);
    assert(decoded.width == 8 && decoded.height == 8 && decoded.channels == 1);
    // Lossy, but a flat image stays close to flat.
    for (auto ch: decoded.pixels) {
        assert(abs(static_cast<unsigned char>(ch) - 0x80) < 4);
    }

    for (auto const& bad: {jpeg.substr(0, jpeg.size() / 2), std::string("\xff\xd8\xff junk")}) {
        try {
            RasterCodec::decodeJPEG(bad);
            assert(false);
        } catch (SiftExc& e) {
            assert(e.getErrorCode() == docsift_e_unsupported);
            assert(std::string(e.what()).find("error decoding JPEG: ") != std::string::npos);
        }
    }
}

static void
test_jpx()
{
    std::string grey_pixels;
    for (int i = 0; i < 12; ++i) {
        grey_pixels += static_cast<char>(i * 20);
    }
    auto j2k = encode_j2k(4, 3, 1, grey_pixels);
    assert(RasterCodec::detectFormat(j2k) == "j2k");
    auto decoded = RasterCodec::decodeJPX(j2k);
    assert(decoded.width == 4 && decoded.height == 3 && decoded.channels == 1);
    assert(decoded.pixels == grey_pixels);

    std::string rgb_pixels("\xff\x00\x00\x00\xff\x00\x00\x00\xff\x10\x20\x30", 12);
    decoded = RasterCodec::decodeJPX(encode_j2k(2, 2, 3, rgb_pixels));
    assert(decoded.width == 2 && decoded.height == 2 && decoded.channels == 3);
    assert(decoded.pixels == rgb_pixels);

    assert(
        RasterCodec::detectFormat(std::string("\0\0\0\x0cjP  \r\n\x87\n....", 16)) == "jp2");
    for (auto const& bad: {std::string("not jpeg 2000"), std::string("\xff\x4f\xff\x51junk")}) {
        try {
            RasterCodec::decodeJPX(bad);
            assert(false);
        } catch (SiftExc& e) {
            assert(e.getErrorCode() == docsift_e_unsupported);
        }
    }
}

static void
test_conversions()
{
    auto cmyk = make_raster(2, 1, 4, std::string("\x00\x00\x00\x00\x00\x00\x00\xff", 8));
    auto rgb = RasterCodec::toRGB(cmyk);
    assert(rgb.channels == 3);
    assert(rgb.pixels == std::string("\xff\xff\xff\x00\x00\x00", 6));

    auto red = make_raster(1, 1, 3, std::string("\xff\x00\x00", 3));
    auto grey = RasterCodec::toGreyscale(red);
    assert(grey.channels == 1);
    assert(static_cast<unsigned char>(grey.pixels.at(0)) == 76);

    auto flat = make_raster(4, 1, 1, std::string(4, '\x55'));
    RasterCodec::stretchContrast(flat);
    assert(flat.pixels == std::string(4, '\x55'));

    auto two = make_raster(100, 1, 1, std::string(50, '\x64') + std::string(50, '\x96'));
    RasterCodec::stretchContrast(two);
    assert(two.pixels == std::string(50, '\x00') + std::string(50, '\xff'));

    assert(RasterCodec::detectFormat("GIF89a...") == "gif");
    assert(RasterCodec::detectFormat(std::string("RIFF\x10\x00\x00\x00WEBPVP8 ", 16)) == "webp");
    assert(RasterCodec::detectFormat(std::string("II*\0", 4)) == "tiff");
    assert(RasterCodec::detectFormat("BM....") == "bmp");
    assert(RasterCodec::detectFormat("%PDF-1.7") == "");
    assert(RasterCodec::detectFormat("") == "");
}

static void
test_color_spaces(QPDF& pdf)
{
    auto no_resources = OH::newDictionary();
    auto cs = ImageStreamDecoder::resolveColorSpace(OH::newName("/DeviceRGB"), no_resources);
    assert(cs && cs->channels == 3 && !cs->indexed);
    cs = ImageStreamDecoder::resolveColorSpace(OH::newName("/G"), no_resources);
    assert(cs && cs->channels == 1);
    cs = ImageStreamDecoder::resolveColorSpace(OH::newName("/DeviceCMYK"), no_resources);
    assert(cs && cs->channels == 4);

    auto icc = [&pdf](std::map<std::string, OH> const& dict) {
        auto profile = OH::newStream(&pdf, "");
        for (auto const& item: dict) {
            profile.getDict().replaceKey(item.first, item.second);
        }
        return OH::newArray({OH::newName("/ICCBased"), profile});
    };
    cs = ImageStreamDecoder::resolveColorSpace(icc({{"/N", OH::newInteger(4)}}), no_resources);
    assert(cs && cs->channels == 4);
    // An unusual /N falls back to /Alternate.
    cs = ImageStreamDecoder::resolveColorSpace(
        icc({{"/N", OH::newInteger(2)}, {"/Alternate", OH::newName("/DeviceGray")}}),
        no_resources);
    assert(cs && cs->channels == 1);
    assert(!ImageStreamDecoder::resolveColorSpace(icc({}), no_resources));

    auto indexed = OH::newArray(
        {OH::newName("/Indexed"),
         OH::newName("/DeviceRGB"),
         OH::newInteger(1),
         OH::newString(std::string("\xff\x00\x00\x00\x00\xff", 6))});
    cs = ImageStreamDecoder::resolveColorSpace(indexed, no_resources);
    assert(cs && cs->indexed && cs->channels == 3 && cs->hival == 1);
    assert(cs->lookup.size() == 6);
    // hival is clamped.
    auto big = OH::newArray(
        {OH::newName("/I"), OH::newName("/G"), OH::newInteger(999), OH::newString("abc")});
    cs = ImageStreamDecoder::resolveColorSpace(big, no_resources);
    assert(cs && cs->hival == 255);
    // An indexed space can't be the base of another.
    auto nested = OH::newArray(
        {OH::newName("/Indexed"), indexed, OH::newInteger(0), OH::newString("x")});
    assert(!ImageStreamDecoder::resolveColorSpace(nested, no_resources));

    // Named color spaces come from the resources, and loops end.
    auto resources = OH::newDictionary(
        {{"/ColorSpace",
          OH::newDictionary(
              {{"/CS0", icc({{"/N", OH::newInteger(3)}})},
               {"/Loop", OH::newName("/Loop")},
               {"/Cal", OH::newArray({OH::newName("/CalRGB"), OH::newDictionary()})}})}});
    cs = ImageStreamDecoder::resolveColorSpace(OH::newName("/CS0"), resources);
    assert(cs && cs->channels == 3);
    cs = ImageStreamDecoder::resolveColorSpace(OH::newName("/Cal"), resources);
    assert(cs && cs->channels == 3);
    assert(!ImageStreamDecoder::resolveColorSpace(OH::newName("/Loop"), resources));
    assert(!ImageStreamDecoder::resolveColorSpace(OH::newName("/Missing"), resources));
    assert(!ImageStreamDecoder::resolveColorSpace(
        OH::newArray({OH::newName("/Lab"), OH::newDictionary()}), resources));
}

static void
test_decode(QPDF& pdf)
{
    std::string info;
    auto logger = QPDFLogger::create();
    logger->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    ImageStreamDecoder decoder(logger);
    auto resources = OH::newDictionary();

    // Indexed, Flate compressed
    auto indexed = OH::newArray(
        {OH::newName("/Indexed"),
         OH::newName("/DeviceRGB"),
         OH::newInteger(1),
         OH::newString(std::string("\xff\x00\x00\x00\x00\xff", 6))});
    auto image = image_stream(
        pdf,
        2,
        1,
        indexed,
        PdfBuilder::deflate(std::string("\x00\x01", 2)),
        {{"/Filter", OH::newName("/FlateDecode")}});
    auto result = decoder.decode(image, resources, "indexed");
    assert(result);
    assert(result->width == 2 && result->height == 1);
    auto raster = RasterCodec::decodePNG(result->png);
    assert(raster.channels == 3);
    assert(raster.pixels == std::string("\xff\x00\x00\x00\x00\xff", 6));

    // Grey, unfiltered, with extra data at the end
    image = image_stream(pdf, 2, 1, OH::newName("/DeviceGray"), "\x10\x20xyz");
    result = decoder.decode(image, resources, "grey");
    assert(result);
    raster = RasterCodec::decodePNG(result->png);
    assert(raster.pixels == std::string("\x10\x10\x10\x20\x20\x20", 6));

    // Grey, ASCIIHex then run-length encoded
    image = image_stream(
        pdf,
        3,
        1,
        OH::newName("/DeviceGray"),
        "02 55 66 77 80>",
        {{"/Filter", OH::newArray({OH::newName("/AHx"), OH::newName("/RunLengthDecode")})}});
    result = decoder.decode(image, resources, "run length");
    assert(result);
    raster = RasterCodec::decodePNG(result->png);
    assert(raster.pixels == std::string("\x55\x55\x55\x66\x66\x66\x77\x77\x77", 9));

    // CMYK is converted.
    image = image_stream(
        pdf, 1, 1, OH::newName("/DeviceCMYK"), std::string("\x00\x00\x00\xff", 4));
    raster = RasterCodec::decodePNG(decoder.decode(image, resources, "cmyk")->png);
    assert(raster.pixels == std::string(3, '\0'));

    // JPEG data is decoded as is.
    auto jpeg = encode_jpeg(8, 8, std::string(64, '\xf0'));
    image = image_stream(
        pdf, 8, 8, OH::newName("/DeviceGray"), jpeg, {{"/Filter", OH::newName("/DCTDecode")}});
    result = decoder.decode(image, resources, "jpeg");
    assert(result && result->width == 8);
    assert(RasterCodec::decodePNG(result->png).channels == 3);

    // Filters before the DCT filter are removed first, with their parameters.
    image = image_stream(
        pdf,
        8,
        8,
        OH::newName("/DeviceGray"),
        PdfBuilder::deflate(jpeg),
        {{"/Filter", OH::newArray({OH::newName("/Fl"), OH::newName("/DCT")})},
         {"/DecodeParms", OH::newArray({OH::newNull(), OH::newNull()})}});
    result = decoder.decode(image, resources, "flate jpeg");
    assert(result && result->width == 8 && result->height == 8);
    raster = RasterCodec::decodePNG(result->png);
    assert(abs(static_cast<unsigned char>(raster.pixels.at(0)) - 0xf0) < 4);

    // JPEG 2000, alone and behind Flate. The image's own dimensions come from the codestream.
    std::string rgb_pixels("\xff\x00\x00\x00\xff\x00\x00\x00\xff\x10\x20\x30", 12);
    auto j2k = encode_j2k(2, 2, 3, rgb_pixels);
    image = image_stream(pdf, 2, 2, OH(), j2k, {{"/Filter", OH::newName("/JPXDecode")}});
    result = decoder.decode(image, resources, "jpx");
    assert(result && result->width == 2 && result->height == 2);
    assert(RasterCodec::decodePNG(result->png).pixels == rgb_pixels);
    image = image_stream(
        pdf,
        2,
        2,
        OH(),
        PdfBuilder::deflate(j2k),
        {{"/Filter", OH::newArray({OH::newName("/FlateDecode"), OH::newName("/JPXDecode")})}});
    result = decoder.decode(image, resources, "flate jpx");
    assert(result);
    assert(RasterCodec::decodePNG(result->png).pixels == rgb_pixels);

    // Damaged codec data is an error, not a skip.
    image = image_stream(
        pdf, 1, 1, OH(), "\xff\x4f\xff\x51junk", {{"/Filter", OH::newName("/JPXDecode")}});
    try {
        decoder.decode(image, resources, "bad jpx");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_unsupported);
    }

    // Skipped images
    assert(info.empty());
    auto skipped = [&decoder, &resources, &info](OH img, char const* reason) {
        info.clear();
        assert(!decoder.decode(img, resources, "skip"));
        assert(info.find("docsift: skip: skipping image: ") == 0);
        assert(info.find(reason) != std::string::npos);
    };
    skipped(
        image_stream(pdf, 1, 1, OH(), "\x00", {{"/ImageMask", OH::newBool(true)}}),
        "stencil masks");
    skipped(
        image_stream(pdf, 0, 1, OH::newName("/DeviceGray"), ""), "invalid image dimensions 0x1");
    skipped(
        image_stream(pdf, 30001, 1, OH::newName("/DeviceGray"), ""), "invalid image dimensions");
    skipped(
        image_stream(
            pdf,
            1,
            1,
            OH::newName("/DeviceRGB"),
            "",
            {{"/Filter",
              OH::newArray({OH::newName("/DCTDecode"), OH::newName("/FlateDecode")})}}),
        "/DCTDecode is not the last filter");
    skipped(
        image_stream(
            pdf,
            1,
            1,
            OH::newName("/DeviceRGB"),
            "",
            {{"/Filter", OH::newArray({OH::newName("/CCITTFaxDecode"), OH::newName("/DCT")})}}),
        "unsupported filter before /DCT");
    skipped(
        image_stream(
            pdf,
            1,
            1,
            OH::newName("/DeviceRGB"),
            "",
            {{"/Filter", OH::newName("/CCITTFaxDecode")}}),
        "unsupported filter /CCITTFaxDecode");
    skipped(
        image_stream(
            pdf,
            1,
            1,
            OH::newName("/DeviceGray"),
            "",
            {{"/Filter", OH::newArray({OH::newName("/FlateDecode"), OH::newName("/DCTDecode")})},
             {"/DecodeParms", OH::newArray({OH::newNull()})}}),
        "/DecodeParms does not match /Filter");
    skipped(
        image_stream(
            pdf,
            1,
            1,
            OH::newName("/DeviceGray"),
            "x",
            {{"/BitsPerComponent", OH::newInteger(1)}}),
        "1 bits per component");
    skipped(image_stream(pdf, 1, 1, OH::newName("/Pattern"), "\x00"), "unsupported color space");
    skipped(image_stream(pdf, 2, 2, OH::newName("/DeviceRGB"), "short"), "too short");
    skipped(OH::newDictionary(), "not a stream");
}

int
main()
{
    QPDF pdf;
    pdf.emptyPDF();
    test_png();
    test_jpeg();
    test_jpx();
    test_conversions();
    test_color_spaces(pdf);
    test_decode(pdf);
    std::cout << "end of image decode tests\n";
    return 0;
}
