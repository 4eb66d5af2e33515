#include <docsift/RasterCodec.hh>

#include <docsift/SiftExc.hh>

#include <qpdf/Pl_String.hh>

#include <jpeglib.h>
#include <openjpeg.h>
#include <png.h>

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace
{
    struct png_io
    {
        Pipeline* out{nullptr};
        std::string const* in{nullptr};
        size_t pos{0};
        std::string msg;
    };

    struct docsift_jpeg_error_mgr
    {
        struct jpeg_error_mgr pub;
        jmp_buf jmpbuf;
        std::string msg;
    };

    struct jpx_input
    {
        unsigned char const* data{nullptr};
        size_t size{0};
        size_t pos{0};
    };

    // Owns the OpenJPEG objects of one decode.
    struct jpx_decoder
    {
        ~jpx_decoder()
        {
            if (image) {
                opj_image_destroy(image);
            }
            if (stream) {
                opj_stream_destroy(stream);
            }
            if (codec) {
                opj_destroy_codec(codec);
            }
        }

        opj_codec_t* codec{nullptr};
        opj_stream_t* stream{nullptr};
        opj_image_t* image{nullptr};
        std::string msg;
    };
} // namespace

// Rasters wider or taller than this are rejected.
static unsigned int const max_raster_dimension = 30000;

static SiftExc
codec_error(std::string const& msg)
{
    return {docsift_e_unsupported, "", "", 0, msg};
}

static void
png_error_handler(png_structp png_ptr, png_const_charp msg)
{
    auto* io = static_cast<png_io*>(png_get_error_ptr(png_ptr));
    io->msg = msg ? msg : "unknown libpng error";
    longjmp(png_jmpbuf(png_ptr), 1);
}

static void
png_warning_handler(png_structp, png_const_charp)
{
    // libpng warnings concern ancillary chunks and are ignored.
}

static void
png_write_data(png_structp png_ptr, png_bytep data, png_size_t len)
{
    auto* io = static_cast<png_io*>(png_get_io_ptr(png_ptr));
    io->out->write(data, len);
}

static void
png_flush_data(png_structp)
{
}

static void
png_read_data(png_structp png_ptr, png_bytep data, png_size_t len)
{
    auto* io = static_cast<png_io*>(png_get_io_ptr(png_ptr));
    if (len > io->in->size() - io->pos) {
        png_error(png_ptr, "PNG data is truncated");
    }
    memcpy(data, io->in->data() + io->pos, len);
    io->pos += len;
}

static void
write_png(png_structp png_ptr, png_infop info_ptr, Raster const& raster)
{
    png_set_IHDR(
        png_ptr,
        info_ptr,
        raster.width,
        raster.height,
        8,
        raster.channels == 1 ? PNG_COLOR_TYPE_GRAY : PNG_COLOR_TYPE_RGB,
        PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_DEFAULT,
        PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);
    size_t row_len = static_cast<size_t>(raster.width) * static_cast<size_t>(raster.channels);
    auto data = reinterpret_cast<png_const_bytep>(raster.pixels.data());
    for (size_t row = 0; row < raster.height; ++row) {
        png_write_row(png_ptr, data + row * row_len);
    }
    png_write_end(png_ptr, nullptr);
}

static void
read_png(png_structp png_ptr, png_infop info_ptr, Raster& raster)
{
    png_read_info(png_ptr, info_ptr);
    int bit_depth = png_get_bit_depth(png_ptr, info_ptr);
    int color_type = png_get_color_type(png_ptr, info_ptr);
    if (bit_depth == 16) {
        png_set_strip_16(png_ptr);
    }
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png_ptr);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(png_ptr);
    }
    if (color_type & PNG_COLOR_MASK_ALPHA) {
        png_set_strip_alpha(png_ptr);
    }
    int passes = png_set_interlace_handling(png_ptr);
    png_read_update_info(png_ptr, info_ptr);

    int channels = png_get_channels(png_ptr, info_ptr);
    if (!(channels == 1 || channels == 3)) {
        png_error(png_ptr, "unexpected number of channels after PNG transformations");
    }
    raster.width = png_get_image_width(png_ptr, info_ptr);
    raster.height = png_get_image_height(png_ptr, info_ptr);
    raster.channels = channels;
    size_t row_len = png_get_rowbytes(png_ptr, info_ptr);
    raster.pixels.assign(row_len * raster.height, '\0');
    auto data = reinterpret_cast<png_bytep>(raster.pixels.data());
    // Interlaced images are assembled in place, one pass at a time.
    for (int pass = 0; pass < passes; ++pass) {
        for (size_t row = 0; row < raster.height; ++row) {
            png_read_row(png_ptr, data + row * row_len, nullptr);
        }
    }
    png_read_end(png_ptr, nullptr);
}

std::string
RasterCodec::encodePNG(Raster const& raster)
{
    if (!(raster.channels == 1 || raster.channels == 3)) {
        throw std::logic_error(
            "RasterCodec::encodePNG called with a raster that is not grey or RGB");
    }
    size_t expected = static_cast<size_t>(raster.width) * raster.height *
        static_cast<size_t>(raster.channels);
    if (raster.pixels.size() != expected) {
        throw std::logic_error(
            "RasterCodec::encodePNG: raster size = " + std::to_string(raster.pixels.size()) +
            "; expected size = " + std::to_string(expected));
    }
    if (expected == 0) {
        throw codec_error("unable to encode an empty image as PNG");
    }

    std::string result;
    Pl_String out("png", nullptr, result);
    png_io io;
    io.out = &out;
    png_structp png_ptr =
        png_create_write_struct(PNG_LIBPNG_VER_STRING, &io, png_error_handler, png_warning_handler);
    if (!png_ptr) {
        throw SiftExc(docsift_e_system, "", "", 0, "unable to create PNG write structure");
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        throw SiftExc(docsift_e_system, "", "", 0, "unable to create PNG info structure");
    }
    png_set_write_fn(png_ptr, &io, png_write_data, png_flush_data);

    bool error = false;
    // libpng is a "C" library, so we use setjmp and longjmp for exception handling.
    if (setjmp(png_jmpbuf(png_ptr)) == 0) {
        try {
            write_png(png_ptr, info_ptr, raster);
        } catch (std::exception& e) {
            io.msg = e.what();
            longjmp(png_jmpbuf(png_ptr), 1);
        }
    } else {
        error = true;
    }
    png_destroy_write_struct(&png_ptr, &info_ptr);
    if (error) {
        throw codec_error("error encoding PNG: " + io.msg);
    }
    return result;
}

Raster
RasterCodec::decodePNG(std::string const& data)
{
    if (detectFormat(data) != "png") {
        throw codec_error("data is not a PNG image");
    }
    Raster raster;
    png_io io;
    io.in = &data;
    png_structp png_ptr =
        png_create_read_struct(PNG_LIBPNG_VER_STRING, &io, png_error_handler, png_warning_handler);
    if (!png_ptr) {
        throw SiftExc(docsift_e_system, "", "", 0, "unable to create PNG read structure");
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        throw SiftExc(docsift_e_system, "", "", 0, "unable to create PNG info structure");
    }
    png_set_read_fn(png_ptr, &io, png_read_data);
    png_set_user_limits(png_ptr, max_raster_dimension, max_raster_dimension);

    bool error = false;
    if (setjmp(png_jmpbuf(png_ptr)) == 0) {
        try {
            read_png(png_ptr, info_ptr, raster);
        } catch (std::exception& e) {
            io.msg = e.what();
            longjmp(png_jmpbuf(png_ptr), 1);
        }
    } else {
        error = true;
    }
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    if (error) {
        throw codec_error("error decoding PNG: " + io.msg);
    }
    return raster;
}

static void
jpeg_error_handler(j_common_ptr cinfo)
{
    auto* jerr = reinterpret_cast<docsift_jpeg_error_mgr*>(cinfo->err);
    char buf[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buf);
    jerr->msg = buf;
    longjmp(jerr->jmpbuf, 1);
}

static void
jpeg_emit_message(j_common_ptr cinfo, int msg_level)
{
    if (msg_level == -1) {
        auto* jerr = reinterpret_cast<docsift_jpeg_error_mgr*>(cinfo->err);
        jerr->msg = "JPEG data is corrupt";
        longjmp(jerr->jmpbuf, 1);
    }
}

static void
init_buffer_source(j_decompress_ptr)
{
}

static boolean
fill_buffer_input_buffer(j_decompress_ptr cinfo)
{
    // The whole JPEG data is in the buffer, so a request for more data means it is truncated.
    auto* jerr = reinterpret_cast<docsift_jpeg_error_mgr*>(cinfo->err);
    jerr->msg = "JPEG data is truncated";
    longjmp(jerr->jmpbuf, 1);
    return TRUE;
}

static void
skip_buffer_input_data(j_decompress_ptr cinfo, long num_bytes)
{
    if (num_bytes <= 0) {
        return;
    }
    auto to_skip = std::min(static_cast<size_t>(num_bytes), cinfo->src->bytes_in_buffer);
    cinfo->src->next_input_byte += to_skip;
    cinfo->src->bytes_in_buffer -= to_skip;
}

static void
term_buffer_source(j_decompress_ptr)
{
}

static void
jpeg_buffer_src(j_decompress_ptr cinfo, std::string const& data)
{
    cinfo->src = reinterpret_cast<jpeg_source_mgr*>(
        // line-break
        (*cinfo->mem->alloc_small)(
            reinterpret_cast<j_common_ptr>(cinfo), JPOOL_PERMANENT, sizeof(jpeg_source_mgr)));

    jpeg_source_mgr* src = cinfo->src;
    src->init_source = init_buffer_source;
    src->fill_input_buffer = fill_buffer_input_buffer;
    src->skip_input_data = skip_buffer_input_data;
    src->resync_to_restart = jpeg_resync_to_restart;
    src->term_source = term_buffer_source;
    src->bytes_in_buffer = data.size();
    src->next_input_byte = reinterpret_cast<JOCTET const*>(data.data());
}

static void
read_jpeg(jpeg_decompress_struct* cinfo, std::string const& data, Raster& raster, bool& adobe)
{
    jpeg_buffer_src(cinfo, data);
    (void)jpeg_read_header(cinfo, TRUE);
    (void)jpeg_calc_output_dimensions(cinfo);
    if (cinfo->output_width > max_raster_dimension ||
        cinfo->output_height > max_raster_dimension) {
        throw std::runtime_error("JPEG image is too large");
    }
    raster.width = cinfo->output_width;
    raster.height = cinfo->output_height;
    raster.channels = cinfo->output_components;
    adobe = cinfo->saw_Adobe_marker;
    size_t row_len = static_cast<size_t>(raster.width) * static_cast<size_t>(raster.channels);
    raster.pixels.assign(row_len * raster.height, '\0');

    (void)jpeg_start_decompress(cinfo);
    while (cinfo->output_scanline < cinfo->output_height) {
        JSAMPROW row = reinterpret_cast<JSAMPROW>(
            raster.pixels.data() + row_len * static_cast<size_t>(cinfo->output_scanline));
        (void)jpeg_read_scanlines(cinfo, &row, 1);
    }
    (void)jpeg_finish_decompress(cinfo);
}

Raster
RasterCodec::decodeJPEG(std::string const& data)
{
    Raster raster;
    bool adobe = false;
    jpeg_decompress_struct cinfo;
    docsift_jpeg_error_mgr jerr;
    cinfo.err = jpeg_std_error(&(jerr.pub));
    jerr.pub.error_exit = jpeg_error_handler;
    jerr.pub.emit_message = jpeg_emit_message;

    bool error = false;
    // libjpeg is a "C" library, so we use setjmp and longjmp for exception handling.
    if (setjmp(jerr.jmpbuf) == 0) {
        try {
            jpeg_create_decompress(&cinfo);
            read_jpeg(&cinfo, data, raster, adobe);
        } catch (std::exception& e) {
            jerr.msg = e.what();
            error = true;
        }
    } else {
        error = true;
    }
    jpeg_destroy_decompress(&cinfo);
    if (error) {
        throw codec_error("error decoding JPEG: " + jerr.msg);
    }
    if (!(raster.channels == 1 || raster.channels == 3 || raster.channels == 4)) {
        throw codec_error(
            "JPEG data has an unsupported number of components (" +
            std::to_string(raster.channels) + ")");
    }
    if (raster.channels == 4 && adobe) {
        for (auto& ch: raster.pixels) {
            ch = static_cast<char>(255 - static_cast<unsigned char>(ch));
        }
    }
    return raster;
}

static OPJ_SIZE_T
jpx_read(void* buffer, OPJ_SIZE_T nbytes, void* user_data)
{
    auto* in = static_cast<jpx_input*>(user_data);
    auto len = std::min(static_cast<size_t>(nbytes), in->size - in->pos);
    if (len == 0) {
        return static_cast<OPJ_SIZE_T>(-1);
    }
    memcpy(buffer, in->data + in->pos, len);
    in->pos += len;
    return len;
}

static OPJ_OFF_T
jpx_skip(OPJ_OFF_T nbytes, void* user_data)
{
    auto* in = static_cast<jpx_input*>(user_data);
    if (nbytes < 0) {
        return -1;
    }
    auto len = std::min(static_cast<size_t>(nbytes), in->size - in->pos);
    in->pos += len;
    return static_cast<OPJ_OFF_T>(len);
}

static OPJ_BOOL
jpx_seek(OPJ_OFF_T offset, void* user_data)
{
    auto* in = static_cast<jpx_input*>(user_data);
    if (offset < 0 || static_cast<size_t>(offset) > in->size) {
        return OPJ_FALSE;
    }
    in->pos = static_cast<size_t>(offset);
    return OPJ_TRUE;
}

static void
jpx_error(char const* msg, void* client_data)
{
    auto* decoder = static_cast<jpx_decoder*>(client_data);
    if (decoder->msg.empty() && msg) {
        decoder->msg = msg;
        // OpenJPEG messages end with a newline.
        while (!decoder->msg.empty() && decoder->msg.back() == '\n') {
            decoder->msg.pop_back();
        }
    }
}

// Return sample x, y of component comp scaled to 8 bits.
static unsigned char
jpx_sample(opj_image_t const* image, unsigned int comp, unsigned int x, unsigned int y)
{
    auto const& c = image->comps[comp];
    auto cx = std::min(x / std::max(c.dx, 1U), c.w - 1);
    auto cy = std::min(y / std::max(c.dy, 1U), c.h - 1);
    long long value = c.data[static_cast<size_t>(cy) * c.w + cx];
    if (c.sgnd) {
        value += 1LL << (c.prec - 1);
    }
    if (c.prec > 8) {
        value >>= (c.prec - 8);
    } else if (c.prec < 8) {
        value = value * 255 / ((1LL << c.prec) - 1);
    }
    return static_cast<unsigned char>(std::clamp(value, 0LL, 255LL));
}

static unsigned char
clamp_sample(double value)
{
    return static_cast<unsigned char>(std::clamp(value + 0.5, 0.0, 255.0));
}

Raster
RasterCodec::decodeJPX(std::string const& data)
{
    auto format = detectFormat(data);
    if (format != "jp2" && format != "j2k") {
        throw codec_error("data is not a JPEG 2000 image");
    }
    jpx_input in;
    in.data = reinterpret_cast<unsigned char const*>(data.data());
    in.size = data.size();

    jpx_decoder decoder;
    decoder.codec = opj_create_decompress(format == "jp2" ? OPJ_CODEC_JP2 : OPJ_CODEC_J2K);
    if (!decoder.codec) {
        throw SiftExc(docsift_e_system, "", "", 0, "unable to create JPEG 2000 decoder");
    }
    opj_set_error_handler(decoder.codec, jpx_error, &decoder);
    opj_dparameters_t parameters;
    opj_set_default_decoder_parameters(&parameters);
    if (!opj_setup_decoder(decoder.codec, &parameters)) {
        throw SiftExc(docsift_e_system, "", "", 0, "unable to set up JPEG 2000 decoder");
    }
    decoder.stream = opj_stream_create(data.size(), OPJ_TRUE);
    if (!decoder.stream) {
        throw SiftExc(docsift_e_system, "", "", 0, "unable to create JPEG 2000 stream");
    }
    opj_stream_set_user_data(decoder.stream, &in, nullptr);
    opj_stream_set_user_data_length(decoder.stream, data.size());
    opj_stream_set_read_function(decoder.stream, jpx_read);
    opj_stream_set_skip_function(decoder.stream, jpx_skip);
    opj_stream_set_seek_function(decoder.stream, jpx_seek);

    if (!opj_read_header(decoder.stream, decoder.codec, &decoder.image) ||
        !opj_decode(decoder.codec, decoder.stream, decoder.image) ||
        !opj_end_decompress(decoder.codec, decoder.stream)) {
        throw codec_error(
            "error decoding JPEG 2000: " +
            (decoder.msg.empty() ? std::string("invalid data") : decoder.msg));
    }

    auto* image = decoder.image;
    if (image->numcomps == 0 || image->x1 <= image->x0 || image->y1 <= image->y0) {
        throw codec_error("JPEG 2000 image is empty");
    }
    for (unsigned int i = 0; i < image->numcomps; ++i) {
        auto const& c = image->comps[i];
        if (!c.data || c.w == 0 || c.h == 0 || c.prec == 0 || c.prec > 31) {
            throw codec_error("JPEG 2000 image has an invalid component");
        }
    }
    Raster raster;
    raster.width = image->x1 - image->x0;
    raster.height = image->y1 - image->y0;
    if (raster.width > max_raster_dimension || raster.height > max_raster_dimension) {
        throw codec_error("JPEG 2000 image is too large");
    }
    // Grey with or without alpha, CMYK, or color with any extra components dropped
    if (image->numcomps < 3) {
        raster.channels = 1;
    } else if (image->numcomps == 4 && image->color_space == OPJ_CLRSPC_CMYK) {
        raster.channels = 4;
    } else {
        raster.channels = 3;
    }
    bool ycc = raster.channels == 3 &&
        (image->color_space == OPJ_CLRSPC_SYCC || image->color_space == OPJ_CLRSPC_EYCC);
    raster.pixels.reserve(
        static_cast<size_t>(raster.width) * raster.height * static_cast<size_t>(raster.channels));
    for (unsigned int y = 0; y < raster.height; ++y) {
        for (unsigned int x = 0; x < raster.width; ++x) {
            if (ycc) {
                double luma = jpx_sample(image, 0, x, y);
                double cb = jpx_sample(image, 1, x, y) - 128.0;
                double cr = jpx_sample(image, 2, x, y) - 128.0;
                raster.pixels += static_cast<char>(clamp_sample(luma + 1.402 * cr));
                raster.pixels +=
                    static_cast<char>(clamp_sample(luma - 0.344136 * cb - 0.714136 * cr));
                raster.pixels += static_cast<char>(clamp_sample(luma + 1.772 * cb));
                continue;
            }
            for (int i = 0; i < raster.channels; ++i) {
                raster.pixels +=
                    static_cast<char>(jpx_sample(image, static_cast<unsigned int>(i), x, y));
            }
        }
    }
    return raster;
}

Raster
RasterCodec::toRGB(Raster const& in)
{
    if (in.channels == 3) {
        return in;
    }
    if (!(in.channels == 1 || in.channels == 4)) {
        throw std::logic_error("RasterCodec::toRGB called with an unknown channel count");
    }
    Raster out;
    out.width = in.width;
    out.height = in.height;
    out.channels = 3;
    size_t npixels = static_cast<size_t>(in.width) * in.height;
    if (in.pixels.size() < npixels * static_cast<size_t>(in.channels)) {
        throw std::logic_error("RasterCodec::toRGB: raster data is too short");
    }
    out.pixels.reserve(npixels * 3);
    auto p = reinterpret_cast<unsigned char const*>(in.pixels.data());
    for (size_t i = 0; i < npixels; ++i) {
        if (in.channels == 1) {
            out.pixels.append(3, static_cast<char>(p[i]));
        } else {
            unsigned int c = p[4 * i];
            unsigned int m = p[4 * i + 1];
            unsigned int y = p[4 * i + 2];
            unsigned int k = p[4 * i + 3];
            out.pixels += static_cast<char>((255 - c) * (255 - k) / 255);
            out.pixels += static_cast<char>((255 - m) * (255 - k) / 255);
            out.pixels += static_cast<char>((255 - y) * (255 - k) / 255);
        }
    }
    return out;
}

Raster
RasterCodec::toGreyscale(Raster const& in)
{
    if (in.channels == 1) {
        return in;
    }
    Raster rgb = toRGB(in);
    Raster out;
    out.width = rgb.width;
    out.height = rgb.height;
    out.channels = 1;
    size_t npixels = static_cast<size_t>(rgb.width) * rgb.height;
    out.pixels.reserve(npixels);
    auto p = reinterpret_cast<unsigned char const*>(rgb.pixels.data());
    for (size_t i = 0; i < npixels; ++i) {
        unsigned int luma = (299 * p[3 * i] + 587 * p[3 * i + 1] + 114 * p[3 * i + 2] + 500) / 1000;
        out.pixels += static_cast<char>(luma);
    }
    return out;
}

void
RasterCodec::stretchContrast(Raster& raster)
{
    if (raster.pixels.empty()) {
        return;
    }
    size_t histogram[256] = {0};
    for (auto ch: raster.pixels) {
        ++histogram[static_cast<unsigned char>(ch)];
    }
    size_t cutoff = raster.pixels.size() / 100;
    unsigned int low = 0;
    size_t count = 0;
    for (; low < 255; ++low) {
        count += histogram[low];
        if (count > cutoff) {
            break;
        }
    }
    unsigned int high = 255;
    count = 0;
    for (; high > 0; --high) {
        count += histogram[high];
        if (count > cutoff) {
            break;
        }
    }
    if (high <= low) {
        return;
    }
    for (auto& ch: raster.pixels) {
        unsigned int v = static_cast<unsigned char>(ch);
        if (v <= low) {
            ch = '\0';
        } else if (v >= high) {
            ch = static_cast<char>(255);
        } else {
            ch = static_cast<char>((v - low) * 255 / (high - low));
        }
    }
}

std::string
RasterCodec::detectFormat(std::string const& data)
{
    auto starts = [&data](char const* sig, size_t len, size_t at = 0) {
        return data.size() >= at + len && data.compare(at, len, sig, len) == 0;
    };
    if (starts("\x89PNG\r\n\x1a\n", 8)) {
        return "png";
    }
    if (starts("\xff\xd8\xff", 3)) {
        return "jpeg";
    }
    if (starts("GIF87a", 6) || starts("GIF89a", 6)) {
        return "gif";
    }
    if (starts("RIFF", 4) && starts("WEBP", 4, 8)) {
        return "webp";
    }
    if (starts("II*\0", 4) || starts("MM\0*", 4)) {
        return "tiff";
    }
    if (starts("BM", 2)) {
        return "bmp";
    }
    if (starts("\0\0\0\x0cjP  \r\n\x87\n", 12)) {
        return "jp2";
    }
    if (starts("\xff\x4f\xff\x51", 4)) {
        return "j2k";
    }
    return "";
}
