#include <docsift/ImageStreamDecoder.hh>

#include <docsift/RasterCodec.hh>

#include <qpdf/Buffer.hh>

#include <algorithm>
#include <set>

// Images wider or taller than this are skipped.
static long long const max_image_dimension = 30000;

// Look up key in oh if oh is a dictionary
static QPDFObjectHandle
dict_key(QPDFObjectHandle oh, std::string const& key)
{
    return oh.isDictionary() ? oh.getKey(key) : QPDFObjectHandle::newNull();
}

static QPDFObjectHandle
array_item(QPDFObjectHandle oh, int n)
{
    return (oh.isArray() && n >= 0 && n < oh.getArrayNItems()) ? oh.getArrayItem(n)
                                                                : QPDFObjectHandle::newNull();
}

static std::string
buffer_string(std::shared_ptr<Buffer> const& buf)
{
    return {reinterpret_cast<char const*>(buf->getBuffer()), buf->getSize()};
}

ImageStreamDecoder::ImageStreamDecoder(std::shared_ptr<QPDFLogger> logger) :
    logger(logger ? logger : QPDFLogger::defaultLogger())
{
}

void
ImageStreamDecoder::skip(std::string const& description, std::string const& reason)
{
    logger->info("docsift: " + description + ": skipping image: " + reason + "\n");
}

static void
find_images(
    QPDFObjectHandle resources,
    std::vector<ImageStreamDecoder::PageImage>& result,
    std::set<QPDFObjGen>& seen_images,
    std::set<QPDFObjGen>& seen_forms)
{
    auto xobjects = dict_key(resources, "/XObject");
    if (!xobjects.isDictionary()) {
        return;
    }
    for (auto const& key: xobjects.getKeys()) {
        auto xobject = xobjects.getKey(key);
        if (!xobject.isStream()) {
            continue;
        }
        std::string subtype;
        if (!xobject.getDict().getKey("/Subtype").getValueAsName(subtype)) {
            continue;
        }
        auto og = xobject.getObjGen();
        if (subtype == "/Image") {
            if (seen_images.insert(og).second) {
                result.push_back({key, xobject, resources});
            }
        } else if (subtype == "/Form" && seen_forms.insert(og).second) {
            auto form_resources = xobject.getDict().getKey("/Resources");
            find_images(
                form_resources.isDictionary() ? form_resources : resources,
                result,
                seen_images,
                seen_forms);
        }
    }
}

std::vector<ImageStreamDecoder::PageImage>
ImageStreamDecoder::findImages(QPDFPageObjectHelper& page)
{
    std::vector<PageImage> result;
    std::set<QPDFObjGen> seen_images;
    std::set<QPDFObjGen> seen_forms;
    find_images(page.getAttribute("/Resources", false), result, seen_images, seen_forms);
    return result;
}

std::optional<ImageStreamDecoder::ColorSpace>
ImageStreamDecoder::resolveColorSpace(QPDFObjectHandle cs, QPDFObjectHandle resources)
{
    return resolveColorSpaceInternal(cs, resources, 0);
}

std::optional<ImageStreamDecoder::ColorSpace>
ImageStreamDecoder::resolveColorSpaceInternal(
    QPDFObjectHandle cs, QPDFObjectHandle resources, int depth)
{
    if (depth > max_color_space_depth) {
        return std::nullopt;
    }
    auto device = [](int channels) {
        ColorSpace result;
        result.channels = channels;
        return std::optional<ColorSpace>(result);
    };

    std::string name;
    if (cs.getValueAsName(name)) {
        if (name == "/DeviceGray" || name == "/CalGray" || name == "/G") {
            return device(1);
        }
        if (name == "/DeviceRGB" || name == "/CalRGB" || name == "/RGB") {
            return device(3);
        }
        if (name == "/DeviceCMYK" || name == "/CMYK") {
            return device(4);
        }
        auto named = dict_key(dict_key(resources, "/ColorSpace"), name);
        if (named.isNull()) {
            return std::nullopt;
        }
        return resolveColorSpaceInternal(named, resources, depth + 1);
    }

    if (!cs.isArray() || cs.getArrayNItems() == 0) {
        return std::nullopt;
    }
    auto family = cs.getArrayItem(0);
    if (!family.getValueAsName(name)) {
        return std::nullopt;
    }
    if (name == "/ICCBased") {
        auto profile = array_item(cs, 1);
        if (!profile.isStream()) {
            return std::nullopt;
        }
        int channels = 0;
        if (profile.getDict().getKey("/N").getValueAsInt(channels) &&
            (channels == 1 || channels == 3 || channels == 4)) {
            return device(channels);
        }
        auto alternate = profile.getDict().getKey("/Alternate");
        if (alternate.isNull()) {
            return std::nullopt;
        }
        return resolveColorSpaceInternal(alternate, resources, depth + 1);
    }
    if (name == "/Indexed" || name == "/I") {
        if (cs.getArrayNItems() < 4) {
            return std::nullopt;
        }
        auto base = resolveColorSpaceInternal(cs.getArrayItem(1), resources, depth + 1);
        int hival = 0;
        if (!base || base->indexed || !cs.getArrayItem(2).getValueAsInt(hival)) {
            return std::nullopt;
        }
        auto lookup = cs.getArrayItem(3);
        ColorSpace result;
        result.channels = base->channels;
        result.indexed = true;
        result.hival = std::clamp(hival, 0, 255);
        if (lookup.getValueAsString(result.lookup)) {
            // The lookup table is given inline.
        } else if (lookup.isStream()) {
            result.lookup = buffer_string(lookup.getStreamData(qpdf_dl_specialized));
        } else {
            return std::nullopt;
        }
        return result;
    }
    if (name == "/CalGray" || name == "/CalRGB" || name == "/DeviceGray" || name == "/DeviceRGB" ||
        name == "/DeviceCMYK") {
        return resolveColorSpaceInternal(family, resources, depth + 1);
    }
    return std::nullopt;
}

static Raster
expand_indexed(
    std::string const& data,
    unsigned int width,
    unsigned int height,
    ImageStreamDecoder::ColorSpace const& cs)
{
    Raster raster;
    raster.width = width;
    raster.height = height;
    raster.channels = cs.channels;
    size_t npixels = static_cast<size_t>(width) * height;
    auto entry_len = static_cast<size_t>(cs.channels);
    raster.pixels.reserve(npixels * entry_len);
    for (size_t i = 0; i < npixels; ++i) {
        auto index = std::min(static_cast<int>(static_cast<unsigned char>(data.at(i))), cs.hival);
        auto offset = static_cast<size_t>(index) * entry_len;
        if (offset + entry_len <= cs.lookup.size()) {
            raster.pixels.append(cs.lookup, offset, entry_len);
        } else if (cs.channels == 4) {
            // Entries missing from a short lookup table are black.
            raster.pixels.append("\0\0\0\xff", 4);
        } else {
            raster.pixels.append(entry_len, '\0');
        }
    }
    return raster;
}

static bool
is_codec_filter(std::string const& filter)
{
    return filter == "/DCTDecode" || filter == "/DCT" || filter == "/JPXDecode";
}

std::optional<ImageStreamDecoder::DecodedImage>
ImageStreamDecoder::decodeCodec(
    QPDFObjectHandle image,
    std::vector<QPDFObjectHandle> const& filters,
    std::vector<QPDFObjectHandle> const& parms,
    std::string const& description)
{
    auto last = filters.back();
    std::string codec_filter = last.getName();
    std::string data;
    if (filters.size() == 1) {
        data = buffer_string(image.getRawStreamData());
    } else {
        // Let qpdf remove the filters that come before the codec.
        auto* qpdf = image.getOwningQPDF();
        if (!qpdf) {
            throw std::logic_error(
                "ImageStreamDecoder::decode called with an image that has no owning QPDF");
        }
        auto prefix_filters = QPDFObjectHandle::newArray(
            std::vector<QPDFObjectHandle>(filters.begin(), filters.end() - 1));
        auto prefix_parms = QPDFObjectHandle::newNull();
        if (!parms.empty()) {
            std::vector<QPDFObjectHandle> items(parms.begin(), parms.end() - 1);
            prefix_parms = QPDFObjectHandle::newArray(items);
        }
        auto prefix = QPDFObjectHandle::newStream(qpdf);
        prefix.replaceStreamData(
            buffer_string(image.getRawStreamData()), prefix_filters, prefix_parms);
        if (!prefix.pipeStreamData(nullptr, 0, qpdf_dl_specialized)) {
            skip(description, "unsupported filter before " + codec_filter);
            return std::nullopt;
        }
        data = buffer_string(prefix.getStreamData(qpdf_dl_specialized));
    }

    auto raster = (codec_filter == "/JPXDecode") ? RasterCodec::decodeJPX(data)
                                                 : RasterCodec::decodeJPEG(data);
    raster = RasterCodec::toRGB(raster);
    DecodedImage result;
    result.width = raster.width;
    result.height = raster.height;
    result.png = RasterCodec::encodePNG(raster);
    return result;
}

std::optional<ImageStreamDecoder::DecodedImage>
ImageStreamDecoder::decode(
    QPDFObjectHandle image, QPDFObjectHandle resources, std::string const& description)
{
    if (!image.isStream()) {
        skip(description, "image is not a stream");
        return std::nullopt;
    }
    auto dict = image.getDict();
    bool image_mask = false;
    if (dict.getKey("/ImageMask").getValueAsBool(image_mask) && image_mask) {
        skip(description, "stencil masks are not supported");
        return std::nullopt;
    }
    long long width = 0;
    long long height = 0;
    dict.getKey("/Width").getValueAsInt(width);
    dict.getKey("/Height").getValueAsInt(height);
    if (width <= 0 || height <= 0 || width > max_image_dimension || height > max_image_dimension) {
        skip(
            description,
            "invalid image dimensions " + std::to_string(width) + "x" + std::to_string(height));
        return std::nullopt;
    }
    int bpc = 8;
    dict.getKey("/BitsPerComponent").getValueAsInt(bpc);

    // /Filter and /DecodeParms may each be a single value or an array.
    std::vector<QPDFObjectHandle> filters;
    auto filter_obj = dict.getKey("/Filter");
    if (filter_obj.isArray()) {
        filters = filter_obj.getArrayAsVector();
    } else if (!filter_obj.isNull()) {
        filters.push_back(filter_obj);
    }
    std::vector<QPDFObjectHandle> parms;
    auto parms_obj = dict.getKey("/DecodeParms");
    if (parms_obj.isArray()) {
        parms = parms_obj.getArrayAsVector();
    } else if (!parms_obj.isNull()) {
        parms.push_back(parms_obj);
    }
    for (auto& filter: filters) {
        if (!filter.isName()) {
            skip(description, "invalid /Filter " + filter_obj.unparse());
            return std::nullopt;
        }
    }
    if (!parms.empty() && parms.size() != filters.size()) {
        skip(description, "/DecodeParms does not match /Filter");
        return std::nullopt;
    }

    for (size_t i = 0; i < filters.size(); ++i) {
        if (is_codec_filter(filters.at(i).getName()) && i + 1 != filters.size()) {
            skip(description, filters.at(i).getName() + " is not the last filter");
            return std::nullopt;
        }
    }
    if (!filters.empty() && is_codec_filter(filters.back().getName())) {
        return decodeCodec(image, filters, parms, description);
    }

    if (!image.pipeStreamData(nullptr, 0, qpdf_dl_specialized)) {
        skip(description, "unsupported filter " + filter_obj.unparse());
        return std::nullopt;
    }
    if (bpc != 8) {
        skip(description, std::to_string(bpc) + " bits per component is not supported");
        return std::nullopt;
    }
    auto cs = resolveColorSpace(dict.getKey("/ColorSpace"), resources);
    if (!cs) {
        skip(description, "unsupported color space " + dict.getKey("/ColorSpace").unparse());
        return std::nullopt;
    }

    auto data = buffer_string(image.getStreamData(qpdf_dl_specialized));
    auto w = static_cast<unsigned int>(width);
    auto h = static_cast<unsigned int>(height);
    size_t samples = cs->indexed ? 1 : static_cast<size_t>(cs->channels);
    size_t expected = static_cast<size_t>(w) * h * samples;
    if (data.size() < expected) {
        skip(
            description,
            "image data is too short (" + std::to_string(data.size()) + " bytes; expected " +
                std::to_string(expected) + ")");
        return std::nullopt;
    }

    Raster raster;
    if (cs->indexed) {
        raster = expand_indexed(data, w, h, *cs);
    } else {
        raster.width = w;
        raster.height = h;
        raster.channels = cs->channels;
        data.resize(expected);
        raster.pixels = std::move(data);
    }
    raster = RasterCodec::toRGB(raster);
    DecodedImage result;
    result.width = w;
    result.height = h;
    result.png = RasterCodec::encodePNG(raster);
    return result;
}
