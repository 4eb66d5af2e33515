#include <docsift/ImageExtractor.hh>

#include <docsift/RasterCodec.hh>
#include <docsift/SiftUtil.hh>

#include <optional>

ImageExtractor::ImageExtractor(
    std::shared_ptr<OcrProvider> ocr, std::shared_ptr<QPDFLogger> logger) :
    ocr(ocr),
    logger(logger ? logger : QPDFLogger::defaultLogger())
{
}

std::string
ImageExtractor::getName() const
{
    return "ImageExtractor";
}

bool
ImageExtractor::supports(std::string const& media_type) const
{
    return media_type == "image/png" || media_type == "image/jpeg" || media_type == "image/jpg" ||
        media_type == "image/webp" || media_type == "image/tiff" || media_type == "image/gif" ||
        media_type == "image/bmp";
}

std::string
ImageExtractor::placeholderText(std::string const& file_name)
{
    return "[Image: " + file_name +
        "] OCR not configured. Provide an OcrProvider to extract text from images.";
}

ExtractedDocument
ImageExtractor::extract(std::string const& data, std::string const& file_name)
{
    auto format = RasterCodec::detectFormat(data);
    auto doc =
        ExtractedDocument::create(file_name, format.empty() ? "image/unknown" : "image/" + format);

    std::optional<Raster> raster;
    if (format == "png") {
        raster = RasterCodec::decodePNG(data);
    } else if (format == "jpeg") {
        raster = RasterCodec::decodeJPEG(data);
    }

    if (!format.empty()) {
        doc.metadata.addDictionaryMember("format", JSON::makeString(format));
    }
    if (raster) {
        doc.metadata.addDictionaryMember("width", JSON::makeInt(raster->width));
        doc.metadata.addDictionaryMember("height", JSON::makeInt(raster->height));
        doc.metadata.addDictionaryMember("channels", JSON::makeInt(raster->channels));
    }
    doc.metadata.addDictionaryMember("ocrEnabled", JSON::makeBool(ocr != nullptr));

    if (!ocr) {
        doc.chunks.emplace_back(dc_paragraph, placeholderText(file_name));
        return doc;
    }

    std::string image = data;
    if (raster) {
        auto grey = RasterCodec::toGreyscale(*raster);
        RasterCodec::stretchContrast(grey);
        image = RasterCodec::encodePNG(grey);
    } else {
        logger->info(
            "docsift: " + file_name + ": passing " + (format.empty() ? "unknown" : format) +
            " image to " + ocr->getName() + " without preprocessing\n");
    }
    auto text = SiftUtil::str_trim(ocr->recognize(image));
    if (!text.empty()) {
        doc.chunks.emplace_back(dc_paragraph, text);
    }
    return doc;
}
