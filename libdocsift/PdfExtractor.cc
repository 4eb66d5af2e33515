#include <docsift/PdfExtractor.hh>

#include <docsift/ContentStreamLexer.hh>
#include <docsift/ContentTextLayer.hh>
#include <docsift/ImageStreamDecoder.hh>
#include <docsift/SiftExc.hh>
#include <docsift/SiftUtil.hh>
#include <docsift/TextDecoder.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

namespace
{
    // Holds the OCR provider for the duration of one extraction and releases it however the
    // extraction ends.
    class OcrSession
    {
      public:
        OcrSession(
            std::shared_ptr<OcrProvider> provider,
            QPDFLogger& logger,
            std::string const& file_name) :
            provider(provider),
            logger(logger),
            file_name(file_name)
        {
        }
        OcrSession(OcrSession const&) = delete;
        OcrSession& operator=(OcrSession const&) = delete;

        ~OcrSession()
        {
            if (!provider) {
                return;
            }
            try {
                provider->release();
            } catch (std::exception& e) {
                logger.warn(
                    "WARNING: " + file_name + ": error releasing OCR provider " +
                    provider->getName() + ": " + e.what() + "\n");
            }
        }

      private:
        std::shared_ptr<OcrProvider> provider;
        QPDFLogger& logger;
        std::string file_name;
    };
} // namespace

static bool
is_horizontal_space(char ch)
{
    return ch == ' ' || ch == '\t';
}

PdfExtractor::PdfExtractor(
    std::shared_ptr<OcrProvider> ocr,
    std::shared_ptr<TextLayerProvider> text_layer,
    std::shared_ptr<QPDFLogger> logger) :
    ocr(ocr),
    text_layer(text_layer ? text_layer : std::make_shared<ContentTextLayer>()),
    logger(logger ? logger : QPDFLogger::defaultLogger())
{
}

std::string
PdfExtractor::getName() const
{
    return "PdfExtractor";
}

bool
PdfExtractor::supports(std::string const& media_type) const
{
    return media_type == "application/pdf";
}

std::string
PdfExtractor::joinTextItems(std::vector<TextItem> const& items)
{
    std::string joined;
    bool first = true;
    bool after_eol = false;
    for (auto const& item: items) {
        if (!first) {
            joined += after_eol ? '\n' : ' ';
        }
        joined += item.str;
        after_eol = item.hasEOL;
        first = false;
    }

    std::string cleaned;
    cleaned.reserve(joined.size());
    size_t newlines = 0;
    for (auto ch: joined) {
        if (ch == '\n') {
            while (!cleaned.empty() && is_horizontal_space(cleaned.back())) {
                cleaned.pop_back();
            }
            if (++newlines > 2) {
                continue;
            }
        } else {
            newlines = 0;
        }
        cleaned += ch;
    }
    return SiftUtil::str_trim(cleaned);
}

std::vector<std::string>
PdfExtractor::splitParagraphs(std::string const& text)
{
    std::vector<std::string> result;
    auto add = [&result](std::string const& piece) {
        auto trimmed = SiftUtil::str_trim(piece);
        if (!trimmed.empty()) {
            result.push_back(trimmed);
        }
    };
    size_t start = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (text.at(pos) == '\n') {
            size_t next = pos + 1;
            while (next < text.size() && is_horizontal_space(text.at(next))) {
                ++next;
            }
            if (next < text.size() && text.at(next) == '\n') {
                add(text.substr(start, pos - start));
                start = pos = next + 1;
                continue;
            }
        }
        ++pos;
    }
    add(text.substr(start));
    return result;
}

bool
PdfExtractor::isHeading(std::string const& paragraph)
{
    if (SiftUtil::utf16_length(paragraph) >= max_heading_length) {
        return false;
    }
    size_t digits = 0;
    for (auto ch: paragraph) {
        if (ch >= '0' && ch <= '9') {
            if (++digits >= 4) {
                return false;
            }
        } else {
            digits = 0;
        }
    }
    // Upper-casing must not change the text.
    return !SiftUtil::has_lower_case(paragraph);
}

std::string
PdfExtractor::getContentStreamText(QPDFPageObjectHelper& page)
{
    std::string contents;
    Pl_String out("page contents", nullptr, contents);
    page.pipeContents(&out);
    std::string result;
    for (auto const& token: ContentStreamLexer::tokenize(contents)) {
        auto text = TextDecoder::decode(token.getBytes());
        if (text.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += " ";
        }
        result += text;
    }
    return result;
}

void
PdfExtractor::addTextChunks(ExtractedDocument& doc, std::string const& text, int pageno)
{
    auto paragraphs = splitParagraphs(text);
    if (paragraphs.empty()) {
        if (!text.empty()) {
            doc.chunks.emplace_back(dc_paragraph, text, pageno);
        }
        return;
    }
    for (auto const& paragraph: paragraphs) {
        auto type = isHeading(paragraph) ? dc_heading : dc_paragraph;
        doc.chunks.emplace_back(type, paragraph, pageno);
    }
}

void
PdfExtractor::addImageChunks(
    ExtractedDocument& doc, QPDFPageObjectHelper& page, int pageno, std::string const& where)
{
    std::vector<ImageStreamDecoder::PageImage> images;
    try {
        images = ImageStreamDecoder::findImages(page);
    } catch (std::exception& e) {
        logger->warn("WARNING: " + where + ": unable to find images: " + e.what() + "\n");
        return;
    }
    ImageStreamDecoder decoder(logger);
    int count = 0;
    for (auto const& image: images) {
        auto description = where + ": image " + image.name;
        try {
            auto decoded = decoder.decode(image.image, image.resources, description);
            if (!decoded) {
                continue;
            }
            auto text = SiftUtil::str_trim(ocr->recognize(decoded->png));
            if (!text.empty()) {
                ++count;
                doc.chunks.emplace_back(dc_image, text, pageno, "image-" + std::to_string(count));
            }
        } catch (std::exception& e) {
            logger->warn("WARNING: " + description + ": " + e.what() + "\n");
        }
    }
}

ExtractedDocument
PdfExtractor::extract(std::string const& data, std::string const& file_name)
{
    OcrSession session(ocr, *logger, file_name);
    if (!ocr) {
        logger->info("docsift: " + file_name + ": no OCR provider; images will not be read\n");
    }
    QPDF pdf;
    std::vector<QPDFPageObjectHelper> pages;
    pdf.setLogger(logger);
    try {
        pdf.processMemoryFile(file_name.c_str(), data.data(), data.size());
        pages = QPDFPageDocumentHelper(pdf).getAllPages();
    } catch (QPDFExc& e) {
        throw SiftExc(
            e.getErrorCode() == qpdf_e_password ? docsift_e_unsupported : docsift_e_damaged_pdf,
            file_name,
            e.getObject(),
            e.getFilePosition(),
            e.getMessageDetail());
    }

    auto doc = ExtractedDocument::create(file_name, "application/pdf");

    auto ocr_pages = JSON::makeArray();
    int sparse_pages = 0;
    int pageno = 0;
    for (auto& page: pages) {
        ++pageno;
        auto where = file_name + ": page " + std::to_string(pageno);

        std::vector<TextItem> items;
        try {
            items = text_layer->getTextItems(page);
        } catch (std::exception& e) {
            logger->warn("WARNING: " + where + ": unable to read text: " + e.what() + "\n");
        }
        auto text = joinTextItems(items);
        bool sparse = SiftUtil::utf16_length(text) < min_text_length;
        if (sparse) {
            ocr_pages.addArrayElement(JSON::makeInt(pageno));
            ++sparse_pages;
        }

        if (items.empty()) {
            std::string fallback;
            try {
                fallback = SiftUtil::str_trim(getContentStreamText(page));
            } catch (std::exception& e) {
                logger->warn(
                    "WARNING: " + where + ": unable to read content streams: " + e.what() + "\n");
            }
            addTextChunks(doc, fallback, pageno);
        } else if (sparse) {
            if (!text.empty()) {
                doc.chunks.emplace_back(dc_paragraph, text, pageno);
            }
        } else {
            addTextChunks(doc, text, pageno);
        }

        if (ocr) {
            addImageChunks(doc, page, pageno, where);
        }
    }

    doc.metadata.addDictionaryMember("pageCount", JSON::makeInt(pageno));
    doc.metadata.addDictionaryMember("ocrPages", ocr_pages);
    doc.metadata.addDictionaryMember(
        "isScannedPdf", JSON::makeBool(pageno > 0 && sparse_pages == pageno));
    doc.metadata.addDictionaryMember("pdfVersion", JSON::makeString(pdf.getPDFVersion()));
    doc.metadata.addDictionaryMember("encrypted", JSON::makeBool(pdf.isEncrypted()));
    return doc;
}
