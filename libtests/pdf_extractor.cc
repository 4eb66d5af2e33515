#include <docsift/assert_test.h>

#include "pdf_builder.hh"

#include <docsift/PdfExtractor.hh>
#include <docsift/RasterCodec.hh>
#include <docsift/SiftExc.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

namespace
{
    // Returns canned text and counts calls.
    class FakeOcr: public OcrProvider
    {
      public:
        std::string
        recognize(std::string const& image) override
        {
            images.push_back(image);
            if (responses.empty()) {
                return "";
            }
            auto text = responses.front();
            responses.erase(responses.begin());
            return text;
        }

        std::string
        getName() const override
        {
            return "fake";
        }

        void
        release() override
        {
            ++releases;
            if (fail_release) {
                throw std::runtime_error("release failed");
            }
        }

        std::vector<std::string> responses;
        std::vector<std::string> images;
        int releases{0};
        bool fail_release{false};
    };

    // Returns scripted items for each page by page number. Pages not listed get no items.
    // Listed failures throw.
    class FakeTextLayer: public TextLayerProvider
    {
      public:
        std::vector<TextItem>
        getTextItems(QPDFPageObjectHelper&) override
        {
            ++pageno;
            if (failures.count(pageno)) {
                throw std::runtime_error("text layer exploded");
            }
            return pages[pageno];
        }

        std::map<int, std::vector<TextItem>> pages;
        std::set<int> failures;
        int pageno{0};
    };
} // namespace

static std::shared_ptr<QPDFLogger>
capture_logger(std::string& warnings)
{
    auto logger = QPDFLogger::create();
    logger->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));
    logger->setInfo(logger->discard());
    return logger;
}

static JSON
get_item(JSON const& j, std::string const& key)
{
    auto result = JSON::makeNull();
    j.forEachDictItem([&result, &key](std::string const& k, JSON value) {
        if (k == key) {
            result = value;
        }
    });
    return result;
}

static long long
get_int(JSON const& j, std::string const& key)
{
    std::string value;
    assert(get_item(j, key).getNumber(value));
    return std::stoll(value);
}

static bool
get_bool(JSON const& j, std::string const& key)
{
    bool value = false;
    assert(get_item(j, key).getBool(value));
    return value;
}

static std::vector<long long>
get_ints(JSON const& j, std::string const& key)
{
    std::vector<long long> result;
    get_item(j, key).forEachArrayItem([&result](JSON item) {
        std::string v;
        assert(item.getNumber(v));
        result.push_back(std::stoll(v));
    });
    return result;
}

static std::string const long_line =
    "This line of body text is comfortably longer than fifty code points.";

static std::string
repeat(std::string const& s, size_t n)
{
    std::string result;
    for (size_t i = 0; i < n; ++i) {
        result += s;
    }
    return result;
}

// GRINNING FACE, two UTF-16 code units
static std::string const emoji = "\xf0\x9f\x98\x80";

static void
test_helpers()
{
    assert(PdfExtractor::joinTextItems({}) == "");
    assert(
        PdfExtractor::joinTextItems({{"one", false}, {"two", true}, {"three", false}}) ==
        "one two\nthree");
    // Space before newlines is dropped, and at most one blank line is kept.
    assert(
        PdfExtractor::joinTextItems({{"a  ", true}, {"\n\n\n", false}, {"b", false}}) ==
        "a\n\n b");
    assert(PdfExtractor::joinTextItems({{"  padded  ", false}}) == "padded");

    auto paragraphs = PdfExtractor::splitParagraphs("first\nstill first\n \t\nsecond\n\n\n");
    assert(paragraphs.size() == 2);
    assert(paragraphs.at(0) == "first\nstill first");
    assert(paragraphs.at(1) == "second");
    assert(PdfExtractor::splitParagraphs("  \n\n ").empty());

    assert(PdfExtractor::isHeading("INTRODUCTION"));
    assert(PdfExtractor::isHeading("SECTION 2: RESULTS & 123"));
    assert(PdfExtractor::isHeading("\xc3\x89TUDE"));
    assert(!PdfExtractor::isHeading("Introduction"));
    assert(!PdfExtractor::isHeading("\xc3\xa9TUDE"));
    assert(!PdfExtractor::isHeading("REPORT 2024"));
    assert(!PdfExtractor::isHeading(std::string(120, 'X')));
    assert(PdfExtractor::isHeading(std::string(119, 'X')));

    // Case is checked in every script that has it.
    // "ПРИВЕТ МИР" and "привет мир"
    assert(PdfExtractor::isHeading(
        "\xd0\x9f\xd0\xa0\xd0\x98\xd0\x92\xd0\x95\xd0\xa2 \xd0\x9c\xd0\x98\xd0\xa0"));
    assert(!PdfExtractor::isHeading(
        "\xd0\xbf\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82 \xd0\xbc\xd0\xb8\xd1\x80"));
    // "ΑΒΓ" and "αβγ"
    assert(PdfExtractor::isHeading("\xce\x91\xce\x92\xce\x93"));
    assert(!PdfExtractor::isHeading("\xce\xb1\xce\xb2\xce\xb3"));
    // Mixed case Cyrillic: "Глава"
    assert(!PdfExtractor::isHeading("\xd0\x93\xd0\xbb\xd0\xb0\xd0\xb2\xd0\xb0"));
    // Scripts without case can't be ruled out by case: "概要"
    assert(PdfExtractor::isHeading("\xe6\xa6\x82\xe8\xa6\x81"));

    // Length is measured in UTF-16 code units.
    assert(PdfExtractor::isHeading(repeat(emoji, 59)));
    assert(!PdfExtractor::isHeading(repeat(emoji, 60)));
}

static void
test_utf16_page_length()
{
    // 25 characters outside the basic multilingual plane are 50 UTF-16 code units, which is
    // enough text for a page. One fewer unit is not.
    std::string warnings;
    auto layer = std::make_shared<FakeTextLayer>();
    layer->pages[1] = {{repeat(emoji, 25), false}};
    layer->pages[2] = {{repeat(emoji, 24) + "x", false}};
    PdfExtractor extractor(nullptr, layer, capture_logger(warnings));
    auto doc = extractor.extract(make_text_pdf({"", ""}), "emoji.pdf");
    assert((get_ints(doc.metadata, "ocrPages") == std::vector<long long>{2}));
    assert(doc.chunks.size() == 2);
    assert(doc.chunks.at(0).text == repeat(emoji, 25));
}

static void
test_dense_and_sparse()
{
    std::string warnings;
    auto ocr = std::make_shared<FakeOcr>();
    PdfExtractor extractor(ocr, nullptr, capture_logger(warnings));
    auto data = make_text_pdf(
        {text_content({long_line}), text_content({"Hi"}), "", text_content({long_line, "more"})});
    auto doc = extractor.extract(data, "mixed.pdf");

    assert(doc.fileName == "mixed.pdf");
    assert(doc.mimeType == "application/pdf");
    assert(!doc.documentId.empty());
    assert(get_int(doc.metadata, "pageCount") == 4);
    assert((get_ints(doc.metadata, "ocrPages") == std::vector<long long>{2, 3}));
    assert(!get_bool(doc.metadata, "isScannedPdf"));
    assert(!get_bool(doc.metadata, "encrypted"));
    std::string version;
    assert(get_item(doc.metadata, "pdfVersion").getString(version) && version == "1.7");

    // Page order is kept; the empty page contributes nothing.
    assert(doc.chunks.size() == 3);
    assert(doc.chunks.at(0).page == 1);
    assert(doc.chunks.at(0).text == long_line);
    assert(doc.chunks.at(0).type == dc_paragraph);
    assert(doc.chunks.at(1).page == 2 && doc.chunks.at(1).text == "Hi");
    assert(doc.chunks.at(2).page == 4 && doc.chunks.at(2).text == long_line + "\nmore");
    // Extractors leave ids to the normalizer.
    assert(doc.chunks.at(0).id.empty());
    assert(ocr->releases == 1);
    assert(warnings.empty());
}

static void
test_scanned()
{
    std::string warnings;
    PdfExtractor extractor(nullptr, nullptr, capture_logger(warnings));
    auto doc = extractor.extract(make_text_pdf({"", text_content({"p. 2"})}), "scan.pdf");
    assert(get_bool(doc.metadata, "isScannedPdf"));
    assert((get_ints(doc.metadata, "ocrPages") == std::vector<long long>{1, 2}));
    assert(doc.chunks.size() == 1 && doc.chunks.at(0).text == "p. 2");
}

static void
test_headings()
{
    std::string warnings;
    auto layer = std::make_shared<FakeTextLayer>();
    layer->pages[1] = {
        {"ANNUAL SUMMARY", true},
        {" ", true},
        {long_line, true},
        {"continued here.", true},
        {" ", true},
        {"REPORT 2024", true},
        {" ", true},
        {"Figures", false}};
    PdfExtractor extractor(nullptr, layer, capture_logger(warnings));
    auto doc = extractor.extract(make_text_pdf({""}), "headings.pdf");
    assert(doc.chunks.size() == 4);
    assert(doc.chunks.at(0).type == dc_heading);
    assert(doc.chunks.at(0).text == "ANNUAL SUMMARY");
    assert(doc.chunks.at(1).type == dc_paragraph);
    assert(doc.chunks.at(1).text == long_line + "\ncontinued here.");
    assert(doc.chunks.at(2).type == dc_paragraph);
    assert(doc.chunks.at(3).type == dc_paragraph);
    assert(doc.chunks.at(3).text == "Figures");
    assert(get_ints(doc.metadata, "ocrPages").empty());
}

static void
test_sparse_page_is_one_paragraph()
{
    std::string warnings;
    auto layer = std::make_shared<FakeTextLayer>();
    layer->pages[1] = {{"TITLE", true}, {" ", true}, {"x", false}};
    PdfExtractor extractor(nullptr, layer, capture_logger(warnings));
    auto doc = extractor.extract(make_text_pdf({""}), "sparse.pdf");
    assert(doc.chunks.size() == 1);
    assert(doc.chunks.at(0).type == dc_paragraph);
    assert(doc.chunks.at(0).text == "TITLE\n\nx");
}

static void
test_fallback_and_failures()
{
    std::string warnings;
    auto layer = std::make_shared<FakeTextLayer>();
    layer->pages[1] = {{long_line, false}};
    layer->failures.insert(2);
    auto ocr = std::make_shared<FakeOcr>();
    PdfExtractor extractor(ocr, layer, capture_logger(warnings));
    auto data = make_text_pdf(
        {text_content({"ignored"}),
         "BT (from the) Tj [(content) -300 (stream)] TJ ET",
         "BT <FEFF00480069> Tj ET"});
    auto doc = extractor.extract(data, "fallback.pdf");
    assert(doc.chunks.size() == 3);
    assert(doc.chunks.at(0).text == long_line);
    // Page 2's text layer failed; the content streams were scanned instead.
    assert(doc.chunks.at(1).page == 2);
    assert(doc.chunks.at(1).text == "from the contentstream");
    assert(doc.chunks.at(2).page == 3 && doc.chunks.at(2).text == "Hi");
    assert(warnings.find("WARNING: fallback.pdf: page 2: unable to read text: ") == 0);
    assert((get_ints(doc.metadata, "ocrPages") == std::vector<long long>{2, 3}));
    assert(ocr->releases == 1);
}

static void
test_release()
{
    std::string warnings;
    auto ocr = std::make_shared<FakeOcr>();
    PdfExtractor extractor(ocr, nullptr, capture_logger(warnings));
    try {
        extractor.extract("not a pdf", "broken.pdf");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_damaged_pdf);
    }
    assert(ocr->releases == 1);

    // A failing release is logged, and the extraction still succeeds.
    ocr->fail_release = true;
    warnings.clear();
    auto doc = extractor.extract(make_text_pdf({text_content({long_line})}), "ok.pdf");
    assert(doc.chunks.size() == 1);
    assert(ocr->releases == 2);
    assert(warnings == "WARNING: ok.pdf: error releasing OCR provider fake: release failed\n");
}

static std::string
image_pdf()
{
    PdfBuilder b;
    int catalog = b.reserve();
    int pages = b.reserve();
    int grey = b.addFlateStream(
        "/Type /XObject /Subtype /Image /Width 2 /Height 2 /ColorSpace /DeviceGray "
        "/BitsPerComponent 8",
        std::string("\x00\xff\xff\x00", 4));
    int rgb = b.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ColorSpace /DeviceRGB "
        "/BitsPerComponent 8",
        "abc");
    int mask = b.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ImageMask true", "x");
    int content = b.addStream("", text_content({long_line}) + "/A Do /B Do /C Do");
    int page = b.add(
        "<< /Type /Page /Parent " + std::to_string(pages) +
        " 0 R /Resources << /XObject << /A " + std::to_string(grey) + " 0 R /B " +
        std::to_string(mask) + " 0 R /C " + std::to_string(rgb) + " 0 R >> >> /Contents " +
        std::to_string(content) + " 0 R >>");
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
    b.set(pages, "<< /Type /Pages /Kids [" + std::to_string(page) + " 0 R] /Count 1 >>");
    return b.build(catalog);
}

static void
test_image_chunks()
{
    std::string warnings;
    auto ocr = std::make_shared<FakeOcr>();
    ocr->responses = {"  text in the first image \n", "   "};
    PdfExtractor extractor(ocr, nullptr, capture_logger(warnings));
    auto doc = extractor.extract(image_pdf(), "images.pdf");

    // The mask is skipped; the other two images are recognized.
    assert(ocr->images.size() == 2);
    for (auto const& image: ocr->images) {
        assert(RasterCodec::detectFormat(image) == "png");
    }
    auto first = RasterCodec::decodePNG(ocr->images.at(0));
    assert(first.width == 2 && first.height == 2);

    // Text first, then images. The blank recognition result adds nothing.
    assert(doc.chunks.size() == 2);
    assert(doc.chunks.at(0).type == dc_paragraph);
    assert(doc.chunks.at(1).type == dc_image);
    assert(doc.chunks.at(1).text == "text in the first image");
    assert(doc.chunks.at(1).page == 1);
    assert(doc.chunks.at(1).section == "image-1");
    assert(ocr->releases == 1);

    // Labels count emitted chunks only; a blank result doesn't use up a label.
    ocr->responses = {"", "text in the second image"};
    doc = extractor.extract(image_pdf(), "images.pdf");
    assert(doc.chunks.size() == 2);
    assert(doc.chunks.at(1).text == "text in the second image");
    assert(doc.chunks.at(1).section == "image-1");

    // Without a provider, images are ignored.
    PdfExtractor no_ocr(nullptr, nullptr, capture_logger(warnings));
    doc = no_ocr.extract(image_pdf(), "images.pdf");
    assert(doc.chunks.size() == 1);
}

int
main()
{
    test_helpers();
    test_dense_and_sparse();
    test_scanned();
    test_headings();
    test_utf16_page_length();
    test_sparse_page_is_one_paragraph();
    test_fallback_and_failures();
    test_release();
    test_image_chunks();
    std::cout << "end of pdf extractor tests\n";
    return 0;
}
