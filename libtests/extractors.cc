#include <docsift/assert_test.h>

#include <docsift/CsvExtractor.hh>
#include <docsift/HtmlExtractor.hh>
#include <docsift/ImageExtractor.hh>
#include <docsift/RasterCodec.hh>
#include <docsift/SiftExc.hh>

#include <qpdf/QPDFLogger.hh>

#include <iostream>

typedef std::vector<std::vector<std::string>> records_t;

namespace
{
    class FakeOcr: public OcrProvider
    {
      public:
        FakeOcr(std::string const& text) :
            text(text)
        {
        }

        std::string
        recognize(std::string const& image) override
        {
            images.push_back(image);
            return text;
        }

        std::string
        getName() const override
        {
            return "fake";
        }

        std::string text;
        std::vector<std::string> images;
    };
} // namespace

static std::shared_ptr<QPDFLogger>
quiet_logger()
{
    auto logger = QPDFLogger::create();
    logger->setInfo(logger->discard());
    logger->setWarn(logger->discard());
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

static std::string
get_string(JSON const& j, std::string const& key)
{
    std::string value;
    assert(get_item(j, key).getString(value));
    return value;
}

static void
test_csv_records()
{
    assert((CsvExtractor::parseRecords("a,b\n1,2\n", ',') == records_t{{"a", "b"}, {"1", "2"}}));
    assert(
        (CsvExtractor::parseRecords("name,notes\n\"Smith, J\",\"said \"\"hi\"\"\"\n", ',') ==
         records_t{{"name", "notes"}, {"Smith, J", "said \"hi\""}}));
    // Quoted fields may span lines and keep their white space.
    assert(
        (CsvExtractor::parseRecords("a\n\"x\ny\",\" z \"", ',') ==
         records_t{{"a"}, {"x\ny", " z "}}));
    // Blank lines are skipped; unquoted fields are trimmed; rows may be ragged.
    assert(
        (CsvExtractor::parseRecords("a,b,c\n\n  \n x , y \r\n1\r\n", ',') ==
         records_t{{"a", "b", "c"}, {"x", "y"}, {"1"}}));
    // An empty quoted field is still a record.
    assert((CsvExtractor::parseRecords("\"\"\n", ',') == records_t{{""}}));
    assert(CsvExtractor::parseRecords("", ',').empty());
    assert((CsvExtractor::parseRecords("a,b\tc", '\t') == records_t{{"a,b", "c"}}));

    try {
        CsvExtractor::parseRecords("a,\"open\nnever closed", ',', "bad.csv");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_unsupported);
        assert(e.getFilename() == "bad.csv");
    }

    assert(
        CsvExtractor::toMarkdown({{"a", "b"}, {"1", "2"}, {"3"}}) ==
        "| a | b |\n| --- | --- |\n| 1 | 2 |\n| 3 |");
    assert(CsvExtractor::toMarkdown({}) == "");
}

static void
test_csv_extract()
{
    CsvExtractor csv;
    assert(csv.supports("text/csv"));
    assert(csv.supports("text/tab-separated-values"));
    assert(csv.supports("application/csv"));
    assert(!csv.supports("text/plain"));

    auto doc = csv.extract("h1\th2\nv1\tv,2\n", "data.tsv");
    assert(doc.fileName == "data.tsv");
    assert(doc.mimeType == "text/csv");
    assert(doc.chunks.size() == 1);
    assert(doc.chunks.at(0).type == dc_table);
    assert(doc.chunks.at(0).text == "| h1 | h2 |\n| --- | --- |\n| v1 | v,2 |");
    assert(!doc.chunks.at(0).page);
    assert(get_int(doc.metadata, "rowCount") == 2);
    assert(get_int(doc.metadata, "columnCount") == 2);
    assert(get_string(doc.metadata, "delimiter") == "\t");

    doc = csv.extract("", "empty.csv");
    assert(doc.chunks.empty());
    assert(get_int(doc.metadata, "rowCount") == 0);
    assert(get_string(doc.metadata, "delimiter") == ",");

    // Latin-1 data is converted to UTF-8.
    doc = csv.extract("caf\xe9,x\n", "latin1.csv");
    assert(doc.chunks.at(0).text.find("caf\xc3\xa9") != std::string::npos);
}

static void
test_html()
{
    HtmlExtractor html;
    assert(html.supports("text/html"));
    assert(html.supports("application/xhtml+xml"));
    assert(!html.supports("text/xml"));

    auto doc = html.extract(
        "<html><head><title>My &amp; Page</title><style>p{color:red}</style>"
        "<SCRIPT>if (a<b) x();</SCRIPT></head><body><h1>Heading</h1>"
        "<p class=\"x\">First para &lt;tag&gt; caf&#233; &#x41;&#39;s</p>"
        "<!-- <p>hidden</p> --><div>Second<br/>line</div><noscript>no</noscript>"
        "<svg><text>vector</text></svg><p>A&nbsp;B &bogus; &amp</p></body></html>",
        "page.html");
    assert(doc.mimeType == "text/html");
    assert(get_string(doc.metadata, "title") == "My & Page");
    assert(doc.chunks.size() == 4);
    for (auto const& chunk: doc.chunks) {
        assert(chunk.type == dc_paragraph);
    }
    // The title is also part of the text.
    assert(doc.chunks.at(0).text == "My & Page Heading");
    assert(doc.chunks.at(1).text == "First para <tag> caf\xc3\xa9 A's");
    assert(doc.chunks.at(2).text == "Second line");
    assert(doc.chunks.at(3).text == "A B &bogus; &amp");

    // Inline tags become spaces; white-space-only lines separate paragraphs.
    doc = html.extract("one<b>two</b>three\n \t\nfour", "inline.html");
    assert(doc.chunks.size() == 2);
    assert(doc.chunks.at(0).text == "one two three");
    assert(doc.chunks.at(1).text == "four");
    assert(get_item(doc.metadata, "title").isNull());

    assert(HtmlExtractor::stripTags("1 < 2 and 3") == "1 < 2 and 3");
    assert(HtmlExtractor::stripTags("a<!-- never closed") == "a");
    assert(HtmlExtractor::stripTags("<script>unterminated") == " unterminated");

    std::string out;
    size_t pos = 0;
    assert(HtmlExtractor::decodeEntity("&#x20AC;", pos, out));
    assert(out == "\xe2\x82\xac" && pos == 8);
    for (auto const& bad: {"&#0;", "&#xD800;", "&#1114112;", "&#x;", "&#12a;", "&unknown;"}) {
        pos = 0;
        out.clear();
        assert(!HtmlExtractor::decodeEntity(bad, pos, out));
        assert(pos == 0 && out.empty());
    }
}

static void
test_image()
{
    Raster raster;
    raster.width = 4;
    raster.height = 1;
    raster.channels = 3;
    raster.pixels = std::string("\x40\x40\x40\x50\x50\x50\x60\x60\x60\x70\x70\x70", 12);
    auto png = RasterCodec::encodePNG(raster);

    ImageExtractor no_ocr(nullptr, quiet_logger());
    assert(no_ocr.supports("image/png"));
    assert(no_ocr.supports("image/jpg"));
    assert(no_ocr.supports("image/bmp"));
    assert(!no_ocr.supports("image/svg+xml"));
    auto doc = no_ocr.extract(png, "scan.png");
    assert(doc.mimeType == "image/png");
    assert(get_string(doc.metadata, "format") == "png");
    assert(get_int(doc.metadata, "width") == 4);
    assert(get_int(doc.metadata, "height") == 1);
    assert(get_int(doc.metadata, "channels") == 3);
    bool ocr_enabled = true;
    assert(get_item(doc.metadata, "ocrEnabled").getBool(ocr_enabled) && !ocr_enabled);
    assert(doc.chunks.size() == 1);
    assert(doc.chunks.at(0).type == dc_paragraph);
    assert(
        doc.chunks.at(0).text ==
        "[Image: scan.png] OCR not configured. Provide an OcrProvider to extract text from "
        "images.");

    // Decodable images are given to the provider as contrast-stretched greyscale PNG.
    auto ocr = std::make_shared<FakeOcr>("  recognized text \n");
    ImageExtractor extractor(ocr, quiet_logger());
    doc = extractor.extract(png, "scan.png");
    assert(doc.chunks.size() == 1);
    assert(doc.chunks.at(0).text == "recognized text");
    assert(ocr->images.size() == 1);
    auto sent = RasterCodec::decodePNG(ocr->images.at(0));
    assert(sent.channels == 1 && sent.width == 4);
    assert(static_cast<unsigned char>(sent.pixels.at(0)) == 0);
    assert(static_cast<unsigned char>(sent.pixels.at(3)) == 255);

    // Other formats are passed through.
    std::string webp("RIFF\x10\x00\x00\x00WEBPVP8 ", 16);
    doc = extractor.extract(webp, "photo.webp");
    assert(doc.mimeType == "image/webp");
    assert(ocr->images.at(1) == webp);
    assert(get_item(doc.metadata, "width").isNull());

    doc = extractor.extract("not an image", "mystery.bin");
    assert(doc.mimeType == "image/unknown");
    assert(get_item(doc.metadata, "format").isNull());

    ocr->text = " \n ";
    assert(extractor.extract(png, "blank.png").chunks.empty());

    try {
        extractor.extract("\x89PNG\r\n\x1a\ntruncated", "broken.png");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_unsupported);
    }
}

int
main()
{
    test_csv_records();
    test_csv_extract();
    test_html();
    test_image();
    std::cout << "end of extractor tests\n";
    return 0;
}
