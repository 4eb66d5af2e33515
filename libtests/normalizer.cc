#include <docsift/assert_test.h>

#include <docsift/ExtractedDocument.hh>
#include <docsift/MimeTypes.hh>
#include <docsift/Normalizer.hh>

#include <algorithm>
#include <iostream>
#include <set>

static void
check_text(std::string const& input, std::string const& expected)
{
    auto result = Normalizer::normalizeText(input);
    if (result != expected) {
        std::cout << "normalizeText(\"" << input << "\") = \"" << result << "\"; wanted \""
                  << expected << "\"\n";
        assert(false);
    }
    // Normalized text is a fixed point.
    assert(Normalizer::normalizeText(result) == result);
}

static void
test_text()
{
    check_text("", "");
    check_text(std::string("a\0b\fc", 5), "abc");
    check_text("a\xc2\xa0z", "a z");
    check_text("zero\xe2\x80\x8bwidth\xe2\x80\x8cand\xe2\x80\x8djoin", "zero width and join");
    check_text("\xef\xbb\xbfhi", "hi");
    check_text("line one\nline two", "line one line two");
    check_text("p1\n\n\n\np2", "p1\n\np2");
    check_text("a  \t b", "a b");
    check_text("  x \n\n  y  ", "x\n\ny");
    check_text("a\n\t\n\nb", "a\n\nb");
    check_text("a\n \nb", "a b");
    check_text("\n\n\nend\n", "end");
    check_text("caf\xc3\xa9 \xe2\x82\xac", "caf\xc3\xa9 \xe2\x82\xac");

    for (auto const& s:
         {"x\n \n \n \ny",
          " \n\xc2\xa0\n\n\xc2\xa0 z",
          "a\n\n \n\n\tb\n c",
          "\t\n\t\n\t",
          "1 \n2\n\n3 \n\n\n 4"}) {
        auto once = Normalizer::normalizeText(s);
        assert(Normalizer::normalizeText(once) == once);
    }
}

static void
test_chunks()
{
    std::vector<ContentChunk> chunks = {
        {dc_heading, "  TITLE  ", 1},
        {dc_paragraph, " \f ", 1},
        {dc_image, "seen\nin image", 2, "image-1"},
        {dc_paragraph, "\xe2\x80\x8b"},
    };
    auto result = Normalizer::normalizeChunks(chunks);
    assert(result.size() == 2);
    assert(result.at(0).type == dc_heading && result.at(0).text == "TITLE");
    assert(result.at(0).page == 1 && !result.at(0).section);
    assert(result.at(1).type == dc_image && result.at(1).text == "seen in image");
    assert(result.at(1).page == 2 && result.at(1).section == "image-1");
    assert(result.at(0).id != result.at(1).id);
    assert(chunks.at(0).id.empty());

    std::vector<ContentChunk> many(500, ContentChunk(dc_paragraph, "text"));
    std::set<std::string> ids;
    for (auto const& chunk: Normalizer::normalizeChunks(many)) {
        // 8-4-4-4-12 hex digits, version 4, variant 10
        assert(chunk.id.size() == 36);
        assert(chunk.id.at(8) == '-' && chunk.id.at(13) == '-' && chunk.id.at(18) == '-');
        assert(chunk.id.at(23) == '-');
        assert(chunk.id.at(14) == '4');
        assert(std::string("89ab").find(chunk.id.at(19)) != std::string::npos);
        ids.insert(chunk.id);
    }
    assert(ids.size() == 500);
}

static void
test_document()
{
    auto doc = ExtractedDocument::create("a.txt", "text/plain");
    assert(doc.documentId.size() == 36);
    doc.chunks.emplace_back(dc_list, "- one\n- two");
    doc.chunks.emplace_back(dc_paragraph, "   ");
    auto normalized = Normalizer::normalizeDocument(doc);
    assert(normalized.documentId == doc.documentId);
    assert(normalized.chunks.size() == 1);
    assert(!normalized.chunks.at(0).id.empty());
    // The input is not modified.
    assert(doc.chunks.size() == 2 && doc.chunks.at(0).id.empty());

    ExtractedDocument bare;
    bare.fileName = "b";
    assert(!Normalizer::normalizeDocument(bare).documentId.empty());
    assert(Normalizer::normalizeDocument(bare).chunks.empty());

    normalized.chunks.at(0).id = "id1";
    normalized.chunks.emplace_back(dc_image, "x", 3, "image-2");
    normalized.chunks.back().id = "id2";
    normalized.documentId = "doc";
    normalized.metadata.addDictionaryMember("pageCount", JSON::makeInt(3));
    assert(
        normalized.getJSON().unparse() ==
        "{\"chunks\":[{\"id\":\"id1\",\"text\":\"- one - two\",\"type\":\"list\"},"
        "{\"id\":\"id2\",\"page\":3,\"section\":\"image-2\",\"text\":\"x\",\"type\":\"image\"}],"
        "\"documentId\":\"doc\",\"fileName\":\"a.txt\",\"metadata\":{\"pageCount\":3},"
        "\"mimeType\":\"text/plain\"}");
    assert(std::string(ContentChunk::typeName(dc_table)) == "table");
}

static void
test_mime_types()
{
    assert(MimeTypes::resolve("", "report.PDF") == "application/pdf");
    assert(MimeTypes::resolve("application/octet-stream", "data.tsv") ==
           "text/tab-separated-values");
    assert(MimeTypes::resolve("Text/HTML", "page.pdf") == "text/html");
    assert(MimeTypes::resolve("", "archive.tar.gz") == "application/octet-stream");
    assert(MimeTypes::resolve("", "no_extension") == "application/octet-stream");
    assert(MimeTypes::resolve("application/x-custom", "") == "application/x-custom");
    assert(MimeTypes::resolve("", "photo.jpeg") == "image/jpeg");
    assert(MimeTypes::resolve("", "photo.jpg") == "image/jpeg");
    assert(MimeTypes::resolve("", "deck.pptx") ==
           "application/vnd.openxmlformats-officedocument.presentationml.presentation");
    assert(MimeTypes::forExtension(".HTM") == "text/html");
    assert(MimeTypes::forExtension("pdf") == "");

    auto types = MimeTypes::supportedTypes();
    assert(types.front() == "application/pdf");
    assert(std::count(types.begin(), types.end(), "image/jpeg") == 1);
    assert(std::count(types.begin(), types.end(), "text/html") == 1);
    assert(types.size() == 16);
}

int
main()
{
    test_text();
    test_chunks();
    test_document();
    test_mime_types();
    std::cout << "end of normalizer tests\n";
    return 0;
}
