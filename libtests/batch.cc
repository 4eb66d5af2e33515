#include <docsift/assert_test.h>

#include "pdf_builder.hh"

#include <docsift/BatchProcessor.hh>
#include <docsift/ExtractorRouter.hh>
#include <docsift/SiftExc.hh>

#include <qpdf/Pl_String.hh>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace
{
    // Handles one media type. The file's contents choose the behavior: "throw" throws SiftExc,
    // "throw-int" throws something that isn't an exception, "sleep" takes half a second, and
    // anything else becomes the text of a paragraph.
    class FakeExtractor: public Extractor
    {
      public:
        FakeExtractor(std::string const& name, std::string const& media_type) :
            name(name),
            media_type(media_type)
        {
        }

        std::string
        getName() const override
        {
            return name;
        }

        bool
        supports(std::string const& type) const override
        {
            return type == media_type;
        }

        ExtractedDocument
        extract(std::string const& data, std::string const& file_name) override
        {
            ++calls;
            if (data == "throw") {
                throw SiftExc(docsift_e_unsupported, file_name, "", 0, "fake failure");
            }
            if (data == "throw-int") {
                throw 42;
            }
            if (data == "sleep") {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
            auto doc = ExtractedDocument::create(file_name, "text/x-" + name);
            doc.chunks.emplace_back(dc_paragraph, data + "\n\n ");
            doc.chunks.emplace_back(dc_paragraph, "   ");
            return doc;
        }

        std::string name;
        std::string media_type;
        std::atomic<int> calls{0};
    };

    // Records the calls it gets. A provider is acquired by its first recognize call and must
    // not be used again once released.
    class CountingOcr: public OcrProvider
    {
      public:
        std::string
        recognize(std::string const&) override
        {
            ++recognized;
            if (released) {
                ++used_after_release;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return "recognized";
        }

        std::string
        getName() const override
        {
            return "counting";
        }

        void
        release() override
        {
            ++released;
        }

        std::atomic<int> recognized{0};
        std::atomic<int> released{0};
        std::atomic<int> used_after_release{0};
    };
} // namespace

static std::shared_ptr<QPDFLogger>
capture_logger(std::string& info)
{
    auto logger = QPDFLogger::create();
    logger->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
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

static BatchProcessor::RouterFactory
share(std::shared_ptr<ExtractorRouter> router)
{
    return [router]() { return router; };
}

// A page with a line of text and two 1x1 grey images
static std::string
two_image_pdf()
{
    PdfBuilder b;
    int catalog = b.reserve();
    int pages = b.reserve();
    int dark = b.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ColorSpace /DeviceGray "
        "/BitsPerComponent 8",
        std::string(1, '\x10'));
    int light = b.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ColorSpace /DeviceGray "
        "/BitsPerComponent 8",
        std::string(1, '\xf0'));
    int content = b.addStream(
        "", text_content({"A page of text with two small images drawn after it."}) + "/A Do /B Do");
    int page = b.add(
        "<< /Type /Page /Parent " + std::to_string(pages) +
        " 0 R /Resources << /XObject << /A " + std::to_string(dark) + " 0 R /B " +
        std::to_string(light) + " 0 R >> >> /Contents " + std::to_string(content) + " 0 R >>");
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
    b.set(pages, "<< /Type /Pages /Kids [" + std::to_string(page) + " 0 R] /Count 1 >>");
    return b.build(catalog);
}

static void
test_router()
{
    std::string info;
    ExtractorRouter router(capture_logger(info));
    auto first = std::make_shared<FakeExtractor>("first", "text/plain");
    auto second = std::make_shared<FakeExtractor>("second", "text/plain");
    auto other = std::make_shared<FakeExtractor>("other", "text/markdown");
    router.registerExtractor(first);
    router.registerExtractor(second);
    router.registerExtractor(other);
    assert(router.getExtractors().size() == 3);

    // The first registered extractor wins.
    assert(router.route("text/plain").getName() == "first");
    assert(router.route("text/markdown").getName() == "other");
    try {
        router.route("application/x-nothing");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_unsupported_media_type);
        assert(
            std::string(e.what()) ==
            "No extractor registered for MIME type: application/x-nothing");
    }

    auto doc = router.process("hello\nthere", "a.txt", "text/plain");
    assert(first->calls == 1 && second->calls == 0);
    // The media type routed by wins over the extractor's own, and the result is normalized.
    assert(doc.mimeType == "text/plain");
    assert(doc.fileName == "a.txt");
    assert(doc.chunks.size() == 1);
    assert(doc.chunks.at(0).text == "hello there");
    assert(!doc.chunks.at(0).id.empty());
    assert(info == "docsift: a.txt: text/plain handled by first\n");

    try {
        router.registerExtractor(nullptr);
        assert(false);
    } catch (std::logic_error&) {
    }

    auto defaults = ExtractorRouter::createDefault(nullptr, capture_logger(info));
    std::vector<std::string> names;
    for (auto const& e: defaults->getExtractors()) {
        names.push_back(e->getName());
    }
    assert(
        (names ==
         std::vector<std::string>{
             "PdfExtractor", "CsvExtractor", "HtmlExtractor", "ImageExtractor"}));
    assert(defaults->route("application/pdf").getName() == "PdfExtractor");
    assert(defaults->route("image/gif").getName() == "ImageExtractor");
    // Office formats are recognized by name but have no extractor.
    try {
        defaults->route(
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_unsupported_media_type);
    }
}

static void
test_batch_isolation()
{
    std::string info;
    auto logger = capture_logger(info);
    BatchProcessor batch(
        [logger]() { return ExtractorRouter::createDefault(nullptr, logger); }, logger);
    auto results = batch.process({
        {"table.csv", "a,b\n1,2\n", ""},
        {"letter.docx", "PK\x03\x04", ""},
        {"broken.pdf", "not a pdf at all", "application/pdf"},
        {"paper.pdf", make_text_pdf({"BT /F1 12 Tf (Hello) Tj ET"}), ""},
    });
    assert(results.size() == 4);

    assert(results.at(0).success);
    assert(results.at(0).fileName == "table.csv");
    assert(results.at(0).document->mimeType == "text/csv");
    assert(results.at(0).document->chunks.at(0).type == dc_table);

    assert(!results.at(1).success);
    assert(results.at(1).fileName == "letter.docx");
    assert(!results.at(1).document);
    assert(
        results.at(1).error ==
        "No extractor registered for MIME type: "
        "application/vnd.openxmlformats-officedocument.wordprocessingml.document");

    assert(!results.at(2).success);
    assert(results.at(2).error.find("broken.pdf") == 0);

    assert(results.at(3).success);
    assert(results.at(3).document->mimeType == "application/pdf");
    assert(results.at(3).document->chunks.at(0).text == "Hello");

    assert(
        info.find("docsift: letter.docx: failed: No extractor registered") != std::string::npos);
    assert(info.find("docsift: paper.pdf: extracted\n") != std::string::npos);
}

static void
test_size_checks()
{
    assert(BatchProcessor::checkSize(1) == "");
    assert(BatchProcessor::checkSize(BatchProcessor::max_file_size) == "");
    assert(
        BatchProcessor::checkSize(BatchProcessor::max_file_size + 1) ==
        "File exceeds the 50 MB limit (50.0 MB).");
    assert(
        BatchProcessor::checkSize(80 * 1024 * 1024) == "File exceeds the 50 MB limit (80.0 MB).");
    assert(BatchProcessor::checkSize(0) == "File is empty.");

    std::string router_info;
    std::string info;
    auto router = std::make_shared<ExtractorRouter>(capture_logger(router_info));
    auto fake = std::make_shared<FakeExtractor>("fake", "text/plain");
    router->registerExtractor(fake);
    BatchProcessor batch(share(router), capture_logger(info));
    auto results = batch.process(
        {{"empty.txt", "", "text/plain"},
         {"big.txt", std::string(BatchProcessor::max_file_size + 10, 'x'), "text/plain"},
         {"ok.txt", "fine", "text/plain"}});
    assert(!results.at(0).success && results.at(0).error == "File is empty.");
    assert(!results.at(1).success);
    assert(results.at(1).error == "File exceeds the 50 MB limit (50.0 MB).");
    assert(results.at(2).success);
    // Rejected files never reach the extractor.
    assert(fake->calls == 1);
}

static void
test_failures_and_timeout()
{
    std::string router_info;
    std::string info;
    auto router = std::make_shared<ExtractorRouter>(capture_logger(router_info));
    router->registerExtractor(std::make_shared<FakeExtractor>("fake", "text/plain"));
    BatchProcessor batch(share(router), capture_logger(info));
    batch.setTimeout(std::chrono::milliseconds(100));
    auto start = std::chrono::steady_clock::now();
    auto results = batch.process(
        {{"slow.txt", "sleep", "text/plain"},
         {"fast.txt", "quick", "text/plain"},
         {"sift.txt", "throw", "text/plain"},
         {"odd.txt", "throw-int", "text/plain"}});
    auto elapsed = std::chrono::steady_clock::now() - start;
    // The batch doesn't wait for the slow file.
    assert(elapsed < std::chrono::milliseconds(450));

    assert(!results.at(0).success);
    assert(results.at(0).error == "Extraction timed out after 0.1 seconds.");
    assert(results.at(1).success);
    assert(results.at(1).document->chunks.at(0).text == "quick");
    assert(!results.at(2).success);
    assert(results.at(2).error == "sift.txt: fake failure");
    assert(!results.at(3).success);
    assert(results.at(3).error == "Unhandled extraction failure");

    auto j = BatchProcessor::getJSON({results.at(2)});
    assert(
        j.unparse() ==
        "{\"results\":[{\"error\":\"sift.txt: fake failure\",\"fileName\":\"sift.txt\","
        "\"success\":false}]}");
    auto ok = results.at(1).getJSON();
    bool success = false;
    assert(get_item(ok, "success").getBool(success) && success);
    std::string file_name;
    assert(get_item(get_item(ok, "document"), "fileName").getString(file_name));
    assert(file_name == "fast.txt");
    assert(get_item(ok, "error").isNull());
}

static void
test_ocr_provider_per_file()
{
    // Files extracted at the same time each get their own provider, which is released once
    // after that file's images are recognized.
    std::string info;
    auto logger = capture_logger(info);
    std::vector<std::shared_ptr<CountingOcr>> providers;
    BatchProcessor batch(
        [logger, &providers]() {
            auto ocr = std::make_shared<CountingOcr>();
            providers.push_back(ocr);
            return ExtractorRouter::createDefault(ocr, logger);
        },
        logger);

    std::vector<BatchInput> inputs;
    for (int i = 1; i <= 6; ++i) {
        inputs.push_back({"file" + std::to_string(i) + ".pdf", two_image_pdf(), ""});
    }
    inputs.push_back({"empty.pdf", "", ""});
    auto results = batch.process(inputs);

    assert(results.size() == 7);
    for (size_t i = 0; i < 6; ++i) {
        assert(results.at(i).success);
        assert(results.at(i).document->chunks.size() == 3);
        assert(results.at(i).document->chunks.at(2).section == "image-2");
    }
    assert(!results.at(6).success);
    // A file rejected before extraction gets no router.
    assert(providers.size() == 6);
    for (auto const& ocr: providers) {
        assert(ocr->recognized == 2);
        assert(ocr->released == 1);
        assert(ocr->used_after_release == 0);
    }

    // A factory that fails stops the batch before any file is started.
    int calls = 0;
    BatchProcessor failing(
        [&calls]() -> std::shared_ptr<ExtractorRouter> {
            if (++calls == 2) {
                throw std::runtime_error("no router today");
            }
            return std::make_shared<ExtractorRouter>();
        },
        logger);
    try {
        failing.process({{"a.txt", "a", ""}, {"b.txt", "b", ""}});
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "no router today");
    }
}

int
main()
{
    test_router();
    test_batch_isolation();
    test_size_checks();
    test_failures_and_timeout();
    test_ocr_provider_per_file();
    std::cout << "end of batch tests\n";
    return 0;
}
