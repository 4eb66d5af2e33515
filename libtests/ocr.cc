#include <docsift/assert_test.h>

#include <docsift/OcrProviderFactory.hh>
#include <docsift/SiftExc.hh>
#include <docsift/VisionOcrProvider.hh>

#include <qpdf/JSON.hh>
#include <qpdf/Pl_String.hh>

#include <cstdlib>
#include <iostream>

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

static std::string
get_string(JSON const& j, std::string const& key)
{
    std::string value;
    assert(get_item(j, key).getString(value));
    return value;
}

static void
test_factory()
{
    auto logger = QPDFLogger::create();
    logger->setInfo(logger->discard());
    logger->setWarn(logger->discard());

    assert(OcrProviderFactory::make("none", logger) == nullptr);
    try {
        OcrProviderFactory::make("crystal-ball", logger);
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_unsupported);
        assert(std::string(e.what()) == "unknown OCR provider crystal-ball");
    }

    if (OcrProviderFactory::haveTesseract()) {
        assert(OcrProviderFactory::make("tesseract", logger)->getName() == "tesseract");
    } else {
        try {
            OcrProviderFactory::make("tesseract", logger);
            assert(false);
        } catch (SiftExc& e) {
            assert(std::string(e.what()) == "docsift was built without tesseract support");
        }
    }

    unsetenv("OPENAI_API_KEY");
    try {
        OcrProviderFactory::make("openai", logger);
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_ocr);
    }
    // Without an API key, auto falls back to whatever is built in.
    auto provider = OcrProviderFactory::make("auto", logger);
    assert(OcrProviderFactory::haveTesseract() == (provider != nullptr));

    setenv("OPENAI_API_KEY", "from-environment", 1);
    provider = OcrProviderFactory::make("auto", logger);
    assert(provider && provider->getName() == "openai-vision");
    unsetenv("OPENAI_API_KEY");
}

static void
test_request()
{
    unsetenv("DOCSIFT_OCR_MODEL");
    VisionOcrProvider::Options options;
    options.api_key = "test-key";
    options.base_url = "http://localhost:1/v1//";
    VisionOcrProvider vision(options);
    assert(vision.getName() == "openai-vision");
    assert(vision.getModel() == VisionOcrProvider::default_model);
    assert(vision.getEndpoint() == "http://localhost:1/v1/responses");

    options.model = "other-model";
    options.prompt = "Read this.";
    VisionOcrProvider custom(options);
    assert(custom.getModel() == "other-model");

    auto request = JSON::parse(custom.makeRequest(std::string("\x89PNG\x00\x01", 6)));
    assert(get_string(request, "model") == "other-model");
    int messages = 0;
    get_item(request, "input").forEachArrayItem([&messages](JSON message) {
        ++messages;
        assert(get_string(message, "role") == "user");
        std::vector<std::string> types;
        get_item(message, "content").forEachArrayItem([&types](JSON item) {
            types.push_back(get_string(item, "type"));
            if (types.back() == "input_text") {
                assert(get_string(item, "text") == "Read this.");
            } else {
                assert(get_string(item, "image_url") == "data:image/png;base64,iVBORwAB");
                assert(get_string(item, "detail") == "high");
            }
        });
        assert((types == std::vector<std::string>{"input_text", "input_image"}));
    });
    assert(messages == 1);
}

static void
test_response()
{
    assert(
        VisionOcrProvider::collectText("{\"output_text\": \"Hello\\nworld\"}") == "Hello\nworld");
    assert(
        VisionOcrProvider::collectText("{\"output_text\": [\"one\", 2, \"two\"]}") ==
        "one\ntwo");
    assert(
        VisionOcrProvider::collectText(
            "{\"output_text\": \"\", \"output\": ["
            "{\"type\": \"reasoning\", \"content\": ["
            "{\"type\": \"output_text\", \"text\": \"no\"}]},"
            "{\"type\": \"message\", \"content\": ["
            "{\"type\": \"refusal\", \"text\": \"no\"},"
            "{\"type\": \"output_text\", \"text\": \"from message\"},"
            "{\"type\": \"output_text\", \"text\": \"second\"}]},"
            "{\"type\": \"message\", \"content\": ["
            "{\"type\": \"output_text\", \"text\": \"later\"}]}]}") == "from message");
    assert(VisionOcrProvider::collectText("{\"output\": []}") == "");
    assert(VisionOcrProvider::collectText("[]") == "");
    try {
        VisionOcrProvider::collectText("<html>Bad Gateway</html>");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_json);
        assert(std::string(e.what()).find("invalid response from vision API: ") == 0);
    }
}

static void
test_recognize_failure()
{
    std::string errors;
    auto logger = QPDFLogger::create();
    logger->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
    VisionOcrProvider::Options options;
    options.api_key = "test-key";
    options.base_url = "http://127.0.0.1:1/v1";
    options.timeout_seconds = 5;
    VisionOcrProvider vision(options, logger);
    // Failures are reported in the text instead of thrown.
    auto text = vision.recognize("not really an image");
    assert(text.find(OcrProvider::error_tag) == 0);
    assert(text.find("request to vision API failed: ") != std::string::npos);
    assert(errors.find("docsift: openai-vision: OCR failed: ") == 0);
}

int
main()
{
    test_factory();
    test_request();
    test_response();
    test_recognize_failure();
    std::cout << "end of ocr tests\n";
    return 0;
}
