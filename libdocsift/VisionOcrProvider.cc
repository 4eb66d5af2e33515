#include <docsift/VisionOcrProvider.hh>

#include <docsift/SiftExc.hh>
#include <docsift/SiftUtil.hh>

#include <qpdf/JSON.hh>
#include <qpdf/QUtil.hh>

#include <curl/curl.h>

#include <mutex>

static std::once_flag curl_initialized;

static size_t
write_response(void* contents, size_t size, size_t nmemb, void* userp)
{
    auto* response = static_cast<std::string*>(userp);
    response->append(static_cast<char const*>(contents), size * nmemb);
    return size * nmemb;
}

// The value of key in a JSON dictionary, or null if j is not a dictionary or has no such key
static JSON
dict_item(JSON const& j, std::string const& key)
{
    auto result = JSON::makeNull();
    j.forEachDictItem([&result, &key](std::string const& k, JSON value) {
        if (k == key) {
            result = value;
        }
    });
    return result;
}

static SiftExc
ocr_error(std::string const& msg)
{
    return {docsift_e_ocr, "", "", 0, msg};
}

VisionOcrProvider::VisionOcrProvider(Options const& options, std::shared_ptr<QPDFLogger> logger) :
    api_key(options.api_key),
    model(options.model),
    prompt(options.prompt.empty() ? default_prompt : options.prompt),
    timeout_seconds(options.timeout_seconds),
    logger(logger ? logger : QPDFLogger::defaultLogger())
{
    if (api_key.empty()) {
        QUtil::get_env("OPENAI_API_KEY", &api_key);
    }
    if (api_key.empty()) {
        throw ocr_error(
            "vision OCR: missing OPENAI_API_KEY; pass an API key or set the environment variable");
    }
    if (model.empty() && !QUtil::get_env("DOCSIFT_OCR_MODEL", &model)) {
        model = default_model;
    }
    std::string base_url = options.base_url;
    if (base_url.empty() && !QUtil::get_env("OPENAI_BASE_URL", &base_url)) {
        base_url = default_base_url;
    }
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    endpoint = base_url + "/responses";
    std::call_once(curl_initialized, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

std::string
VisionOcrProvider::getName() const
{
    return "openai-vision";
}

std::string const&
VisionOcrProvider::getModel() const
{
    return model;
}

std::string const&
VisionOcrProvider::getEndpoint() const
{
    return endpoint;
}

std::string
VisionOcrProvider::makeRequest(std::string const& image) const
{
    auto encoded = SiftUtil::base64_encode(image);

    auto text_item = JSON::makeDictionary();
    text_item.addDictionaryMember("type", JSON::makeString("input_text"));
    text_item.addDictionaryMember("text", JSON::makeString(prompt));
    auto image_item = JSON::makeDictionary();
    image_item.addDictionaryMember("type", JSON::makeString("input_image"));
    image_item.addDictionaryMember(
        "image_url", JSON::makeString("data:image/png;base64," + encoded));
    image_item.addDictionaryMember("detail", JSON::makeString("high"));

    auto message = JSON::makeDictionary();
    message.addDictionaryMember("role", JSON::makeString("user"));
    auto content = message.addDictionaryMember("content", JSON::makeArray());
    content.addArrayElement(text_item);
    content.addArrayElement(image_item);

    auto request = JSON::makeDictionary();
    request.addDictionaryMember("model", JSON::makeString(model));
    request.addDictionaryMember("input", JSON::makeArray()).addArrayElement(message);
    return request.unparse();
}

std::string
VisionOcrProvider::collectText(std::string const& response)
{
    auto j = JSON::makeNull();
    try {
        j = JSON::parse(response);
    } catch (std::runtime_error& e) {
        throw SiftExc(
            docsift_e_json,
            "",
            "",
            0,
            "invalid response from vision API: " + std::string(e.what()));
    }

    std::string result;
    auto output_text = dict_item(j, "output_text");
    if (output_text.getString(result) && !result.empty()) {
        return result;
    }
    if (output_text.isArray()) {
        bool first = true;
        output_text.forEachArrayItem([&result, &first](JSON item) {
            std::string text;
            if (item.getString(text)) {
                if (!first) {
                    result += "\n";
                }
                result += text;
                first = false;
            }
        });
        if (!result.empty()) {
            return result;
        }
    }

    bool found = false;
    dict_item(j, "output").forEachArrayItem([&result, &found](JSON item) {
        std::string type;
        if (found || !(dict_item(item, "type").getString(type) && type == "message")) {
            return;
        }
        dict_item(item, "content").forEachArrayItem([&result, &found](JSON content) {
            std::string content_type;
            if (!found && dict_item(content, "type").getString(content_type) &&
                content_type == "output_text") {
                dict_item(content, "text").getString(result);
                found = true;
            }
        });
    });
    return result;
}

std::string
VisionOcrProvider::post(std::string const& body) const
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ocr_error("unable to initialize curl");
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        nullptr, curl_slist_free_all);
    auto add_header = [&headers](std::string const& header) {
        auto* list = curl_slist_append(headers.get(), header.c_str());
        if (list == nullptr) {
            throw ocr_error("unable to allocate HTTP headers");
        }
        headers.release();
        headers.reset(list);
    };
    add_header("Authorization: Bearer " + api_key);
    add_header("Content-Type: application/json");

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_response);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ocr_error(std::string("request to vision API failed: ") + curl_easy_strerror(res));
    }
    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        std::string detail;
        try {
            dict_item(dict_item(JSON::parse(response), "error"), "message").getString(detail);
        } catch (std::runtime_error&) {
            detail = response.substr(0, 200);
        }
        throw ocr_error(
            "vision API returned HTTP status " + std::to_string(http_code) +
            (detail.empty() ? "" : ": " + detail));
    }
    return response;
}

std::string
VisionOcrProvider::recognize(std::string const& image)
{
    try {
        return SiftUtil::str_trim(collectText(post(makeRequest(image))));
    } catch (std::exception& e) {
        logger->error("docsift: " + getName() + ": OCR failed: " + e.what() + "\n");
        return error_tag + std::string(e.what());
    }
}
