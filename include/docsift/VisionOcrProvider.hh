// Copyright (c) 2026 The docsift authors
//
// This file is part of docsift.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef VISIONOCRPROVIDER_HH
#define VISIONOCRPROVIDER_HH

#include <docsift/OcrProvider.hh>
#include <qpdf/QPDFLogger.hh>

#include <memory>

// Recognition through a remote vision model using the OpenAI Responses API. Each call to
// recognize makes one HTTPS request with its own curl handle.
class DOCSIFT_DLL_CLASS VisionOcrProvider: public OcrProvider
{
  public:
    static constexpr char const* default_model = "gpt-4.1-mini";
    static constexpr char const* default_base_url = "https://api.openai.com/v1";
    static constexpr char const* default_prompt =
        "You are an OCR engine. Read every word in the image and return plain text with natural "
        "line breaks.";

    // Empty values are replaced by defaults. The API key comes from OPENAI_API_KEY, the base URL
    // from OPENAI_BASE_URL and the model from DOCSIFT_OCR_MODEL when those are set.
    struct Options
    {
        // User-provided so Options can be the default argument of the constructor below.
        Options() {}

        std::string api_key;
        std::string model;
        std::string prompt;
        std::string base_url;
        long timeout_seconds{120};
    };

    // Throws SiftExc with code docsift_e_ocr if no API key is available.
    DOCSIFT_DLL
    VisionOcrProvider(Options const& options = {}, std::shared_ptr<QPDFLogger> logger = nullptr);
    DOCSIFT_DLL
    ~VisionOcrProvider() override = default;

    DOCSIFT_DLL
    std::string recognize(std::string const& image) override;
    DOCSIFT_DLL
    std::string getName() const override;

    DOCSIFT_DLL
    std::string const& getModel() const;
    DOCSIFT_DLL
    std::string const& getEndpoint() const;

    // Build the JSON request body for an image. Exposed for testing.
    DOCSIFT_DLL
    std::string makeRequest(std::string const& image) const;

    // Extract the recognized text from a response body. Uses the top-level output_text when
    // present and otherwise the first output_text content item of the first message in output.
    // Throws SiftExc if the body is not valid JSON.
    DOCSIFT_DLL
    static std::string collectText(std::string const& response);

  private:
    std::string post(std::string const& body) const;

    std::string api_key;
    std::string model;
    std::string prompt;
    std::string endpoint;
    long timeout_seconds;
    std::shared_ptr<QPDFLogger> logger;
};

#endif // VISIONOCRPROVIDER_HH
