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

#ifndef IMAGEEXTRACTOR_HH
#define IMAGEEXTRACTOR_HH

#include <docsift/Extractor.hh>
#include <docsift/OcrProvider.hh>
#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <string>

// Recognizes the text in an image file. PNG and JPEG images are converted to contrast-stretched
// greyscale PNG before they are given to the OCR provider; other formats are passed on
// unchanged. Without an OCR provider, the document holds one placeholder paragraph.
//
// Metadata: format, width, height and channels (PNG and JPEG only), ocrEnabled.
class DOCSIFT_DLL_CLASS ImageExtractor: public Extractor
{
  public:
    DOCSIFT_DLL
    ImageExtractor(
        std::shared_ptr<OcrProvider> ocr = nullptr, std::shared_ptr<QPDFLogger> logger = nullptr);
    DOCSIFT_DLL
    ~ImageExtractor() override = default;

    DOCSIFT_DLL
    std::string getName() const override;
    DOCSIFT_DLL
    bool supports(std::string const& media_type) const override;
    // Throws SiftExc if a PNG or JPEG image can't be decoded.
    DOCSIFT_DLL
    ExtractedDocument extract(std::string const& data, std::string const& file_name) override;

    // Text of the paragraph emitted when there is no OCR provider
    DOCSIFT_DLL
    static std::string placeholderText(std::string const& file_name);

  private:
    std::shared_ptr<OcrProvider> ocr;
    std::shared_ptr<QPDFLogger> logger;
};

#endif // IMAGEEXTRACTOR_HH
