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

#ifndef TESSERACTOCRPROVIDER_HH
#define TESSERACTOCRPROVIDER_HH

#include <docsift/OcrProvider.hh>
#include <qpdf/QPDFLogger.hh>

#include <memory>

// Local recognition with tesseract. Images are read with leptonica. The engine is initialized on
// first use and shut down by release(). Calls to recognize are serialized.
//
// This class is only available when docsift is built with DOCSIFT_ENABLE_TESSERACT; see
// OcrProviderFactory::haveTesseract().
class DOCSIFT_DLL_CLASS TesseractOcrProvider: public OcrProvider
{
  public:
    // language is a tesseract language code such as "eng" or "eng+fra".
    DOCSIFT_DLL
    TesseractOcrProvider(
        std::string const& language = "eng", std::shared_ptr<QPDFLogger> logger = nullptr);
    DOCSIFT_DLL
    ~TesseractOcrProvider() override;

    DOCSIFT_DLL
    std::string recognize(std::string const& image) override;
    DOCSIFT_DLL
    std::string getName() const override;
    DOCSIFT_DLL
    void release() override;

  private:
    class Members;
    std::unique_ptr<Members> m;
};

#endif // TESSERACTOCRPROVIDER_HH
