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

#ifndef OCRPROVIDERFACTORY_HH
#define OCRPROVIDERFACTORY_HH

#include <docsift/OcrProvider.hh>
#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <string>

// Creates OCR providers for the composition root. Nothing here keeps state; each call returns a
// new provider.
class OcrProviderFactory
{
  public:
    // Pick the best available provider. If OPENAI_API_KEY is set, try the vision provider; if
    // that fails, log a warning. Otherwise, or after such a failure, use tesseract when docsift was
    // built with it. Returns a null pointer when no provider is available.
    DOCSIFT_DLL
    static std::shared_ptr<OcrProvider> makeDefault(
        std::shared_ptr<QPDFLogger> logger = nullptr, std::string const& language = "eng");

    // Select a provider by name: "none" returns a null pointer, "auto" calls makeDefault,
    // "tesseract" and "openai" create that provider. Throws SiftExc if the provider is not
    // available or the name is not known.
    DOCSIFT_DLL
    static std::shared_ptr<OcrProvider> make(
        std::string const& name,
        std::shared_ptr<QPDFLogger> logger = nullptr,
        std::string const& language = "eng");

    // Whether docsift was built with tesseract support
    DOCSIFT_DLL
    static bool haveTesseract();
};

#endif // OCRPROVIDERFACTORY_HH
