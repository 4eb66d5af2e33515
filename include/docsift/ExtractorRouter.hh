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

#ifndef EXTRACTORROUTER_HH
#define EXTRACTORROUTER_HH

#include <docsift/DLL.h>
#include <docsift/ExtractedDocument.hh>
#include <docsift/Extractor.hh>
#include <docsift/OcrProvider.hh>

#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <string>
#include <vector>

// Dispatches files to extractors by media type. Extractors are consulted in the order in which
// they were registered, and the first one that supports the type is used. A router created with
// an OCR provider must not be used by more than one task at a time, since the provider is
// released at the end of each extraction.
class ExtractorRouter
{
  public:
    DOCSIFT_DLL
    ExtractorRouter(std::shared_ptr<QPDFLogger> logger = nullptr);

    // Create a router with the built-in extractors in priority order: PDF, CSV, HTML, image.
    // ocr, which may be null, is given to the PDF and image extractors.
    DOCSIFT_DLL
    static std::shared_ptr<ExtractorRouter>
    createDefault(std::shared_ptr<OcrProvider> ocr, std::shared_ptr<QPDFLogger> logger = nullptr);

    DOCSIFT_DLL
    void registerExtractor(std::shared_ptr<Extractor>);

    DOCSIFT_DLL
    std::vector<std::shared_ptr<Extractor>> const& getExtractors() const;

    // Return the first extractor that supports media_type. Throws SiftExc with code
    // docsift_e_unsupported_media_type if there is none.
    DOCSIFT_DLL
    Extractor& route(std::string const& media_type) const;

    // Route, extract and normalize. The result's mimeType is media_type.
    DOCSIFT_DLL
    ExtractedDocument process(
        std::string const& data, std::string const& file_name, std::string const& media_type) const;

  private:
    std::shared_ptr<QPDFLogger> logger;
    std::vector<std::shared_ptr<Extractor>> extractors;
};

#endif // EXTRACTORROUTER_HH
