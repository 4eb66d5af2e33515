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

#ifndef PDFEXTRACTOR_HH
#define PDFEXTRACTOR_HH

#include <docsift/Extractor.hh>
#include <docsift/OcrProvider.hh>
#include <docsift/TextLayerProvider.hh>

#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <memory>
#include <string>
#include <vector>

// Extracts text from PDF files page by page. Each page's text is read through a
// TextLayerProvider. When that yields nothing, the text-showing operators of the page's content
// streams are scanned directly. Pages with little text are listed in the ocrPages metadata
// entry. If an OCR provider is available, the images on every page are decoded and recognized
// and each non-empty result becomes an image chunk. Image chunks on a page are labeled image-1,
// image-2 and so on in the order they are emitted.
//
// Metadata: pageCount, ocrPages, isScannedPdf, pdfVersion, encrypted.
class DOCSIFT_DLL_CLASS PdfExtractor: public Extractor
{
  public:
    // Pages whose text is shorter than this, in UTF-16 code units, are listed in ocrPages.
    static size_t const min_text_length = 50;
    // Paragraphs shorter than this, in UTF-16 code units, may be headings.
    static size_t const max_heading_length = 120;

    // ocr may be null. If text_layer is null, a ContentTextLayer is used.
    DOCSIFT_DLL
    PdfExtractor(
        std::shared_ptr<OcrProvider> ocr = nullptr,
        std::shared_ptr<TextLayerProvider> text_layer = nullptr,
        std::shared_ptr<QPDFLogger> logger = nullptr);
    DOCSIFT_DLL
    ~PdfExtractor() override = default;

    DOCSIFT_DLL
    std::string getName() const override;
    DOCSIFT_DLL
    bool supports(std::string const& media_type) const override;
    // Throws SiftExc if the file is too damaged to find any pages or needs a password.
    DOCSIFT_DLL
    ExtractedDocument extract(std::string const& data, std::string const& file_name) override;

    // Join text items with a newline after items that end a line and a space after others, then
    // remove white space before newlines, reduce runs of blank lines to one and trim.
    DOCSIFT_DLL
    static std::string joinTextItems(std::vector<TextItem> const& items);

    // Split page text at blank lines into trimmed, non-empty paragraphs.
    DOCSIFT_DLL
    static std::vector<std::string> splitParagraphs(std::string const& text);

    // A paragraph is taken to be a heading when it is short, has no run of four or more digits,
    // and has no character in any script that upper-casing would change.
    DOCSIFT_DLL
    static bool isHeading(std::string const& paragraph);

    // Recover text from a page's content streams without interpreting them. Strings shown by
    // text operators are decoded with TextDecoder and joined with spaces. Throws QPDFExc if the
    // content streams can't be read.
    DOCSIFT_DLL
    static std::string getContentStreamText(QPDFPageObjectHelper& page);

  private:
    void addTextChunks(ExtractedDocument&, std::string const& text, int pageno);
    void addImageChunks(
        ExtractedDocument&, QPDFPageObjectHelper& page, int pageno, std::string const& where);

    std::shared_ptr<OcrProvider> ocr;
    std::shared_ptr<TextLayerProvider> text_layer;
    std::shared_ptr<QPDFLogger> logger;
};

#endif // PDFEXTRACTOR_HH
