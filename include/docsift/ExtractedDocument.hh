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

#ifndef EXTRACTEDDOCUMENT_HH
#define EXTRACTEDDOCUMENT_HH

#include <docsift/Constants.h>
#include <docsift/DLL.h>
#include <qpdf/JSON.hh>

#include <optional>
#include <string>
#include <vector>

// One unit of extracted text. Extractors leave id empty; Normalizer assigns it.
struct ContentChunk
{
    DOCSIFT_DLL
    ContentChunk() = default;
    DOCSIFT_DLL
    ContentChunk(
        docsift_chunk_type_e type,
        std::string const& text,
        std::optional<int> page = std::nullopt,
        std::optional<std::string> section = std::nullopt);

    // "heading", "paragraph", "table", "list" or "image"
    DOCSIFT_DLL
    static char const* typeName(docsift_chunk_type_e);

    // {"id": ..., "type": ..., "text": ..., "page": ..., "section": ...}. page and section are
    // omitted when not set.
    DOCSIFT_DLL
    JSON getJSON() const;

    std::string id;
    docsift_chunk_type_e type{dc_paragraph};
    std::string text;
    // 1-based page number
    std::optional<int> page;
    // Slide, sheet or image label
    std::optional<std::string> section;
};

// The result of extracting one file. Chunks are in reading order: page order, then the order in
// which they were found on the page.
struct ExtractedDocument
{
    // Create a document with a fresh random documentId and an empty metadata dictionary.
    DOCSIFT_DLL
    static ExtractedDocument create(std::string const& file_name, std::string const& mime_type);

    // {"documentId": ..., "fileName": ..., "mimeType": ..., "metadata": {...}, "chunks": [...]}
    DOCSIFT_DLL
    JSON getJSON() const;

    std::string documentId;
    std::string fileName;
    std::string mimeType;
    JSON metadata{JSON::makeDictionary()};
    std::vector<ContentChunk> chunks;
};

#endif // EXTRACTEDDOCUMENT_HH
