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

#ifndef NORMALIZER_HH
#define NORMALIZER_HH

#include <docsift/DLL.h>
#include <docsift/ExtractedDocument.hh>

#include <string>
#include <vector>

// Cleanup applied to every extracted document before it is returned.
namespace Normalizer
{
    // Clean UTF-8 text: remove NUL and form feed; turn no-break and zero-width spaces and byte
    // order marks into spaces; join lines separated by a single newline; reduce runs of blank lines
    // to one blank line and runs of spaces and tabs to one space; trim each line and the whole
    // text. Applying normalizeText to its own output returns the same text.
    DOCSIFT_DLL
    std::string normalizeText(std::string const& text);

    // Normalize the text of each chunk, drop chunks whose text becomes empty, and give each
    // remaining chunk a new random id.
    DOCSIFT_DLL
    std::vector<ContentChunk> normalizeChunks(std::vector<ContentChunk> const& chunks);

    // Normalize the chunks of doc. A document without a documentId is given one.
    DOCSIFT_DLL
    ExtractedDocument normalizeDocument(ExtractedDocument const& doc);
} // namespace Normalizer

#endif // NORMALIZER_HH
