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

#ifndef HTMLEXTRACTOR_HH
#define HTMLEXTRACTOR_HH

#include <docsift/Extractor.hh>

#include <string>

// Reads the text of an HTML document. Scripts, style sheets, noscript and svg elements, and
// comments are dropped. Block-level tags end a line and other tags become a space. Common named
// entities and numeric character references are decoded. The text is split into paragraphs at
// blank lines. The content of the first title element is stored in the title metadata entry.
class DOCSIFT_DLL_CLASS HtmlExtractor: public Extractor
{
  public:
    DOCSIFT_DLL
    HtmlExtractor() = default;
    DOCSIFT_DLL
    ~HtmlExtractor() override = default;

    DOCSIFT_DLL
    std::string getName() const override;
    DOCSIFT_DLL
    bool supports(std::string const& media_type) const override;
    DOCSIFT_DLL
    ExtractedDocument extract(std::string const& data, std::string const& file_name) override;

    // Return the document's text with tags removed and entities decoded, as described above, but
    // before paragraph splitting. If title is not null, it receives the title.
    DOCSIFT_DLL
    static std::string stripTags(std::string const& html, std::string* title = nullptr);

    // Decode the entity starting at html[pos], which is '&'. On success, append its text to
    // result, advance pos past it and return true.
    DOCSIFT_DLL
    static bool decodeEntity(std::string const& html, size_t& pos, std::string& result);
};

#endif // HTMLEXTRACTOR_HH
