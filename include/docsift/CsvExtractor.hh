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

#ifndef CSVEXTRACTOR_HH
#define CSVEXTRACTOR_HH

#include <docsift/Extractor.hh>

#include <string>
#include <vector>

// Turns comma- or tab-separated data into one markdown table chunk. The delimiter is a tab if the
// data contains any tab and a comma otherwise. Fields may be quoted as described in RFC 4180.
// Fields are trimmed, blank lines are skipped, and rows may have different numbers of fields.
//
// Metadata: rowCount, columnCount (fields in the first row), delimiter.
class DOCSIFT_DLL_CLASS CsvExtractor: public Extractor
{
  public:
    DOCSIFT_DLL
    CsvExtractor() = default;
    DOCSIFT_DLL
    ~CsvExtractor() override = default;

    DOCSIFT_DLL
    std::string getName() const override;
    DOCSIFT_DLL
    bool supports(std::string const& media_type) const override;
    DOCSIFT_DLL
    ExtractedDocument extract(std::string const& data, std::string const& file_name) override;

    // Split text into records. Throws SiftExc if the text ends inside a quoted field.
    DOCSIFT_DLL
    static std::vector<std::vector<std::string>>
    parseRecords(std::string const& text, char delimiter, std::string const& file_name = "");

    // Format records as a markdown table. The first record is the header.
    DOCSIFT_DLL
    static std::string toMarkdown(std::vector<std::vector<std::string>> const& records);
};

#endif // CSVEXTRACTOR_HH
