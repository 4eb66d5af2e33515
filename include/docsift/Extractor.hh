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

#ifndef EXTRACTOR_HH
#define EXTRACTOR_HH

#include <docsift/DLL.h>
#include <docsift/ExtractedDocument.hh>

#include <string>

// Base class for format-specific extractors. An extractor may be used by several threads at once,
// so extract must not modify shared state.
class DOCSIFT_DLL_CLASS Extractor
{
  public:
    DOCSIFT_DLL
    virtual ~Extractor() = default;

    // Name for log messages
    DOCSIFT_DLL
    virtual std::string getName() const = 0;

    // Whether this extractor handles media_type, which is lower case
    DOCSIFT_DLL
    virtual bool supports(std::string const& media_type) const = 0;

    // Extract the contents of data, the complete contents of a file named file_name. The result is
    // not normalized. Failures throw an exception, normally SiftExc; an extractor never returns an
    // empty document in place of an error.
    DOCSIFT_DLL
    virtual ExtractedDocument extract(std::string const& data, std::string const& file_name) = 0;
};

#endif // EXTRACTOR_HH
