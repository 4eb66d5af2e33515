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

#ifndef SIFTUTIL_HH
#define SIFTUTIL_HH

#include <docsift/DLL.h>

#include <string>

// Helpers used throughout docsift that QUtil doesn't provide. Number formatting, hex encoding,
// UTF-8 and UTF-16 conversion and the like come from QUtil.
namespace SiftUtil
{
    // Read a whole file. Throws SiftExc with code docsift_e_system if the file can't be opened or
    // read.
    DOCSIFT_DLL
    std::string read_file_into_string(char const* filename);

    // Length of a UTF-8 string in UTF-16 code units: code points above U+FFFF count twice. Each
    // invalid sequence counts as one.
    DOCSIFT_DLL
    size_t utf16_length(std::string const& utf8_val);

    // Whether upper-casing the string would change it, i.e. whether it contains a character with
    // an upper-case mapping. This covers every script Unicode gives case to.
    DOCSIFT_DLL
    bool has_lower_case(std::string const& utf8_val);

    // A random (version 4) UUID in its canonical lower-case form.
    DOCSIFT_DLL
    std::string random_uuid();

    // Standard base64 with padding.
    DOCSIFT_DLL
    std::string base64_encode(std::string const&);

    // ASCII-only lower-casing
    DOCSIFT_DLL
    std::string str_lower(std::string const&);

    // Remove leading and trailing white space (space, tab, CR, LF, FF, VT).
    DOCSIFT_DLL
    std::string str_trim(std::string const&);
} // namespace SiftUtil

#endif // SIFTUTIL_HH
