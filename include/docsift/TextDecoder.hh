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

#ifndef TEXTDECODER_HH
#define TEXTDECODER_HH

#include <docsift/DLL.h>

#include <string>

// Converts the bytes of a PDF string operand to UTF-8 without font information.
class TextDecoder
{
  public:
    // Strings starting with a UTF-16 byte order mark are decoded as UTF-16 in that byte order.
    // Other strings are taken as UTF-8 if they are valid UTF-8 and as Latin-1 otherwise.
    DOCSIFT_DLL
    static std::string decode(std::string const& bytes);

    // Map every byte to the code point of the same value.
    DOCSIFT_DLL
    static std::string latin1ToUTF8(std::string const& bytes);

    // True if bytes is valid UTF-8 that doesn't encode U+FFFD.
    DOCSIFT_DLL
    static bool isCleanUTF8(std::string const& bytes);
};

#endif // TEXTDECODER_HH
