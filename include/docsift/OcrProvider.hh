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

#ifndef OCRPROVIDER_HH
#define OCRPROVIDER_HH

#include <docsift/DLL.h>

#include <string>

// A text recognition engine. An extraction uses its provider from a single thread and calls
// release when it is done; concurrent extractions each get their own provider.
class DOCSIFT_DLL_CLASS OcrProvider
{
  public:
    // Text returned by recognize when recognition fails starts with this tag.
    static constexpr char const* error_tag = "[OCR Error] ";

    DOCSIFT_DLL
    virtual ~OcrProvider() = default;

    // Return the text recognized in image, which is encoded image data, normally PNG. This method
    // does not throw. If recognition fails, it logs an error and returns error_tag followed by a
    // description of the problem.
    DOCSIFT_DLL
    virtual std::string recognize(std::string const& image) = 0;

    // A short name for log messages
    DOCSIFT_DLL
    virtual std::string getName() const = 0;

    // Release resources held by a stateful engine. Called when an extraction that used the
    // provider finishes. The provider must still be usable afterwards. This method may throw;
    // callers log the error and continue.
    DOCSIFT_DLL
    virtual void
    release()
    {
    }
};

#endif // OCRPROVIDER_HH
