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

#ifndef TEXTLAYERPROVIDER_HH
#define TEXTLAYERPROVIDER_HH

#include <docsift/DLL.h>

#include <qpdf/QPDFPageObjectHelper.hh>

#include <string>
#include <vector>

// A run of text shown on a page. hasEOL is true when the text that follows starts a new line.
struct TextItem
{
    std::string str;
    bool hasEOL{false};
};

// Source of the structured text of a page. Implementations throw an exception, normally SiftExc
// or QPDFExc, when the page's text can't be read.
class DOCSIFT_DLL_CLASS TextLayerProvider
{
  public:
    DOCSIFT_DLL
    virtual ~TextLayerProvider() = default;

    virtual std::vector<TextItem> getTextItems(QPDFPageObjectHelper& page) = 0;
};

#endif // TEXTLAYERPROVIDER_HH
