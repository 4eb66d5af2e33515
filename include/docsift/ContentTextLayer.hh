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

#ifndef CONTENTTEXTLAYER_HH
#define CONTENTTEXTLAYER_HH

#include <docsift/TextLayerProvider.hh>

// Reads a page's text by interpreting the text operators of its content streams. Strings are
// mapped through the current font's /ToUnicode CMap when it has one and decoded with
// TextDecoder otherwise. Line breaks are inferred from text positioning operators.
class DOCSIFT_DLL_CLASS ContentTextLayer: public TextLayerProvider
{
  public:
    DOCSIFT_DLL
    ContentTextLayer() = default;
    DOCSIFT_DLL
    ~ContentTextLayer() override = default;

    DOCSIFT_DLL
    std::vector<TextItem> getTextItems(QPDFPageObjectHelper& page) override;
};

#endif // CONTENTTEXTLAYER_HH
