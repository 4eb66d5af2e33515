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

#ifndef MIMETYPES_HH
#define MIMETYPES_HH

#include <docsift/DLL.h>

#include <string>
#include <vector>

namespace MimeTypes
{
    // Return the media type to route a file by. A declared type other than empty or
    // application/octet-stream is used as is, in lower case. Otherwise the file name's extension
    // decides. If the extension is not known, the result is the declared type, or
    // application/octet-stream if none was declared.
    DOCSIFT_DLL
    std::string resolve(std::string const& declared, std::string const& file_name);

    // Return the media type for an extension such as ".pdf", or the empty string. Case is
    // ignored.
    DOCSIFT_DLL
    std::string forExtension(std::string const& extension);

    // Return each media type that some known extension maps to, once, in a stable order.
    DOCSIFT_DLL
    std::vector<std::string> supportedTypes();
} // namespace MimeTypes

#endif // MIMETYPES_HH
