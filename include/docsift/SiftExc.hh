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

#ifndef SIFTEXC_HH
#define SIFTEXC_HH

#include <docsift/Constants.h>
#include <docsift/DLL.h>
#include <docsift/Types.h>

#include <stdexcept>
#include <string>

class DOCSIFT_DLL_CLASS SiftExc: public std::runtime_error
{
  public:
    DOCSIFT_DLL
    SiftExc(
        docsift_error_code_e error_code,
        std::string const& filename,
        std::string const& object,
        docsift_offset_t offset,
        std::string const& message);

    DOCSIFT_DLL
    ~SiftExc() noexcept override = default;

    // To get a complete error string, call what(), provided by std::exception. The accessors below
    // return the original values used to create the exception. Only the error code and message are
    // guaranteed to have non-zero/empty values.

    // There is no lookup code that maps numeric error codes into strings. The numeric error code
    // is just another way to get at the underlying issue, but it is more programmer-friendly than
    // trying to parse a string that is subject to change.

    DOCSIFT_DLL
    docsift_error_code_e getErrorCode() const;
    DOCSIFT_DLL
    std::string const& getFilename() const;
    DOCSIFT_DLL
    std::string const& getObject() const;
    DOCSIFT_DLL
    docsift_offset_t getFilePosition() const;
    DOCSIFT_DLL
    std::string const& getMessageDetail() const;

  private:
    DOCSIFT_DLL_PRIVATE
    static std::string createWhat(
        std::string const& filename,
        std::string const& object,
        docsift_offset_t offset,
        std::string const& message);

    // This class does not use the Members pattern to avoid needless memory allocations during
    // exception handling.

    docsift_error_code_e error_code;
    std::string filename;
    std::string object;
    docsift_offset_t offset;
    std::string message;
};

// Thrown by the argument parser for command-line usage errors.
class DOCSIFT_DLL_CLASS SiftUsage: public std::runtime_error
{
  public:
    DOCSIFT_DLL
    SiftUsage(std::string const& msg);
};

#endif // SIFTEXC_HH
