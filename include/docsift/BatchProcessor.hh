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

#ifndef BATCHPROCESSOR_HH
#define BATCHPROCESSOR_HH

#include <docsift/DLL.h>
#include <docsift/ExtractedDocument.hh>
#include <docsift/ExtractorRouter.hh>

#include <qpdf/JSON.hh>
#include <qpdf/QPDFLogger.hh>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct BatchInput
{
    std::string fileName;
    std::string data;
    // The declared media type. It may be empty, in which case the file name decides.
    std::string mimeType;
};

struct BatchResult
{
    // {"success": true, "document": {...}} or {"success": false, "fileName": ..., "error": ...}
    DOCSIFT_DLL
    JSON getJSON() const;

    bool success{false};
    std::string fileName;
    std::optional<ExtractedDocument> document;
    std::string error;
};

// Extracts a batch of files concurrently with one task per file. Every file gets a result in
// input order: a failure in one file never affects another. Each task gets its own router from
// the router factory, so extractors and OCR providers are never shared between tasks. The
// logger is shared; its channels are serialized before the tasks start.
class BatchProcessor
{
  public:
    static size_t const max_file_size = 50 * 1024 * 1024;

    typedef std::function<std::shared_ptr<ExtractorRouter>()> RouterFactory;

    DOCSIFT_DLL
    BatchProcessor(RouterFactory router_factory, std::shared_ptr<QPDFLogger> logger = nullptr);
    // Waits for any tasks abandoned because of a timeout.
    DOCSIFT_DLL
    ~BatchProcessor();

    BatchProcessor(BatchProcessor const&) = delete;
    BatchProcessor& operator=(BatchProcessor const&) = delete;

    // Limit the wall-clock time of each call to process. Files not finished in time get a timeout
    // error; their tasks keep running until they finish on their own. A zero duration, the
    // default, means no limit.
    DOCSIFT_DLL
    void setTimeout(std::chrono::milliseconds);

    // Routers are created on the calling thread before any task starts, so an exception from the
    // router factory propagates from here.
    DOCSIFT_DLL
    std::vector<BatchResult> process(std::vector<BatchInput> const& inputs);

    // Return the error for a file of this size that is rejected before extraction, or the empty
    // string.
    DOCSIFT_DLL
    static std::string checkSize(size_t size);

    // {"results": [...]}
    DOCSIFT_DLL
    static JSON getJSON(std::vector<BatchResult> const& results);

  private:
    RouterFactory router_factory;
    std::shared_ptr<QPDFLogger> logger;
    std::chrono::milliseconds timeout{0};
    std::vector<std::future<BatchResult>> abandoned;
};

#endif // BATCHPROCESSOR_HH
