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

#ifndef DOCSIFTJOB_HH
#define DOCSIFTJOB_HH

#include <docsift/BatchProcessor.hh>
#include <docsift/Constants.h>
#include <docsift/DLL.h>
#include <docsift/OcrProvider.hh>

#include <qpdf/Pipeline.hh>
#include <qpdf/QPDFLogger.hh>

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// DocSiftJob implements the docsift command-line tool. It can be configured from command-line
// arguments with initializeFromArgv or through its setters, and then run.
class DocSiftJob
{
  public:
    // Exit codes -- returned by getExitCode() after calling run()
    static int constexpr EXIT_ERROR = docsift_exit_error;
    static int constexpr EXIT_WARNING = docsift_exit_warning;

    DOCSIFT_DLL
    DocSiftJob();

    // Parse command-line arguments. Throws SiftUsage on invalid arguments. --help and --version
    // write to the info channel; afterwards, createsOutput() returns false and run() does
    // nothing. progname_env is the name of an environment variable that overrides the program
    // name in messages.
    DOCSIFT_DLL
    void initializeFromArgv(char const* const argv[], char const* progname_env = nullptr);

    DOCSIFT_DLL
    std::string getMessagePrefix() const;

    DOCSIFT_DLL
    std::shared_ptr<QPDFLogger> getLogger();
    DOCSIFT_DLL
    void setLogger(std::shared_ptr<QPDFLogger>);

    // Redirect standard output and standard error, mostly for tests. Either may be null, in
    // which case the logger's default is kept.
    DOCSIFT_DLL
    void setOutputStreams(std::ostream* out_stream, std::ostream* err_stream);

    DOCSIFT_DLL
    void addFile(std::string const& filename);
    // Media type to use for every file instead of detecting it from the file name
    DOCSIFT_DLL
    void setMimeType(std::string const&);
    // "none", "auto", "tesseract" or "openai"
    DOCSIFT_DLL
    void setOcr(std::string const&);
    DOCSIFT_DLL
    void setOcrLanguage(std::string const&);
    // Create OCR providers with this function instead of from the --ocr setting. It is called
    // once for each file that is extracted.
    DOCSIFT_DLL
    void setOcrProviderFactory(std::function<std::shared_ptr<OcrProvider>()>);
    // Seconds for the whole batch; 0 means no limit
    DOCSIFT_DLL
    void setTimeout(int seconds);
    // Write results to this file instead of standard output
    DOCSIFT_DLL
    void setOutputFile(std::string const&);
    DOCSIFT_DLL
    void setTextOutput(bool);
    DOCSIFT_DLL
    void setVerbose(bool);
    DOCSIFT_DLL
    void setQuiet(bool);

    // Make run() do nothing. Used after --help or --version.
    DOCSIFT_DLL
    void setExiting();
    // Whether run() will produce results. False after --help or --version.
    DOCSIFT_DLL
    bool createsOutput() const;

    // Extract all files and write the results. Throws SiftUsage if there are no files and SiftExc
    // if the OCR provider can't be created or the output can't be written. A file that can't be
    // read or extracted gets a failure result.
    DOCSIFT_DLL
    void run();

    // Return one of the EXIT_* constants. 0 means every file was extracted.
    DOCSIFT_DLL
    int getExitCode() const;

    DOCSIFT_DLL
    std::vector<BatchResult> const& getResults() const;

    DOCSIFT_DLL
    static std::string usageText(std::string const& whoami);

  private:
    void setUpLogger();
    std::vector<BatchResult> extractAll();
    void writeJSON(Pipeline&);
    void writeText(Pipeline&);

    class Members
    {
        friend class DocSiftJob;

      public:
        DOCSIFT_DLL
        ~Members() = default;

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<QPDFLogger> log;
        std::ostream* out_stream{&std::cout};
        std::string message_prefix{"docsift"};
        std::vector<std::string> files;
        std::string mime_type;
        std::string ocr{"auto"};
        std::string ocr_language{"eng"};
        std::function<std::shared_ptr<OcrProvider>()> ocr_provider_factory;
        int timeout{60};
        std::string output_file;
        bool text_output{false};
        bool verbose{false};
        bool quiet{false};
        bool creates_output{true};
        std::vector<BatchResult> results;
    };
    std::shared_ptr<Members> m;
};

#endif // DOCSIFTJOB_HH
