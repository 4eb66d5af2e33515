#include <docsift/DocSiftJob.hh>

#include <docsift/ExtractorRouter.hh>
#include <docsift/OcrProviderFactory.hh>
#include <docsift/SiftExc.hh>
#include <docsift/SiftUtil.hh>

#include <qpdf/JSON.hh>
#include <qpdf/Pl_OStream.hh>

#include <cerrno>
#include <cstring>
#include <fstream>

DocSiftJob::Members::Members() :
    log(QPDFLogger::defaultLogger())
{
}

DocSiftJob::DocSiftJob() :
    m(new Members())
{
}

std::string
DocSiftJob::getMessagePrefix() const
{
    return m->message_prefix;
}

std::shared_ptr<QPDFLogger>
DocSiftJob::getLogger()
{
    return m->log;
}

void
DocSiftJob::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l ? l : QPDFLogger::defaultLogger();
}

void
DocSiftJob::setOutputStreams(std::ostream* out, std::ostream* err)
{
    if (out) {
        m->out_stream = out;
    }
    m->log->setOutputStreams(out, err);
}

void
DocSiftJob::addFile(std::string const& filename)
{
    m->files.push_back(filename);
}

void
DocSiftJob::setMimeType(std::string const& mime_type)
{
    m->mime_type = mime_type;
}

void
DocSiftJob::setOcr(std::string const& ocr)
{
    m->ocr = ocr;
}

void
DocSiftJob::setOcrLanguage(std::string const& language)
{
    m->ocr_language = language;
}

void
DocSiftJob::setOcrProviderFactory(std::function<std::shared_ptr<OcrProvider>()> factory)
{
    m->ocr_provider_factory = factory;
}

void
DocSiftJob::setTimeout(int seconds)
{
    m->timeout = seconds;
}

void
DocSiftJob::setOutputFile(std::string const& filename)
{
    m->output_file = filename;
}

void
DocSiftJob::setTextOutput(bool val)
{
    m->text_output = val;
}

void
DocSiftJob::setVerbose(bool val)
{
    m->verbose = val;
}

void
DocSiftJob::setQuiet(bool val)
{
    m->quiet = val;
}

void
DocSiftJob::setExiting()
{
    m->creates_output = false;
}

bool
DocSiftJob::createsOutput() const
{
    return m->creates_output;
}

int
DocSiftJob::getExitCode() const
{
    for (auto const& result: m->results) {
        if (!result.success) {
            return EXIT_WARNING;
        }
    }
    return 0;
}

std::vector<BatchResult> const&
DocSiftJob::getResults() const
{
    return m->results;
}

void
DocSiftJob::setUpLogger()
{
    // Standard output carries results, so progress messages go with errors.
    if (m->verbose) {
        m->log->setInfo(m->log->getError());
    } else {
        m->log->setInfo(m->log->discard());
    }
    if (m->quiet) {
        m->log->setWarn(m->log->discard());
    }
}

std::vector<BatchResult>
DocSiftJob::extractAll()
{
    auto make_ocr = m->ocr_provider_factory;
    if (!make_ocr) {
        auto name = m->ocr;
        auto language = m->ocr_language;
        auto log = m->log;
        make_ocr = [name, language, log]() {
            return OcrProviderFactory::make(name, log, language);
        };
    }
    // Every file gets a router with its own OCR provider.
    auto log = m->log;
    auto prefix = m->message_prefix;
    auto announced = std::make_shared<bool>(false);
    auto make_router = [make_ocr, log, prefix, announced]() {
        auto ocr = make_ocr();
        if (ocr && !*announced) {
            log->info(prefix + ": using OCR provider " + ocr->getName() + "\n");
            *announced = true;
        }
        return ExtractorRouter::createDefault(ocr, log);
    };

    // Files that can't be read get their result here; the rest go to the batch.
    std::vector<BatchResult> results(m->files.size());
    std::vector<BatchInput> inputs;
    std::vector<size_t> positions;
    for (size_t i = 0; i < m->files.size(); ++i) {
        auto const& filename = m->files.at(i);
        BatchInput input;
        input.fileName = filename;
        input.mimeType = m->mime_type;
        try {
            input.data = SiftUtil::read_file_into_string(filename.c_str());
        } catch (SiftExc& e) {
            m->log->warn("WARNING: " + e.getMessageDetail() + "\n");
            results.at(i).fileName = filename;
            results.at(i).error = e.getMessageDetail();
            continue;
        }
        inputs.push_back(std::move(input));
        positions.push_back(i);
    }

    BatchProcessor processor(make_router, m->log);
    processor.setTimeout(std::chrono::seconds(m->timeout));
    auto batch_results = processor.process(inputs);
    for (size_t i = 0; i < batch_results.size(); ++i) {
        results.at(positions.at(i)) = std::move(batch_results.at(i));
    }
    return results;
}

void
DocSiftJob::writeJSON(Pipeline& p)
{
    // Same output as BatchProcessor::getJSON(m->results).write(&p), one result at a time
    bool first = true;
    JSON::writeDictionaryOpen(&p, first, 0);
    JSON::writeDictionaryKey(&p, first, "results", 1);
    bool first_result = true;
    JSON::writeArrayOpen(&p, first_result, 1);
    for (auto const& result: m->results) {
        JSON::writeArrayItem(&p, first_result, result.getJSON(), 2);
    }
    JSON::writeArrayClose(&p, first_result, 1);
    JSON::writeDictionaryClose(&p, first, 0);
    p << "\n";
}

void
DocSiftJob::writeText(Pipeline& p)
{
    bool first = true;
    for (auto const& result: m->results) {
        if (!first) {
            p << "\n";
        }
        first = false;
        p << "== " << result.fileName << " ==\n";
        if (!(result.success && result.document)) {
            p << "error: " << result.error << "\n";
            continue;
        }
        for (auto const& chunk: result.document->chunks) {
            p << "[" << ContentChunk::typeName(chunk.type);
            if (chunk.page) {
                p << " p." << *chunk.page;
            }
            if (chunk.section) {
                p << " " << *chunk.section;
            }
            p << "] " << chunk.text << "\n";
        }
    }
}

void
DocSiftJob::run()
{
    if (!m->creates_output) {
        return;
    }
    if (m->files.empty()) {
        throw SiftUsage("no input files given");
    }
    setUpLogger();
    m->results = extractAll();

    std::ofstream file;
    std::ostream* out = m->out_stream;
    if (!m->output_file.empty()) {
        file.open(m->output_file, std::ios_base::out | std::ios_base::binary);
        if (!file) {
            throw SiftExc(
                docsift_e_system,
                m->output_file,
                "",
                0,
                "open " + m->output_file + ": " + strerror(errno));
        }
        out = &file;
    }
    Pl_OStream p("docsift output", *out);
    if (m->text_output) {
        writeText(p);
    } else {
        writeJSON(p);
    }
    p.finish();
    if (!m->output_file.empty()) {
        file.close();
        if (!file) {
            throw SiftExc(
                docsift_e_system, m->output_file, "", 0, "error writing " + m->output_file);
        }
        m->log->info(m->message_prefix + ": wrote " + m->output_file + "\n");
    }
}
