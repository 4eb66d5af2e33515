#include <docsift/BatchProcessor.hh>

#include <docsift/MimeTypes.hh>
#include <docsift/Pl_Serialized.hh>

#include <qpdf/QUtil.hh>

#include <stdexcept>

static BatchResult
failure(std::string const& file_name, std::string const& error)
{
    BatchResult result;
    result.fileName = file_name;
    result.error = error;
    return result;
}

static BatchResult
extract_one(
    std::shared_ptr<ExtractorRouter> router, std::shared_ptr<BatchInput const> input)
{
    BatchResult result;
    result.fileName = input->fileName;
    auto media_type = MimeTypes::resolve(input->mimeType, input->fileName);
    result.document = router->process(input->data, input->fileName, media_type);
    result.success = true;
    return result;
}

JSON
BatchResult::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("success", JSON::makeBool(success));
    if (success && document) {
        j.addDictionaryMember("document", document->getJSON());
    } else {
        j.addDictionaryMember("fileName", JSON::makeString(fileName));
        j.addDictionaryMember("error", JSON::makeString(error));
    }
    return j;
}

BatchProcessor::BatchProcessor(RouterFactory router_factory, std::shared_ptr<QPDFLogger> logger) :
    router_factory(router_factory),
    logger(logger ? logger : QPDFLogger::defaultLogger())
{
    if (!router_factory) {
        throw std::logic_error("BatchProcessor created without a router factory");
    }
}

BatchProcessor::~BatchProcessor()
{
    for (auto& task: abandoned) {
        task.wait();
    }
}

void
BatchProcessor::setTimeout(std::chrono::milliseconds t)
{
    timeout = t;
}

std::string
BatchProcessor::checkSize(size_t size)
{
    if (size > max_file_size) {
        return "File exceeds the 50 MB limit (" +
            QUtil::double_to_string(static_cast<double>(size) / 1024.0 / 1024.0, 1, false) +
            " MB).";
    }
    if (size == 0) {
        return "File is empty.";
    }
    return "";
}

std::vector<BatchResult>
BatchProcessor::process(std::vector<BatchInput> const& inputs)
{
    std::vector<std::optional<BatchResult>> results(inputs.size());
    std::vector<std::shared_ptr<ExtractorRouter>> routers(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        auto const& input = inputs.at(i);
        auto error = checkSize(input.data.size());
        if (!error.empty()) {
            results.at(i) = failure(input.fileName, error);
            continue;
        }
        routers.at(i) = router_factory();
        if (!routers.at(i)) {
            throw std::logic_error("BatchProcessor router factory returned a null router");
        }
    }

    Pl_Serialized::serialize(*logger);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::future<BatchResult>> tasks(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (routers.at(i)) {
            tasks.at(i) = std::async(
                std::launch::async,
                extract_one,
                routers.at(i),
                std::make_shared<BatchInput const>(inputs.at(i)));
        }
    }

    for (size_t i = 0; i < inputs.size(); ++i) {
        auto& task = tasks.at(i);
        if (!task.valid()) {
            continue;
        }
        auto const& file_name = inputs.at(i).fileName;
        if (timeout.count() > 0 && task.wait_until(deadline) != std::future_status::ready) {
            results.at(i) = failure(
                file_name,
                "Extraction timed out after " +
                    QUtil::double_to_string(
                        static_cast<double>(timeout.count()) / 1000.0, 3, true) +
                    " seconds.");
            abandoned.push_back(std::move(task));
            continue;
        }
        try {
            results.at(i) = task.get();
        } catch (std::exception& e) {
            results.at(i) = failure(file_name, e.what());
        } catch (...) {
            results.at(i) = failure(file_name, "Unhandled extraction failure");
        }
    }

    std::vector<BatchResult> ordered;
    ordered.reserve(results.size());
    for (auto& result: results) {
        if (result->success) {
            logger->info("docsift: " + result->fileName + ": extracted\n");
        } else {
            logger->info("docsift: " + result->fileName + ": failed: " + result->error + "\n");
        }
        ordered.push_back(std::move(*result));
    }
    return ordered;
}

JSON
BatchProcessor::getJSON(std::vector<BatchResult> const& results)
{
    auto j = JSON::makeDictionary();
    auto j_results = j.addDictionaryMember("results", JSON::makeArray());
    for (auto const& result: results) {
        j_results.addArrayElement(result.getJSON());
    }
    return j;
}
