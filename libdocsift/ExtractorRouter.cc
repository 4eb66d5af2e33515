#include <docsift/ExtractorRouter.hh>

#include <docsift/CsvExtractor.hh>
#include <docsift/HtmlExtractor.hh>
#include <docsift/ImageExtractor.hh>
#include <docsift/Normalizer.hh>
#include <docsift/PdfExtractor.hh>
#include <docsift/SiftExc.hh>

#include <stdexcept>

ExtractorRouter::ExtractorRouter(std::shared_ptr<QPDFLogger> logger) :
    logger(logger ? logger : QPDFLogger::defaultLogger())
{
}

std::shared_ptr<ExtractorRouter>
ExtractorRouter::createDefault(std::shared_ptr<OcrProvider> ocr, std::shared_ptr<QPDFLogger> logger)
{
    auto router = std::make_shared<ExtractorRouter>(logger);
    router->registerExtractor(std::make_shared<PdfExtractor>(ocr, nullptr, router->logger));
    router->registerExtractor(std::make_shared<CsvExtractor>());
    router->registerExtractor(std::make_shared<HtmlExtractor>());
    router->registerExtractor(std::make_shared<ImageExtractor>(ocr, router->logger));
    return router;
}

void
ExtractorRouter::registerExtractor(std::shared_ptr<Extractor> extractor)
{
    if (!extractor) {
        throw std::logic_error("ExtractorRouter::registerExtractor called with a null extractor");
    }
    extractors.push_back(extractor);
}

std::vector<std::shared_ptr<Extractor>> const&
ExtractorRouter::getExtractors() const
{
    return extractors;
}

Extractor&
ExtractorRouter::route(std::string const& media_type) const
{
    for (auto const& extractor: extractors) {
        if (extractor->supports(media_type)) {
            return *extractor;
        }
    }
    throw SiftExc(
        docsift_e_unsupported_media_type,
        "",
        "",
        0,
        "No extractor registered for MIME type: " + media_type);
}

ExtractedDocument
ExtractorRouter::process(
    std::string const& data, std::string const& file_name, std::string const& media_type) const
{
    auto& extractor = route(media_type);
    logger->info(
        "docsift: " + file_name + ": " + media_type + " handled by " + extractor.getName() + "\n");
    auto doc = extractor.extract(data, file_name);
    doc.mimeType = media_type;
    return Normalizer::normalizeDocument(doc);
}
