#include <docsift/OcrProviderFactory.hh>

#include <docsift/SiftExc.hh>
#include <docsift/VisionOcrProvider.hh>

#include <qpdf/QUtil.hh>

#ifdef DOCSIFT_HAVE_TESSERACT
# include <docsift/TesseractOcrProvider.hh>
#endif

static std::shared_ptr<OcrProvider>
make_tesseract(std::shared_ptr<QPDFLogger> logger, std::string const& language)
{
#ifdef DOCSIFT_HAVE_TESSERACT
    return std::make_shared<TesseractOcrProvider>(language, logger);
#else
    (void)logger;
    (void)language;
    return nullptr;
#endif
}

bool
OcrProviderFactory::haveTesseract()
{
#ifdef DOCSIFT_HAVE_TESSERACT
    return true;
#else
    return false;
#endif
}

std::shared_ptr<OcrProvider>
OcrProviderFactory::makeDefault(std::shared_ptr<QPDFLogger> logger, std::string const& language)
{
    if (!logger) {
        logger = QPDFLogger::defaultLogger();
    }
    std::string api_key;
    if (QUtil::get_env("OPENAI_API_KEY", &api_key) && !api_key.empty()) {
        try {
            auto provider =
                std::make_shared<VisionOcrProvider>(VisionOcrProvider::Options(), logger);
            logger->info("docsift: using vision OCR with model " + provider->getModel() + "\n");
            return provider;
        } catch (std::exception& e) {
            logger->warn(
                "WARNING: docsift: unable to set up vision OCR: " + std::string(e.what()) + "\n");
        }
    }
    if (auto provider = make_tesseract(logger, language)) {
        logger->info("docsift: using tesseract OCR (" + language + ")\n");
        return provider;
    }
    logger->info("docsift: no OCR provider is available\n");
    return nullptr;
}

std::shared_ptr<OcrProvider>
OcrProviderFactory::make(
    std::string const& name, std::shared_ptr<QPDFLogger> logger, std::string const& language)
{
    if (name == "none") {
        return nullptr;
    }
    if (name == "auto") {
        return makeDefault(logger, language);
    }
    if (name == "openai") {
        return std::make_shared<VisionOcrProvider>(VisionOcrProvider::Options(), logger);
    }
    if (name == "tesseract") {
        if (auto provider = make_tesseract(logger, language)) {
            return provider;
        }
        throw SiftExc(
            docsift_e_unsupported, "", "", 0, "docsift was built without tesseract support");
    }
    throw SiftExc(docsift_e_unsupported, "", "", 0, "unknown OCR provider " + name);
}
