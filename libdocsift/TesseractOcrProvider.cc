#include <docsift/TesseractOcrProvider.hh>

#include <docsift/SiftExc.hh>
#include <docsift/SiftUtil.hh>

#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>

#include <mutex>

namespace
{
    struct PixDeleter
    {
        void
        operator()(Pix* pix) const
        {
            pixDestroy(&pix);
        }
    };
} // namespace

class TesseractOcrProvider::Members
{
  public:
    Members(std::string const& language, std::shared_ptr<QPDFLogger> logger) :
        language(language),
        logger(logger ? logger : QPDFLogger::defaultLogger())
    {
    }

    std::string language;
    std::shared_ptr<QPDFLogger> logger;
    std::mutex lock;
    std::unique_ptr<tesseract::TessBaseAPI> api;
};

TesseractOcrProvider::TesseractOcrProvider(
    std::string const& language, std::shared_ptr<QPDFLogger> logger) :
    m(new Members(language, logger))
{
}

TesseractOcrProvider::~TesseractOcrProvider()
{
    if (m->api) {
        m->api->End();
    }
}

std::string
TesseractOcrProvider::getName() const
{
    return "tesseract";
}

std::string
TesseractOcrProvider::recognize(std::string const& image)
{
    try {
        std::lock_guard<std::mutex> guard(m->lock);
        if (!m->api) {
            auto api = std::make_unique<tesseract::TessBaseAPI>();
            if (api->Init(nullptr, m->language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
                throw SiftExc(
                    docsift_e_ocr,
                    "",
                    "",
                    0,
                    "unable to initialize tesseract for language " + m->language);
            }
            api->SetVariable("preserve_interword_spaces", "1");
            m->api = std::move(api);
        }
        std::unique_ptr<Pix, PixDeleter> pix(
            pixReadMem(reinterpret_cast<l_uint8 const*>(image.data()), image.size()));
        if (!pix) {
            throw SiftExc(docsift_e_ocr, "", "", 0, "leptonica was unable to read the image");
        }
        m->api->SetImage(pix.get());
        std::unique_ptr<char[]> text(m->api->GetUTF8Text());
        m->api->Clear();
        if (!text) {
            throw SiftExc(docsift_e_ocr, "", "", 0, "tesseract did not return any text");
        }
        return SiftUtil::str_trim(text.get());
    } catch (std::exception& e) {
        m->logger->error("docsift: tesseract: recognition failed: " + std::string(e.what()) + "\n");
        return error_tag + std::string(e.what());
    }
}

void
TesseractOcrProvider::release()
{
    std::lock_guard<std::mutex> guard(m->lock);
    if (m->api) {
        m->api->End();
        m->api.reset();
    }
}
