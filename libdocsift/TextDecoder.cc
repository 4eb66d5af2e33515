#include <docsift/TextDecoder.hh>

#include <qpdf/QUtil.hh>


std::string
TextDecoder::decode(std::string const& bytes)
{
    if (bytes.length() >= 2) {
        auto b0 = static_cast<unsigned char>(bytes.at(0));
        auto b1 = static_cast<unsigned char>(bytes.at(1));
        if ((b0 == 0xfe && b1 == 0xff) || (b0 == 0xff && b1 == 0xfe)) {
            return QUtil::utf16_to_utf8(bytes);
        }
    }
    if (isCleanUTF8(bytes)) {
        return bytes;
    }
    return latin1ToUTF8(bytes);
}

std::string
TextDecoder::latin1ToUTF8(std::string const& bytes)
{
    std::string result;
    for (char ch: bytes) {
        result += QUtil::toUTF8(static_cast<unsigned char>(ch));
    }
    return result;
}

bool
TextDecoder::isCleanUTF8(std::string const& bytes)
{
    size_t pos = 0;
    while (pos < bytes.length()) {
        bool error = false;
        auto codepoint = QUtil::get_next_utf8_codepoint(bytes, pos, error);
        if (error || codepoint == 0xfffd) {
            return false;
        }
    }
    return true;
}
