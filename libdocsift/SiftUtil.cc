#include <docsift/SiftUtil.hh>

#include <docsift/SiftExc.hh>

#include <qpdf/QUtil.hh>

#include <unicode/uchar.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

std::string
SiftUtil::read_file_into_string(char const* filename)
{
    FILE* f = fopen(filename, "rb");
    if (f == nullptr) {
        int saved_errno = errno;
        throw SiftExc(
            docsift_e_system,
            filename,
            "",
            0,
            std::string("open ") + filename + ": " + strerror(saved_errno));
    }
    QUtil::FileCloser fc(f);
    std::string result;
    char buf[8192];
    size_t len = 0;
    while ((len = fread(buf, 1, sizeof(buf), f)) > 0) {
        result.append(buf, len);
    }
    if (ferror(f)) {
        throw SiftExc(
            docsift_e_system,
            filename,
            "",
            0,
            std::string("failure reading file ") + filename + " into memory");
    }
    return result;
}

size_t
SiftUtil::utf16_length(std::string const& utf8_val)
{
    size_t result = 0;
    size_t pos = 0;
    bool error = false;
    while (pos < utf8_val.length()) {
        auto ch = QUtil::get_next_utf8_codepoint(utf8_val, pos, error);
        result += (!error && ch > 0xffff) ? 2 : 1;
    }
    return result;
}

bool
SiftUtil::has_lower_case(std::string const& utf8_val)
{
    size_t pos = 0;
    bool error = false;
    while (pos < utf8_val.length()) {
        auto ch = QUtil::get_next_utf8_codepoint(utf8_val, pos, error);
        if (error || ch > 0x10ffff) {
            continue;
        }
        if (u_hasBinaryProperty(static_cast<UChar32>(ch), UCHAR_CHANGES_WHEN_UPPERCASED)) {
            return true;
        }
    }
    return false;
}

std::string
SiftUtil::random_uuid()
{
    unsigned char bytes[16];
    QUtil::initializeWithRandomBytes(bytes, sizeof(bytes));
    // version 4, variant 10
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
    std::string hex =
        QUtil::hex_encode(std::string(reinterpret_cast<char*>(bytes), sizeof(bytes)));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
        hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string
SiftUtil::base64_encode(std::string const& data)
{
    static char const* const alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    auto byte = [&data](size_t at) {
        return at < data.size() ? static_cast<unsigned int>(static_cast<unsigned char>(data[at]))
                                : 0U;
    };
    for (; i < data.size(); i += 3) {
        unsigned int group = (byte(i) << 16) | (byte(i + 1) << 8) | byte(i + 2);
        size_t have = std::min(data.size() - i, size_t(3));
        result += alphabet[(group >> 18) & 0x3f];
        result += alphabet[(group >> 12) & 0x3f];
        result += have > 1 ? alphabet[(group >> 6) & 0x3f] : '=';
        result += have > 2 ? alphabet[group & 0x3f] : '=';
    }
    return result;
}

std::string
SiftUtil::str_lower(std::string const& s)
{
    std::string result = s;
    for (auto& ch: result) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }
    return result;
}

std::string
SiftUtil::str_trim(std::string const& s)
{
    size_t first = 0;
    while (first < s.length() && QUtil::is_space(s.at(first))) {
        ++first;
    }
    size_t last = s.length();
    while (last > first && QUtil::is_space(s.at(last - 1))) {
        --last;
    }
    return s.substr(first, last - first);
}
