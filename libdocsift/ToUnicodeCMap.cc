#include <docsift/ToUnicodeCMap.hh>

#include <docsift/TextDecoder.hh>

#include <qpdf/BufferInputSource.hh>
#include <qpdf/QPDFTokenizer.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <vector>

using tt = QPDFTokenizer;

namespace
{
    // Ranges larger than this are almost certainly damage.
    size_t const max_range = 0x10000;
} // namespace

static unsigned long
code_value(std::string const& code)
{
    unsigned long result = 0;
    for (char ch: code) {
        result = (result << 8) + static_cast<unsigned char>(ch);
    }
    return result;
}

static std::string
code_string(unsigned long value, size_t length)
{
    std::string result(length, '\0');
    for (size_t i = length; i > 0; --i) {
        result.at(i - 1) = static_cast<char>(value & 0xff);
        value >>= 8;
    }
    return result;
}

ToUnicodeCMap::ToUnicodeCMap(std::string const& data)
{
    BufferInputSource input("ToUnicode CMap", data);
    QPDFTokenizer tokenizer;
    tokenizer.allowEOF();

    enum { st_top, st_codespace, st_bfchar, st_bfrange } state = st_top;
    std::vector<std::string> operands;
    bool in_array = false;
    std::vector<std::string> array;

    while (true) {
        auto token = tokenizer.readToken(input, "ToUnicode CMap", true);
        auto type = token.getType();
        if (type == tt::tt_eof) {
            break;
        }
        if (type == tt::tt_array_open) {
            in_array = true;
            array.clear();
            continue;
        }
        if (type == tt::tt_array_close) {
            in_array = false;
            // A destination array for bfrange: one destination per code
            if (state == st_bfrange && operands.size() == 2) {
                auto lo = code_value(operands.at(0));
                auto hi = code_value(operands.at(1));
                for (size_t i = 0; i < array.size() && lo + i <= hi; ++i) {
                    mappings[code_string(lo + i, operands.at(0).length())] = array.at(i);
                }
            }
            operands.clear();
            continue;
        }
        if (type == tt::tt_string) {
            if (in_array) {
                array.push_back(token.getValue());
                continue;
            }
            operands.push_back(token.getValue());
            if (state == st_codespace && operands.size() == 2) {
                if (code_length == 0) {
                    code_length = operands.at(0).length();
                }
                operands.clear();
            } else if (state == st_bfchar && operands.size() == 2) {
                mappings[operands.at(0)] = operands.at(1);
                operands.clear();
            } else if (state == st_bfrange && operands.size() == 3) {
                addRange(operands.at(0), operands.at(1), operands.at(2));
                operands.clear();
            }
            continue;
        }
        if (type == tt::tt_word) {
            auto const& word = token.getValue();
            if (word == "begincodespacerange") {
                state = st_codespace;
            } else if (word == "beginbfchar") {
                state = st_bfchar;
            } else if (word == "beginbfrange") {
                state = st_bfrange;
            } else if (
                word == "endcodespacerange" || word == "endbfchar" || word == "endbfrange") {
                state = st_top;
            }
            operands.clear();
            continue;
        }
        if (!in_array) {
            operands.clear();
        }
    }

    if (code_length == 0 && !mappings.empty()) {
        code_length = mappings.begin()->first.length();
    }
    if (code_length != 1 && code_length != 2) {
        code_length = (code_length == 0 ? 1 : 2);
    }
}

void
ToUnicodeCMap::addRange(std::string const& lo, std::string const& hi, std::string const& dst)
{
    if (lo.empty() || lo.length() != hi.length() || dst.empty()) {
        return;
    }
    auto lo_value = code_value(lo);
    auto hi_value = code_value(hi);
    if (hi_value < lo_value || hi_value - lo_value >= max_range) {
        return;
    }
    // The last byte of the destination is incremented for each code.
    std::string target = dst;
    for (auto code = lo_value; code <= hi_value; ++code) {
        mappings[code_string(code, lo.length())] = target;
        auto& last = target.back();
        last = static_cast<char>(static_cast<unsigned char>(last) + 1);
    }
}

std::string
ToUnicodeCMap::decode(std::string const& bytes) const
{
    std::string result;
    size_t pos = 0;
    while (pos < bytes.length()) {
        size_t len = std::min(code_length, bytes.length() - pos);
        std::string code = bytes.substr(pos, len);
        pos += len;
        auto iter = mappings.find(code);
        if (iter != mappings.end()) {
            result += QUtil::utf16_to_utf8(iter->second);
        } else if (len == 1) {
            result += TextDecoder::latin1ToUTF8(code);
        }
    }
    return result;
}
