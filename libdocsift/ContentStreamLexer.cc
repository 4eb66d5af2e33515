#include <docsift/ContentStreamLexer.hh>

#include <docsift/Util.hh>

#include <cstring>

using namespace docsift;

std::string
ContentStreamLexer::Token::getBytes() const
{
    std::string result;
    for (auto const& s: strings) {
        result += s;
    }
    return result;
}

ContentStreamLexer::ContentStreamLexer(std::string const& data) :
    data(data)
{
}

std::vector<ContentStreamLexer::Token>
ContentStreamLexer::tokenize(std::string const& data)
{
    std::vector<Token> result;
    ContentStreamLexer lexer(data);
    Token token;
    while (lexer.nextToken(token)) {
        result.push_back(token);
    }
    return result;
}

bool
ContentStreamLexer::atEnd() const
{
    return pos >= data.length();
}

bool
ContentStreamLexer::atWord(char const* word) const
{
    // True if word starts at pos and is delimited on both sides.
    size_t len = strlen(word);
    if (data.compare(pos, len, word) != 0) {
        return false;
    }
    if (pos > 0 && !util::is_pdf_space(data.at(pos - 1)) && !util::is_delimiter(data.at(pos - 1))) {
        return false;
    }
    return (pos + len >= data.length()) || util::is_pdf_space(data.at(pos + len)) ||
        util::is_delimiter(data.at(pos + len));
}

void
ContentStreamLexer::skipSpace()
{
    while (!atEnd() && util::is_pdf_space(data.at(pos))) {
        ++pos;
    }
}

void
ContentStreamLexer::skipComment()
{
    while (!atEnd() && data.at(pos) != '\r' && data.at(pos) != '\n') {
        ++pos;
    }
}

void
ContentStreamLexer::skipInlineImageData()
{
    // Positioned at ID. The binary data ends at the first EI surrounded by white space or a
    // delimiter.
    pos += 2;
    while (!atEnd()) {
        if (data.at(pos) == 'E' && atWord("EI")) {
            pos += 2;
            return;
        }
        ++pos;
    }
}

bool
ContentStreamLexer::nextToken(Token& token)
{
    while (!atEnd()) {
        char ch = data.at(pos);
        if (ch == '%') {
            skipComment();
        } else if (
            ch == '(' || (ch == '<' && (pos + 1 >= data.length() || data.at(pos + 1) != '<'))) {
            std::string s = (ch == '(') ? readLiteralString() : readHexString();
            std::string op = readOperator();
            if (op == "Tj" || op == "'" || op == "\"") {
                token = Token(op, {s});
                return true;
            }
        } else if (ch == '<') {
            // dictionary open
            pos += 2;
        } else if (ch == '[') {
            auto items = readArray();
            std::string op = readOperator();
            if (op == "TJ") {
                token = Token(op, items);
                return true;
            }
        } else if (ch == 'I' && atWord("ID")) {
            skipInlineImageData();
        } else {
            ++pos;
        }
    }
    return false;
}

std::string
ContentStreamLexer::readLiteralString()
{
    // Positioned at the opening parenthesis.
    ++pos;
    std::string result;
    int depth = 1;
    while (!atEnd()) {
        char ch = data.at(pos++);
        if (ch == '\\') {
            if (atEnd()) {
                break;
            }
            char esc = data.at(pos++);
            switch (esc) {
            case 'n':
                result += '\n';
                break;
            case 'r':
                result += '\r';
                break;
            case 't':
                result += '\t';
                break;
            case 'b':
                result += '\b';
                break;
            case 'f':
                result += '\f';
                break;
            case '\r':
                // line continuation
                if (!atEnd() && data.at(pos) == '\n') {
                    ++pos;
                }
                break;
            case '\n':
                break;
            default:
                if (util::is_octal_digit(esc)) {
                    int value = esc - '0';
                    for (int i = 1; i < 3 && !atEnd() && util::is_octal_digit(data.at(pos)); ++i) {
                        value = (value << 3) + (data.at(pos++) - '0');
                    }
                    result += static_cast<char>(value & 0xff);
                } else {
                    // Includes \( \) and \\.
                    result += esc;
                }
                break;
            }
        } else if (ch == '(') {
            ++depth;
            result += ch;
        } else if (ch == ')') {
            if (--depth == 0) {
                break;
            }
            result += ch;
        } else {
            result += ch;
        }
    }
    return result;
}

std::string
ContentStreamLexer::readHexString()
{
    // Positioned at <.
    ++pos;
    std::string digits;
    while (!atEnd()) {
        char ch = data.at(pos++);
        if (ch == '>') {
            break;
        }
        if (util::is_hex_digit(ch)) {
            digits += ch;
        }
    }
    if (digits.length() % 2 == 1) {
        digits += '0';
    }
    std::string result;
    for (size_t i = 0; i < digits.length(); i += 2) {
        result += static_cast<char>(
            (util::hex_decode_char(digits.at(i)) << 4) + util::hex_decode_char(digits.at(i + 1)));
    }
    return result;
}

std::vector<std::string>
ContentStreamLexer::readArray()
{
    // Positioned at [. Only the strings are kept; nested arrays are scanned through.
    ++pos;
    std::vector<std::string> result;
    int depth = 1;
    while (!atEnd() && depth > 0) {
        char ch = data.at(pos);
        if (ch == '(') {
            result.push_back(readLiteralString());
        } else if (ch == '<') {
            if (pos + 1 < data.length() && data.at(pos + 1) == '<') {
                pos += 2;
            } else {
                result.push_back(readHexString());
            }
        } else if (ch == '%') {
            skipComment();
        } else {
            if (ch == '[') {
                ++depth;
            } else if (ch == ']') {
                --depth;
            }
            ++pos;
        }
    }
    return result;
}

std::string
ContentStreamLexer::readOperator()
{
    skipSpace();
    if (atEnd()) {
        return "";
    }
    char ch = data.at(pos);
    if (ch == '\'' || ch == '"') {
        ++pos;
        return std::string(1, ch);
    }
    size_t start = pos;
    while (!atEnd() && util::is_alpha(data.at(pos))) {
        ++pos;
    }
    return data.substr(start, pos - start);
}
