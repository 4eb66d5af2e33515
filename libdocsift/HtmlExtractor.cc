#include <docsift/HtmlExtractor.hh>

#include <docsift/TextDecoder.hh>

#include <qpdf/QUtil.hh>

#include <cctype>
#include <set>

static bool
is_html_space(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

static bool
is_block_tag(std::string const& name)
{
    static std::set<std::string> const block_tags = {
        "p",      "div",    "br",   "hr",    "section",    "article", "header",
        "footer", "main",   "nav",  "aside", "blockquote", "pre",     "table",
        "tr",     "ul",     "ol",   "dl",    "dt",         "dd",      "figcaption",
        "figure", "h1",     "h2",   "h3",    "h4",         "h5",      "h6"};
    return block_tags.count(name) > 0;
}

// Elements whose content is not text
static bool
is_skipped_element(std::string const& name)
{
    return name == "script" || name == "style" || name == "noscript" || name == "svg";
}

// Find needle in s at or after pos, ignoring ASCII case. needle must be lower case.
static size_t
find_lower(std::string const& s, std::string const& needle, size_t pos)
{
    for (; pos + needle.size() <= s.size(); ++pos) {
        size_t i = 0;
        while (i < needle.size() &&
               tolower(static_cast<unsigned char>(s.at(pos + i))) == needle.at(i)) {
            ++i;
        }
        if (i == needle.size()) {
            return pos;
        }
    }
    return std::string::npos;
}

// Collapse runs of white space to one space and trim.
static std::string
collapse_space(std::string const& s)
{
    std::string result;
    bool pending_space = false;
    for (auto ch: s) {
        if (is_html_space(ch)) {
            pending_space = !result.empty();
        } else {
            if (pending_space) {
                result += ' ';
                pending_space = false;
            }
            result += ch;
        }
    }
    return result;
}

static std::string
decode_entities(std::string const& s)
{
    std::string result;
    size_t pos = 0;
    while (pos < s.size()) {
        if (!(s.at(pos) == '&' && HtmlExtractor::decodeEntity(s, pos, result))) {
            result += s.at(pos++);
        }
    }
    return result;
}

std::string
HtmlExtractor::getName() const
{
    return "HtmlExtractor";
}

bool
HtmlExtractor::supports(std::string const& media_type) const
{
    return media_type == "text/html" || media_type == "application/xhtml+xml";
}

bool
HtmlExtractor::decodeEntity(std::string const& html, size_t& pos, std::string& result)
{
    auto semi = html.find(';', pos);
    if (semi == std::string::npos || semi - pos > 10) {
        return false;
    }
    auto name = html.substr(pos + 1, semi - pos - 1);
    std::string text;
    if (name == "amp") {
        text = "&";
    } else if (name == "lt") {
        text = "<";
    } else if (name == "gt") {
        text = ">";
    } else if (name == "quot") {
        text = "\"";
    } else if (name == "nbsp") {
        text = " ";
    } else if (name.size() > 1 && name.at(0) == '#') {
        bool hex = (name.at(1) == 'x' || name.at(1) == 'X');
        auto digits = name.substr(hex ? 2 : 1);
        if (digits.empty()) {
            return false;
        }
        unsigned long code = 0;
        for (auto ch: digits) {
            auto uch = static_cast<unsigned char>(ch);
            if (!(hex ? isxdigit(uch) : isdigit(uch))) {
                return false;
            }
            code = code * (hex ? 16 : 10) +
                static_cast<unsigned long>(isdigit(uch) ? uch - '0' : tolower(uch) - 'a' + 10);
            if (code > 0x10ffff) {
                return false;
            }
        }
        if (code == 0 || (code >= 0xd800 && code <= 0xdfff)) {
            return false;
        }
        text = QUtil::toUTF8(code);
    } else {
        return false;
    }
    result += text;
    pos = semi + 1;
    return true;
}

std::string
HtmlExtractor::stripTags(std::string const& html, std::string* title)
{
    std::string result;
    bool have_title = false;
    size_t pos = 0;
    while (pos < html.size()) {
        char ch = html.at(pos);
        if (ch == '&') {
            if (!decodeEntity(html, pos, result)) {
                result += ch;
                ++pos;
            }
            continue;
        }
        if (ch != '<') {
            result += ch;
            ++pos;
            continue;
        }
        if (html.compare(pos, 4, "<!--") == 0) {
            auto end = html.find("-->", pos + 4);
            pos = (end == std::string::npos) ? html.size() : end + 3;
            continue;
        }
        auto end = html.find('>', pos + 1);
        if (end == std::string::npos) {
            // A '<' that doesn't start a tag is text.
            result += ch;
            ++pos;
            continue;
        }

        size_t p = pos + 1;
        bool closing = false;
        if (p < end && html.at(p) == '/') {
            closing = true;
            ++p;
        }
        std::string name;
        while (p < end && isalnum(static_cast<unsigned char>(html.at(p)))) {
            name += static_cast<char>(tolower(static_cast<unsigned char>(html.at(p))));
            ++p;
        }
        pos = end + 1;

        if (!closing && is_skipped_element(name)) {
            auto close = find_lower(html, "</" + name, pos);
            if (close != std::string::npos) {
                auto close_end = html.find('>', close);
                pos = (close_end == std::string::npos) ? html.size() : close_end + 1;
                continue;
            }
        }
        if (!closing && name == "title" && !have_title) {
            auto close = find_lower(html, "</title", pos);
            if (close != std::string::npos) {
                have_title = true;
                if (title) {
                    *title = collapse_space(decode_entities(html.substr(pos, close - pos)));
                }
            }
        }
        result += is_block_tag(name) ? '\n' : ' ';
    }
    return result;
}

ExtractedDocument
HtmlExtractor::extract(std::string const& data, std::string const& file_name)
{
    std::string title;
    auto text = stripTags(TextDecoder::decode(data), &title);

    auto doc = ExtractedDocument::create(file_name, "text/html");
    auto add = [&doc](std::string const& piece) {
        auto paragraph = collapse_space(piece);
        if (!paragraph.empty()) {
            doc.chunks.emplace_back(dc_paragraph, paragraph);
        }
    };
    // Paragraphs are separated by lines with nothing but white space.
    size_t start = 0;
    size_t pos = 0;
    while ((pos = text.find('\n', pos)) != std::string::npos) {
        size_t next = pos + 1;
        while (next < text.size() && text.at(next) != '\n' && is_html_space(text.at(next))) {
            ++next;
        }
        if (next < text.size() && text.at(next) == '\n') {
            add(text.substr(start, pos - start));
            start = pos = next + 1;
        } else {
            pos = next;
        }
    }
    add(text.substr(start));

    if (!title.empty()) {
        doc.metadata.addDictionaryMember("title", JSON::makeString(title));
    }
    return doc;
}
