#include <docsift/Normalizer.hh>

#include <docsift/SiftUtil.hh>

static bool
at(std::string const& s, size_t pos, char const* seq, size_t len)
{
    return s.compare(pos, len, seq, len) == 0;
}

static std::string
collapse_blank_lines(std::string const& s)
{
    std::string result;
    result.reserve(s.size());
    size_t run = 0;
    for (auto ch: s) {
        if (ch == '\n') {
            if (++run > 2) {
                continue;
            }
        } else {
            run = 0;
        }
        result += ch;
    }
    return result;
}

std::string
Normalizer::normalizeText(std::string const& text)
{
    std::string s;
    s.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char ch = text.at(i);
        if (ch == '\0' || ch == '\f') {
            continue;
        }
        if (at(text, i, "\xc2\xa0", 2)) {
            s += ' ';
            i += 1;
        } else if (
            at(text, i, "\xe2\x80\x8b", 3) || at(text, i, "\xe2\x80\x8c", 3) ||
            at(text, i, "\xe2\x80\x8d", 3) || at(text, i, "\xef\xbb\xbf", 3)) {
            s += ' ';
            i += 2;
        } else {
            s += ch;
        }
    }

    // A lone newline is a line wrap, not a paragraph break.
    for (size_t i = 1; i + 1 < s.size(); ++i) {
        if (s.at(i) == '\n' && s.at(i - 1) != '\n' && s.at(i + 1) != '\n') {
            s.at(i) = ' ';
        }
    }
    s = collapse_blank_lines(s);

    std::string collapsed;
    collapsed.reserve(s.size());
    for (auto ch: s) {
        bool blank = (ch == ' ' || ch == '\t');
        if (blank) {
            if (!collapsed.empty() && collapsed.back() == ' ') {
                continue;
            }
            ch = ' ';
        }
        collapsed += ch;
    }

    std::string result;
    result.reserve(collapsed.size());
    size_t start = 0;
    while (true) {
        auto end = collapsed.find('\n', start);
        auto line = collapsed.substr(start, end == std::string::npos ? end : end - start);
        auto first = line.find_first_not_of(" \t\r");
        if (first != std::string::npos) {
            result += line.substr(first, line.find_last_not_of(" \t\r") - first + 1);
        }
        if (end == std::string::npos) {
            break;
        }
        result += '\n';
        start = end + 1;
    }
    // Trimming lines can leave newlines adjacent that were separated by white space.
    return collapse_blank_lines(SiftUtil::str_trim(result));
}

std::vector<ContentChunk>
Normalizer::normalizeChunks(std::vector<ContentChunk> const& chunks)
{
    std::vector<ContentChunk> result;
    result.reserve(chunks.size());
    for (auto const& chunk: chunks) {
        auto text = normalizeText(chunk.text);
        if (text.empty()) {
            continue;
        }
        result.push_back(chunk);
        result.back().text = text;
        result.back().id = SiftUtil::random_uuid();
    }
    return result;
}

ExtractedDocument
Normalizer::normalizeDocument(ExtractedDocument const& doc)
{
    ExtractedDocument result = doc;
    if (result.documentId.empty()) {
        result.documentId = SiftUtil::random_uuid();
    }
    result.chunks = normalizeChunks(doc.chunks);
    return result;
}
