#include <docsift/assert_test.h>

#include <docsift/ContentStreamLexer.hh>
#include <docsift/TextDecoder.hh>

#include <iostream>

static std::vector<std::string>
texts(std::string const& content)
{
    std::vector<std::string> result;
    for (auto const& token: ContentStreamLexer::tokenize(content)) {
        result.push_back(TextDecoder::decode(token.getBytes()));
    }
    return result;
}

static void
test_operators()
{
    auto tokens = ContentStreamLexer::tokenize(
        "BT /F1 12 Tf (one) Tj T* (two) ' 1 2 (three) \" [(fo) -120 (ur)] TJ ET");
    assert(tokens.size() == 4);
    assert(tokens.at(0).getOperator() == "Tj");
    assert(tokens.at(1).getOperator() == "'");
    assert(tokens.at(2).getOperator() == "\"");
    assert(tokens.at(3).getOperator() == "TJ");
    assert(tokens.at(3).getStrings().size() == 2);
    assert(tokens.at(3).getBytes() == "four");

    // Strings not followed by a text-showing operator are ignored.
    assert(texts("(dash) d (marked) BDC (x) Tj").size() == 1);
    assert(texts("").empty());
    assert(texts("q 1 0 0 1 0 0 cm Q").empty());
}

static void
test_literal_strings()
{
    auto t = texts("(a\\(b\\)c) Tj (nested (parens) ok) Tj (tab\\there) Tj (\\101\\102C) Tj");
    assert(t.size() == 4);
    assert(t.at(0) == "a(b)c");
    assert(t.at(1) == "nested (parens) ok");
    assert(t.at(2) == "tab\there");
    assert(t.at(3) == "ABC");

    // Line continuation
    assert(texts("(con\\\ntinued) Tj").at(0) == "continued");
    // Unterminated string at the end of the data
    assert(texts("(unterminated").empty());
}

static void
test_hex_strings()
{
    auto t = texts("<48656C6C6F> Tj <48 65 6c 6c 6f> Tj <414> Tj");
    assert(t.size() == 3);
    assert(t.at(0) == "Hello");
    assert(t.at(1) == "Hello");
    // An odd digit is padded with 0.
    assert(t.at(2) == "A@");

    // Dictionaries are not strings.
    assert(texts("/Span << /ActualText (x) >> BDC (y) Tj EMC") == std::vector<std::string>{"y"});
    // TJ arrays may mix hex and literal strings.
    assert(texts("[<4142> -300 (C)] TJ").at(0) == "ABC");
}

static void
test_comments_and_images()
{
    assert(texts("% (not text) Tj\n(text) Tj") == std::vector<std::string>{"text"});
    // Inline image data may contain anything, including string delimiters.
    auto t = texts("BI /W 2 /H 2 /BPC 8 /CS /G ID (x) Tj \xff( EI (after) Tj");
    assert(t == std::vector<std::string>{"after"});
    // A word that merely starts with EI doesn't end the image.
    t = texts("BI ID EIX (hidden) Tj EI (shown) Tj");
    assert(t == std::vector<std::string>{"shown"});
}

static void
test_decoder()
{
    // UTF-16 with either byte order mark
    assert(TextDecoder::decode(std::string("\xfe\xff\x00H\x00i", 6)) == "Hi");
    assert(TextDecoder::decode(std::string("\xff\xfeH\x00i\x00", 6)) == "Hi");
    assert(TextDecoder::decode(std::string("\xfe\xff\xd8\x3d\xde\x00", 6)) == "\xf0\x9f\x98\x80");
    // Valid UTF-8 is kept.
    assert(TextDecoder::decode("caf\xc3\xa9") == "caf\xc3\xa9");
    // Anything else is Latin-1.
    assert(TextDecoder::decode("caf\xe9") == "caf\xc3\xa9");
    assert(TextDecoder::latin1ToUTF8("\xa0\xff") == "\xc2\xa0\xc3\xbf");
    // Text that decodes to the replacement character is not clean.
    assert(!TextDecoder::isCleanUTF8("\xef\xbf\xbd"));
    assert(TextDecoder::isCleanUTF8(""));
    assert(TextDecoder::decode("") == "");
}

int
main()
{
    test_operators();
    test_literal_strings();
    test_hex_strings();
    test_comments_and_images();
    test_decoder();
    std::cout << "end of content lexer tests\n";
    return 0;
}
