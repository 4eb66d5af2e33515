#include <docsift/assert_test.h>

#include <docsift/SiftExc.hh>
#include <docsift/SiftUtil.hh>

#include <iostream>

static void
test_unicode()
{
    assert(SiftUtil::utf16_length("") == 0);
    assert(SiftUtil::utf16_length("caf\xc3\xa9") == 4);
    // Characters outside the basic multilingual plane take a surrogate pair.
    assert(SiftUtil::utf16_length("a\xf0\x9f\xa5\x94") == 3);
    // truncated sequence
    assert(SiftUtil::utf16_length("a\xe2\x82") == 2);

    assert(SiftUtil::has_lower_case("Heading"));
    assert(!SiftUtil::has_lower_case("HEADING 12"));
    assert(!SiftUtil::has_lower_case(""));
    // Latin-1: e acute, sharp s
    assert(SiftUtil::has_lower_case("CAF\xc3\xa9"));
    assert(!SiftUtil::has_lower_case("CAF\xc3\x89"));
    assert(SiftUtil::has_lower_case("STRA\xc3\x9f" "E"));
    // Cyrillic
    assert(SiftUtil::has_lower_case("\xd0\xbf\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82"));
    assert(!SiftUtil::has_lower_case("\xd0\x9f\xd0\xa0\xd0\x98\xd0\x92\xd0\x95\xd0\xa2"));
    // Greek alpha and capital alpha
    assert(SiftUtil::has_lower_case("\xce\xb1"));
    assert(!SiftUtil::has_lower_case("\xce\x91"));
    // Armenian small ayb
    assert(SiftUtil::has_lower_case("\xd5\xa1"));
    // Scripts without case
    assert(!SiftUtil::has_lower_case("\xe4\xb8\xad\xe6\x96\x87"));
    assert(!SiftUtil::has_lower_case("\xd8\xb9\xd8\xb1\xd8\xa8\xd9\x8a"));
    // invalid UTF-8 is ignored
    assert(!SiftUtil::has_lower_case("A\xff" "B"));
}

static void
test_strings()
{
    assert(SiftUtil::str_lower("Text/HTML \xc3\x89") == "text/html \xc3\x89");
    assert(SiftUtil::str_trim(" \t\r\n\f\vx y\n ") == "x y");
    assert(SiftUtil::str_trim(" \n ").empty());

    assert(SiftUtil::base64_encode("").empty());
    assert(SiftUtil::base64_encode("f") == "Zg==");
    assert(SiftUtil::base64_encode("fo") == "Zm8=");
    assert(SiftUtil::base64_encode("foobar") == "Zm9vYmFy");
    assert(SiftUtil::base64_encode(std::string("\x00\xff\xfe", 3)) == "AP/+");
}

static void
test_system()
{
    try {
        SiftUtil::read_file_into_string("util-test-no-such-file");
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_system);
        assert(e.getFilename() == "util-test-no-such-file");
        assert(e.getMessageDetail().find("open util-test-no-such-file: ") == 0);
    }

    auto uuid = SiftUtil::random_uuid();
    assert(uuid.size() == 36);
    assert(uuid.at(8) == '-' && uuid.at(13) == '-' && uuid.at(18) == '-' && uuid.at(23) == '-');
    assert(uuid.at(14) == '4');
    assert(std::string("89ab").find(uuid.at(19)) != std::string::npos);
    assert(SiftUtil::str_lower(uuid) == uuid);
    assert(SiftUtil::random_uuid() != uuid);
}

int
main()
{
    test_unicode();
    test_strings();
    test_system();
    std::cout << "end of util tests\n";
    return 0;
}
