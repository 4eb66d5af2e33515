#include <docsift/assert_test.h>

#include <docsift/DocSiftJob.hh>
#include <docsift/RasterCodec.hh>
#include <docsift/SiftExc.hh>
#include <docsift/SiftUtil.hh>

#include <qpdf/JSON.hh>
#include <qpdf/Pl_String.hh>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace
{
    class FakeOcr: public OcrProvider
    {
      public:
        std::string
        recognize(std::string const&) override
        {
            return "text from image";
        }

        std::string
        getName() const override
        {
            return "fake";
        }
    };

    // A DocSiftJob whose output goes to strings
    struct Job
    {
        Job()
        {
            job.setLogger(QPDFLogger::create());
            job.setOutputStreams(&out, &err);
        }

        void
        init(std::vector<char const*> args)
        {
            args.insert(args.begin(), "docsift");
            args.push_back(nullptr);
            job.initializeFromArgv(args.data());
        }

        DocSiftJob job;
        std::ostringstream out;
        std::ostringstream err;
    };
} // namespace

static JSON
get_item(JSON const& j, std::string const& key)
{
    auto result = JSON::makeNull();
    j.forEachDictItem([&result, &key](std::string const& k, JSON value) {
        if (k == key) {
            result = value;
        }
    });
    return result;
}

static void
write_file(char const* filename, std::string const& data)
{
    std::ofstream f(filename, std::ios_base::out | std::ios_base::binary);
    f << data;
    f.close();
    assert(f);
}

static void
expect_usage(std::vector<char const*> args, std::string const& message)
{
    Job j;
    try {
        j.init(args);
        assert(false);
    } catch (SiftUsage& e) {
        if (message != e.what()) {
            std::cout << "got \"" << e.what() << "\"; wanted \"" << message << "\"\n";
            assert(false);
        }
    }
}

static void
test_arguments()
{
    expect_usage({}, "no input files given");
    expect_usage({"--text"}, "no input files given");
    expect_usage(
        {"--verbose", "--quiet", "a.pdf"}, "--verbose and --quiet may not be given together");
    std::string const bad_timeout = "--timeout must be given as a whole number of seconds";
    expect_usage({"--timeout=abc", "a.pdf"}, bad_timeout);
    expect_usage({"--timeout=-1", "a.pdf"}, bad_timeout);
    expect_usage({"--timeout=99999999999", "a.pdf"}, "--timeout is out of range");
    expect_usage({"--mime-type=pdf", "a.pdf"}, "--mime-type must be given as type/subtype");
    expect_usage(
        {"--ocr=magic", "a.pdf"}, "--ocr must be given as --ocr={auto,none,openai,tesseract}");
    expect_usage({"--output=", "a.pdf"}, "--output may not be empty");
    expect_usage({"--ocr-language=", "a.pdf"}, "--ocr-language may not be empty");
    expect_usage({"--pages=1", "a.pdf"}, "unrecognized argument --pages=1");

    Job j;
    j.init({"--text", "--ocr=none", "--timeout=5", "--mime-type=Text/CSV", "a.csv", "b.csv"});
    assert(j.job.createsOutput());
    assert(j.job.getMessagePrefix() == "docsift");
    assert(j.out.str().empty() && j.err.str().empty());

    // Running without files is a usage error even when the job was set up directly.
    DocSiftJob empty;
    empty.setLogger(QPDFLogger::create());
    try {
        empty.run();
        assert(false);
    } catch (SiftUsage& e) {
        assert(std::string(e.what()) == "no input files given");
    }
}

static void
test_help_and_version()
{
    Job help;
    help.init({"--help", "ignored.pdf"});
    assert(!help.job.createsOutput());
    assert(help.out.str().find("Usage: docsift [options] file...\n") == 0);
    assert(help.out.str().find("--ocr={none,auto,tesseract,openai}") != std::string::npos);
    // Nothing is read or written.
    help.job.run();
    assert(help.job.getResults().empty());

    Job version;
    version.init({"--version"});
    assert(!version.job.createsOutput());
    assert(version.out.str() == "docsift version " DOCSIFT_VERSION "\n");
}

static void
test_json_output()
{
    Job j;
    j.init({"--ocr=none", "job_test.csv", "job_test.html", "job_test_missing.pdf"});
    j.job.run();
    assert(j.job.getExitCode() == DocSiftJob::EXIT_WARNING);
    assert(j.job.getResults().size() == 3);
    assert(j.err.str().find("WARNING: open job_test_missing.pdf: ") == 0);

    auto const& text = j.out.str();
    std::string expected;
    Pl_String p("expected", nullptr, expected);
    BatchProcessor::getJSON(j.job.getResults()).write(&p);
    assert(text == expected + "\n");
    auto json = JSON::parse(text);
    std::vector<JSON> results;
    assert(get_item(json, "results").forEachArrayItem(
        [&results](JSON item) { results.push_back(item); }));
    assert(results.size() == 3);

    bool success = false;
    std::string value;
    assert(get_item(results.at(0), "success").getBool(success) && success);
    auto doc = get_item(results.at(0), "document");
    assert(get_item(doc, "mimeType").getString(value) && value == "text/csv");
    assert(get_item(doc, "fileName").getString(value) && value == "job_test.csv");

    assert(get_item(results.at(1), "success").getBool(success) && success);
    assert(
        get_item(get_item(results.at(1), "document"), "mimeType").getString(value) &&
        value == "text/html");

    assert(get_item(results.at(2), "success").getBool(success) && !success);
    assert(get_item(results.at(2), "fileName").getString(value));
    assert(value == "job_test_missing.pdf");
    assert(get_item(results.at(2), "error").getString(value));
    assert(value.find("open job_test_missing.pdf: ") == 0);

    // With every file extracted, the exit code is 0.
    Job good;
    good.init({"--ocr=none", "--quiet", "job_test.csv"});
    good.job.run();
    assert(good.job.getExitCode() == 0);
    assert(good.err.str().empty());
}

static void
test_text_output()
{
    Job j;
    j.init({"--text", "--ocr=none", "job_test.csv", "job_test.html", "job_test_missing.pdf"});
    j.job.run();
    auto text = j.out.str();
    auto expected_start = "== job_test.csv ==\n"
                          "[table] | a | b | | --- | --- | | 1 | 2 |\n"
                          "\n"
                          "== job_test.html ==\n"
                          "[paragraph] Hello world\n"
                          "\n"
                          "== job_test_missing.pdf ==\n"
                          "error: open job_test_missing.pdf: ";
    if (text.find(expected_start) != 0) {
        std::cout << "unexpected text output:\n" << text;
        assert(false);
    }

    // A media type given on the command line applies to every file.
    Job forced;
    forced.init({"--text", "--ocr=none", "--mime-type=text/html", "job_test.csv"});
    forced.job.run();
    assert(forced.out.str() == "== job_test.csv ==\n[paragraph] a,b 1,2\n");
}

static void
test_output_file_and_ocr()
{
    std::remove("job_test_out.json");
    Job j;
    j.init({"--verbose", "--output=job_test_out.json", "job_test.png"});
    int providers = 0;
    j.job.setOcrProviderFactory([&providers]() {
        ++providers;
        return std::make_shared<FakeOcr>();
    });
    j.job.run();
    assert(j.job.getExitCode() == 0);
    assert(j.out.str().empty());
    auto err = j.err.str();
    assert(err.find("docsift: using OCR provider fake\n") != std::string::npos);
    assert(err.find("docsift: wrote job_test_out.json\n") != std::string::npos);

    auto json = JSON::parse(SiftUtil::read_file_into_string("job_test_out.json"));
    std::string text;
    get_item(json, "results").forEachArrayItem([&text](JSON result) {
        get_item(get_item(result, "document"), "chunks").forEachArrayItem(
            [&text](JSON chunk) { assert(get_item(chunk, "text").getString(text)); });
    });
    assert(text == "text from image");
    assert(providers == 1);
    std::remove("job_test_out.json");

    // Each file gets a new provider.
    Job two;
    two.init({"--quiet", "job_test.png", "job_test.png"});
    providers = 0;
    two.job.setOcrProviderFactory([&providers]() {
        ++providers;
        return std::make_shared<FakeOcr>();
    });
    two.job.run();
    assert(two.job.getResults().size() == 2);
    assert(providers == 2);

    Job bad;
    bad.init({"--ocr=none", "--output=no-such-dir/out.json", "job_test.csv"});
    try {
        bad.job.run();
        assert(false);
    } catch (SiftExc& e) {
        assert(e.getErrorCode() == docsift_e_system);
    }
}

int
main()
{
    unsetenv("DOCSIFT_EXECUTABLE");
    write_file("job_test.csv", "a,b\n1,2\n");
    write_file("job_test.html", "<html><body><p>Hello <b>world</b></p></body></html>");
    Raster raster;
    raster.width = 2;
    raster.height = 2;
    raster.channels = 1;
    raster.pixels = std::string("\x00\x80\x80\xff", 4);
    write_file("job_test.png", RasterCodec::encodePNG(raster));
    std::remove("job_test_missing.pdf");

    test_arguments();
    test_help_and_version();
    test_json_output();
    test_text_output();
    test_output_file_and_ocr();

    std::remove("job_test.csv");
    std::remove("job_test.html");
    std::remove("job_test.png");
    std::cout << "end of docsift job tests\n";
    return 0;
}
