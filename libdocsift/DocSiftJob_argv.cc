#include <docsift/DocSiftJob.hh>

#include <docsift/SiftArgParser.hh>
#include <docsift/SiftExc.hh>
#include <docsift/SiftUtil.hh>

#include <qpdf/QUtil.hh>

namespace
{
    class ArgParser
    {
      public:
        ArgParser(SiftArgParser& ap, DocSiftJob& job);
        void parseOptions();

      private:
        void argPositional(std::string const&);
        void argHelp();
        void argVersion();
        void argJson();
        void argText();
        void argMimeType(std::string const&);
        void argOcr(std::string const&);
        void argOcrLanguage(std::string const&);
        void argTimeout(std::string const&);
        void argOutput(std::string const&);
        void argVerbose();
        void argQuiet();
        void finalChecks();

        void initOptionTables();

        SiftArgParser ap;
        DocSiftJob& job;
        bool gave_input{false};
        bool exiting{false};
        bool verbose{false};
        bool quiet{false};
    };
} // namespace

ArgParser::ArgParser(SiftArgParser& ap, DocSiftJob& job) :
    ap(ap),
    job(job)
{
    initOptionTables();
}

void
ArgParser::initOptionTables()
{
    auto b = [this](void (ArgParser::*f)()) { return SiftArgParser::bindBare(f, this); };
    auto p = [this](void (ArgParser::*f)(std::string const&)) {
        return SiftArgParser::bindParam(f, this);
    };

    ap.addPositional(p(&ArgParser::argPositional));
    ap.addBare("help", b(&ArgParser::argHelp));
    ap.addBare("version", b(&ArgParser::argVersion));
    ap.addBare("json", b(&ArgParser::argJson));
    ap.addBare("text", b(&ArgParser::argText));
    ap.addRequiredParameter("mime-type", p(&ArgParser::argMimeType), "type");
    char const* ocr_choices[] = {"none", "auto", "tesseract", "openai", nullptr};
    ap.addChoices("ocr", p(&ArgParser::argOcr), ocr_choices);
    ap.addRequiredParameter("ocr-language", p(&ArgParser::argOcrLanguage), "language");
    ap.addRequiredParameter("timeout", p(&ArgParser::argTimeout), "seconds");
    ap.addRequiredParameter("output", p(&ArgParser::argOutput), "file");
    ap.addBare("verbose", b(&ArgParser::argVerbose));
    ap.addBare("quiet", b(&ArgParser::argQuiet));
    ap.addFinalCheck(b(&ArgParser::finalChecks));
}

void
ArgParser::argPositional(std::string const& arg)
{
    job.addFile(arg);
    gave_input = true;
}

void
ArgParser::argHelp()
{
    *job.getLogger()->getInfo() << DocSiftJob::usageText(ap.getProgname());
    exiting = true;
}

void
ArgParser::argVersion()
{
    *job.getLogger()->getInfo() << ap.getProgname() << " version " << DOCSIFT_VERSION << "\n";
    exiting = true;
}

void
ArgParser::argJson()
{
    job.setTextOutput(false);
}

void
ArgParser::argText()
{
    job.setTextOutput(true);
}

void
ArgParser::argMimeType(std::string const& parameter)
{
    if (parameter.empty() || parameter.find('/') == std::string::npos) {
        ap.usage("--mime-type must be given as type/subtype");
    }
    job.setMimeType(SiftUtil::str_lower(parameter));
}

void
ArgParser::argOcr(std::string const& parameter)
{
    job.setOcr(parameter);
}

void
ArgParser::argOcrLanguage(std::string const& parameter)
{
    if (parameter.empty()) {
        ap.usage("--ocr-language may not be empty");
    }
    job.setOcrLanguage(parameter);
}

void
ArgParser::argTimeout(std::string const& parameter)
{
    if (parameter.empty() ||
        parameter.find_first_not_of("0123456789") != std::string::npos) {
        ap.usage("--timeout must be given as a whole number of seconds");
    }
    int seconds = 0;
    try {
        seconds = QUtil::string_to_int(parameter.c_str());
    } catch (std::range_error&) {
        ap.usage("--timeout is out of range");
    }
    job.setTimeout(seconds);
}

void
ArgParser::argOutput(std::string const& parameter)
{
    if (parameter.empty()) {
        ap.usage("--output may not be empty");
    }
    job.setOutputFile(parameter);
}

void
ArgParser::argVerbose()
{
    verbose = true;
    job.setVerbose(true);
}

void
ArgParser::argQuiet()
{
    quiet = true;
    job.setQuiet(true);
}

void
ArgParser::finalChecks()
{
    if (exiting) {
        return;
    }
    if (verbose && quiet) {
        ap.usage("--verbose and --quiet may not be given together");
    }
    if (!gave_input) {
        ap.usage("no input files given");
    }
}

void
ArgParser::parseOptions()
{
    ap.parseArgs();
    if (exiting) {
        job.setExiting();
    }
}

std::string
DocSiftJob::usageText(std::string const& whoami)
{
    return "Usage: " + whoami +
        " [options] file...\n"
        "\n"
        "Extract text from PDF, CSV, HTML and image files.\n"
        "\n"
        "Options:\n"
        "  --json                 write results as JSON (default)\n"
        "  --text                 write results as plain text\n"
        "  --mime-type=TYPE       treat every file as TYPE instead of using its extension\n"
        "  --ocr={none,auto,tesseract,openai}\n"
        "                         how to read images (default auto)\n"
        "  --ocr-language=LANG    tesseract language (default eng)\n"
        "  --timeout=SECONDS      time limit for the whole batch; 0 for none (default 60)\n"
        "  --output=FILE          write results to FILE instead of standard output\n"
        "  --verbose              show progress messages on standard error\n"
        "  --quiet                suppress warnings\n"
        "  --version              show version\n"
        "  --help                 show this help\n"
        "\n"
        "Environment: OPENAI_API_KEY enables the vision OCR provider; OPENAI_BASE_URL and\n"
        "DOCSIFT_OCR_MODEL select its endpoint and model.\n"
        "\n"
        "Exit status is 0 when all files were extracted, 3 when some failed, and 2 on error.\n";
}

void
DocSiftJob::initializeFromArgv(char const* const argv[], char const* progname_env)
{
    if (progname_env == nullptr) {
        progname_env = "DOCSIFT_EXECUTABLE";
    }
    int argc = 0;
    for (auto k = argv; *k; ++k) {
        ++argc;
    }
    SiftArgParser sap(argc, argv, progname_env);
    m->message_prefix = sap.getProgname();
    ArgParser ap(sap, *this);
    ap.parseOptions();
}
