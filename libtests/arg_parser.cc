#include <docsift/assert_test.h>

#include <docsift/SiftArgParser.hh>
#include <docsift/SiftExc.hh>

#include <iostream>
#include <stdexcept>
#include <vector>

class ArgParser
{
  public:
    ArgParser(std::vector<char const*> args);
    void parseArgs();

    std::vector<std::string> output;

  private:
    void handlePotato();
    void handleSalad(std::string const& p);
    void handleOink(std::string const& p);
    void handlePositional(std::string const& p);
    void finalChecks();

    void initOptions();

    std::vector<char const*> argv;
    SiftArgParser ap;
};

static std::vector<char const*>
null_terminated(std::vector<char const*> args)
{
    args.push_back(nullptr);
    return args;
}

ArgParser::ArgParser(std::vector<char const*> args) :
    argv(null_terminated(args)),
    ap(static_cast<int>(args.size()), argv.data(), "TEST_ARG_PARSER")
{
    initOptions();
}

void
ArgParser::initOptions()
{
    auto b = [this](void (ArgParser::*f)()) { return SiftArgParser::bindBare(f, this); };
    auto p = [this](void (ArgParser::*f)(std::string const&)) {
        return SiftArgParser::bindParam(f, this);
    };

    ap.addBare("potato", b(&ArgParser::handlePotato));
    ap.addRequiredParameter("salad", p(&ArgParser::handleSalad), "tossed");
    char const* choices[] = {"pig", "boar", "sow", nullptr};
    ap.addChoices("oink", p(&ArgParser::handleOink), choices);
    ap.addBare("version", [this]() { output.emplace_back("3.14159"); });
    ap.addPositional(p(&ArgParser::handlePositional));
    ap.addFinalCheck(b(&ArgParser::finalChecks));
}

void
ArgParser::handlePotato()
{
    output.emplace_back("got potato");
}

void
ArgParser::handleSalad(std::string const& p)
{
    output.push_back("got salad=" + p);
}

void
ArgParser::handleOink(std::string const& p)
{
    output.push_back("got oink=" + p);
}

void
ArgParser::handlePositional(std::string const& p)
{
    output.push_back("positional " + p);
}

void
ArgParser::finalChecks()
{
    output.emplace_back("total arguments: " + std::to_string(output.size()));
}

void
ArgParser::parseArgs()
{
    ap.parseArgs();
}

static std::vector<std::string>
parse(std::vector<char const*> args)
{
    ArgParser ap(args);
    ap.parseArgs();
    return ap.output;
}

static void
expect_usage(std::vector<char const*> args, std::string const& message)
{
    try {
        parse(args);
        assert(false);
    } catch (SiftUsage& e) {
        if (message != e.what()) {
            std::cout << "got \"" << e.what() << "\"; wanted \"" << message << "\"\n";
            assert(false);
        }
    }
}

static void
test_options()
{
    auto out =
        parse({"test", "--potato", "-salad=green", "file.pdf", "--oink=sow", "-", "--version"});
    assert(
        (out ==
         std::vector<std::string>{
             "got potato",
             "got salad=green",
             "positional file.pdf",
             "got oink=sow",
             "positional -",
             "3.14159",
             "total arguments: 6"}));

    // After --, everything is positional.
    out = parse({"test", "--", "--potato", "--"});
    assert(
        (out ==
         std::vector<std::string>{
             "positional --potato", "positional --", "total arguments: 2"}));

    // Only the first = separates the parameter.
    out = parse({"test", "--salad=a=b", "--salad="});
    assert(out.at(0) == "got salad=a=b" && out.at(1) == "got salad=");

    // The final check runs even without arguments.
    assert((parse({"test"}) == std::vector<std::string>{"total arguments: 0"}));
}

static void
test_errors()
{
    expect_usage({"test", "--tomato"}, "unrecognized argument --tomato");
    expect_usage({"test", "---potato"}, "unrecognized argument ---potato");
    expect_usage({"test", "--=x"}, "unrecognized argument --=x");
    expect_usage({"test", "--salad"}, "--salad must be given as --salad=tossed");
    expect_usage({"test", "--oink"}, "--oink must be given as --oink={boar,pig,sow}");
    expect_usage({"test", "--oink=cow"}, "--oink must be given as --oink={boar,pig,sow}");
    expect_usage(
        {"test", "--potato=baked"}, "--potato does not take a parameter, but \"baked\" was given");
}

static void
test_registration()
{
    char const* argv[] = {"test", nullptr};
    SiftArgParser ap(1, argv, nullptr);
    assert(ap.getProgname() == "test");
    ap.addBare("x", []() {});
    try {
        ap.addBare("x", []() {});
        assert(false);
    } catch (std::logic_error& e) {
        assert(std::string(e.what()) == "SiftArgParser: adding a duplicate handler for option x");
    }

    char const* argv2[] = {"/usr/local/bin/docsift", nullptr};
    SiftArgParser ap2(1, argv2, nullptr);
    assert(ap2.getProgname() == "docsift");
}

int
main()
{
    test_options();
    test_errors();
    test_registration();
    std::cout << "end of arg parser tests\n";
    return 0;
}
