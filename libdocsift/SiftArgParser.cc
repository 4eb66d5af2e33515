#include <docsift/SiftArgParser.hh>

#include <docsift/SiftExc.hh>

#include <qpdf/QUtil.hh>

#include <cstring>
#include <vector>

using namespace std::literals;

SiftArgParser::Members::Members(int argc, char const* const argv[], char const* progname_env) :
    argc(argc),
    argv(argv)
{
    std::string tmp(argv[0]);
    std::vector<char> buf(tmp.begin(), tmp.end());
    buf.push_back('\0');
    whoami = QUtil::getWhoami(buf.data());
    if (progname_env) {
        QUtil::get_env(progname_env, &whoami);
    }
}

SiftArgParser::SiftArgParser(int argc, char const* const argv[], char const* progname_env) :
    m(new Members(argc, argv, progname_env))
{
}

SiftArgParser::OptionEntry&
SiftArgParser::registerArg(std::string const& arg)
{
    if (m->option_table.count(arg)) {
        throw std::logic_error("SiftArgParser: adding a duplicate handler for option " + arg);
    }
    return m->option_table[arg];
}

void
SiftArgParser::addPositional(param_arg_handler_t handler)
{
    OptionEntry& oe = registerArg("");
    oe.param_arg_handler = handler;
}

void
SiftArgParser::addBare(std::string const& arg, bare_arg_handler_t handler)
{
    OptionEntry& oe = registerArg(arg);
    oe.parameter_needed = false;
    oe.bare_arg_handler = handler;
}

void
SiftArgParser::addRequiredParameter(
    std::string const& arg, param_arg_handler_t handler, char const* parameter_name)
{
    OptionEntry& oe = registerArg(arg);
    oe.parameter_needed = true;
    oe.parameter_name = parameter_name;
    oe.param_arg_handler = handler;
}

void
SiftArgParser::addChoices(std::string const& arg, param_arg_handler_t handler, char const** choices)
{
    OptionEntry& oe = registerArg(arg);
    oe.parameter_needed = true;
    oe.param_arg_handler = handler;
    for (char const** i = choices; *i; ++i) {
        oe.choices.insert(*i);
    }
}

void
SiftArgParser::addFinalCheck(bare_arg_handler_t handler)
{
    m->final_check_handler = handler;
}

void
SiftArgParser::usage(std::string const& message)
{
    throw SiftUsage(message);
}

std::string
SiftArgParser::getProgname()
{
    return m->whoami;
}

void
SiftArgParser::parseArgs()
{
    bool positional_only = false;
    for (int cur_arg = 1; cur_arg < m->argc; ++cur_arg) {
        auto oep = m->option_table.end();
        char const* arg = m->argv[cur_arg];
        std::string parameter;
        bool have_parameter = false;
        std::string o_arg(arg);
        std::string arg_s(arg);
        if ((!positional_only) && strcmp(arg, "--") == 0) {
            // Everything after -- is positional.
            positional_only = true;
            continue;
        } else if ((!positional_only) && (arg[0] == '-') && (strcmp(arg, "-") != 0)) {
            ++arg;
            if (arg[0] == '-') {
                // Be lax about -arg vs --arg
                ++arg;
            }

            // Search for = from after the first character so that --=something is not treated as
            // the empty positional key.
            arg_s = arg;
            size_t equal_pos = std::string::npos;
            if (!arg_s.empty()) {
                equal_pos = arg_s.find('=', 1);
            }
            if (equal_pos != std::string::npos) {
                have_parameter = true;
                parameter = arg_s.substr(equal_pos + 1);
                arg_s = arg_s.substr(0, equal_pos);
            }
            if (!(arg_s.empty() || (arg_s.at(0) == '-'))) {
                oep = m->option_table.find(arg_s);
            }
        } else {
            // The empty string maps to the positional argument handler.
            oep = m->option_table.find("");
            parameter = o_arg;
        }

        if (oep == m->option_table.end()) {
            usage("unrecognized argument " + o_arg);
        }

        OptionEntry& oe = oep->second;
        if ((oe.parameter_needed && !have_parameter) ||
            (!oe.choices.empty() && have_parameter && !oe.choices.count(parameter))) {
            std::string message = "--" + arg_s + " must be given as --" + arg_s + "=";
            if (!oe.choices.empty()) {
                message += "{";
                bool first = true;
                for (auto const& choice: oe.choices) {
                    if (first) {
                        first = false;
                    } else {
                        message += ",";
                    }
                    message += choice;
                }
                message += "}";
            } else if (!oe.parameter_name.empty()) {
                message += oe.parameter_name;
            } else {
                // should not be possible
                message += "option";
            }
            usage(message);
        }

        if (oe.bare_arg_handler) {
            if (have_parameter) {
                usage(
                    "--"s + arg_s + " does not take a parameter, but \"" + parameter +
                    "\" was given");
            }
            oe.bare_arg_handler();
        } else if (oe.param_arg_handler) {
            oe.param_arg_handler(parameter);
        }
    }
    if (m->final_check_handler != nullptr) {
        m->final_check_handler();
    }
}
