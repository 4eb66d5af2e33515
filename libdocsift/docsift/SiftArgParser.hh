#ifndef SIFTARGPARSER_HH
#define SIFTARGPARSER_HH

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

// This is a table-driven command-line parser. Options are given as --option or --option=value;
// a single leading dash is also accepted. Arguments that don't start with - are positional.
// Errors are reported by throwing SiftUsage.
class SiftArgParser
{
  public:
    // progname_env is the name of an environment variable that, when set, overrides the program
    // name shown in messages.
    SiftArgParser(int argc, char const* const argv[], char const* progname_env);

    // Parse the arguments, calling handlers as options are seen. Any final check handler is
    // called after the last argument.
    void parseArgs();

    std::string getProgname();

    typedef std::function<void()> bare_arg_handler_t;
    typedef std::function<void(std::string const&)> param_arg_handler_t;

    void addPositional(param_arg_handler_t);
    void addBare(std::string const& arg, bare_arg_handler_t);
    void addRequiredParameter(
        std::string const& arg, param_arg_handler_t, char const* parameter_name);
    // choices is a null-terminated array.
    void addChoices(std::string const& arg, param_arg_handler_t, char const** choices);
    void addFinalCheck(bare_arg_handler_t);

    template <class T>
    static bare_arg_handler_t
    bindBare(void (T::*f)(), T* o)
    {
        return std::bind(std::mem_fn(f), o);
    }
    template <class T>
    static param_arg_handler_t
    bindParam(void (T::*f)(std::string const&), T* o)
    {
        return std::bind(std::mem_fn(f), o, std::placeholders::_1);
    }

    // Throw SiftUsage with the given message.
    [[noreturn]] void usage(std::string const& message);

  private:
    struct OptionEntry
    {
        bool parameter_needed{false};
        std::string parameter_name;
        std::set<std::string> choices;
        bare_arg_handler_t bare_arg_handler{nullptr};
        param_arg_handler_t param_arg_handler{nullptr};
    };
    typedef std::map<std::string, OptionEntry> option_table_t;

    OptionEntry& registerArg(std::string const& arg);

    class Members
    {
        friend class SiftArgParser;

      public:
        ~Members() = default;

      private:
        Members(int argc, char const* const argv[], char const* progname_env);
        Members(Members const&) = delete;

        int argc;
        char const* const* argv;
        std::string whoami;
        option_table_t option_table;
        bare_arg_handler_t final_check_handler{nullptr};
    };
    std::shared_ptr<Members> m;
};

#endif // SIFTARGPARSER_HH
