#ifndef SPDFARGPARSER_HH
#define SPDFARGPARSER_HH

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

// Command-line parser for spdf. It knows about options written as
// --opt or --opt=value (one leading dash works too), positional
// arguments, and options such as --help and --version that may only
// appear on their own. Problems are reported by throwing SPDFUsage.
class SPDFArgParser
{
  public:
    typedef std::function<void()> bare_arg_handler_t;
    typedef std::function<void(std::string const&)> param_arg_handler_t;

    SPDFArgParser(int argc, char const* const argv[]);

    // Call the handler for each argument in order. When the only
    // argument is --help or an option added with addSoleBare, the
    // program exits with status 0 after handling it.
    void parseArgs();

    // The last path element of argv[0]
    std::string getProgname();

    void addPositional(param_arg_handler_t);
    void addBare(std::string const& arg, bare_arg_handler_t);
    void
    addRequiredParameter(std::string const& arg, param_arg_handler_t, char const* parameter_name);
    void addSoleBare(std::string const& arg, bare_arg_handler_t);

    // --help lists the topics, --help=topic and --help=--option show
    // one entry, and --help=all shows everything. Short texts are one
    // line with no newline. Long texts and the footer end with a
    // newline. The footer is appended to all help after a blank line.
    void addHelpFooter(std::string const&);
    void addHelpTopic(
        std::string const& topic, std::string const& short_text, std::string const& long_text);
    void addOptionHelp(
        std::string const& option_name,
        std::string const& topic,
        std::string const& short_text,
        std::string const& long_text);

    // Empty means the topic list. Throws SPDFUsage for unknown names.
    std::string getHelp(std::string const& topic_or_option);

    void usage(std::string const& message);

  private:
    struct OptionEntry
    {
        std::string parameter_name;
        bare_arg_handler_t bare_handler;
        param_arg_handler_t param_handler;
    };

    struct HelpEntry
    {
        std::string short_text;
        std::string long_text;
        std::set<std::string> options;
    };

    OptionEntry& newOption(std::map<std::string, OptionEntry>&, std::string const& arg);
    void handleSole(std::string const& name, std::string const& value, bool have_value);
    std::string describe(HelpEntry const&);

    class Members
    {
        friend class SPDFArgParser;

      public:
        ~Members() = default;

      private:
        Members(int argc, char const* const argv[]);
        Members(Members const&) = delete;

        int argc;
        char const* const* argv;
        std::string whoami;
        std::map<std::string, OptionEntry> options;
        std::map<std::string, OptionEntry> sole_options;
        param_arg_handler_t positional;
        std::map<std::string, HelpEntry> topics;
        std::map<std::string, HelpEntry> option_help;
        std::string footer;
    };
    std::shared_ptr<Members> m;
};

#endif // SPDFARGPARSER_HH
