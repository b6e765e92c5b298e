#include <spdf/SPDFArgParser.hh>

#include <spdf/SPDFLogger.hh>
#include <spdf/SPDFUsage.hh>
#include <spdf/SUtil.hh>

#include <cstdlib>
#include <stdexcept>

SPDFArgParser::Members::Members(int argc, char const* const argv[]) :
    argc(argc),
    argv(argv)
{
    std::string tmp = argv[0];
    whoami = SUtil::getWhoami(tmp.data());
}

SPDFArgParser::SPDFArgParser(int argc, char const* const argv[]) :
    m(new Members(argc, argv))
{
}

std::string
SPDFArgParser::getProgname()
{
    return m->whoami;
}

void
SPDFArgParser::usage(std::string const& message)
{
    throw SPDFUsage(message);
}

SPDFArgParser::OptionEntry&
SPDFArgParser::newOption(std::map<std::string, OptionEntry>& table, std::string const& arg)
{
    if (arg.empty() || (arg == "help") || m->options.contains(arg) ||
        m->sole_options.contains(arg)) {
        throw std::logic_error("SPDFArgParser: can't add a handler for option \"" + arg + "\"");
    }
    return table[arg];
}

void
SPDFArgParser::addPositional(param_arg_handler_t handler)
{
    m->positional = handler;
}

void
SPDFArgParser::addBare(std::string const& arg, bare_arg_handler_t handler)
{
    newOption(m->options, arg).bare_handler = handler;
}

void
SPDFArgParser::addRequiredParameter(
    std::string const& arg, param_arg_handler_t handler, char const* parameter_name)
{
    auto& oe = newOption(m->options, arg);
    oe.parameter_name = parameter_name;
    oe.param_handler = handler;
}

void
SPDFArgParser::addSoleBare(std::string const& arg, bare_arg_handler_t handler)
{
    newOption(m->sole_options, arg).bare_handler = handler;
}

void
SPDFArgParser::handleSole(std::string const& name, std::string const& value, bool have_value)
{
    if (name == "help") {
        if (have_value && value.empty()) {
            usage("unknown help option");
        }
        auto out = SPDFLogger::defaultLogger()->getInfo();
        out->writeString(getHelp(value));
        out->finish();
    } else {
        if (have_value) {
            usage("--" + name + " does not take a parameter, but \"" + value + "\" was given");
        }
        m->sole_options[name].bare_handler();
    }
    exit(0);
}

void
SPDFArgParser::parseArgs()
{
    for (int i = 1; i < m->argc; ++i) {
        std::string arg = m->argv[i];
        if ((arg.length() < 2) || (arg.at(0) != '-')) {
            if (!m->positional) {
                usage("unrecognized argument " + arg);
            }
            m->positional(arg);
            continue;
        }

        // Be lax about -opt vs --opt.
        std::string name = arg.substr((arg.at(1) == '-') ? 2 : 1);
        std::string value;
        bool have_value = false;
        // "=" as the first character doesn't end the option name, so
        // --=x is an unknown option rather than a nameless one.
        auto eq = name.find('=', 1);
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.erase(eq);
            have_value = true;
        }
        if (name.empty() || (name.at(0) == '-')) {
            usage("unrecognized argument " + arg);
        }

        if ((m->argc == 2) && ((name == "help") || m->sole_options.contains(name))) {
            handleSole(name, value, have_value);
        }
        auto oe = m->options.find(name);
        if (oe == m->options.end()) {
            usage("unrecognized argument " + arg);
        }
        auto const& entry = oe->second;
        if (entry.bare_handler) {
            if (have_value) {
                usage("--" + name + " does not take a parameter, but \"" + value + "\" was given");
            }
            entry.bare_handler();
        } else {
            if (!have_value) {
                usage("--" + name + " must be given as --" + name + "=" + entry.parameter_name);
            }
            entry.param_handler(value);
        }
    }
}

void
SPDFArgParser::addHelpFooter(std::string const& text)
{
    m->footer = "\n" + text;
}

void
SPDFArgParser::addHelpTopic(
    std::string const& topic, std::string const& short_text, std::string const& long_text)
{
    if (topic.empty() || (topic == "all") || (topic.at(0) == '-')) {
        throw std::logic_error("SPDFArgParser: invalid help topic \"" + topic + "\"");
    }
    if (!m->topics.insert({topic, HelpEntry{short_text, long_text, {}}}).second) {
        throw std::logic_error("SPDFArgParser: topic " + topic + " has already been added");
    }
}

void
SPDFArgParser::addOptionHelp(
    std::string const& option_name,
    std::string const& topic,
    std::string const& short_text,
    std::string const& long_text)
{
    if ((option_name.length() < 3) || (option_name.compare(0, 2, "--") != 0)) {
        throw std::logic_error("SPDFArgParser: options for help must start with --");
    }
    auto t = m->topics.find(topic);
    if (t == m->topics.end()) {
        throw std::logic_error(
            "SPDFArgParser: unable to add option " + option_name + " to unknown help topic " +
            topic);
    }
    if (!m->option_help.insert({option_name, HelpEntry{short_text, long_text, {}}}).second) {
        throw std::logic_error("SPDFArgParser: option " + option_name + " already has help");
    }
    t->second.options.insert(option_name);
}

std::string
SPDFArgParser::describe(HelpEntry const& entry)
{
    std::string result = entry.long_text.empty() ? (entry.short_text + "\n") : entry.long_text;
    if (!entry.options.empty()) {
        result += "\nRelated options:\n";
        for (auto const& o: entry.options) {
            result += "  " + o + ": " + m->option_help[o].short_text + "\n";
        }
    }
    return result;
}

std::string
SPDFArgParser::getHelp(std::string const& topic_or_option)
{
    auto const& w = m->whoami;
    std::string top = "Run \"" + w + " --help=topic\" for help on a topic.\n" + "Run \"" + w +
        " --help=--option\" for help on an option.\n" + "Run \"" + w +
        " --help=all\" to see all available help.\n\nTopics:\n";
    for (auto const& t: m->topics) {
        top += "  " + t.first + ": " + t.second.short_text + "\n";
    }

    std::string result;
    if (topic_or_option.empty()) {
        result = top;
    } else if (topic_or_option == "all") {
        result = top;
        for (auto const* table: {&m->topics, &m->option_help}) {
            for (auto const& e: *table) {
                result += "\n== " + e.first + " (" + e.second.short_text + ") ==\n\n" +
                    describe(e.second);
            }
        }
        result += "\n====\n";
    } else if (m->topics.contains(topic_or_option)) {
        result = describe(m->topics[topic_or_option]);
    } else if (m->option_help.contains(topic_or_option)) {
        result = describe(m->option_help[topic_or_option]);
    } else {
        usage("unknown help option " + topic_or_option);
    }
    return result + m->footer;
}
