#include <spdf/SPDFJob.hh>

#include <spdf/SPDFArgParser.hh>
#include <spdf/SPDFConfigFile.hh>
#include <spdf/SPDFLogger.hh>

#include <memory>

namespace
{
    class ArgParser
    {
      public:
        ArgParser(SPDFArgParser& ap, SPDFJob& job);
        void parseOptions();

      private:
        void argPositional(std::string const&);
        void argConfig(std::string const&);
        void argVersion();

        void initOptionTables();
        void addHelp();

        SPDFArgParser& ap;
        SPDFJob& job;
    };
} // namespace

ArgParser::ArgParser(SPDFArgParser& ap, SPDFJob& job) :
    ap(ap),
    job(job)
{
    initOptionTables();
}

void
ArgParser::initOptionTables()
{
    ap.addSoleBare("version", [this]() { argVersion(); });
    ap.addPositional([this](std::string const& arg) { argPositional(arg); });
    ap.addRequiredParameter("config", [this](std::string const& arg) { argConfig(arg); }, "file");
    addHelp();
}

void
ArgParser::addHelp()
{
    ap.addHelpFooter("The configuration file documents every setting.\n");
    ap.addHelpTopic(
        "usage",
        "basic invocation",
        "Usage: spdf [--config=file] [input-file output-file]\n"
        "\n"
        "Sanitize PDF files by running them through a fixed sequence of\n"
        "external tools: qpdf to unlock (and optionally linearize),\n"
        "pdfdetach to extract attachments, exiftool to strip metadata,\n"
        "and Ghostscript to rewrite the document. Encrypted files are\n"
        "unlocked with a password read from standard input and can be\n"
        "locked again afterwards.\n"
        "\n"
        "Without file arguments, every file below INPUT_DIR that matches\n"
        "FILE_PATTERN is processed. An input and an output file may be\n"
        "given instead when the configuration sets CLI_OVERRIDE=yes.\n"
        "\n"
        "Exit status: 0 if no file failed, 2 for usage, configuration,\n"
        "or discovery errors, 3 if at least one file failed.\n");
    ap.addHelpTopic(
        "configuration",
        "the configuration file",
        "Settings are read from a file of KEY=VALUE lines, by default\n"
        "spdf.conf in the directory that contains the spdf executable.\n"
        "If the file doesn't exist, it is created with every setting at\n"
        "its default value and a short description of each.\n");
    ap.addOptionHelp(
        "--config",
        "configuration",
        "read settings from the given file",
        "--config=file\n"
        "\n"
        "Read settings from the given file instead of spdf.conf next to\n"
        "the executable. The file is created with default settings if it\n"
        "doesn't exist.\n");
    ap.addHelpTopic(
        "help", "information about spdf", "Help options are only valid as the sole argument.\n");
    ap.addOptionHelp(
        "--help",
        "help",
        "show help",
        "--help[=topic|--option|all]\n"
        "\n"
        "Show help on a topic or option, or all help with --help=all.\n");
    ap.addOptionHelp("--version", "help", "show the version of spdf", "");
}

void
ArgParser::parseOptions()
{
    ap.parseArgs();
}

void
ArgParser::argPositional(std::string const& arg)
{
    job.addPositional(arg);
}

void
ArgParser::argConfig(std::string const& arg)
{
    if (arg.empty()) {
        ap.usage("--config requires a file name");
    }
    job.setConfigFile(arg);
}

void
ArgParser::argVersion()
{
    auto out = SPDFLogger::defaultLogger()->getInfo();
    *out << ap.getProgname() << " version " << SPDF_VERSION << "\n";
    out->finish();
}

void
SPDFJob::initializeFromArgv(char const* const argv[])
{
    int argc = 0;
    for (auto k = argv; *k; ++k) {
        ++argc;
    }
    SPDFArgParser sap(argc, argv);
    setConfigFile(SPDFConfigFile::defaultPath(argv[0]));
    ArgParser ap(sap, *this);
    ap.parseOptions();
}
