#include <spdf/SPDFConfigFile.hh>

#include <spdf/SPDFExc.hh>
#include <spdf/SUtil.hh>

#include <cctype>
#include <functional>
#include <stdexcept>

namespace
{
    using setter_t = std::function<void(SPDFRunConfig::Builder&, std::string const&)>;

    struct Key
    {
        char const* name;
        char const* default_value;
        char const* description;
        setter_t setter;
    };

    class BadValue: public std::runtime_error
    {
      public:
        BadValue(std::string const& msg) :
            std::runtime_error(msg)
        {
        }
    };

    bool
    parse_yes_no(std::string const& value)
    {
        auto v = SUtil::str_tolower(value);
        if (v == "yes") {
            return true;
        }
        if (v == "no") {
            return false;
        }
        throw BadValue("expected yes or no, found \"" + value + "\"");
    }

    int
    parse_timeout(std::string const& value)
    {
        if (!SUtil::is_number(value.c_str())) {
            throw BadValue("expected a number of seconds, found \"" + value + "\"");
        }
        int seconds = SUtil::string_to_int(value.c_str());
        if (seconds <= 0) {
            throw BadValue("timeout must be greater than 0");
        }
        return seconds;
    }

    spdf_encryption_strength_e
    parse_strength(std::string const& value)
    {
        if (value == "40") {
            return spdf_bits_40;
        }
        if (value == "128") {
            return spdf_bits_128;
        }
        if (value == "256") {
            return spdf_bits_256;
        }
        throw BadValue("expected 40, 128, or 256, found \"" + value + "\"");
    }

    spdf_quality_e
    parse_quality(std::string const& value)
    {
        std::string v = value;
        if (!v.empty() && (v.at(0) == '/')) {
            v = v.substr(1);
        }
        for (auto q:
             {spdf_quality_screen, spdf_quality_ebook, spdf_quality_printer, spdf_quality_prepress}) {
            if (v == SPDFRunConfig::qualityName(q)) {
                return q;
            }
        }
        throw BadValue("expected /screen, /ebook, /printer, or /prepress, found \"" + value + "\"");
    }

    std::vector<Key> const&
    keys()
    {
        using B = SPDFRunConfig::Builder;
        static std::vector<Key> const result{
            {"INPUT_DIR",
             "./input",
             "Directory that is searched recursively for PDFs to sanitize",
             [](B& b, std::string const& v) { b.inputDir(v); }},
            {"OUTPUT_DIR",
             "./output",
             "Directory that receives the sanitized PDFs",
             [](B& b, std::string const& v) { b.outputDir(v); }},
            {"ATTACHMENT_DIR",
             "",
             "Directory to move extracted attachments to (default: none)\n"
             "  If empty, attachments are deleted (see DELETE_ATTACHMENTS) or\n"
             "  left in <output name>_attachments next to the output",
             [](B& b, std::string const& v) { b.attachmentDir(v); }},
            {"RELOCK_CLEANED",
             "no",
             "Re-encrypt sanitized PDFs with the password used to unlock them (yes/no)",
             [](B& b, std::string const& v) { b.relock(parse_yes_no(v)); }},
            {"LOG_FILE",
             "spdf.log",
             "File that every action, warning, and error is appended to",
             [](B& b, std::string const& v) { b.logFile(v); }},
            {"FILE_PATTERN",
             "*.pdf",
             "Only process files whose name matches this shell pattern",
             [](B& b, std::string const& v) { b.filePattern(v); }},
            {"PASSWORD_TIMEOUT",
             "120",
             "Seconds to wait for a password before skipping an encrypted PDF",
             [](B& b, std::string const& v) { b.passwordTimeout(parse_timeout(v)); }},
            {"DRY_RUN",
             "no",
             "Only report what would be done without changing anything (yes/no)",
             [](B& b, std::string const& v) { b.dryRun(parse_yes_no(v)); }},
            {"OUTPUT_PREFIX",
             "sanitized_",
             "Prefix for output file names in batch mode",
             [](B& b, std::string const& v) { b.outputPrefix(v); }},
            {"MIRROR_DIR_STRUCTURE",
             "no",
             "Reproduce the input subdirectories below OUTPUT_DIR (yes/no)",
             [](B& b, std::string const& v) { b.mirrorDirStructure(parse_yes_no(v)); }},
            {"ENCRYPTION_STRENGTH",
             "256",
             "Key length for relocking: 40, 128, or 256",
             [](B& b, std::string const& v) { b.encryptionStrength(parse_strength(v)); }},
            {"EXIFTOOL_ARGS",
             "-all=",
             "Arguments passed to exiftool to scrub metadata\n"
             "  Example: \"-all= -XMP:Author= -XMP:Creator=\"",
             [](B& b, std::string const& v) { b.exiftoolArgs(SUtil::split_words(v)); }},
            {"DELETE_ATTACHMENTS",
             "no",
             "Delete extracted attachments when ATTACHMENT_DIR is not set (yes/no)",
             [](B& b, std::string const& v) { b.deleteAttachments(parse_yes_no(v)); }},
            {"GS_QUALITY",
             "/prepress",
             "Ghostscript quality setting\n"
             "  /screen    - lowest quality, smallest file size\n"
             "  /ebook     - medium quality, smaller file size\n"
             "  /printer   - high quality, larger file size\n"
             "  /prepress  - highest quality, largest file size",
             [](B& b, std::string const& v) { b.quality(parse_quality(v)); }},
            {"CLI_OVERRIDE",
             "no",
             "Accept an input and output file on the command line (yes/no)\n"
             "  yes  - spdf INPUT OUTPUT processes exactly that file\n"
             "  no   - command-line files are ignored and batch mode is used",
             [](B& b, std::string const& v) { b.cliOverride(parse_yes_no(v)); }},
            {"LINEARIZE",
             "no",
             "Restructure each PDF with qpdf --linearize before the other stages (yes/no)",
             [](B& b, std::string const& v) { b.linearize(parse_yes_no(v)); }},
            {"SAVE_STEP_FILES",
             "yes",
             "Keep a copy of the document after each of the first three stages\n"
             "  as <output name>_step<N>.pdf (yes/no)",
             [](B& b, std::string const& v) { b.saveStepFiles(parse_yes_no(v)); }},
            {"WORK_DIR",
             "",
             "Directory for temporary files (default: the system temporary directory)",
             [](B& b, std::string const& v) { b.workDir(v); }},
            {"QPDF",
             "qpdf",
             "Program used for unlocking, linearizing, and relocking",
             [](B& b, std::string const& v) { b.qpdfProgram(v); }},
            {"PDFDETACH",
             "pdfdetach",
             "Program used to extract attachments",
             [](B& b, std::string const& v) { b.pdfdetachProgram(v); }},
            {"EXIFTOOL",
             "exiftool",
             "Program used to scrub metadata",
             [](B& b, std::string const& v) { b.exiftoolProgram(v); }},
            {"GHOSTSCRIPT",
             "gs",
             "Program used to rewrite the document",
             [](B& b, std::string const& v) { b.ghostscriptProgram(v); }},
        };
        return result;
    }

    Key const*
    find_key(std::string const& name)
    {
        for (auto const& k: keys()) {
            if (name == k.name) {
                return &k;
            }
        }
        return nullptr;
    }

    bool
    valid_key_name(std::string const& name)
    {
        if (name.empty() || isdigit(static_cast<unsigned char>(name.at(0)))) {
            return false;
        }
        for (char ch: name) {
            if (!(isalnum(static_cast<unsigned char>(ch)) || (ch == '_'))) {
                return false;
            }
        }
        return true;
    }

    // Returns an error message, or the empty string on success.
    std::string
    parse_value(std::string const& text, std::string& value)
    {
        value.clear();
        size_t pos = 0;
        while ((pos < text.length()) && isspace(static_cast<unsigned char>(text.at(pos)))) {
            ++pos;
        }
        if (pos == text.length()) {
            return "";
        }
        char quote = text.at(pos);
        if ((quote == '"') || (quote == '\'')) {
            ++pos;
            bool closed = false;
            while (pos < text.length()) {
                char ch = text.at(pos++);
                if (ch == quote) {
                    closed = true;
                    break;
                }
                if ((quote == '"') && (ch == '\\') && (pos < text.length()) &&
                    ((text.at(pos) == '"') || (text.at(pos) == '\\'))) {
                    ch = text.at(pos++);
                }
                value.append(1, ch);
            }
            if (!closed) {
                return "missing closing quote";
            }
        } else {
            while ((pos < text.length()) && !isspace(static_cast<unsigned char>(text.at(pos)))) {
                value.append(1, text.at(pos++));
            }
        }
        auto rest = SUtil::trim(text.substr(pos));
        if (!(rest.empty() || (rest.at(0) == '#'))) {
            return "unexpected text after value: " + rest;
        }
        return "";
    }
} // namespace

void
SPDFConfigFile::parseLines(
    std::string const& filename,
    std::list<std::string> const& lines,
    SPDFRunConfig::Builder& builder,
    SPDFLogger& logger)
{
    int lineno = 0;
    for (auto const& raw: lines) {
        ++lineno;
        auto where = filename + ":" + std::to_string(lineno);
        auto line = SUtil::trim(raw);
        if (line.empty() || (line.at(0) == '#')) {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw SPDFExc(spdf_e_bootstrap, where, "expected KEY=VALUE");
        }
        auto name = SUtil::trim(line.substr(0, eq));
        if (!valid_key_name(name)) {
            throw SPDFExc(spdf_e_bootstrap, where, "invalid key \"" + name + "\"");
        }
        std::string value;
        auto err = parse_value(line.substr(eq + 1), value);
        if (!err.empty()) {
            throw SPDFExc(spdf_e_bootstrap, where, name + ": " + err);
        }
        auto key = find_key(name);
        if (key == nullptr) {
            logger.warn(where + ": unknown configuration key " + name + " ignored");
            continue;
        }
        if (value.empty()) {
            value = key->default_value;
        }
        try {
            key->setter(builder, value);
        } catch (BadValue& e) {
            throw SPDFExc(spdf_e_bootstrap, where, name + ": " + e.what());
        }
    }
}

SPDFRunConfig
SPDFConfigFile::resolve(
    std::string const& config_path,
    std::vector<std::string> const& positionals,
    std::shared_ptr<SPDFLogger> logger)
{
    if (!SUtil::file_exists(config_path)) {
        try {
            auto dir = SUtil::path_dirname(config_path);
            if (!dir.empty()) {
                SUtil::make_directories(dir);
            }
            SUtil::write_file(config_path.c_str(), defaultContents());
        } catch (std::runtime_error& e) {
            throw SPDFExc(
                spdf_e_bootstrap,
                config_path,
                std::string("unable to create default configuration: ") + e.what());
        }
        logger->info("Created default config file at " + config_path);
    }

    std::list<std::string> lines;
    try {
        lines = SUtil::read_lines_from_file(config_path.c_str());
    } catch (std::runtime_error& e) {
        throw SPDFExc(
            spdf_e_bootstrap, config_path, std::string("unable to read configuration: ") + e.what());
    }

    SPDFRunConfig::Builder builder;
    parseLines(config_path, lines, builder, *logger);
    auto config = builder.build();

    if (positionals.empty()) {
        return config;
    }
    if (!config.getCliOverride()) {
        logger->warn(
            "command-line files ignored because CLI_OVERRIDE is not enabled in " + config_path +
            "; running in batch mode");
        return config;
    }
    if (positionals.size() != 2) {
        logger->warn(
            "expected an input and an output file on the command line, found " +
            std::to_string(positionals.size()) + " arguments; running in batch mode");
        return config;
    }
    return SPDFRunConfig::Builder(config)
        .explicitPair(positionals.at(0), positionals.at(1))
        .build();
}

std::string
SPDFConfigFile::defaultContents()
{
    std::string result =
        "# spdf configuration\n"
        "#\n"
        "# One KEY=VALUE assignment per line. An empty value selects the\n"
        "# default shown here. Quote values that contain spaces.\n";
    for (auto const& k: keys()) {
        result += "\n";
        std::string description = k.description;
        std::string prefix = std::string("# ") + k.name + ": ";
        size_t start = 0;
        while (start <= description.length()) {
            auto nl = description.find('\n', start);
            if (nl == std::string::npos) {
                nl = description.length();
            }
            result += prefix + description.substr(start, nl - start) + "\n";
            prefix = "# ";
            start = nl + 1;
        }
        result += std::string(k.name) + "=\"" + k.default_value + "\"\n";
    }
    return result;
}

std::string
SPDFConfigFile::defaultPath(char const* argv0)
{
    return SUtil::path_join(SUtil::path_dirname(argv0 ? argv0 : ""), "spdf.conf");
}
