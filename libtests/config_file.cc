#include <spdf/assert_test.h>

#include <spdf/Pl_String.hh>
#include <spdf/SPDFConfigFile.hh>
#include <spdf/SPDFExc.hh>
#include <spdf/SUtil.hh>

#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace
{
    // A logger whose output is collected in strings
    struct TestLogger
    {
        TestLogger() :
            logger(SPDFLogger::create())
        {
            logger->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
            logger->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
        }

        std::shared_ptr<SPDFLogger> logger;
        std::string info;
        std::string errors;
    };
} // namespace

static SPDFRunConfig
parse(std::list<std::string> const& lines, TestLogger& t)
{
    SPDFRunConfig::Builder b;
    SPDFConfigFile::parseLines("test.conf", lines, b, *t.logger);
    return b.build();
}

static std::string
parse_error(std::list<std::string> const& lines)
{
    TestLogger t;
    try {
        parse(lines, t);
    } catch (SPDFExc& e) {
        assert(e.getErrorCode() == spdf_e_bootstrap);
        return e.what();
    }
    return "";
}

static void
test_defaults()
{
    SPDFRunConfig c;
    assert(c.getInputDir() == "./input");
    assert(c.getOutputDir() == "./output");
    assert(c.getAttachmentDir().empty());
    assert(!c.getRelock());
    assert(c.getLogFile() == "spdf.log");
    assert(c.getFilePattern() == "*.pdf");
    assert(c.getPasswordTimeout() == 120);
    assert(!c.getDryRun());
    assert(c.getOutputPrefix() == "sanitized_");
    assert(!c.getMirrorDirStructure());
    assert(c.getEncryptionStrength() == spdf_bits_256);
    assert(c.getExiftoolArgs().size() == 1);
    assert(c.getExiftoolArgs().at(0) == "-all=");
    assert(!c.getDeleteAttachments());
    assert(c.getQuality() == spdf_quality_prepress);
    assert(!c.getCliOverride());
    assert(!c.getLinearize());
    assert(c.getSaveStepFiles());
    assert(c.getWorkDir() == SUtil::temp_directory());
    assert(c.getQpdfProgram() == "qpdf");
    assert(c.getGhostscriptProgram() == "gs");
    assert(!c.hasExplicitPair());
}

static void
test_parse_values()
{
    TestLogger t;
    auto c = parse(
        {"# comment",
         "",
         "  INPUT_DIR = \"/data/in box\"  # trailing comment",
         "OUTPUT_DIR=/data/out",
         "ATTACHMENT_DIR='/data/attach'",
         "RELOCK_CLEANED=YES",
         "FILE_PATTERN=\"report_*.pdf\"",
         "PASSWORD_TIMEOUT=5",
         "DRY_RUN=yes",
         "OUTPUT_PREFIX=\"\"",
         "MIRROR_DIR_STRUCTURE=yes",
         "ENCRYPTION_STRENGTH=128",
         "EXIFTOOL_ARGS=\"-all= -XMP:Author= -overwrite_original\"",
         "DELETE_ATTACHMENTS=yes",
         "GS_QUALITY=ebook",
         "CLI_OVERRIDE=yes",
         "LINEARIZE=yes",
         "SAVE_STEP_FILES=no",
         "WORK_DIR=/var/tmp/spdf",
         "QPDF=/opt/qpdf/bin/qpdf",
         "LOG_FILE=\"say \\\"hi\\\" \\\\ there\""},
        t);
    assert(c.getInputDir() == "/data/in box");
    assert(c.getOutputDir() == "/data/out");
    assert(c.getAttachmentDir() == "/data/attach");
    assert(c.getRelock());
    assert(c.getFilePattern() == "report_*.pdf");
    assert(c.getPasswordTimeout() == 5);
    assert(c.getDryRun());
    // An empty value selects the default.
    assert(c.getOutputPrefix() == "sanitized_");
    assert(c.getMirrorDirStructure());
    assert(c.getEncryptionStrength() == spdf_bits_128);
    assert(c.getExiftoolArgs().size() == 3);
    assert(c.getExiftoolArgs().at(2) == "-overwrite_original");
    assert(c.getDeleteAttachments());
    assert(c.getQuality() == spdf_quality_ebook);
    assert(c.getCliOverride());
    assert(c.getLinearize());
    assert(!c.getSaveStepFiles());
    assert(c.getWorkDir() == "/var/tmp/spdf");
    assert(c.getQpdfProgram() == "/opt/qpdf/bin/qpdf");
    assert(c.getLogFile() == "say \"hi\" \\ there");
    assert(t.errors.empty());
}

static void
test_unknown_key()
{
    TestLogger t;
    auto c = parse({"COLOR=blue", "OUTPUT_DIR=out"}, t);
    assert(c.getOutputDir() == "out");
    assert(t.errors.find("WARNING: test.conf:1: unknown configuration key COLOR ignored\n") !=
           std::string::npos);
}

static void
test_errors()
{
    assert(parse_error({"INPUT_DIR"}) == "test.conf:1: expected KEY=VALUE");
    assert(parse_error({"", "1KEY=x"}) == "test.conf:2: invalid key \"1KEY\"");
    assert(parse_error({"=x"}) == "test.conf:1: invalid key \"\"");
    assert(
        parse_error({"INPUT_DIR=\"abc"}) == "test.conf:1: INPUT_DIR: missing closing quote");
    assert(
        parse_error({"INPUT_DIR=a b"}) ==
        "test.conf:1: INPUT_DIR: unexpected text after value: b");
    assert(
        parse_error({"DRY_RUN=maybe"}) ==
        "test.conf:1: DRY_RUN: expected yes or no, found \"maybe\"");
    assert(
        parse_error({"PASSWORD_TIMEOUT=0"}) ==
        "test.conf:1: PASSWORD_TIMEOUT: timeout must be greater than 0");
    assert(
        parse_error({"PASSWORD_TIMEOUT=soon"}) ==
        "test.conf:1: PASSWORD_TIMEOUT: expected a number of seconds, found \"soon\"");
    assert(
        parse_error({"ENCRYPTION_STRENGTH=64"}) ==
        "test.conf:1: ENCRYPTION_STRENGTH: expected 40, 128, or 256, found \"64\"");
    assert(
        parse_error({"GS_QUALITY=/best"}) ==
        "test.conf:1: GS_QUALITY: expected /screen, /ebook, /printer, or /prepress, "
        "found \"/best\"");
}

static void
test_default_contents_round_trip()
{
    auto contents = SPDFConfigFile::defaultContents();
    assert(contents.find("\nINPUT_DIR=\"./input\"\n") != std::string::npos);
    assert(contents.find("\nGS_QUALITY=\"/prepress\"\n") != std::string::npos);
    assert(contents.find("# ATTACHMENT_DIR: ") != std::string::npos);

    std::list<std::string> lines;
    size_t start = 0;
    while (start < contents.length()) {
        auto nl = contents.find('\n', start);
        lines.push_back(contents.substr(start, nl - start));
        start = nl + 1;
    }
    TestLogger t;
    auto c = parse(lines, t);
    assert(t.errors.empty());
    assert(c.getOutputPrefix() == "sanitized_");
    assert(c.getQuality() == spdf_quality_prepress);
    assert(c.getPasswordTimeout() == 120);
}

static void
test_resolve(std::string const& dir)
{
    auto path = SUtil::path_join(dir, "conf/spdf.conf");
    {
        // Missing file is created with defaults.
        TestLogger t;
        auto c = SPDFConfigFile::resolve(path, {}, t.logger);
        assert(SUtil::file_exists(path));
        assert(t.info.find("Created default config file at " + path) != std::string::npos);
        assert(c.getInputDir() == "./input");
    }
    {
        // Positionals are ignored without CLI_OVERRIDE.
        TestLogger t;
        auto c = SPDFConfigFile::resolve(path, {"a.pdf", "b.pdf"}, t.logger);
        assert(t.info.find("Created default") == std::string::npos);
        assert(!c.hasExplicitPair());
        assert(t.errors.find("CLI_OVERRIDE is not enabled") != std::string::npos);
    }

    SUtil::write_file(path.c_str(), "CLI_OVERRIDE=yes\nDRY_RUN=yes\n");
    {
        TestLogger t;
        auto c = SPDFConfigFile::resolve(path, {"a.pdf", "out/b.pdf"}, t.logger);
        assert(c.hasExplicitPair());
        assert(c.getExplicitInput() == "a.pdf");
        assert(c.getExplicitOutput() == "out/b.pdf");
        assert(c.getDryRun());
        assert(t.errors.empty());
    }
    {
        TestLogger t;
        auto c = SPDFConfigFile::resolve(path, {"a.pdf"}, t.logger);
        assert(!c.hasExplicitPair());
        assert(t.errors.find("found 1 arguments; running in batch mode") != std::string::npos);
    }

    // Unreadable location for a new configuration file
    auto blocker = SUtil::path_join(dir, "blocker");
    SUtil::write_file(blocker.c_str(), "");
    try {
        TestLogger t;
        SPDFConfigFile::resolve(SUtil::path_join(blocker, "spdf.conf"), {}, t.logger);
        assert(false);
    } catch (SPDFExc& e) {
        assert(e.getErrorCode() == spdf_e_bootstrap);
    }
}

static void
test_default_path()
{
    assert(SPDFConfigFile::defaultPath("/opt/spdf/bin/spdf") == "/opt/spdf/bin/spdf.conf");
    assert(SPDFConfigFile::defaultPath("spdf") == "spdf.conf");
}

int
main()
{
    std::string templ = SUtil::path_join(SUtil::temp_directory(), "spdf-config-XXXXXX");
    assert(mkdtemp(templ.data()) != nullptr);
    test_defaults();
    test_parse_values();
    test_unknown_key();
    test_errors();
    test_default_contents_round_trip();
    test_resolve(templ);
    test_default_path();
    SUtil::remove_tree(templ);
    std::cout << "config file tests passed" << std::endl;
    return 0;
}
