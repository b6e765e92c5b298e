#include <spdf/assert_test.h>

#include <spdf/Pl_String.hh>
#include <spdf/SPDFExc.hh>
#include <spdf/SPDFJob.hh>
#include <spdf/SPDFLogger.hh>
#include <spdf/SPDFUsage.hh>
#include <spdf/SUtil.hh>

#include <climits>
#include <deque>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

static char const* fake_qpdf = R"(#!/bin/sh
case "$1" in
  --is-encrypted)
    case "$2" in *locked*) exit 0 ;; *) exit 2 ;; esac ;;
  --password-file=-)
    IFS= read -r pw
    [ "$pw" = "pw1" ] || { echo "qpdf: $3: invalid password" >&2; exit 2; }
    cp "$3" "$4" ;;
  @-)
    n=0
    while IFS= read -r line; do
      [ $n -eq 0 ] && first="$line"
      last="$line"
      n=$((n + 1))
    done
    { cat "$first"; echo "relocked"; } > "$last" ;;
  *) exit 2 ;;
esac
)";

static char const* fake_pdfdetach = "#!/bin/sh\nexit 0\n";

static char const* fake_exiftool = R"(#!/bin/sh
for last; do :; done
echo "scrubbed" >> "$last"
)";

static char const* fake_gs = R"(#!/bin/sh
for a; do
  case "$a" in -sOutputFile=*) out="${a#-sOutputFile=}" ;; esac
  last="$a"
done
if grep -q BAD "$last"; then
  echo "Unrecoverable error" >&2
  exit 1
fi
cp "$last" "$out"
)";

namespace
{
    class Passwords: public SPDFPasswordSource
    {
      public:
        response_e
        requestPassword(std::string const&, int, std::string& password) override
        {
            if (answers.empty()) {
                return pw_unavailable;
            }
            password = answers.front();
            answers.pop_front();
            return pw_provided;
        }

        std::deque<std::string> answers;
    };

    struct Setup
    {
        Setup(std::string const& top, std::string const& name) :
            dir(SUtil::path_join(top, name)),
            in(SUtil::path_join(dir, "in")),
            out(SUtil::path_join(dir, "out")),
            conf(SUtil::path_join(dir, "spdf.conf")),
            log(SUtil::path_join(dir, "logs/spdf.log")),
            logger(SPDFLogger::create())
        {
            auto bin = SUtil::path_join(dir, "bin");
            SUtil::make_directories(bin);
            SUtil::make_directories(in);
            for (auto const& [tool, script]: std::initializer_list<std::pair<char const*, char const*>>{
                     {"qpdf", fake_qpdf},
                     {"pdfdetach", fake_pdfdetach},
                     {"exiftool", fake_exiftool},
                     {"gs", fake_gs}}) {
                auto path = SUtil::path_join(bin, tool);
                SUtil::write_file(path.c_str(), script);
                assert(chmod(path.c_str(), 0755) == 0);
            }
            config = "INPUT_DIR=\"" + in + "\"\n" + "OUTPUT_DIR=\"" + out + "\"\n" +
                "LOG_FILE=\"" + log + "\"\n" + "WORK_DIR=\"" + SUtil::path_join(dir, "work") +
                "\"\n" + "SAVE_STEP_FILES=no\n" + "RELOCK_CLEANED=yes\n" + "QPDF=\"" +
                SUtil::path_join(bin, "qpdf") + "\"\n" + "PDFDETACH=\"" +
                SUtil::path_join(bin, "pdfdetach") + "\"\n" + "EXIFTOOL=\"" +
                SUtil::path_join(bin, "exiftool") + "\"\n" + "GHOSTSCRIPT=\"" +
                SUtil::path_join(bin, "gs") + "\"\n";
            logger->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
            logger->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
        }

        void
        input(std::string const& relative, std::string const& data)
        {
            auto path = SUtil::path_join(in, relative);
            SUtil::make_directories(SUtil::path_dirname(path));
            SUtil::write_file(path.c_str(), data);
        }

        void
        prepare(SPDFJob& j, std::string const& extra = "")
        {
            SUtil::write_file(conf.c_str(), config + extra);
            j.setConfigFile(conf);
            j.setLogger(logger);
            j.setPasswordSource(passwords);
        }

        std::string dir;
        std::string in;
        std::string out;
        std::string conf;
        std::string log;
        std::string config;
        std::shared_ptr<SPDFLogger> logger;
        std::string info;
        std::string errors;
        std::shared_ptr<Passwords> passwords{std::make_shared<Passwords>()};
    };

    std::string
    contents(std::string const& path)
    {
        std::string result;
        Pl_String p("contents", nullptr, result);
        SUtil::pipe_file(path.c_str(), &p);
        return result;
    }

    bool
    has(std::string const& text, std::string const& needle)
    {
        return text.find(needle) != std::string::npos;
    }
} // namespace

static void
test_batch(std::string const& top)
{
    Setup s(top, "batch");
    s.input("a.pdf", "alpha\n");
    s.input("locked.pdf", "secret\n");
    s.input("sub/bad.pdf", "BAD\n");
    s.input("notes.txt", "not a pdf\n");
    s.passwords->answers.push_back("pw1");

    SPDFJob j;
    s.prepare(j);
    j.run();
    assert(j.getExitCode() == SPDFJob::EXIT_ITEM_FAILED);

    auto report = j.getReport();
    auto items = report->getItems();
    assert(items.size() == 3);
    assert(items.at(0).status == SPDFItemReport::is_succeeded);
    assert(items.at(1).status == SPDFItemReport::is_succeeded);
    assert(items.at(1).relocked);
    assert(items.at(2).status == SPDFItemReport::is_failed);
    assert(items.at(2).reason == "rewrite failed: " + SUtil::path_join(s.dir, "bin/gs") +
                                     " exited with status 1: Unrecoverable error");
    assert(report->count(SPDFItemReport::is_succeeded) == 2);

    assert(contents(SUtil::path_join(s.out, "sanitized_a.pdf")) == "alpha\nscrubbed\n");
    assert(contents(SUtil::path_join(s.out, "sanitized_locked.pdf")) ==
           "secret\nscrubbed\nrelocked\n");
    assert(!SUtil::file_exists(SUtil::path_join(s.out, "sanitized_bad.pdf")));
    assert(!SUtil::file_exists(SUtil::path_join(s.out, "sanitized_notes.txt")));
    assert(SUtil::list_files_recursive(SUtil::path_join(s.dir, "work")).empty());

    auto log = contents(s.log);
    assert(has(log, "Found 3 file(s) matching *.pdf in " + s.in));
    assert(has(log, "Summary: 3 file(s), 2 succeeded, 0 skipped, 1 failed"));
    assert(has(log, "ERROR: Failed " + SUtil::path_join(s.in, "sub/bad.pdf")));
    assert(!has(log, "pw1"));
    assert(has(s.info, "Summary: 3 file(s)"));

    auto config = j.getConfig();
    assert(config.getRelock());
    assert(!config.getSaveStepFiles());
}

static void
test_skipped_is_not_failure(std::string const& top)
{
    Setup s(top, "skipped");
    s.input("locked.pdf", "secret\n");
    SPDFJob j;
    s.prepare(j);
    j.run();
    assert(j.getExitCode() == 0);
    assert(j.getReport()->count(SPDFItemReport::is_skipped) == 1);
    assert(has(s.info, "  skipped " + SUtil::path_join(s.in, "locked.pdf") +
                           ": no password available"));
}

static void
test_dry_run(std::string const& top)
{
    Setup s(top, "dry");
    s.input("a.pdf", "alpha\n");
    SPDFJob j;
    s.prepare(j, "DRY_RUN=yes\n");
    j.run();
    assert(j.getExitCode() == 0);
    assert(!SUtil::file_exists(s.out));
    assert(has(s.info, "[DRY RUN] Would process: "));
}

static void
test_discovery_error(std::string const& top)
{
    Setup s(top, "nothing");
    SPDFJob j;
    s.prepare(j);
    try {
        j.run();
        assert(false);
    } catch (SPDFExc& e) {
        assert(e.getErrorCode() == spdf_e_discovery);
        assert(e.getMessageDetail() == "no files matching *.pdf found");
    }
}

static void
test_argv(std::string const& top)
{
    Setup s(top, "argv");
    s.input("one.pdf", "one\n");
    auto in = SUtil::path_join(s.in, "one.pdf");
    auto out = SUtil::path_join(s.dir, "single/result.pdf");
    auto conf = "--config=" + s.conf;
    char const* argv[] = {"spdf", conf.c_str(), in.c_str(), out.c_str(), nullptr};

    SPDFJob j;
    s.prepare(j, "CLI_OVERRIDE=yes\n");
    j.setConfigFile("not-used.conf");
    j.initializeFromArgv(argv);
    j.run();
    assert(j.getExitCode() == 0);
    assert(j.getConfig().hasExplicitPair());
    assert(contents(out) == "one\nscrubbed\n");
    assert(!SUtil::file_exists(s.out));
    assert(!SUtil::file_exists("not-used.conf"));

    char const* bad[] = {"spdf", "--colour=red", nullptr};
    SPDFJob k;
    try {
        k.initializeFromArgv(bad);
        assert(false);
    } catch (SPDFUsage& e) {
        assert(std::string(e.what()) == "unrecognized argument --colour=red");
    }
    char const* empty_config[] = {"spdf", "--config=", nullptr};
    try {
        k.initializeFromArgv(empty_config);
        assert(false);
    } catch (SPDFUsage& e) {
        assert(std::string(e.what()) == "--config requires a file name");
    }
}

static void
test_default_config_logged(std::string const& top)
{
    // The default configuration is created relative to the current
    // directory, and so is its log file.
    auto dir = SUtil::path_join(top, "bootstrap");
    SUtil::make_directories(dir);
    char cwd[PATH_MAX];
    assert(getcwd(cwd, sizeof(cwd)) != nullptr);
    assert(chdir(dir.c_str()) == 0);

    auto logger = SPDFLogger::create();
    std::string info;
    logger->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    logger->setError(logger->discard());
    SPDFJob j;
    j.setLogger(logger);
    j.setConfigFile("conf/spdf.conf");
    try {
        // There is no ./input yet.
        j.run();
        assert(false);
    } catch (SPDFExc& e) {
        assert(e.getErrorCode() == spdf_e_discovery);
    }
    logger->setLogFile("");
    assert(SUtil::file_exists("conf/spdf.conf"));
    assert(has(info, "Created default config file at conf/spdf.conf"));
    assert(has(contents("spdf.log"), "Created default config file at conf/spdf.conf"));

    assert(chdir(cwd) == 0);
}

int
main()
{
    std::string templ = SUtil::path_join(SUtil::temp_directory(), "spdf-job-XXXXXX");
    assert(mkdtemp(templ.data()) != nullptr);
    test_batch(templ);
    test_skipped_is_not_failure(templ);
    test_dry_run(templ);
    test_discovery_error(templ);
    test_argv(templ);
    test_default_config_logged(templ);
    SUtil::remove_tree(templ);
    std::cout << "job tests passed" << std::endl;
    return 0;
}
