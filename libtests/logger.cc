#include <spdf/assert_test.h>

#include <spdf/Pl_String.hh>
#include <spdf/SPDFLogger.hh>
#include <spdf/SUtil.hh>

#include <climits>
#include <cstdlib>
#include <dirent.h>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

// Strip the "[timestamp] " prefix from every line.
static std::string
untimed(std::string const& text)
{
    std::string result;
    size_t start = 0;
    while (start < text.length()) {
        auto nl = text.find('\n', start);
        assert(nl != std::string::npos);
        auto line = text.substr(start, nl - start);
        assert(line.at(0) == '[');
        auto close = line.find("] ");
        assert(close == 20);
        result += line.substr(close + 2) + "\n";
        start = nl + 1;
    }
    return result;
}

// The descriptor flags of the open file whose real path is path, or -1
// if this process doesn't have it open.
static int
fd_flags_for(std::string const& path)
{
    char real[PATH_MAX];
    assert(realpath(path.c_str(), real) != nullptr);
    int result = -1;
    DIR* d = opendir("/proc/self/fd");
    assert(d != nullptr);
    while (auto e = readdir(d)) {
        if (e->d_name[0] == '.') {
            continue;
        }
        auto link = std::string("/proc/self/fd/") + e->d_name;
        char target[PATH_MAX];
        auto len = readlink(link.c_str(), target, sizeof(target) - 1);
        if (len <= 0) {
            continue;
        }
        target[len] = '\0';
        if (std::string(target) == real) {
            result = fcntl(atoi(e->d_name), F_GETFD);
        }
    }
    closedir(d);
    return result;
}

static void
test_channels()
{
    auto l = SPDFLogger::create();
    std::string info;
    std::string errors;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->setError(std::make_shared<Pl_String>("errors", nullptr, errors));

    // Warning follows error until set explicitly.
    l->info("one");
    l->warn("two");
    l->error("three");
    assert(untimed(info) == "one\n");
    assert(untimed(errors) == "WARNING: two\nERROR: three\n");

    std::string warnings;
    l->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));
    l->warn("four");
    assert(untimed(warnings) == "WARNING: four\n");
    assert(untimed(errors) == "WARNING: two\nERROR: three\n");

    l->setWarn(l->discard());
    l->warn("not seen");
    assert(untimed(warnings) == "WARNING: four\n");

    l->setWarn(nullptr);
    l->warn("five");
    assert(untimed(errors) == "WARNING: two\nERROR: three\nWARNING: five\n");

    l->setInfo(nullptr);
    assert(l->getInfo() == l->standardOutput());
    l->setError(nullptr);
    assert(l->getError() == l->standardError());
}

static void
test_log_file(std::string const& dir)
{
    auto l = SPDFLogger::create();
    l->setInfo(l->discard());
    l->setError(l->discard());
    auto path = SUtil::path_join(dir, "logs/sub/run.log");
    l->setLogFile(path);
    assert(l->getLogFile() == path);
    l->info("started");
    // Child processes don't inherit the log file.
    int flags = fd_flags_for(path);
    assert(flags != -1);
    assert(flags & FD_CLOEXEC);
    l->warn("careful");
    l->error("broken");
    l->setLogFile("");
    assert(l->getLogFile().empty());
    l->info("not logged to file");

    // The log file is appended to, not truncated.
    l->setLogFile(path);
    l->info("again");
    l->setLogFile("");

    std::string contents;
    for (auto const& line: SUtil::read_lines_from_file(path.c_str(), true)) {
        contents += line;
    }
    assert(untimed(contents) == "started\nWARNING: careful\nERROR: broken\nagain\n");
}

static std::string
file_contents(std::string const& path)
{
    std::string result;
    for (auto const& line: SUtil::read_lines_from_file(path.c_str(), true)) {
        result += line;
    }
    return result;
}

static void
test_held_lines(std::string const& dir)
{
    auto l = SPDFLogger::create();
    std::string info;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->setError(l->discard());

    // Lines written before the log file is known are written to it
    // when it is opened.
    l->holdForLogFile();
    l->info("created config");
    l->warn("unknown key");
    auto path = SUtil::path_join(dir, "held.log");
    l->setLogFile(path);
    l->info("running");
    l->setLogFile("");
    assert(untimed(file_contents(path)) == "created config\nWARNING: unknown key\nrunning\n");
    assert(untimed(info) == "created config\nrunning\n");

    // Held lines are dropped when holding stops.
    l->holdForLogFile();
    l->info("dropped");
    l->holdForLogFile(false);
    l->info("not held");
    auto other = SUtil::path_join(dir, "other.log");
    l->setLogFile(other);
    l->info("kept");
    l->setLogFile("");
    assert(untimed(file_contents(other)) == "kept\n");
}

static void
test_bad_log_file(std::string const& dir)
{
    auto l = SPDFLogger::create();
    auto blocker = SUtil::path_join(dir, "plain-file");
    SUtil::write_file(blocker.c_str(), "x");
    try {
        l->setLogFile(SUtil::path_join(blocker, "run.log"));
        assert(false);
    } catch (std::runtime_error&) {
        // expected
    }
    assert(l->getLogFile().empty());
}

int
main()
{
    std::string templ = SUtil::path_join(SUtil::temp_directory(), "spdf-logger-XXXXXX");
    assert(mkdtemp(templ.data()) != nullptr);
    test_channels();
    test_log_file(templ);
    test_held_lines(templ);
    test_bad_log_file(templ);
    SUtil::remove_tree(templ);
    return 0;
}
