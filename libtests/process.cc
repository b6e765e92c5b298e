#include <spdf/assert_test.h>

#include <spdf/Pl_String.hh>
#include <spdf/SPDFProcess.hh>

#include <iostream>
#include <stdexcept>
#include <vector>

static int
run_sh(
    std::string const& script,
    std::string const& input,
    std::string& out,
    std::string& err)
{
    out.clear();
    err.clear();
    Pl_String p_out("out", nullptr, out);
    Pl_String p_err("err", nullptr, err);
    SPDFProcess proc({"/bin/sh", "-c", script, "test-script"});
    proc.setInput(input);
    proc.setOutput(&p_out);
    proc.setError(&p_err);
    return proc.run();
}

static void
test_exit_status()
{
    std::string out;
    std::string err;
    assert(run_sh("exit 0", "", out, err) == 0);
    assert(run_sh("exit 3", "", out, err) == 3);
    assert(run_sh("kill -TERM $$", "", out, err) == 128 + 15);
}

static void
test_output()
{
    std::string out;
    std::string err;
    assert(run_sh("echo to-out; echo to-err >&2; echo \"$0\"", "", out, err) == 0);
    assert(out == "to-out\ntest-script\n");
    assert(err == "to-err\n");
}

static void
test_input()
{
    std::string out;
    std::string err;
    assert(run_sh("read a; read b; echo \"$b/$a\"", "first\nsecond\n", out, err) == 0);
    assert(out == "second/first\n");

    // Large input and output in both directions at once
    std::string big;
    for (int i = 0; i < 20000; ++i) {
        big += "line " + std::to_string(i) + "\n";
    }
    assert(run_sh("cat; cat /dev/null >&2", big, out, err) == 0);
    assert(out == big);

    // The child doesn't have to read its input.
    assert(run_sh("exit 0", big, out, err) == 0);
}

static void
test_launch_failure()
{
    std::string err;
    Pl_String p_err("err", nullptr, err);
    SPDFProcess proc({"/nonexistent/spdf-tool", "--help"});
    proc.setError(&p_err);
    assert(proc.run() == SPDFProcess::exit_launch_failed);
    assert(err.find("/nonexistent/spdf-tool: unable to run: ") == 0);
    assert(proc.getCommandLine() == "/nonexistent/spdf-tool --help");

    // Output can be discarded.
    SPDFProcess quiet({"/bin/sh", "-c", "echo ignored"});
    assert(quiet.run() == 0);

    try {
        SPDFProcess empty{std::vector<std::string>()};
        assert(false);
    } catch (std::logic_error&) {
        // expected
    }
}

int
main()
{
    test_exit_status();
    test_output();
    test_input();
    test_launch_failure();
    std::cout << "process tests passed" << std::endl;
    return 0;
}
