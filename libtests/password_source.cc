#include <spdf/assert_test.h>

#include <spdf/Pl_String.hh>
#include <spdf/SPDFPasswordSource.hh>

#include <climits>
#include <ctime>
#include <iostream>
#include <unistd.h>

namespace
{
    // A pipe whose read end stands in for the terminal
    struct TestPipe
    {
        TestPipe()
        {
            assert(pipe(fds) == 0);
        }
        ~TestPipe()
        {
            closeWrite();
            close(fds[0]);
        }
        void
        send(std::string const& s)
        {
            assert(write(fds[1], s.data(), s.length()) == static_cast<ssize_t>(s.length()));
        }
        void
        closeWrite()
        {
            if (fds[1] != -1) {
                close(fds[1]);
                fds[1] = -1;
            }
        }

        int fds[2];
    };
} // namespace

static void
test_provided()
{
    TestPipe p;
    std::string prompts;
    auto out = std::make_shared<Pl_String>("prompt", nullptr, prompts);
    SPDFTerminalPasswordSource source(p.fds[0], out);
    p.send("s3cret\nsecond\r\n");

    std::string pw;
    assert(source.requestPassword("Password for a.pdf: ", 5, pw) == SPDFPasswordSource::pw_provided);
    assert(pw == "s3cret");
    // A trailing carriage return is not part of the password.
    assert(source.requestPassword("Password for b.pdf: ", 5, pw) == SPDFPasswordSource::pw_provided);
    assert(pw == "second");
    // Not a terminal, so no newline is added after the prompt.
    assert(prompts == "Password for a.pdf: Password for b.pdf: ");
}

static void
test_empty_password()
{
    TestPipe p;
    std::string prompts;
    SPDFTerminalPasswordSource source(
        p.fds[0], std::make_shared<Pl_String>("prompt", nullptr, prompts));
    p.send("\n");
    std::string pw = "unchanged";
    assert(source.requestPassword("pw: ", 5, pw) == SPDFPasswordSource::pw_provided);
    assert(pw.empty());
}

static void
test_end_of_input()
{
    TestPipe p;
    std::string prompts;
    SPDFTerminalPasswordSource source(
        p.fds[0], std::make_shared<Pl_String>("prompt", nullptr, prompts));
    p.send("unterminated");
    p.closeWrite();
    std::string pw;
    assert(source.requestPassword("pw: ", 5, pw) == SPDFPasswordSource::pw_provided);
    assert(pw == "unterminated");
    pw = "unchanged";
    assert(source.requestPassword("pw: ", 5, pw) == SPDFPasswordSource::pw_unavailable);
    assert(pw == "unchanged");
}

static void
test_timeout()
{
    TestPipe p;
    std::string prompts;
    SPDFTerminalPasswordSource source(
        p.fds[0], std::make_shared<Pl_String>("prompt", nullptr, prompts));
    // A partial line is discarded when time runs out.
    p.send("too-sl");
    std::string pw = "unchanged";
    auto start = time(nullptr);
    assert(source.requestPassword("pw: ", 1, pw) == SPDFPasswordSource::pw_timed_out);
    assert(time(nullptr) - start <= 3);
    assert(pw == "unchanged");
}

static void
test_long_timeout()
{
    // Timeouts whose millisecond count doesn't fit in an int still wait
    // for input.
    TestPipe p;
    std::string prompts;
    SPDFTerminalPasswordSource source(
        p.fds[0], std::make_shared<Pl_String>("prompt", nullptr, prompts));
    p.send("late\n");
    std::string pw;
    assert(source.requestPassword("pw: ", 3000000, pw) == SPDFPasswordSource::pw_provided);
    assert(pw == "late");
    p.send("later\n");
    assert(source.requestPassword("pw: ", INT_MAX, pw) == SPDFPasswordSource::pw_provided);
    assert(pw == "later");
}

int
main()
{
    test_provided();
    test_empty_password();
    test_end_of_input();
    test_timeout();
    test_long_timeout();
    std::cout << "password source tests passed" << std::endl;
    return 0;
}
