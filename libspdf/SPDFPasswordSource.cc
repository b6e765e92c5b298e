#include <spdf/SPDFPasswordSource.hh>

#include <spdf/Pl_OStream.hh>
#include <spdf/SUtil.hh>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <iostream>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

class SPDFTerminalPasswordSource::Members
{
  public:
    Members(int fd, std::shared_ptr<Pipeline> prompt_output) :
        fd(fd),
        prompt_output(prompt_output)
    {
        if (!this->prompt_output) {
            this->prompt_output = std::make_shared<Pl_OStream>("password prompt", std::cerr);
        }
    }
    Members(Members const&) = delete;
    ~Members() = default;

    int fd;
    std::shared_ptr<Pipeline> prompt_output;
};

namespace
{
    // Turns off echo on a terminal and restores the previous settings
    // when destroyed.
    class TermiosGuard
    {
      public:
        TermiosGuard(int fd) :
            fd(fd)
        {
            if (isatty(fd) && (tcgetattr(fd, &saved) == 0)) {
                struct termios silent = saved;
                silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
                active = (tcsetattr(fd, TCSAFLUSH, &silent) == 0);
            }
        }
        TermiosGuard(TermiosGuard const&) = delete;
        ~TermiosGuard()
        {
            if (active) {
                tcsetattr(fd, TCSAFLUSH, &saved);
            }
        }

        bool active{false};

      private:
        int fd;
        struct termios saved;
    };
} // namespace

SPDFTerminalPasswordSource::SPDFTerminalPasswordSource(
    int fd, std::shared_ptr<Pipeline> prompt_output) :
    m(new Members(fd, prompt_output))
{
}

SPDFTerminalPasswordSource::~SPDFTerminalPasswordSource() = default;

SPDFPasswordSource::response_e
SPDFTerminalPasswordSource::requestPassword(
    std::string const& prompt, int timeout_seconds, std::string& password)
{
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::seconds(timeout_seconds);

    *m->prompt_output << prompt;
    m->prompt_output->finish();

    TermiosGuard guard(m->fd);
    std::string line;
    response_e result = pw_unavailable;
    bool done = false;
    while (!done) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (remaining <= 0) {
            result = pw_timed_out;
            break;
        }
        // poll waits forever on a negative timeout, so don't let a long
        // wait wrap around.
        int wait_ms = static_cast<int>(std::min<long long>(remaining, INT_MAX));
        struct pollfd pfd{m->fd, POLLIN, 0};
        int n = poll(&pfd, 1, wait_ms);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            SUtil::throw_system_error("wait for password");
        }
        if (n == 0) {
            continue;
        }
        char ch;
        auto len = read(m->fd, &ch, 1);
        if (len == -1) {
            if ((errno == EINTR) || (errno == EAGAIN)) {
                continue;
            }
            SUtil::throw_system_error("read password");
        }
        if (len == 0) {
            // End of input. An unterminated last line still counts.
            result = line.empty() ? pw_unavailable : pw_provided;
            done = true;
        } else if (ch == '\n') {
            result = pw_provided;
            done = true;
        } else {
            line.append(1, ch);
        }
    }
    if (guard.active) {
        // The user's newline wasn't echoed.
        *m->prompt_output << "\n";
        m->prompt_output->finish();
    }
    if (result == pw_provided) {
        if (!line.empty() && (line.back() == '\r')) {
            line.pop_back();
        }
        password = line;
    }
    return result;
}
