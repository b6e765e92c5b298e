#include <spdf/SPDFProcess.hh>

#include <spdf/SUtil.hh>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

class SPDFProcess::Members
{
  public:
    Members(std::vector<std::string> const& args) :
        args(args)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    std::vector<std::string> args;
    std::string input;
    Pipeline* out{nullptr};
    Pipeline* err{nullptr};
};

namespace
{
    // Owns the two ends of a pipe.
    class PipeFds
    {
      public:
        PipeFds()
        {
            SUtil::os_wrapper("create pipe", pipe2(fds, O_CLOEXEC));
        }
        PipeFds(PipeFds const&) = delete;
        ~PipeFds()
        {
            closeRead();
            closeWrite();
        }

        void
        closeRead()
        {
            if (fds[0] != -1) {
                close(fds[0]);
                fds[0] = -1;
            }
        }

        void
        closeWrite()
        {
            if (fds[1] != -1) {
                close(fds[1]);
                fds[1] = -1;
            }
        }

        int fds[2]{-1, -1};
    };

    // Ignore SIGPIPE while writing to a child that may exit early.
    class SigpipeGuard
    {
      public:
        SigpipeGuard()
        {
            struct sigaction sa;
            memset(&sa, 0, sizeof(sa));
            sa.sa_handler = SIG_IGN;
            sigemptyset(&sa.sa_mask);
            sigaction(SIGPIPE, &sa, &old);
        }
        SigpipeGuard(SigpipeGuard const&) = delete;
        ~SigpipeGuard()
        {
            sigaction(SIGPIPE, &old, nullptr);
        }

      private:
        struct sigaction old;
    };

    [[noreturn]] void
    exec_child(
        std::vector<std::string> const& args, int in_fd, int out_fd, int err_fd, int status_fd)
    {
        signal(SIGPIPE, SIG_DFL);
        if ((dup2(in_fd, STDIN_FILENO) == -1) || (dup2(out_fd, STDOUT_FILENO) == -1) ||
            (dup2(err_fd, STDERR_FILENO) == -1)) {
            int e = errno;
            (void)!write(status_fd, &e, sizeof(e));
            _exit(SPDFProcess::exit_launch_failed);
        }
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto const& a: args) {
            argv.push_back(const_cast<char*>(a.c_str()));
        }
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());
        // status_fd is close-on-exec, so the parent sees data only if
        // exec failed.
        int e = errno;
        (void)!write(status_fd, &e, sizeof(e));
        _exit(SPDFProcess::exit_launch_failed);
    }
} // namespace

SPDFProcess::SPDFProcess(std::vector<std::string> const& args) :
    m(new Members(args))
{
    if (args.empty()) {
        throw std::logic_error("SPDFProcess created with no program");
    }
}

void
SPDFProcess::setInput(std::string const& data)
{
    m->input = data;
}

void
SPDFProcess::setOutput(Pipeline* p)
{
    m->out = p;
}

void
SPDFProcess::setError(Pipeline* p)
{
    m->err = p;
}

std::string
SPDFProcess::getCommandLine() const
{
    std::string result;
    for (auto const& a: m->args) {
        if (!result.empty()) {
            result += " ";
        }
        result += a;
    }
    return result;
}

int
SPDFProcess::run()
{
    PipeFds in_pipe;
    PipeFds out_pipe;
    PipeFds err_pipe;
    PipeFds status_pipe;
    SigpipeGuard sigpipe_guard;

    pid_t pid = SUtil::os_wrapper("fork " + m->args.at(0), fork());
    if (pid == 0) {
        exec_child(
            m->args, in_pipe.fds[0], out_pipe.fds[1], err_pipe.fds[1], status_pipe.fds[1]);
    }

    in_pipe.closeRead();
    out_pipe.closeWrite();
    err_pipe.closeWrite();
    status_pipe.closeWrite();

    int exec_errno = 0;
    if (read(status_pipe.fds[0], &exec_errno, sizeof(exec_errno)) != sizeof(exec_errno)) {
        exec_errno = 0;
    }
    status_pipe.closeRead();

    if (exec_errno == 0) {
        fcntl(in_pipe.fds[1], F_SETFL, fcntl(in_pipe.fds[1], F_GETFL) | O_NONBLOCK);
        size_t written = 0;
        if (m->input.empty()) {
            in_pipe.closeWrite();
        }
        unsigned char buf[8192];
        while ((in_pipe.fds[1] != -1) || (out_pipe.fds[0] != -1) || (err_pipe.fds[0] != -1)) {
            struct pollfd pfds[3];
            pfds[0] = {in_pipe.fds[1], POLLOUT, 0};
            pfds[1] = {out_pipe.fds[0], POLLIN, 0};
            pfds[2] = {err_pipe.fds[0], POLLIN, 0};
            // poll ignores negative descriptors
            if (poll(pfds, 3, -1) == -1) {
                if (errno == EINTR) {
                    continue;
                }
                SUtil::throw_system_error("poll " + m->args.at(0));
            }
            if (pfds[0].revents) {
                auto n = write(
                    in_pipe.fds[1], m->input.data() + written, m->input.length() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                }
                // The child may exit without reading all of its input.
                if ((written == m->input.length()) ||
                    ((n == -1) && (errno != EAGAIN) && (errno != EINTR))) {
                    in_pipe.closeWrite();
                }
            }
            for (int i = 1; i <= 2; ++i) {
                if (pfds[i].revents == 0) {
                    continue;
                }
                PipeFds& p = (i == 1) ? out_pipe : err_pipe;
                Pipeline* dest = (i == 1) ? m->out : m->err;
                auto n = read(p.fds[0], buf, sizeof(buf));
                if (n > 0) {
                    if (dest) {
                        dest->write(buf, static_cast<size_t>(n));
                    }
                } else if ((n == 0) || (errno != EINTR)) {
                    p.closeRead();
                }
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            SUtil::throw_system_error("wait for " + m->args.at(0));
        }
    }
    if (m->out) {
        m->out->finish();
    }
    if (m->err) {
        m->err->finish();
    }

    if (exec_errno != 0) {
        if (m->err) {
            m->err->writeString(
                m->args.at(0) + ": unable to run: " + strerror(exec_errno) + "\n");
            m->err->finish();
        }
        return exit_launch_failed;
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return WEXITSTATUS(status);
}
