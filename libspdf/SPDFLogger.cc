#include <spdf/SPDFLogger.hh>

#include <spdf/Pl_Discard.hh>
#include <spdf/Pl_OStream.hh>
#include <spdf/Pl_StdioFile.hh>
#include <spdf/SUtil.hh>

#include <cstdio>
#include <mutex>
#include <stdexcept>

class SPDFLogger::Members
{
  public:
    Members() :
        p_discard(new Pl_Discard()),
        p_stdout(new Pl_OStream("standard output", std::cout)),
        p_stderr(new Pl_OStream("standard error", std::cerr)),
        p_info(p_stdout),
        p_warn(nullptr),
        p_error(p_stderr)
    {
    }
    Members(Members const&) = delete;
    ~Members()
    {
        p_stdout->finish();
        p_stderr->finish();
        closeLogFile();
    }

    void
    closeLogFile()
    {
        if (p_file) {
            p_file->finish();
            p_file = nullptr;
        }
        if (log_file) {
            fclose(log_file);
            log_file = nullptr;
        }
        log_path.clear();
    }

    std::mutex lock;
    std::shared_ptr<Pipeline> p_discard;
    std::shared_ptr<Pipeline> p_stdout;
    std::shared_ptr<Pipeline> p_stderr;
    std::shared_ptr<Pipeline> p_info;
    std::shared_ptr<Pipeline> p_warn;
    std::shared_ptr<Pipeline> p_error;
    std::shared_ptr<Pipeline> p_file;
    FILE* log_file{nullptr};
    std::string log_path;
    bool holding{false};
    std::string held;
};

SPDFLogger::SPDFLogger() :
    m(new Members())
{
}

std::shared_ptr<SPDFLogger>
SPDFLogger::create()
{
    return std::shared_ptr<SPDFLogger>(new SPDFLogger);
}

std::shared_ptr<SPDFLogger>
SPDFLogger::defaultLogger()
{
    static auto l = create();
    return l;
}

void
SPDFLogger::writeLine(std::shared_ptr<Pipeline> p, char const* tag, std::string const& msg)
{
    std::string line = "[" + SUtil::current_timestamp() + "] " + tag + msg + "\n";
    p->writeString(line);
    p->finish();
    if (m->p_file) {
        m->p_file->writeString(line);
        m->p_file->finish();
    } else if (m->holding) {
        m->held += line;
    }
}

void
SPDFLogger::info(std::string const& s)
{
    std::lock_guard<std::mutex> guard(m->lock);
    writeLine(getInfo(false), "", s);
}

std::shared_ptr<Pipeline>
SPDFLogger::getInfo(bool null_okay)
{
    return throwIfNull(m->p_info, null_okay);
}

void
SPDFLogger::warn(std::string const& s)
{
    std::lock_guard<std::mutex> guard(m->lock);
    writeLine(getWarn(false), "WARNING: ", s);
}

std::shared_ptr<Pipeline>
SPDFLogger::getWarn(bool null_okay)
{
    if (m->p_warn) {
        return m->p_warn;
    }
    return getError(null_okay);
}

void
SPDFLogger::error(std::string const& s)
{
    std::lock_guard<std::mutex> guard(m->lock);
    writeLine(getError(false), "ERROR: ", s);
}

std::shared_ptr<Pipeline>
SPDFLogger::getError(bool null_okay)
{
    return throwIfNull(m->p_error, null_okay);
}

std::shared_ptr<Pipeline>
SPDFLogger::standardOutput()
{
    return m->p_stdout;
}

std::shared_ptr<Pipeline>
SPDFLogger::standardError()
{
    return m->p_stderr;
}

std::shared_ptr<Pipeline>
SPDFLogger::discard()
{
    return m->p_discard;
}

void
SPDFLogger::setInfo(std::shared_ptr<Pipeline> p)
{
    std::lock_guard<std::mutex> guard(m->lock);
    if (p == nullptr) {
        p = m->p_stdout;
    }
    m->p_info = p;
}

void
SPDFLogger::setWarn(std::shared_ptr<Pipeline> p)
{
    std::lock_guard<std::mutex> guard(m->lock);
    m->p_warn = p;
}

void
SPDFLogger::setError(std::shared_ptr<Pipeline> p)
{
    std::lock_guard<std::mutex> guard(m->lock);
    if (p == nullptr) {
        p = m->p_stderr;
    }
    m->p_error = p;
}

void
SPDFLogger::setOutputStreams(std::ostream* out_stream, std::ostream* err_stream)
{
    std::lock_guard<std::mutex> guard(m->lock);
    if (out_stream == &std::cout) {
        out_stream = nullptr;
    }
    if (err_stream == &std::cerr) {
        err_stream = nullptr;
    }
    std::shared_ptr<Pipeline> new_out;
    std::shared_ptr<Pipeline> new_err;

    if (out_stream == nullptr) {
        new_out = m->p_stdout;
    } else {
        new_out = std::make_shared<Pl_OStream>("output", *out_stream);
    }
    if (err_stream == nullptr) {
        new_err = m->p_stderr;
    } else {
        new_err = std::make_shared<Pl_OStream>("error output", *err_stream);
    }
    m->p_info = new_out;
    m->p_warn = nullptr;
    m->p_error = new_err;
}

void
SPDFLogger::setLogFile(std::string const& path)
{
    std::lock_guard<std::mutex> guard(m->lock);
    std::string held;
    held.swap(m->held);
    m->holding = false;
    m->closeLogFile();
    if (path.empty()) {
        return;
    }
    auto dir = SUtil::path_dirname(path);
    if (!dir.empty()) {
        SUtil::make_directories(dir);
    }
    // Close on exec so the external tools don't inherit the log.
    m->log_file = SUtil::safe_fopen(path.c_str(), "ae");
    m->p_file = std::make_shared<Pl_StdioFile>("log file", m->log_file);
    m->log_path = path;
    if (!held.empty()) {
        m->p_file->writeString(held);
        m->p_file->finish();
    }
}

void
SPDFLogger::holdForLogFile(bool hold)
{
    std::lock_guard<std::mutex> guard(m->lock);
    m->holding = hold;
    if (!hold) {
        m->held.clear();
    }
}

std::string
SPDFLogger::getLogFile() const
{
    std::lock_guard<std::mutex> guard(m->lock);
    return m->log_path;
}

std::shared_ptr<Pipeline>
SPDFLogger::throwIfNull(std::shared_ptr<Pipeline> p, bool null_okay)
{
    if (!(null_okay || p)) {
        throw std::logic_error("SPDFLogger: requested a null pipeline without null_okay == true");
    }
    return p;
}
