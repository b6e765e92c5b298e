#include <spdf/SUtil.hh>

#include <spdf/Pipeline.hh>
#include <spdf/Pl_StdioFile.hh>
#include <spdf/SPDFSystemError.hh>

#include <gnutls/crypto.h>
#include <gnutls/gnutls.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fnmatch.h>
#include <stdexcept>
#include <sys/time.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    [[noreturn]] void
    throw_fs_error(std::string const& description, std::error_code const& ec)
    {
        throw SPDFSystemError(description, ec.value());
    }

    bool
    read_char_from_FILE(char& ch, FILE* f)
    {
        auto len = fread(&ch, 1, 1, f);
        if (len == 0) {
            if (ferror(f)) {
                SUtil::throw_system_error("read a character");
            }
            return false;
        }
        return true;
    }
} // namespace

std::string
SUtil::int_to_string(long long num, int length)
{
    std::string result = std::to_string(num);
    bool negative = num < 0;
    size_t width = static_cast<size_t>(std::max(length, 0));
    if (result.length() < width) {
        // Pad with zeroes after the sign
        result.insert(negative ? 1 : 0, width - result.length(), '0');
    }
    return result;
}

int
SUtil::string_to_int(char const* str)
{
    errno = 0;
    char* end = nullptr;
    long long result = strtoll(str, &end, 10);
    if ((end == str) || (*end != '\0')) {
        throw std::runtime_error(std::string("invalid integer ") + str);
    }
    if ((errno == ERANGE) || (result < INT_MIN) || (result > INT_MAX)) {
        throw std::range_error(std::string("overflow/underflow converting ") + str + " to int");
    }
    return static_cast<int>(result);
}

bool
SUtil::is_number(char const* str)
{
    try {
        string_to_int(str);
        return true;
    } catch (std::exception&) {
        // not a number or out of range
    }
    return false;
}

void
SUtil::throw_system_error(std::string const& description)
{
    throw SPDFSystemError(description, errno);
}

int
SUtil::os_wrapper(std::string const& description, int status)
{
    if (status == -1) {
        throw_system_error(description);
    }
    return status;
}

FILE*
SUtil::safe_fopen(char const* filename, char const* mode)
{
    return fopen_wrapper(std::string("open ") + filename, fopen(filename, mode));
}

FILE*
SUtil::fopen_wrapper(std::string const& description, FILE* f)
{
    if (f == nullptr) {
        throw_system_error(description);
    }
    return f;
}

bool
SUtil::file_can_be_opened(char const* filename)
{
    if (is_directory(filename)) {
        return false;
    }
    try {
        fclose(safe_fopen(filename, "rb"));
        return true;
    } catch (std::runtime_error&) {
        // can't open the file
    }
    return false;
}

bool
SUtil::file_exists(std::string const& path)
{
    std::error_code ec;
    return fs::exists(path, ec);
}

bool
SUtil::is_directory(std::string const& path)
{
    std::error_code ec;
    return fs::is_directory(path, ec);
}

void
SUtil::remove_file(char const* path)
{
    os_wrapper(std::string("remove ") + path, unlink(path));
}

void
SUtil::rename_file(char const* oldname, char const* newname)
{
    os_wrapper(std::string("rename ") + oldname + " " + newname, rename(oldname, newname));
}

void
SUtil::move_file(char const* oldname, char const* newname)
{
    try {
        rename_file(oldname, newname);
    } catch (SPDFSystemError& e) {
        if (e.getErrno() != EXDEV) {
            throw;
        }
        copy_file(oldname, newname);
        remove_file(oldname);
    }
}

void
SUtil::copy_file(char const* from, char const* to)
{
    FileCloser out(safe_fopen(to, "wb"));
    Pl_StdioFile p("copy", out.f);
    pipe_file(from, &p);
    if (fclose(out.f) != 0) {
        out.f = nullptr;
        throw_system_error(std::string("close ") + to);
    }
    out.f = nullptr;
}

void
SUtil::pipe_file(char const* filename, Pipeline* p)
{
    FILE* f = safe_fopen(filename, "rb");
    FileCloser fc(f);
    size_t len = 0;
    int constexpr size = 8192;
    unsigned char buf[size];
    while ((len = fread(buf, 1, size, f)) > 0) {
        p->write(buf, len);
    }
    p->finish();
    if (ferror(f)) {
        throw std::runtime_error(std::string("failure reading file ") + filename);
    }
}

void
SUtil::make_directories(std::string const& path)
{
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw_fs_error("create directory " + path, ec);
    }
}

void
SUtil::remove_tree(std::string const& path)
{
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw_fs_error("remove " + path, ec);
    }
}

std::vector<std::string>
SUtil::list_files(std::string const& dir)
{
    std::vector<std::string> result;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw_fs_error("read directory " + dir, ec);
    }
    for (auto const& entry: it) {
        if (entry.is_regular_file(ec)) {
            result.push_back(entry.path().string());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::string>
SUtil::list_files_recursive(std::string const& dir)
{
    std::vector<std::string> result;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        throw_fs_error("read directory " + dir, ec);
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw_fs_error("read directory " + dir, ec);
        }
        if (it->is_regular_file(ec)) {
            result.push_back(it->path().lexically_relative(dir).string());
        }
    }
    if (ec) {
        throw_fs_error("read directory " + dir, ec);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::string
SUtil::path_basename(std::string const& filename)
{
    std::string last = filename;
    auto len = last.length();
    while (len > 1) {
        auto pos = last.find_last_of('/');
        if (pos == len - 1) {
            last.pop_back();
            --len;
        } else if (pos == std::string::npos) {
            break;
        } else {
            last = last.substr(pos + 1);
            break;
        }
    }
    return last;
}

std::string
SUtil::path_dirname(std::string const& filename)
{
    std::string path = filename;
    while ((path.length() > 1) && (path.back() == '/')) {
        path.pop_back();
    }
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::string
SUtil::path_stem(std::string const& filename)
{
    std::string base = path_basename(filename);
    auto pos = base.rfind('.');
    if ((pos == std::string::npos) || (pos == 0)) {
        return base;
    }
    return base.substr(0, pos);
}

std::string
SUtil::path_extension(std::string const& filename)
{
    std::string base = path_basename(filename);
    auto pos = base.rfind('.');
    if ((pos == std::string::npos) || (pos == 0)) {
        return "";
    }
    return base.substr(pos);
}

std::string
SUtil::path_join(std::string const& a, std::string const& b)
{
    if (a.empty()) {
        return b;
    }
    if (b.empty()) {
        return a;
    }
    if (a.back() == '/') {
        return a + b;
    }
    return a + "/" + b;
}

bool
SUtil::glob_match(std::string const& pattern, std::string const& name)
{
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

std::string
SUtil::hex_encode(std::string const& input)
{
    static auto constexpr hexchars = "0123456789abcdef";
    std::string result;
    result.reserve(2 * input.length());
    for (const char c: input) {
        result += hexchars[static_cast<unsigned char>(c) >> 4];
        result += hexchars[c & 0x0f];
    }
    return result;
}

std::string
SUtil::random_hex(size_t nbytes)
{
    std::string data(nbytes, '\0');
    int code = gnutls_rnd(GNUTLS_RND_NONCE, data.data(), nbytes);
    if (code < 0) {
        throw std::runtime_error(
            std::string("gnutls: random number generation error: ") +
            std::string(gnutls_strerror(code)));
    }
    return hex_encode(data);
}

std::string
SUtil::str_tolower(std::string const& s)
{
    std::string result(s);
    for (auto& ch: result) {
        ch = static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    }
    return result;
}

std::string
SUtil::trim(std::string const& s)
{
    auto is_space = [](char ch) { return isspace(static_cast<unsigned char>(ch)) != 0; };
    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

std::vector<std::string>
SUtil::split_words(std::string const& s)
{
    std::vector<std::string> result;
    std::string word;
    for (char ch: s) {
        if (isspace(static_cast<unsigned char>(ch))) {
            if (!word.empty()) {
                result.push_back(word);
                word.clear();
            }
        } else {
            word.append(1, ch);
        }
    }
    if (!word.empty()) {
        result.push_back(word);
    }
    return result;
}

void
SUtil::setLineBuf(FILE* f)
{
    setvbuf(f, reinterpret_cast<char*>(0), _IOLBF, 0);
}

char*
SUtil::getWhoami(char* argv0)
{
    char* whoami = nullptr;
    if ((whoami = strrchr(argv0, '/')) == nullptr) {
        whoami = argv0;
    } else {
        ++whoami;
    }
    return whoami;
}

bool
SUtil::get_env(std::string const& var, std::string* value)
{
    char* p = getenv(var.c_str());
    if (p == nullptr) {
        return false;
    }
    if (value) {
        *value = p;
    }
    return true;
}

std::string
SUtil::temp_directory()
{
    std::string result;
    if (get_env("TMPDIR", &result) && !result.empty()) {
        return result;
    }
    return "/tmp";
}

std::string
SUtil::current_timestamp()
{
    struct tm ltime;
    time_t now = time(nullptr);
    localtime_r(&now, &ltime);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &ltime);
    return buf;
}

double
SUtil::now_seconds()
{
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    return static_cast<double>(tv.tv_sec) + (static_cast<double>(tv.tv_usec) / 1e6);
}

std::list<std::string>
SUtil::read_lines_from_file(char const* filename, bool preserve_eol)
{
    std::list<std::string> lines;
    FILE* f = safe_fopen(filename, "rb");
    FileCloser fc(f);
    std::string* buf = nullptr;
    char c;
    while (read_char_from_FILE(c, f)) {
        if (buf == nullptr) {
            lines.emplace_back("");
            buf = &(lines.back());
        }
        if (c == '\n') {
            if (preserve_eol) {
                buf->append(1, c);
            } else if ((!buf->empty()) && (buf->back() == '\r')) {
                // Remove any carriage return that preceded the newline
                buf->pop_back();
            }
            buf = nullptr;
        } else {
            buf->append(1, c);
        }
    }
    return lines;
}

void
SUtil::write_file(char const* filename, std::string const& contents)
{
    FileCloser fc(safe_fopen(filename, "wb"));
    Pl_StdioFile p("write_file", fc.f);
    p.writeString(contents);
    p.finish();
    FILE* f = fc.f;
    fc.f = nullptr;
    if (fclose(f) != 0) {
        throw_system_error(std::string("close ") + filename);
    }
}
