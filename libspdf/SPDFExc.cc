#include <spdf/SPDFExc.hh>

SPDFExc::SPDFExc(
    spdf_error_code_e error_code, std::string const& filename, std::string const& message) :
    std::runtime_error(createWhat(filename, message)),
    error_code(error_code),
    filename(filename),
    message(message)
{
}

std::string
SPDFExc::createWhat(std::string const& filename, std::string const& message)
{
    if (filename.empty()) {
        return message;
    }
    return filename + ": " + message;
}

spdf_error_code_e
SPDFExc::getErrorCode() const
{
    return error_code;
}

std::string const&
SPDFExc::getFilename() const
{
    return filename;
}

std::string const&
SPDFExc::getMessageDetail() const
{
    return message;
}
