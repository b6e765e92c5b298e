#include <spdf/SPDFSystemError.hh>

#include <cstring>

SPDFSystemError::SPDFSystemError(std::string const& description, int system_errno) :
    std::runtime_error(createWhat(description, system_errno)),
    description(description),
    system_errno(system_errno)
{
}

std::string
SPDFSystemError::createWhat(std::string const& description, int system_errno)
{
    return description + ": " + strerror(system_errno);
}

std::string const&
SPDFSystemError::getDescription() const
{
    return description;
}

int
SPDFSystemError::getErrno() const
{
    return system_errno;
}
