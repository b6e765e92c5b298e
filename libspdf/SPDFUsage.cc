#include <spdf/SPDFUsage.hh>

SPDFUsage::SPDFUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}
