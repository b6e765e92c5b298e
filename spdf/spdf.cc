#include <spdf/SPDFJob.hh>
#include <spdf/SPDFUsage.hh>
#include <spdf/SUtil.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>

static char const* whoami = nullptr;

static void
usageExit(std::string const& msg)
{
    std::cerr << std::endl
              << whoami << ": " << msg << std::endl
              << std::endl
              << "For help:" << std::endl
              << "  " << whoami << " --help=usage       usage information" << std::endl
              << "  " << whoami << " --help=topic       help on a topic" << std::endl
              << "  " << whoami << " --help=--option    help on an option" << std::endl
              << "  " << whoami << " --help             general help and a topic list"
              << std::endl
              << std::endl;
    exit(SPDFJob::EXIT_ERROR);
}

int
main(int argc, char* argv[])
{
    whoami = SUtil::getWhoami(argv[0]);
    SUtil::setLineBuf(stdout);

    SPDFJob j;
    try {
        j.initializeFromArgv(argv);
        j.run();
    } catch (SPDFUsage& e) {
        usageExit(e.what());
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << std::endl;
        return SPDFJob::EXIT_ERROR;
    }
    return j.getExitCode();
}
