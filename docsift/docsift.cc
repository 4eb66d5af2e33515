#include <docsift/DocSiftJob.hh>
#include <docsift/SiftExc.hh>

#include <qpdf/QUtil.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

static char const* whoami = nullptr;

static void
usageExit(std::string const& msg)
{
    std::cerr << "\n"
              << whoami << ": " << msg << "\n"
              << "\n"
              << "For help:\n"
              << "  " << whoami << " --help\n"
              << "\n";
    exit(DocSiftJob::EXIT_ERROR);
}

static int
realmain(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);

    // Remove prefix added by libtool for consistency during testing.
    if (strncmp(whoami, "lt-", 3) == 0) {
        whoami += 3;
    }

    DocSiftJob j;
    try {
        j.initializeFromArgv(argv);
        j.run();
    } catch (SiftUsage& e) {
        usageExit(e.what());
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << "\n";
        return DocSiftJob::EXIT_ERROR;
    }
    return j.getExitCode();
}

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}
