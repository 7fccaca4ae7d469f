// Test runner: initializes logging, then runs all tests.

#include <gtest/gtest.h>
#include <iostream>
#include <string>

#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <unistd.h>

#include "common/MsgLogger.h"
#include "tests/rbstest.h"

using namespace RBS::Test;
using namespace std;

/**
 * On SIGINT the temporary test directory is removed before exiting, so that
 * an interrupted run does not leave files behind.
 */
void
HandleSignal(int signum)
{
    cout << "Caught signal: " << strsignal(signum) << endl;
    if (signum == SIGINT) {
        RbsTestUtils::RemoveForcefully(RbsTestUtils::kTestHome);
        exit(1);
    }
}

static void
RandInit()
{
    struct timeval now;
    gettimeofday(&now, NULL);

    int pid = getpid();
    int seed = (now.tv_sec * 1000 + now.tv_usec / 1000) ^ (pid * 0x5bd1e995);

    srand(seed);
    srandom(seed);
}

GTEST_API_ int
main(int argc, char **argv)
{
    signal(SIGINT, HandleSignal);

    RandInit();

    if (RbsTestUtils::FileExists(RbsTestUtils::kTestHome)) {
        RbsTestUtils::RemoveForcefully(RbsTestUtils::kTestHome);
    }
    mkdir(RbsTestUtils::kTestHome.c_str(), S_IRWXU|S_IRWXG|S_IROTH|S_IXOTH);

    const char* const logLevel = getenv("RBS_TEST_LOG_LEVEL");
    RBS::MsgLogger::Init(0, RBS::MsgLogger::kLogLevelWARN);
    if (logLevel) {
        RBS::MsgLogger::GetLogger()->SetLogLevel(logLevel);
    }

    cout << "Running custom main() from tests/rbstest_main" << endl;
    testing::InitGoogleTest(&argc, argv);

    int ret = RUN_ALL_TESTS();
    RbsTestUtils::RemoveForcefully(RbsTestUtils::kTestHome);
    RBS::MsgLogger::Stop();
    return ret;
}
