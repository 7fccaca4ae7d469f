#include "tests/rbstest.h"

#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

namespace RBS {
namespace Test {

using namespace std;

const string RbsTestUtils::kTestHome = "/tmp/rbstest";

int
RbsTestUtils::CreateTempFile(string* path)
{
    mkdir(kTestHome.c_str(), S_IRWXU);
    string tmpl = kTestHome + "/tmpfileXXXXXX";
    char*  buf  = strdup(tmpl.c_str());
    const int fd = mkstemp(buf);
    if (fd >= 0 && path) {
        *path = buf;
    }
    free(buf);
    return fd;
}

string
RbsTestUtils::WriteTempFile(const string& data)
{
    string path;
    const int fd = CreateTempFile(&path);
    if (fd < 0) {
        ADD_FAILURE() << "failed to create temporary file: " <<
            strerror(errno);
        return string();
    }
    const char* ptr = data.data();
    size_t      rem = data.size();
    while (rem > 0) {
        const ssize_t n = write(fd, ptr, rem);
        if (n <= 0) {
            ADD_FAILURE() << "failed to write temporary file: " <<
                strerror(errno);
            break;
        }
        ptr += n;
        rem -= n;
    }
    close(fd);
    return path;
}

bool
RbsTestUtils::FileExists(const string& path, struct stat* s)
{
    struct stat st;
    return (stat(path.c_str(), s ? s : &st) == 0);
}

static int
RemoveEntry(const char* path, const struct stat*, int, struct FTW*)
{
    return remove(path);
}

void
RbsTestUtils::RemoveForcefully(const string& path)
{
    if (! FileExists(path)) {
        return;
    }
    nftw(path.c_str(), &RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
}

string
RbsTestUtils::MakeData(size_t size, uint32_t seed)
{
    string   ret(size, char(0));
    uint32_t x = seed ? seed : 1;
    for (size_t i = 0; i < size; i++) {
        // xorshift32
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        ret[i] = char(x & 0xFF);
    }
    return ret;
}

void
RbsTestUtils::SleepMs(int ms)
{
    usleep(ms * 1000);
}

} // namespace Test
} // namespace RBS
