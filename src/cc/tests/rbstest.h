// Shared test utilities.

#ifndef TESTS_RBSTEST_H
#define TESTS_RBSTEST_H

#include <gtest/gtest.h>
#include <stdint.h>
#include <sys/stat.h>
#include <string>

int main(int, char**);

namespace RBS {
namespace Test {

using namespace std;

class RbsTestUtils
{
public:
    static const string kTestHome;

    /**
     * Creates a temporary file under kTestHome.
     *
     * @param path Output parameter set to the path of the new temporary file.
     * @return The file descriptor, the caller must close it.
     */
    static int CreateTempFile(string* path);

    /**
     * Writes a string to a new temporary file.
     *
     * @return The path of the temporary file.
     */
    static string WriteTempFile(const string& data);

    static bool FileExists(const string& path, struct stat* s = NULL);

    /**
     * Remove a file or directory forcefully, e.g. calling rm -rf on it.
     */
    static void RemoveForcefully(const string& path);

    /**
     * Deterministic pseudo random bytes, the same seed yields the same data.
     */
    static string MakeData(size_t size, uint32_t seed = 1);

    /**
     * Polls the predicate every millisecond until it returns true or the
     * timeout expires.
     *
     * @return The last predicate value.
     */
    template<typename T>
    static bool WaitFor(const T& pred, int timeoutMs = 5000)
    {
        for (int i = 0; i < timeoutMs; i++) {
            if (pred()) {
                return true;
            }
            SleepMs(1);
        }
        return pred();
    }

    static void SleepMs(int ms);
};

} // namespace Test
} // namespace RBS

#endif // TESTS_RBSTEST_H
