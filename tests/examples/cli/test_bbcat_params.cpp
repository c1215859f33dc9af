/*
===============================================================================
 examples::cli::bbcat - Parameter Parsing Tests
===============================================================================

Scope:
------
configure() for the bbcat example, run from a directory that holds none of
the files the defaults name.

Covered Requirements:
---------------------
P1. Defaults
    - No arguments yields the default path, capacity and Print mode
    - The default path is not checked for existence while parsing

P2. Explicit arguments
    - An existing path is accepted from an unrelated working directory
    - Capacity, --count and --lenient reach Params
    - "-" selects stdin without touching the filesystem

===============================================================================
*/

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "common/test_check.hpp"
#include "common/cli/bbcat_params.hpp"

using namespace bufbytes;
using examples::cli::bbcat::Mode;
using examples::cli::bbcat::Params;


// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

// Switches the working directory to a fresh empty directory for its lifetime.
class ScopedEmptyCwd {
public:
    ScopedEmptyCwd() {
        char buf[4096];
        TEST_CHECK(::getcwd(buf, sizeof(buf)) != nullptr);
        prev_ = buf;
        char tmpl[] = "/tmp/bufbytes_cwd_XXXXXX";
        TEST_CHECK(::mkdtemp(tmpl) != nullptr);
        dir_ = tmpl;
        TEST_CHECK(::chdir(dir_.c_str()) == 0);
    }

    ~ScopedEmptyCwd() {
        if (::chdir(prev_.c_str()) == 0) {
            ::rmdir(dir_.c_str());
        }
    }

    ScopedEmptyCwd(const ScopedEmptyCwd&) = delete;
    ScopedEmptyCwd& operator=(const ScopedEmptyCwd&) = delete;

private:
    std::string prev_;
    std::string dir_;
};

static Params parse(std::vector<std::string> args) {
    args.insert(args.begin(), "bbcat");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    return examples::cli::bbcat::configure(static_cast<int>(args.size()), argv.data(), "bbcat test");
}


// -----------------------------------------------------------------------------
// P1. Defaults
// -----------------------------------------------------------------------------
void test_defaults_without_default_file() {
    std::cout << "[TEST] P1: defaults in a directory without the default file\n";

    ScopedEmptyCwd cwd;
    const Params params = parse({});

    TEST_CHECK_EQ(params.path, std::string{"CMakeLists.txt"});
    TEST_CHECK_EQ(params.capacity, core::config::DEFAULT_CAPACITY);
    TEST_CHECK(params.mode() == Mode::Print);
    TEST_CHECK(params.buffer_config().empty_source == core::config::EmptySourcePolicy::Strict);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// P2. Explicit arguments
// -----------------------------------------------------------------------------
void test_explicit_path_from_other_directory() {
    std::cout << "[TEST] P2: explicit path from an unrelated directory\n";

    char tmpl[] = "/tmp/bufbytes_input_XXXXXX";
    const int fd = ::mkstemp(tmpl);
    TEST_CHECK(fd >= 0);
    TEST_CHECK(::close(fd) == 0);
    const std::string input = tmpl;

    {
        ScopedEmptyCwd cwd;
        const Params params = parse({input, "-c", "16", "--count", "--lenient"});

        TEST_CHECK_EQ(params.path, input);
        TEST_CHECK_EQ(params.capacity, std::size_t{16});
        TEST_CHECK(params.mode() == Mode::Count);
        TEST_CHECK(params.buffer_config().empty_source == core::config::EmptySourcePolicy::Lenient);
    }

    ::unlink(input.c_str());
    std::cout << "[TEST] OK\n";
}

void test_stdin_path() {
    std::cout << "[TEST] P2: '-' selects stdin\n";

    ScopedEmptyCwd cwd;
    const Params params = parse({"-", "--hash"});

    TEST_CHECK_EQ(params.path, std::string{"-"});
    TEST_CHECK(params.mode() == Mode::Hash);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_defaults_without_default_file();
    test_explicit_path_from_other_directory();
    test_stdin_path();

    std::cout << "\n[BBCAT PARAMETER TESTS PASSED]\n";
    return 0;
}
