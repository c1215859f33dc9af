/*
===============================================================================
 core::BufferedByteSource - Group A Unit Tests
===============================================================================

Scope:
------
Construction guarantees of bufbytes::core::BufferedByteSource<Source>.

Covered Requirements:
---------------------
A1. Successful construction
    - Instance positioned at the first byte (Ready, cursor 0)
    - Valid length equals the first fill
    - Exactly one read issued

A2. Empty source, Strict policy (default)
    - create() returns EmptySource, no instance produced

A3. Empty source, Lenient policy
    - Instance produced in the Exhausted state
    - First next_byte() reports end, no error recorded, no re-read

A4. First fill failure
    - Error propagated verbatim, not stored, no instance produced

A5. Invalid capacity
    - capacity 0 rejected with InvalidCapacity

A6. Source contract violation
    - A source reporting more bytes than requested is rejected

===============================================================================
*/

#include <cerrno>
#include <iostream>
#include <optional>
#include <string>

#include "bufbytes/core.hpp"
#include "common/mock_source.hpp"
#include "common/test_check.hpp"

using namespace bufbytes::core;
using namespace bufbytes::core::source;

using ScriptedBytes = BufferedByteSource<test::ScriptedSource>;


// -----------------------------------------------------------------------------
// A1. Successful construction
// -----------------------------------------------------------------------------
void test_create_positions_at_first_byte() {
    std::cout << "[TEST] Group A1: create positions at first byte\n";

    std::optional<ScriptedBytes> bytes;
    test::ScriptedSource script;
    script.data("hello");

    TEST_CHECK(ScriptedBytes::create_with_capacity(std::move(script), 8, bytes) == no_error);
    TEST_CHECK(bytes.has_value());
    TEST_CHECK(bytes->state() == State::Ready);
    TEST_CHECK_EQ(bytes->cursor(), 0u);
    TEST_CHECK_EQ(bytes->valid_length(), 5u);
    TEST_CHECK_EQ(bytes->capacity(), 8u);
    TEST_CHECK_EQ(bytes->source().read_calls(), 1u);
    TEST_CHECK(bytes->last_error() == nullptr);

    std::uint8_t b = 0;
    TEST_CHECK(bytes->next_byte(b));
    TEST_CHECK_EQ(b, 'h');

    std::cout << "[TEST] OK\n";
}

void test_create_uses_default_capacity() {
    std::cout << "[TEST] Group A1: default capacity\n";

    std::optional<MemoryByteSource> bytes;
    TEST_CHECK(MemoryByteSource::create(MemorySource{std::string_view{"x"}}, bytes) == no_error);
    TEST_CHECK(bytes.has_value());
    TEST_CHECK_EQ(bytes->capacity(), config::DEFAULT_CAPACITY);
    TEST_CHECK_EQ(config::DEFAULT_CAPACITY, 8192u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A2. Empty source, Strict policy
// -----------------------------------------------------------------------------
void test_empty_source_strict_fails() {
    std::cout << "[TEST] Group A2: empty source rejected (Strict)\n";

    std::optional<MemoryByteSource> bytes;
    const IoError err = MemoryByteSource::create(MemorySource{std::string_view{}}, bytes);

    TEST_CHECK(err.code == Error::EmptySource);
    TEST_CHECK(err.sys_errno == 0);
    TEST_CHECK(!bytes.has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A3. Empty source, Lenient policy
// -----------------------------------------------------------------------------
void test_empty_source_lenient_ends_immediately() {
    std::cout << "[TEST] Group A3: empty source accepted (Lenient)\n";

    std::optional<ScriptedBytes> bytes;
    test::ScriptedSource script;
    script.end().data("never read");

    const config::Buffered cfg{16, config::EmptySourcePolicy::Lenient};
    TEST_CHECK(ScriptedBytes::create(std::move(script), bytes, cfg) == no_error);
    TEST_CHECK(bytes.has_value());
    TEST_CHECK(bytes->state() == State::Exhausted);

    std::uint8_t b = 0;
    TEST_CHECK(!bytes->next_byte(b));
    TEST_CHECK(!bytes->next_byte(b));
    TEST_CHECK(bytes->last_error() == nullptr);
    TEST_CHECK_EQ(bytes->source().read_calls(), 1u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A4. First fill failure
// -----------------------------------------------------------------------------
void test_first_fill_failure_propagates() {
    std::cout << "[TEST] Group A4: first fill failure propagates\n";

    std::optional<ScriptedBytes> bytes;
    test::ScriptedSource script;
    script.fail(make_error(Error::ReadFailed, EACCES));

    const IoError err = ScriptedBytes::create_with_capacity(std::move(script), 8, bytes);
    TEST_CHECK(err.code == Error::ReadFailed);
    TEST_CHECK(err.sys_errno == EACCES);
    TEST_CHECK(!bytes.has_value());

    std::cout << "[TEST] OK\n";
}

void test_failed_create_clears_previous_instance() {
    std::cout << "[TEST] Group A4: failed create leaves output empty\n";

    std::optional<MemoryByteSource> bytes;
    TEST_CHECK(MemoryByteSource::create(MemorySource{std::string_view{"abc"}}, bytes) == no_error);
    TEST_CHECK(bytes.has_value());

    TEST_CHECK(MemoryByteSource::create(MemorySource{std::string_view{}}, bytes).code == Error::EmptySource);
    TEST_CHECK(!bytes.has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A5. Invalid capacity
// -----------------------------------------------------------------------------
void test_zero_capacity_rejected() {
    std::cout << "[TEST] Group A5: capacity 0 rejected\n";

    std::optional<MemoryByteSource> bytes;
    const IoError err = MemoryByteSource::create_with_capacity(MemorySource{std::string_view{"abc"}}, 0, bytes);
    TEST_CHECK(err.code == Error::InvalidCapacity);
    TEST_CHECK(!bytes.has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A6. Source contract violation
// -----------------------------------------------------------------------------
void test_oversized_fill_rejected() {
    std::cout << "[TEST] Group A6: oversized fill rejected\n";

    std::optional<BufferedByteSource<test::LyingSource>> bytes;
    const IoError err = BufferedByteSource<test::LyingSource>::create_with_capacity(test::LyingSource{}, 4, bytes);
    TEST_CHECK(err.code == Error::SourceContract);
    TEST_CHECK(!bytes.has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_create_positions_at_first_byte();
    test_create_uses_default_capacity();
    test_empty_source_strict_fails();
    test_empty_source_lenient_ends_immediately();
    test_first_fill_failure_propagates();
    test_failed_create_clears_previous_instance();
    test_zero_capacity_rejected();
    test_oversized_fill_rejected();

    std::cout << "\n[GROUP A - CONSTRUCTION TESTS PASSED]\n";
    return 0;
}
