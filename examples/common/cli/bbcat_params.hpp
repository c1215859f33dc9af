#pragma once

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "bufbytes/core/config/buffer.hpp"
#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace bufbytes::examples::cli::bbcat {

enum class Mode {
    Print,   // stream bytes to stdout
    Count,   // print the number of bytes
    Hash     // print the XXH64 digest of the bytes
};

struct Params {
    std::string path      = "CMakeLists.txt";
    std::size_t capacity  = core::config::DEFAULT_CAPACITY;
    bool lenient          = false;
    bool count            = false;
    bool hash             = false;
    std::string log_level = "warn";

    [[nodiscard]] inline Mode mode() const noexcept {
        if (hash)  return Mode::Hash;
        if (count) return Mode::Count;
        return Mode::Print;
    }

    [[nodiscard]] inline core::config::Buffered buffer_config() const noexcept {
        return core::config::Buffered{
            capacity,
            lenient ? core::config::EmptySourcePolicy::Lenient : core::config::EmptySourcePolicy::Strict
        };
    }

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Path         : " << path << "\n"
           << "  Capacity     : " << capacity << "\n"
           << "  Empty source : " << core::config::to_string(buffer_config().empty_source) << "\n"
           << "  Log Level    : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    // No default_val() here: it would run the existing-file check on the
    // default path before parse(), outside the try below.
    app.add_option("path", params.path, "File to read ('-' for stdin)")->check(input_path_validator)->capture_default_str();
    app.add_option("-c,--capacity", params.capacity, "Buffer capacity in bytes")->check(CLI::PositiveNumber)->default_val(params.capacity);
    app.add_flag("--lenient", params.lenient, "Accept empty input instead of failing");
    auto* count = app.add_flag("--count", params.count, "Print the byte count instead of the bytes");
    auto* hash  = app.add_flag("--hash", params.hash, "Print the XXH64 digest instead of the bytes");
    count->excludes(hash);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Bytes are pulled one at a time through a fixed-size buffer.\n"
        "Diagnostics go to stderr; stdout carries only program output."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace bufbytes::examples::cli::bbcat
