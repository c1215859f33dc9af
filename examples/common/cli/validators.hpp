#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace bufbytes::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace | debug | info | warn | error | fatal | off";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Input path validator ("-" selects stdin)
// -------------------------------------------------------------
inline auto input_path_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "-") {
            return {};
        }
        return CLI::ExistingFile(value);
    },
    "Input path validator"
);

} // namespace bufbytes::examples::cli
