//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

/// Settings for one invocation.  Filled by the command line layer and handed to the engine
/// explicitly, nothing below main() reads the environment or the current directory.
struct Config {
    std::filesystem::path root = ".";
    int depth = 2;
    size_t jobs = 0;
    bool color = true;
    bool show_primary = false;
    std::string log_level = "warn";

    /// Absolute, normalized form of `root`.
    std::filesystem::path searchRoot() const;
};

/// Installs the stderr logger and applies `level` (trace, debug, info, warn, error, off).
void setupLogging(const std::string &level);
