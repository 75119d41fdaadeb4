#pragma once

#include <weft/log.hpp>
#include <weft/result.hpp>
#include <cstddef>
#include <string>

namespace weft {

// Options a grammar hands to every engine pass.
struct EngineOptions {
    // Nested Recursive/Reference resolutions allowed before a lookup is
    // treated as a non-match.
    std::size_t max_recursion_depth = 256;
};

struct LogOptions {
    log::Level level = log::Warn;
    bool color = false;
    bool color_set = false;
};

// TOML-backed settings:
//
//   [engine]
//   max-recursion-depth = 256
//
//   [log]
//   level = "info"
//   color = true
struct Config {
    EngineOptions engine;
    LogOptions log;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    // Push the [log] settings into weft::log.
    void apply_logging() const;
};

} // namespace weft
