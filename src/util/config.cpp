#include <weft/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace weft {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WeftError{WeftError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [engine] section
    if (auto engine = doc["engine"].as_table()) {
        if (auto v = (*engine)["max-recursion-depth"].value<int64_t>()) {
            if (*v <= 0) {
                return WeftError{WeftError::Config,
                    "engine.max-recursion-depth must be positive, got " +
                    std::to_string(*v)};
            }
            cfg.engine.max_recursion_depth = static_cast<std::size_t>(*v);
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) {
                auto err = std::move(lvl).error();
                err.code = WeftError::Config;
                return err;
            }
            cfg.log.level = lvl.value();
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log.color = *v;
            cfg.log.color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WeftError{WeftError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::apply_logging() const {
    log::set_level(log.level);
    if (log.color_set) {
        log::set_color_enabled(log.color);
    }
}

} // namespace weft
