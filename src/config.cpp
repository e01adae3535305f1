// =============================================================================
// config.cpp - Validator configuration loading
// =============================================================================

#include "cpamm/config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cpamm {

namespace {

Pubkey parse_program_id(const nlohmann::json& node, const char* key, const Pubkey& fallback) {
    if (!node.contains(key)) return fallback;

    std::string text = node.at(key).get<std::string>();
    auto id = Pubkey::from_base58(text);
    if (!id) {
        throw std::runtime_error(std::string("Invalid program id for ") + key + ": " + text);
    }
    return *id;
}

// spdlog maps every unrecognised name to `off`, which would silence the
// validator without complaint
std::string parse_log_level(std::string_view name) {
    std::string level{name};
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
        throw std::runtime_error("Unknown log level: " + level);
    }
    return level;
}

} // namespace

Config& Config::with_log_level(std::string_view level) {
    log_level = parse_log_level(level);
    return *this;
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    try {
        auto doc = nlohmann::json::parse(std::string(content));
        if (!doc.is_object()) {
            throw std::runtime_error("Config must be a JSON object");
        }

        if (doc.contains("log_level")) {
            config.with_log_level(doc.at("log_level").get<std::string>());
        }
        if (doc.contains("log_rejections")) {
            config.log_rejections = doc.at("log_rejections").get<bool>();
        }
        if (doc.contains("programs")) {
            const auto& programs = doc.at("programs");
            config.programs.token_program =
                parse_program_id(programs, "token_program", config.programs.token_program);
            config.programs.associated_token_program =
                parse_program_id(programs, "associated_token_program",
                                 config.programs.associated_token_program);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed config: ") + e.what());
    }

    return config;
}

} // namespace cpamm
