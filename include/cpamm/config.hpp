#ifndef CPAMM_CONFIG_HPP
#define CPAMM_CONFIG_HPP

#include <string>
#include <string_view>

#include "address.hpp"

namespace cpamm {

// =============================================================================
// Validator Configuration
// =============================================================================

class Config {
public:
    std::string log_level = "info";
    bool log_rejections = false;   // Rejections at warn instead of debug
    ProgramIds programs = ProgramIds::defaults();

    Config() = default;

    // Load from a JSON document. Throws std::runtime_error on unreadable
    // files, malformed JSON, unknown log levels and bad program ids:
    // { "log_level": "debug", "log_rejections": true,
    //   "programs": { "token_program": "...", "associated_token_program": "..." } }
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    // Builder methods
    Config& with_programs(const ProgramIds& ids) {
        programs = ids;
        return *this;
    }

    // Throws std::runtime_error for a name spdlog does not know
    Config& with_log_level(std::string_view level);

    Config& enable_rejection_logging(bool enabled = true) {
        log_rejections = enabled;
        return *this;
    }
};

} // namespace cpamm

#endif // CPAMM_CONFIG_HPP
