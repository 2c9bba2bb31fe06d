#include "circulation/config.hpp"
#include "circulation/errors.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace circ {

static int positiveFromEnv(const char* name, int fallback) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;
    const std::string value(raw);
    int parsed = 0;
    try {
        std::size_t idx{0};
        parsed = std::stoi(value, &idx);
        if (idx != value.size()) throw LoanError::validation(std::string(name) + " is not a number");
    } catch (const std::logic_error&) {
        throw LoanError::validation(std::string(name) + " is not a number");
    }
    if (parsed <= 0) throw LoanError::validation(std::string(name) + " must be positive");
    return parsed;
}

EngineConfig EngineConfig::fromEnv() {
    EngineConfig cfg;
    cfg.loanPeriodDays = positiveFromEnv("CIRCULATION_LOAN_DAYS", cfg.loanPeriodDays);
    cfg.maxActiveLoans = positiveFromEnv("CIRCULATION_MAX_ACTIVE_LOANS", cfg.maxActiveLoans);
    if (const char* level = std::getenv("CIRCULATION_LOG_LEVEL")) {
        cfg.logLevel = level;
    }
    // from_str devuelve off para nombres desconocidos
    if (cfg.logLevel != "off" && spdlog::level::from_str(cfg.logLevel) == spdlog::level::off) {
        throw LoanError::validation("unknown log level '" + cfg.logLevel + "'");
    }
    return cfg;
}

void configureLogging(const EngineConfig& cfg) {
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
}

} // namespace circ
