#pragma once
#include <string>

namespace circ {

struct EngineConfig {
    int loanPeriodDays{14};
    int maxActiveLoans{3};
    std::string logLevel{"info"};

    // CIRCULATION_LOAN_DAYS, CIRCULATION_MAX_ACTIVE_LOANS, CIRCULATION_LOG_LEVEL
    static EngineConfig fromEnv();
};

// Ajusta el nivel del logger por defecto de spdlog.
void configureLogging(const EngineConfig& cfg);

} // namespace circ
