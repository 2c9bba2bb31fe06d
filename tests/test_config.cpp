#include <catch2/catch_all.hpp>
#include "circulation/config.hpp"
#include "circulation/errors.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>

using namespace circ;

namespace {

// Limpia las variables al salir del test
struct EnvGuard {
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }
    static void clear() {
        ::unsetenv("CIRCULATION_LOAN_DAYS");
        ::unsetenv("CIRCULATION_MAX_ACTIVE_LOANS");
        ::unsetenv("CIRCULATION_LOG_LEVEL");
    }
};

} // namespace

TEST_CASE("Config: valores por defecto sin variables") {
    EnvGuard env;
    auto cfg = EngineConfig::fromEnv();
    REQUIRE(cfg.loanPeriodDays == 14);
    REQUIRE(cfg.maxActiveLoans == 3);
    REQUIRE(cfg.logLevel == "info");
}

TEST_CASE("Config: las variables sobreescriben los defaults") {
    EnvGuard env;
    ::setenv("CIRCULATION_LOAN_DAYS", "7", 1);
    ::setenv("CIRCULATION_MAX_ACTIVE_LOANS", "5", 1);
    ::setenv("CIRCULATION_LOG_LEVEL", "debug", 1);
    auto cfg = EngineConfig::fromEnv();
    REQUIRE(cfg.loanPeriodDays == 7);
    REQUIRE(cfg.maxActiveLoans == 5);
    REQUIRE(cfg.logLevel == "debug");
}

TEST_CASE("Config: números mal formados o no positivos") {
    EnvGuard env;
    ::setenv("CIRCULATION_LOAN_DAYS", "14d", 1);
    REQUIRE_THROWS_WITH(EngineConfig::fromEnv(), "VALIDATION_ERROR");
    ::setenv("CIRCULATION_LOAN_DAYS", "0", 1);
    REQUIRE_THROWS_WITH(EngineConfig::fromEnv(), "VALIDATION_ERROR");
    ::setenv("CIRCULATION_LOAN_DAYS", "", 1);
    REQUIRE_THROWS_WITH(EngineConfig::fromEnv(), "VALIDATION_ERROR");
    ::unsetenv("CIRCULATION_LOAN_DAYS");
    ::setenv("CIRCULATION_MAX_ACTIVE_LOANS", "-2", 1);
    REQUIRE_THROWS_WITH(EngineConfig::fromEnv(), "VALIDATION_ERROR");
}

TEST_CASE("Config: nivel de log desconocido") {
    EnvGuard env;
    ::setenv("CIRCULATION_LOG_LEVEL", "chatty", 1);
    REQUIRE_THROWS_WITH(EngineConfig::fromEnv(), "VALIDATION_ERROR");
    ::setenv("CIRCULATION_LOG_LEVEL", "off", 1);
    REQUIRE_NOTHROW(EngineConfig::fromEnv());
}

TEST_CASE("configureLogging ajusta el nivel de spdlog") {
    const auto previous = spdlog::get_level();
    EngineConfig cfg;
    cfg.logLevel = "warn";
    configureLogging(cfg);
    REQUIRE(spdlog::get_level() == spdlog::level::warn);
    spdlog::set_level(previous);
}
