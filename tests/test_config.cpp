#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "config.hpp"
#include <filesystem>
#include <fstream>

using namespace fincalc;

namespace {

const std::string DATA_DIR = FINCALC_TEST_DATA_DIR;

} // anonymous namespace

TEST_CASE("Scenario file parses every section", "[config]") {
    RunConfig config = parse_config_from_file(DATA_DIR + "/scenario.json");

    REQUIRE(config.debts.empty());
    REQUIRE(config.debts_file == (std::filesystem::path(DATA_DIR) / "debts.csv").string());
    REQUIRE(config.budget.has_value());
    REQUIRE(*config.budget == 500.0);

    REQUIRE(config.simulation.strategy == Strategy::Avalanche);
    REQUIRE_FALSE(config.simulation.cascade_excess);
    REQUIRE(config.simulation.max_periods == 1200);

    REQUIRE(config.savings.has_value());
    REQUIRE(config.savings->periodic_contribution == 1000.0);
    REQUIRE(config.savings->periodic_rate == 0.05);
    REQUIRE(config.savings->target_amount == 10000.0);
    REQUIRE(config.savings->precision == SavingsParameters::DEFAULT_PRECISION);

    REQUIRE(config.experiment.debt_counts == std::vector<size_t>{10, 25});
    REQUIRE(config.experiment.seed == 7);

    REQUIRE(config.logging.min_level == LogLevel::WARN);
    REQUIRE_FALSE(config.logging.enable_console);
}

TEST_CASE("Scenario debts are collected from the CSV file", "[config]") {
    RunConfig config = parse_config_from_file(DATA_DIR + "/scenario.json");
    std::vector<Debt> debts = collect_debts(config);

    REQUIRE(debts.size() == 3);
    REQUIRE(debts[0] == Debt(5000.0, 0.18));
    REQUIRE(debts[2] == Debt(3000.0, 0.04));
}

TEST_CASE("Inline debts come before file debts", "[config]") {
    std::string json = R"({
        "debts": [{"principal": 250.0, "annual_rate": 0.3}],
        "debts_file": "debts.csv"
    })";
    RunConfig config = parse_config_from_string(json, DATA_DIR);
    std::vector<Debt> debts = collect_debts(config);

    REQUIRE(debts.size() == 4);
    REQUIRE(debts[0] == Debt(250.0, 0.3));
    REQUIRE(debts[1] == Debt(5000.0, 0.18));
}

TEST_CASE("Missing sections keep their defaults", "[config]") {
    RunConfig config = parse_config_from_string("{}");

    REQUIRE(config.debts.empty());
    REQUIRE(config.debts_file.empty());
    REQUIRE_FALSE(config.budget.has_value());
    REQUIRE_FALSE(config.savings.has_value());
    REQUIRE(config.simulation.strategy == Strategy::Avalanche);
    REQUIRE(config.experiment.debt_counts.size() == 10);
    REQUIRE(config.logging.min_level == LogLevel::INFO);
}

TEST_CASE("Simulation section is shared with the experiment", "[config]") {
    std::string json = R"({
        "simulation": {"strategy": "Snowball", "cascade_excess": true, "max_periods": 60}
    })";
    RunConfig config = parse_config_from_string(json);

    REQUIRE(config.simulation.strategy == Strategy::Snowball);
    REQUIRE(config.simulation.cascade_excess);
    REQUIRE(config.simulation.max_periods == 60);
    REQUIRE(config.experiment.simulation.strategy == Strategy::Snowball);
    REQUIRE(config.experiment.simulation.max_periods == 60);
}

TEST_CASE("Savings precision override", "[config]") {
    RunConfig config = parse_config_from_string(
        R"({"savings": {"initial": 100, "target": 500, "contribution": 50, "precision": 0.01}})");

    REQUIRE(config.savings->initial_principal == 100.0);
    REQUIRE(config.savings->precision == 0.01);
    REQUIRE(config.savings->periodic_rate == 0.0);
}

TEST_CASE("Log file path is resolved against the config directory", "[config]") {
    RunConfig config = parse_config_from_string(
        R"({"logging": {"level": "DEBUG", "file": "run.log", "json": false}})", "/var/tmp");

    REQUIRE(config.logging.min_level == LogLevel::DEBUG);
    REQUIRE(config.logging.enable_file);
    REQUIRE_FALSE(config.logging.enable_json);
    REQUIRE(config.logging.log_file_path == (std::filesystem::path("/var/tmp") / "run.log").string());
}

TEST_CASE("resolve_relative_path", "[config]") {
    REQUIRE(resolve_relative_path("/abs/debts.csv", "/base") == "/abs/debts.csv");
    REQUIRE(resolve_relative_path("debts.csv", "") == "debts.csv");
    REQUIRE(resolve_relative_path("debts.csv", "/base") ==
            (std::filesystem::path("/base") / "debts.csv").string());
}

// ============================================================================
// Error handling
// ============================================================================

TEST_CASE("Invalid JSON is reported", "[config][error]") {
    REQUIRE_THROWS_AS(parse_config_from_string("{ not json"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string("[1, 2, 3]"), ConfigParseError);
}

TEST_CASE("Missing config file is reported", "[config][error]") {
    REQUIRE_THROWS_AS(parse_config_from_file(DATA_DIR + "/does_not_exist.json"), ConfigParseError);
}

TEST_CASE("Out-of-range values are rejected", "[config][error]") {
    REQUIRE_THROWS_AS(parse_config_from_string(R"({"budget": -5})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(R"({"budget": "lots"})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"debts": [{"principal": -1, "annual_rate": 0.1}]})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"simulation": {"max_periods": 0}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"simulation": {"max_periods": 1e12}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"simulation": {"max_periods": 2.7}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"simulation": {"max_periods": 3000000000}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"simulation": {"payoff_threshold": -0.5}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"savings": {"target": 100, "precision": 0}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"experiment": {"counts": [10, 0]}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"experiment": {"budget_fraction": 0}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"logging": {"level": "VERBOSE"}})"), ConfigParseError);
}

TEST_CASE("Missing required fields are named", "[config][error]") {
    REQUIRE_THROWS_WITH(parse_config_from_string(R"({"debts": [{"principal": 100}]})"),
                        Catch::Matchers::ContainsSubstring("annual_rate"));
    REQUIRE_THROWS_WITH(parse_config_from_string(R"({"savings": {"initial": 100}})"),
                        Catch::Matchers::ContainsSubstring("target"));
}

TEST_CASE("Unknown strategy is rejected", "[config][error]") {
    REQUIRE_THROWS_WITH(parse_config_from_string(R"({"simulation": {"strategy": "tsunami"}})"),
                        Catch::Matchers::ContainsSubstring("strategy"));
}

TEST_CASE("Wrong types are rejected", "[config][error]") {
    REQUIRE_THROWS_AS(parse_config_from_string(R"({"debts": {"principal": 1}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"simulation": {"cascade_excess": "yes"}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_config_from_string(
        R"({"experiment": {"seed": -3}})"), ConfigParseError);
}
