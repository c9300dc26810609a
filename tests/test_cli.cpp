#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

const std::string BINARY = FINCALC_BINARY;
const std::string DATA_DIR = FINCALC_TEST_DATA_DIR;

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "/tmp/fincalc_test_stdout.txt";
    std::string stderr_file = "/tmp/fincalc_test_stderr.txt";

    std::string full_cmd = BINARY + " " + args + " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // system() returns the raw wait status
    result.exit_code = WEXITSTATUS(status);

    return result;
}

const std::string REFERENCE_DEBTS = "--debt 5000:0.18 --debt 8000:0.06 --debt 3000:0.04";

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("simulate") != std::string::npos);
    REQUIRE(result.stderr_output.find("--budget") != std::string::npos);
    REQUIRE(result.stderr_output.find("--strategy") != std::string::npos);
    REQUIRE(result.stderr_output.find("--target") != std::string::npos);
    REQUIRE(result.stderr_output.find("--counts") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI unknown option fails", "[cli]") {
    auto result = run_command("simulate --unknown-option");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
}

TEST_CASE("CLI unknown command fails", "[cli]") {
    auto result = run_command("frobnicate --budget 100");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Unknown command") != std::string::npos);
}

TEST_CASE("CLI missing inputs fail", "[cli]") {
    SECTION("Missing debts") {
        auto result = run_command("simulate --budget 500");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("No debts given") != std::string::npos);
    }

    SECTION("Missing budget") {
        auto result = run_command("simulate " + REFERENCE_DEBTS);
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--budget is required") != std::string::npos);
    }

    SECTION("Missing savings target") {
        auto result = run_command("savings --contribution 100");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--target") != std::string::npos);
    }

    SECTION("Missing debts file") {
        auto result = run_command("simulate --debts nonexistent.csv --budget 500");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("not found") != std::string::npos);
    }
}

TEST_CASE("CLI invalid values fail", "[cli]") {
    SECTION("Bad debt") {
        auto result = run_command("simulate --debt 5000 --budget 500");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --debt") != std::string::npos);
    }

    SECTION("Negative budget") {
        auto result = run_command("simulate " + REFERENCE_DEBTS + " --budget -5");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Non-numeric budget") {
        auto result = run_command("simulate " + REFERENCE_DEBTS + " --budget nan");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--budget must be a non-negative number") !=
                std::string::npos);
        REQUIRE(result.stdout_output.empty());
    }

    SECTION("Unknown strategy") {
        auto result = run_command("simulate " + REFERENCE_DEBTS + " --budget 500 --strategy tsunami");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Unknown strategy") != std::string::npos);
    }
}

TEST_CASE("CLI simulate prints summary and JSON", "[cli][integration]") {
    auto result = run_command("simulate " + REFERENCE_DEBTS + " --budget 500");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Debt Repayment Simulation") != std::string::npos);

    auto j = nlohmann::json::parse(result.stdout_output);
    REQUIRE(j["status"] == "completed");
    REQUIRE(j["periods_elapsed"] == 38);
    REQUIRE_THAT(j["total_interest_paid"].get<double>(),
                 Catch::Matchers::WithinAbs(1743.09, 1.0));
}

TEST_CASE("CLI simulate reports insufficient budget", "[cli][integration]") {
    auto result = run_command("simulate --debt 10000:0.25 --debt 5000:0.20 --debt 3000:0.15 "
                              "--budget 100");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("WARNING") != std::string::npos);

    auto j = nlohmann::json::parse(result.stdout_output);
    REQUIRE(j["status"] == "insufficient_budget");
    REQUIRE(j["periods_elapsed"] == 1);
    REQUIRE(j["payoff_order"].empty());
}

TEST_CASE("CLI runs from a config file", "[cli][integration]") {
    auto result = run_command("compare --config " + DATA_DIR + "/scenario.json");
    REQUIRE(result.exit_code == 0);

    auto j = nlohmann::json::parse(result.stdout_output);
    REQUIRE(j["avalanche"]["periods_elapsed"] == 38);
    REQUIRE(j["snowball"]["periods_elapsed"] == 37);
    REQUIRE(j["interest_savings"].get<double>() > 0.0);
}

TEST_CASE("CLI compare writes CSV", "[cli][integration]") {
    const std::string csv_path = "cli_compare.csv";
    auto result = run_command("compare --debts " + DATA_DIR + "/debts.csv --budget 500 --csv " + csv_path);
    REQUIRE(result.exit_code == 0);

    std::string csv = read_file(csv_path);
    REQUIRE(csv.find("Strategy,Months,TotalInterestPaid,SavingsVsSnowball") == 0);
    REQUIRE(csv.find("Avalanche,38,") != std::string::npos);

    std::filesystem::remove(csv_path);
}

TEST_CASE("CLI savings estimate", "[cli][integration]") {
    const std::string output_path = "cli_savings.json";
    auto result = run_command("savings --contribution 1000 --rate 0.05 --target 10000 --output " +
                              output_path);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("8 years and 4 months") != std::string::npos);

    auto j = nlohmann::json::parse(read_file(output_path));
    REQUIRE(j["time"].get<double>() > 8.0);
    REQUIRE(j["time"].get<double>() < 10.0);

    std::filesystem::remove(output_path);
}

TEST_CASE("CLI savings unreachable goal fails", "[cli]") {
    auto result = run_command("savings --initial 100 --target 1000");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Unreachable goal") != std::string::npos);
}

TEST_CASE("CLI experiment", "[cli][integration]") {
    const std::string csv_path = "cli_experiment.csv";
    auto result = run_command("experiment --counts 5,10 --seed 3 --csv " + csv_path);
    REQUIRE(result.exit_code == 0);

    auto j = nlohmann::json::parse(result.stdout_output);
    REQUIRE(j["rows"].size() == 2);
    REQUIRE(j["rows"][1]["num_debts"] == 10);

    std::string csv = read_file(csv_path);
    REQUIRE(csv.find("NumDebts,RuntimeMillis,MonthsElapsed,TotalInterestPaid") == 0);

    std::filesystem::remove(csv_path);
}
