#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>
#include <vector>

#include "libdynfit/result_table.hpp"

namespace {
std::vector<libdynfit::CutoffRow> two_levels() {
    libdynfit::CutoffRow level0;
    level0.level = 0;
    level0.srmr = {0.046, 0.95};
    level0.rmsea = {0.0312, 0.95};
    level0.cfi = {0.9871, 0.95};

    libdynfit::CutoffRow level1;
    level1.level = 1;
    level1.srmr = {0.05, 0.30};
    level1.rmsea = {0.07, 0.95};
    level1.cfi = {0.9, 0.605};
    level1.magnitude = 0.5;
    return {level0, level1};
}
}  // namespace

TEST_CASE("format_number keeps three decimals without trailing zeros", "[result_table]") {
    REQUIRE(libdynfit::format_number(0.06) == "0.06");
    REQUIRE(libdynfit::format_number(0.0504) == "0.05");
    REQUIRE(libdynfit::format_number(12.3456) == "12.346");
    REQUIRE(libdynfit::format_number(1.0) == "1");
    REQUIRE(libdynfit::format_number(24.0) == "24");
    REQUIRE(libdynfit::format_number(-0.0001) == "0");
    REQUIRE(libdynfit::format_number(std::numeric_limits<double>::quiet_NaN()) == "NA");
}

TEST_CASE("format_power renders percentages", "[result_table]") {
    REQUIRE(libdynfit::format_power(0.95) == "95%");
    REQUIRE(libdynfit::format_power(0.505) == "50.5%");
    REQUIRE(libdynfit::format_power(0.0) == "0%");
}

TEST_CASE("build_cutoff_table lays out levels with power rows", "[result_table]") {
    const auto table = libdynfit::build_cutoff_table(two_levels());
    REQUIRE(table.columns == std::vector<std::string>{"SRMR", "RMSEA", "CFI", "Magnitude"});
    REQUIRE(table.row_names == std::vector<std::string>{"Level-0", "Specificity", "", "Level-1", "Sensitivity"});

    REQUIRE(table.cells[0] == std::vector<std::string>{"0.046", "0.031", "0.987", ""});
    REQUIRE(table.cells[1] == std::vector<std::string>{"95%", "95%", "95%", ""});
    REQUIRE(table.cells[2] == std::vector<std::string>{"", "", "", ""});
    REQUIRE(table.cells[3] == std::vector<std::string>{"NONE", "0.07", "0.9", "0.5"});
    REQUIRE(table.cells[4] == std::vector<std::string>{"30%", "95%", "60.5%", ""});

    const std::string text = table.render();
    REQUIRE(text.find("Level-1     NONE") != std::string::npos);
    REQUIRE(text.find("Specificity 95%") != std::string::npos);
    REQUIRE(text.substr(0, 16) == "            SRMR");
}

TEST_CASE("build_empirical_fit_table reports the user's fit", "[result_table]") {
    libdynfit::FitResult fit;
    fit.chi_square = 31.2044;
    fit.df = 24.0;
    fit.p_value = 0.1471;
    fit.srmr = 0.0321;
    fit.rmsea = 0.0208;
    fit.cfi = 0.9921;
    const auto table = libdynfit::build_empirical_fit_table(libdynfit::empirical_fit(fit));
    REQUIRE(table.columns.front() == "Chi-Square");
    REQUIRE(table.cells.size() == 1);
    REQUIRE(table.cells[0] == std::vector<std::string>{"31.204", "24", "0.147", "0.032", "0.021", "0.992"});
}

TEST_CASE("replication_rows lists true and misspecified fits", "[result_table]") {
    libdynfit::SimulationRun run;
    libdynfit::LevelSimulation level;
    level.level = 2;
    libdynfit::ReplicationRecord record;
    record.level = 2;
    record.replication = 0;
    record.true_fit = {0.031, 0.012, 0.995};
    record.true_converged = true;
    record.misspecified_fit = {std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0};
    record.misspecified_converged = false;
    level.replications.push_back(record);
    run.levels.push_back(level);

    const auto rows = libdynfit::replication_rows(run);
    REQUIRE(libdynfit::replication_header().size() == 7);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0] == std::vector<std::string>{"2", "1", "True", "0.031", "0.012", "0.995", "TRUE"});
    REQUIRE(rows[1][2] == "Misspecified");
    REQUIRE(rows[1][3] == "NA");
    REQUIRE(rows[1][6] == "FALSE");
}
