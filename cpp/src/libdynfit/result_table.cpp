#include "libdynfit/result_table.hpp"

#include "libdynfit/data_io.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace libdynfit {

namespace {
[[nodiscard]] std::string trim_zeros(std::string text) {
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

[[nodiscard]] std::string fixed(double value, int decimals) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimals) << value;
    return out.str();
}

[[nodiscard]] std::string full_precision(double value) {
    if (!std::isfinite(value)) {
        return "NA";
    }
    std::ostringstream out;
    out << std::setprecision(10) << value;
    return out.str();
}

[[nodiscard]] std::string cutoff_cell(const IndexCutoff& cutoff, bool reference_row) {
    if (!reference_row && cutoff.none()) {
        return "NONE";
    }
    return format_number(cutoff.cutoff);
}
}  // namespace

std::string format_number(double value) {
    if (!std::isfinite(value)) {
        return "NA";
    }
    return trim_zeros(fixed(std::round(value * 1000.0) / 1000.0, 3));
}

std::string format_power(double power) {
    return trim_zeros(fixed(std::round(power * 10000.0) / 100.0, 2)) + "%";
}

std::string ResultTable::render() const {
    std::size_t label_width = 0;
    for (const auto& name : row_names) {
        label_width = std::max(label_width, name.size());
    }
    std::vector<std::size_t> widths(columns.size());
    for (std::size_t j = 0; j < columns.size(); ++j) {
        widths[j] = columns[j].size();
        for (const auto& row : cells) {
            if (j < row.size()) {
                widths[j] = std::max(widths[j], row[j].size());
            }
        }
    }

    std::ostringstream out;
    out << std::left << std::setw(static_cast<int>(label_width)) << "";
    for (std::size_t j = 0; j < columns.size(); ++j) {
        out << ' ' << std::setw(static_cast<int>(widths[j])) << columns[j];
    }
    out << '\n';
    for (std::size_t i = 0; i < cells.size(); ++i) {
        const std::string& name = i < row_names.size() ? row_names[i] : std::string();
        out << std::setw(static_cast<int>(label_width)) << name;
        for (std::size_t j = 0; j < columns.size(); ++j) {
            out << ' ' << std::setw(static_cast<int>(widths[j])) << (j < cells[i].size() ? cells[i][j] : "");
        }
        out << '\n';
    }
    return out.str();
}

ResultTable build_cutoff_table(const std::vector<CutoffRow>& rows) {
    ResultTable table;
    table.columns = {"SRMR", "RMSEA", "CFI", "Magnitude"};
    for (const auto& row : rows) {
        const bool reference_row = row.level == 0;
        table.row_names.push_back("Level-" + std::to_string(row.level));
        table.cells.push_back({cutoff_cell(row.srmr, reference_row), cutoff_cell(row.rmsea, reference_row),
                               cutoff_cell(row.cfi, reference_row),
                               row.magnitude ? format_number(*row.magnitude) : std::string()});

        table.row_names.emplace_back(reference_row ? "Specificity" : "Sensitivity");
        table.cells.push_back({format_power(row.srmr.power), format_power(row.rmsea.power),
                               format_power(row.cfi.power), std::string()});

        table.row_names.emplace_back();
        table.cells.push_back({"", "", "", ""});
    }
    if (!table.cells.empty()) {
        table.row_names.pop_back();
        table.cells.pop_back();
    }
    return table;
}

EmpiricalFit empirical_fit(const FitResult& fit) {
    return EmpiricalFit{fit.chi_square, fit.df, fit.p_value, fit.srmr, fit.rmsea, fit.cfi};
}

ResultTable build_empirical_fit_table(const EmpiricalFit& fit) {
    ResultTable table;
    table.columns = {"Chi-Square", "df", "p-value", "SRMR", "RMSEA", "CFI"};
    table.row_names = {""};
    table.cells = {{format_number(fit.chi_square), format_number(fit.df), format_number(fit.p_value),
                    format_number(fit.srmr), format_number(fit.rmsea), format_number(fit.cfi)}};
    return table;
}

std::vector<std::string> replication_header() {
    return {"level", "replication", "model", "srmr", "rmsea", "cfi", "converged"};
}

std::vector<std::vector<std::string>> replication_rows(const SimulationRun& run) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& level : run.levels) {
        for (const auto& record : level.replications) {
            const std::string lvl = std::to_string(record.level);
            const std::string rep = std::to_string(record.replication + 1);
            rows.push_back({lvl, rep, "True", full_precision(record.true_fit.srmr),
                            full_precision(record.true_fit.rmsea), full_precision(record.true_fit.cfi),
                            record.true_converged ? "TRUE" : "FALSE"});
            rows.push_back({lvl, rep, "Misspecified", full_precision(record.misspecified_fit.srmr),
                            full_precision(record.misspecified_fit.rmsea), full_precision(record.misspecified_fit.cfi),
                            record.misspecified_converged ? "TRUE" : "FALSE"});
        }
    }
    return rows;
}

void write_replication_csv(const std::string& path, const SimulationRun& run) {
    write_csv(path, replication_header(), replication_rows(run));
}

}  // namespace libdynfit
