#pragma once

#include <Eigen/Core>

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace libdynfit {

struct DataTable {
    std::vector<std::string> columns;
    Eigen::MatrixXd values;  // rows are complete cases
    std::size_t dropped_rows{0};
};

// Comma separated values with a header row. Quoted cells are unquoted; rows
// with an empty, NA or non-numeric cell are dropped (listwise deletion).
[[nodiscard]] DataTable parse_csv(std::istream& input);

[[nodiscard]] DataTable read_csv(const std::string& path);

// Columns in the given order. Throws InputMismatchError for a missing column.
[[nodiscard]] Eigen::MatrixXd select_columns(const DataTable& table, const std::vector<std::string>& names);

void write_csv(const std::string& path, const std::vector<std::string>& header,
               const std::vector<std::vector<std::string>>& rows);

}  // namespace libdynfit
