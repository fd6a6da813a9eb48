#include "libdynfit/data_io.hpp"

#include "libdynfit/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace libdynfit {

namespace {
[[nodiscard]] std::string unquote(std::string cell) {
    while (!cell.empty() && (cell.back() == '\r' || cell.back() == ' ')) {
        cell.pop_back();
    }
    std::size_t begin = 0;
    while (begin < cell.size() && cell[begin] == ' ') {
        ++begin;
    }
    cell = cell.substr(begin);
    if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
        cell = cell.substr(1, cell.size() - 2);
    }
    return cell;
}

[[nodiscard]] std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(unquote(cell));
    }
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

[[nodiscard]] std::optional<double> parse_cell(const std::string& cell) {
    if (cell.empty() || cell == "NA" || cell == "NaN" || cell == ".") {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(cell.c_str(), &end);
    if (end == cell.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::string quote_if_needed(const std::string& cell) {
    if (cell.find_first_of(",\"") == std::string::npos) {
        return cell;
    }
    std::string quoted = "\"";
    for (char ch : cell) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}
}  // namespace

DataTable parse_csv(std::istream& input) {
    DataTable table;
    std::string line;
    if (!std::getline(input, line)) {
        throw InputMismatchError("data file is empty");
    }
    table.columns = split_line(line);
    if (table.columns.empty()) {
        throw InputMismatchError("data file has no header columns");
    }

    std::vector<std::vector<double>> rows;
    while (std::getline(input, line)) {
        if (unquote(line).empty()) {
            continue;
        }
        const auto cells = split_line(line);
        if (cells.size() != table.columns.size()) {
            ++table.dropped_rows;
            continue;
        }
        std::vector<double> row;
        row.reserve(cells.size());
        for (const auto& cell : cells) {
            const auto value = parse_cell(cell);
            if (!value) {
                break;
            }
            row.push_back(*value);
        }
        if (row.size() != cells.size()) {
            ++table.dropped_rows;
            continue;
        }
        rows.push_back(std::move(row));
    }

    table.values.resize(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(table.columns.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (std::size_t j = 0; j < rows[i].size(); ++j) {
            table.values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
        }
    }
    return table;
}

DataTable read_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputMismatchError("cannot open data file: " + path);
    }
    return parse_csv(file);
}

Eigen::MatrixXd select_columns(const DataTable& table, const std::vector<std::string>& names) {
    Eigen::MatrixXd selected(table.values.rows(), static_cast<Eigen::Index>(names.size()));
    for (std::size_t j = 0; j < names.size(); ++j) {
        std::size_t column = table.columns.size();
        for (std::size_t k = 0; k < table.columns.size(); ++k) {
            if (table.columns[k] == names[j]) {
                column = k;
                break;
            }
        }
        if (column == table.columns.size()) {
            throw InputMismatchError("data has no column named " + names[j]);
        }
        selected.col(static_cast<Eigen::Index>(j)) = table.values.col(static_cast<Eigen::Index>(column));
    }
    return selected;
}

void write_csv(const std::string& path, const std::vector<std::string>& header,
               const std::vector<std::vector<std::string>>& rows) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open output file: " + path);
    }
    auto write_row = [&file](const std::vector<std::string>& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) {
                file << ',';
            }
            file << quote_if_needed(cells[i]);
        }
        file << '\n';
    };
    write_row(header);
    for (const auto& row : rows) {
        write_row(row);
    }
    if (!file) {
        throw std::runtime_error("failed writing output file: " + path);
    }
}

}  // namespace libdynfit
