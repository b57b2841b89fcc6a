/// @file src/core/data_loader.cpp
/// @brief Text loader for descriptor trajectories.

#include "mlcv/data_loader.hpp"
#include "mlcv/log.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace mlcv::core {

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<std::vector<double>>
DataLoader::parse_row(const std::string& line) noexcept {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || line[first] == '#') {
        return std::nullopt;
    }

    std::vector<double> fields;
    std::size_t pos = first;
    while (pos < line.size()) {
        const auto start = line.find_first_not_of(" \t\r\n,", pos);
        if (start == std::string::npos) {
            break;
        }
        auto end = line.find_first_of(" \t\r\n,", start);
        if (end == std::string::npos) {
            end = line.size();
        }
        const std::string token = line.substr(start, end - start);

        errno = 0;
        char* parsed_end = nullptr;
        const double val = std::strtod(token.c_str(), &parsed_end);
        if (parsed_end != token.c_str() + token.size() || errno == ERANGE) {
            return std::nullopt;  // trailing garbage or overflow
        }
        if (!std::isfinite(val)) {
            return std::nullopt;
        }
        fields.push_back(val);
        pos = end;
    }

    if (fields.empty()) {
        return std::nullopt;
    }
    return fields;
}

// ─── DataLoader::parse_string ─────────────────────────────────────────────────

Matrix DataLoader::parse_string(const std::string& content) noexcept {
    std::vector<std::vector<double>> rows;
    std::istringstream stream(content);
    std::string line;
    std::size_t line_no = 0;
    bool first_content_line = true;
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        const auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        auto row = parse_row(line);
        if (first_content_line) {
            first_content_line = false;
            if (!row) {
                continue;  // header
            }
        }
        if (!row || (!rows.empty() && row->size() != rows.front().size())) {
            ++skipped;
            log::debug("skipping malformed line {}", line_no);
            continue;
        }
        rows.push_back(std::move(*row));
    }

    if (skipped > 0) {
        log::warn("skipped {} malformed rows", skipped);
    }
    if (rows.empty()) {
        return Matrix(0, 0);
    }

    const auto n_rows = static_cast<Eigen::Index>(rows.size());
    const auto n_cols = static_cast<Eigen::Index>(rows.front().size());
    Matrix out(n_rows, n_cols);
    for (Eigen::Index i = 0; i < n_rows; ++i) {
        for (Eigen::Index j = 0; j < n_cols; ++j) {
            out(i, j) = rows[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)];
        }
    }
    return out;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<Matrix> DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }

    return parse_string(contents);
}

} // namespace mlcv::core
