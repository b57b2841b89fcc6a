#pragma once

/// @file include/mlcv/data_loader.hpp
/// @brief Text loader for trajectories of descriptor values.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse column files (one sample per line, one descriptor per column) into
/// a `Matrix`. Columns are separated by commas, spaces or tabs.
///
/// ## Expected Format
/// ```
/// # x y
/// -0.998  0.012
/// -1.003 -0.041
/// ```
/// - Blank lines and lines starting with `#` are skipped
/// - A first line that is not numeric (a header) is skipped
/// - The first numeric row fixes the column count; rows with another count,
///   unparsable tokens or non-finite values are skipped with a warning
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only if the file cannot be opened
/// - Does not modify any file or external state

#include "mlcv/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mlcv::core {

class DataLoader {
public:
    /// Load a descriptor matrix from a file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - 0×0 matrix if the file holds no valid rows
    /// - (rows × columns) matrix otherwise
    [[nodiscard]] static std::optional<Matrix>
    load_csv(const std::string& filepath) noexcept;

    /// Parse a descriptor matrix from text (same format as `load_csv`).
    [[nodiscard]] static Matrix parse_string(const std::string& content) noexcept;

    /// Parse one line into numbers. Returns `nullopt` for blank, comment or
    /// malformed lines.
    [[nodiscard]] static std::optional<std::vector<double>>
    parse_row(const std::string& line) noexcept;
};

} // namespace mlcv::core
