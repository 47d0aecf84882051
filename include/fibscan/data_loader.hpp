#pragma once

/// @file include/fibscan/data_loader.hpp
/// @brief CSV data loader for price series.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV price data into `std::vector<PriceSample>`. Malformed rows are
/// skipped; the loader never crashes on bad input.
///
/// ## Accepted CSV Formats
/// Two-column:
/// ```
/// timestamp,price
/// 1,100.0
/// ```
/// Six-column OHLCV (the close is used as the price):
/// ```
/// timestamp,open,high,low,close,volume
/// 1,100.0,105.0,99.0,103.0,1000000
/// ```
/// The first non-comment line is treated as a header and skipped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Rows with non-finite values, non-positive prices, inconsistent OHLC or a
///   timestamp earlier than the previous kept row are skipped

#include "fibscan/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fibscan::core {

class DataLoader {
public:
    /// Load samples from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has no valid data rows
    [[nodiscard]] static std::optional<std::vector<PriceSample>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse samples from CSV text (same format as `load_csv`).
    [[nodiscard]] static std::vector<PriceSample>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse one data row. `nullopt` for blank, comment or malformed rows.
    [[nodiscard]] static std::optional<PriceSample>
    parse_row(const std::string& line) noexcept;

    /// Split samples into parallel price and timestamp vectors.
    static void split(std::span<const PriceSample> samples,
                      std::vector<double>& prices,
                      std::vector<double>& timestamps);
};

}  // namespace fibscan::core
