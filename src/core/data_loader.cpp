/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for price series.

#include "fibscan/data_loader.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fibscan::core {

namespace {

/// Parse one trimmed CSV field as a finite double.
std::optional<double> parse_field(std::string token) noexcept {
    const auto first = token.find_first_not_of(" \t\r\n");
    const auto last  = token.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;  // empty token
    }
    token = token.substr(first, last - first + 1);

    double val = 0.0;
    try {
        std::size_t pos = 0;
        val = std::stod(token, &pos);
        if (pos != token.size()) {
            return std::nullopt;  // trailing garbage
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (!std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

}  // namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<PriceSample>
DataLoader::parse_row(const std::string& line) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::vector<double> fields;
    fields.reserve(6);
    try {
        std::istringstream ss(line);
        std::string token;
        while (std::getline(ss, token, ',')) {
            auto val = parse_field(token);
            if (!val) {
                return std::nullopt;
            }
            fields.push_back(*val);
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    PriceSample sample{};
    if (fields.size() == 2) {
        sample = PriceSample{.timestamp = fields[0], .price = fields[1]};
    } else if (fields.size() == 6) {
        // timestamp, open, high, low, close, volume
        const double open  = fields[1];
        const double high  = fields[2];
        const double low   = fields[3];
        const double close = fields[4];
        if (high < low || open > high || open < low || close > high || close < low) {
            return std::nullopt;
        }
        if (fields[5] < 0.0) {
            return std::nullopt;
        }
        sample = PriceSample{.timestamp = fields[0], .price = close};
    } else {
        return std::nullopt;
    }

    if (sample.price <= 0.0) {
        return std::nullopt;
    }
    return sample;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<PriceSample>
DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<PriceSample> samples;
    try {
        std::istringstream stream(csv_content);
        std::string line;
        bool header_skipped = false;

        while (std::getline(stream, line)) {
            // Trim carriage return.
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            if (!header_skipped) {
                // First non-empty, non-comment line is the header.
                if (!line.empty() && line[0] != '#') {
                    header_skipped = true;
                }
                continue;
            }

            auto sample = parse_row(line);
            if (!sample) {
                continue;
            }
            // Timestamps must not run backwards.
            if (!samples.empty() && sample->timestamp < samples.back().timestamp) {
                continue;
            }
            samples.push_back(*sample);
        }
    } catch (const std::exception&) {
        samples.clear();
    }

    return samples;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<PriceSample>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

// ─── DataLoader::split ────────────────────────────────────────────────────────

void DataLoader::split(std::span<const PriceSample> samples,
                       std::vector<double>& prices,
                       std::vector<double>& timestamps) {
    prices.clear();
    timestamps.clear();
    prices.reserve(samples.size());
    timestamps.reserve(samples.size());
    for (const auto& s : samples) {
        prices.push_back(s.price);
        timestamps.push_back(s.timestamp);
    }
}

}  // namespace fibscan::core
