/**
 * @file CsvPointReader.hpp
 * @brief Decoding of tabular GPS samples through the OGR CSV driver
 */

#pragma once

#include "density_generator.hpp"
#include <string>
#include <vector>

namespace dkmz {

/**
 * @brief Per-file decoding counters
 */
struct CsvReadStats {
    size_t rows_read = 0;
    size_t rows_accepted = 0;
    size_t rows_rejected = 0;
};

/**
 * @brief Reads {latitude, longitude, category} rows from CSV files
 *
 * Rows whose coordinates are not finite numbers or whose category is blank
 * are dropped with a warning. Categories are trimmed and upper-cased.
 */
class CsvPointReader {
public:
    CsvPointReader(const std::string& latitude_column = "gps_latitude",
                   const std::string& longitude_column = "gps_longitude",
                   const std::string& category_column = "carrier");

    /**
     * @brief Read every valid row of one file
     * @throws EmptyInputError if the file yields no valid row
     * @throws std::runtime_error if the file cannot be opened
     */
    std::vector<GeoPoint> read_file(const std::string& filename);

    /**
     * @brief Read several files and concatenate their rows in order
     */
    std::vector<GeoPoint> read_files(const std::vector<std::string>& filenames);

    /**
     * @brief Trim surrounding whitespace and upper-case a label
     */
    static std::string normalize_category(const std::string& raw);

    /**
     * @brief Parse a leading decimal number
     * @return false if no number could be read or it is not finite
     */
    static bool parse_coordinate(const std::string& text, double& value);

    const CsvReadStats& last_stats() const { return stats_; }

private:
    std::string latitude_column_;
    std::string longitude_column_;
    std::string category_column_;
    CsvReadStats stats_;

    std::string required_columns() const;
};

} // namespace dkmz
