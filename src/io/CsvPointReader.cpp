/**
 * @file CsvPointReader.cpp
 * @brief Implementation of CSV point decoding
 */

#include "CsvPointReader.hpp"
#include "../core/Logger.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace dkmz {

CsvPointReader::CsvPointReader(const std::string& latitude_column,
                               const std::string& longitude_column,
                               const std::string& category_column)
    : latitude_column_(latitude_column),
      longitude_column_(longitude_column),
      category_column_(category_column) {
    GDALAllRegister();
}

std::string CsvPointReader::normalize_category(const std::string& raw) {
    const auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = raw.find_last_not_of(" \t\r\n");

    std::string label = raw.substr(first, last - first + 1);
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return label;
}

bool CsvPointReader::parse_coordinate(const std::string& text, double& value) {
    const char* begin = text.c_str();
    char* end = nullptr;
    const double parsed = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

std::string CsvPointReader::required_columns() const {
    return latitude_column_ + ", " + longitude_column_ + ", " + category_column_;
}

std::vector<GeoPoint> CsvPointReader::read_file(const std::string& filename) {
    Logger logger("CsvPointReader");
    stats_ = {};

    // The CSV driver only claims .csv/.tsv files unless asked explicitly
    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string open_path = (ext == ".csv") ? filename : "CSV:" + filename;

    const char* const allowed_drivers[] = {"CSV", nullptr};
    GDALDataset* dataset = static_cast<GDALDataset*>(
        GDALOpenEx(open_path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY,
                   allowed_drivers, nullptr, nullptr));
    if (!dataset) {
        throw std::runtime_error("Cannot open CSV file: " + filename);
    }

    OGRLayer* layer = dataset->GetLayer(0);
    if (!layer) {
        GDALClose(dataset);
        throw EmptyInputError("no rows in " + filename + ". Ensure columns: " + required_columns() + " exist.");
    }

    OGRFeatureDefn* defn = layer->GetLayerDefn();
    const int lat_index = defn->GetFieldIndex(latitude_column_.c_str());
    const int lon_index = defn->GetFieldIndex(longitude_column_.c_str());
    const int cat_index = defn->GetFieldIndex(category_column_.c_str());

    if (lat_index < 0 || lon_index < 0 || cat_index < 0) {
        GDALClose(dataset);
        throw EmptyInputError("no valid rows found in " + filename + ". Ensure columns: " +
                              required_columns() + " exist.");
    }

    std::vector<GeoPoint> points;
    layer->ResetReading();

    OGRFeature* feature = nullptr;
    while ((feature = layer->GetNextFeature()) != nullptr) {
        ++stats_.rows_read;

        double latitude = 0.0;
        double longitude = 0.0;
        std::string category;

        bool valid = feature->IsFieldSetAndNotNull(lat_index) &&
                     feature->IsFieldSetAndNotNull(lon_index) &&
                     feature->IsFieldSetAndNotNull(cat_index);
        if (valid) {
            valid = parse_coordinate(feature->GetFieldAsString(lat_index), latitude) &&
                    parse_coordinate(feature->GetFieldAsString(lon_index), longitude);
        }
        if (valid) {
            category = normalize_category(feature->GetFieldAsString(cat_index));
            valid = !category.empty();
        }

        if (valid) {
            points.emplace_back(latitude, longitude, std::move(category));
            ++stats_.rows_accepted;
        } else {
            ++stats_.rows_rejected;
            logger.warning("Skipping invalid row in " + filename);
        }

        OGRFeature::DestroyFeature(feature);
    }

    GDALClose(dataset);
    logger.flush();

    if (points.empty()) {
        throw EmptyInputError("no valid rows found in " + filename + ". Ensure columns: " +
                              required_columns() + " exist.");
    }

    logger.detailed("Read " + std::to_string(stats_.rows_accepted) + " of " +
                    std::to_string(stats_.rows_read) + " rows from " + filename);
    return points;
}

std::vector<GeoPoint> CsvPointReader::read_files(const std::vector<std::string>& filenames) {
    Logger logger("CsvPointReader");
    std::vector<GeoPoint> all_points;

    for (const auto& filename : filenames) {
        logger.info("Reading " + filename + "...");
        std::vector<GeoPoint> points = read_file(filename);
        logger.info("Loaded " + std::to_string(points.size()) + " rows from " + filename);
        all_points.insert(all_points.end(),
                          std::make_move_iterator(points.begin()),
                          std::make_move_iterator(points.end()));
    }

    return all_points;
}

} // namespace dkmz
