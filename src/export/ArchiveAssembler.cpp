/**
 * @file ArchiveAssembler.cpp
 * @brief Implementation of KML manifest generation and KMZ packaging
 */

#include "ArchiveAssembler.hpp"
#include "../core/Logger.hpp"
#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_vsi.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <climits>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace dkmz {

ArchiveAssembler::ArchiveAssembler(const std::string& folder_name)
    : folder_name_(folder_name) {
}

std::string ArchiveAssembler::sanitize_filename(const std::string& label) {
    std::string name;
    name.reserve(label.size());

    bool in_whitespace = false;
    for (char c : label) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_whitespace) {
                name += '_';
                in_whitespace = true;
            }
        } else {
            name += c;
            in_whitespace = false;
        }
    }

    return name + RASTER_EXTENSION;
}

std::string ArchiveAssembler::format_coordinate(double value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc()) {
        std::ostringstream oss;
        oss.precision(17);
        oss << value;
        return oss.str();
    }
    return std::string(buffer, result.ptr);
}

std::string ArchiveAssembler::escape_xml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::vector<EncodedLayer> ArchiveAssembler::order_layers(const std::vector<EncodedLayer>& layers) {
    std::vector<EncodedLayer> ordered = layers;
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const EncodedLayer& a, const EncodedLayer& b) {
            return a.category < b.category;
        });
    return ordered;
}

std::vector<std::string> ArchiveAssembler::assign_filenames(const std::vector<EncodedLayer>& ordered) {
    std::vector<std::string> filenames;
    std::set<std::string> used;
    used.insert(MANIFEST_NAME);

    for (const auto& layer : ordered) {
        const std::string base = sanitize_filename(layer.category);
        std::string candidate = base;

        const std::string stem = base.substr(0, base.size() - std::string(RASTER_EXTENSION).size());
        for (int suffix = 2; used.count(candidate) > 0; ++suffix) {
            candidate = stem + "_" + std::to_string(suffix) + RASTER_EXTENSION;
        }

        used.insert(candidate);
        filenames.push_back(candidate);
    }

    return filenames;
}

std::string ArchiveAssembler::build_manifest(const std::vector<EncodedLayer>& ordered,
                                             const std::vector<std::string>& filenames) const {
    std::ostringstream kml;

    kml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    kml << "<kml xmlns=\"http://www.opengis.net/kml/2.2\">\n";
    kml << "  <Folder>\n";
    kml << "    <name>" << escape_xml(folder_name_) << "</name>\n";
    kml << "    <open>1</open>\n";

    for (size_t i = 0; i < ordered.size(); ++i) {
        const auto& layer = ordered[i];
        kml << "    <GroundOverlay>\n";
        kml << "      <name>" << escape_xml(layer.category) << "</name>\n";
        kml << "      <Icon>\n";
        kml << "        <href>" << escape_xml(filenames[i]) << "</href>\n";
        kml << "      </Icon>\n";
        kml << "      <LatLonBox>\n";
        kml << "        <north>" << format_coordinate(layer.extent.north) << "</north>\n";
        kml << "        <south>" << format_coordinate(layer.extent.south) << "</south>\n";
        kml << "        <east>" << format_coordinate(layer.extent.east) << "</east>\n";
        kml << "        <west>" << format_coordinate(layer.extent.west) << "</west>\n";
        kml << "      </LatLonBox>\n";
        kml << "    </GroundOverlay>\n";
    }

    kml << "  </Folder>\n";
    kml << "</kml>\n";
    return kml.str();
}

std::vector<ArchiveEntry> ArchiveAssembler::build_entries(const std::vector<EncodedLayer>& layers) const {
    if (layers.empty()) {
        throw EmptyInputError("no layers to package");
    }

    std::vector<EncodedLayer> ordered = order_layers(layers);
    std::vector<std::string> filenames = assign_filenames(ordered);
    std::string manifest = build_manifest(ordered, filenames);

    std::vector<ArchiveEntry> entries;
    entries.reserve(ordered.size() + 1);
    entries.push_back({MANIFEST_NAME, std::vector<uint8_t>(manifest.begin(), manifest.end())});

    for (size_t i = 0; i < ordered.size(); ++i) {
        entries.push_back({filenames[i], ordered[i].png});
    }
    return entries;
}

void ArchiveAssembler::write_zip(const std::string& zip_path,
                                 const std::vector<ArchiveEntry>& entries) const {
    Logger logger("ArchiveAssembler");

    void* zip = CPLCreateZip(zip_path.c_str(), nullptr);
    if (!zip) {
        throw EncodingError("cannot create zip archive " + zip_path);
    }

    for (const auto& entry : entries) {
        if (entry.data.size() > static_cast<size_t>(INT_MAX)) {
            CPLCloseZip(zip);
            throw EncodingError("entry too large for zip: " + entry.name);
        }

        bool ok = CPLCreateFileInZip(zip, entry.name.c_str(), nullptr) == CE_None;
        if (ok && !entry.data.empty()) {
            ok = CPLWriteFileInZip(zip, entry.data.data(), static_cast<int>(entry.data.size())) == CE_None;
        }
        if (ok) {
            ok = CPLCloseFileInZip(zip) == CE_None;
        }
        if (!ok) {
            CPLCloseZip(zip);
            throw EncodingError("failed writing zip entry " + entry.name + " (" +
                                CPLGetLastErrorMsg() + ")");
        }

        logger.debug("Added " + entry.name + " (" + std::to_string(entry.data.size()) + " bytes)");
    }

    if (CPLCloseZip(zip) != CE_None) {
        throw EncodingError("failed to finalize zip archive " + zip_path);
    }
}

std::vector<uint8_t> ArchiveAssembler::assemble(const std::vector<EncodedLayer>& layers) const {
    static std::atomic<unsigned long> counter{0};
    Logger logger("ArchiveAssembler");

    std::vector<ArchiveEntry> entries = build_entries(layers);

    const std::string vsi_path = "/vsimem/dkmz_archive_" + std::to_string(counter.fetch_add(1)) + ".kmz";
    try {
        write_zip(vsi_path, entries);
    } catch (const EncodingError&) {
        VSIUnlink(vsi_path.c_str());
        throw;
    }

    vsi_l_offset length = 0;
    GByte* buffer = VSIGetMemFileBuffer(vsi_path.c_str(), &length, TRUE);
    if (!buffer) {
        throw EncodingError("archive output missing from " + vsi_path);
    }

    std::vector<uint8_t> bytes(buffer, buffer + length);
    CPLFree(buffer);

    logger.detailed("Assembled KMZ with " + std::to_string(entries.size()) + " entries, " +
                    std::to_string(bytes.size()) + " bytes");
    return bytes;
}

bool ArchiveAssembler::write_file(const std::vector<EncodedLayer>& layers,
                                  const std::string& filename) const {
    Logger logger("ArchiveAssembler");

    std::vector<uint8_t> bytes = assemble(layers);

    std::filesystem::path path(filename);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        logger.error("Failed to create KMZ file: " + filename);
        return false;
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        logger.error("Failed to write KMZ file: " + filename);
        return false;
    }

    logger.info("Exported KMZ: " + filename + " (" + std::to_string(layers.size()) + " layers)");
    return true;
}

} // namespace dkmz
