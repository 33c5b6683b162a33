/**
 * @file ArchiveAssembler.hpp
 * @brief KMZ packaging of encoded density layers
 *
 * Builds a KML manifest with one GroundOverlay per layer and stores it,
 * together with every PNG, in a zip container written through GDAL's
 * virtual file system.
 */

#pragma once

#include "density_generator.hpp"
#include <string>
#include <vector>

namespace dkmz {

/**
 * @brief One archive entry: name inside the zip plus its content
 */
struct ArchiveEntry {
    std::string name;
    std::vector<uint8_t> data;
};

class ArchiveAssembler {
public:
    static constexpr const char* MANIFEST_NAME = "doc.kml";
    static constexpr const char* RASTER_EXTENSION = ".png";

    explicit ArchiveAssembler(const std::string& folder_name = "Operators Density Heatmaps");

    /**
     * @brief Filesystem-safe filename for a label (whitespace runs -> '_')
     */
    static std::string sanitize_filename(const std::string& label);

    /**
     * @brief Shortest decimal text that reads back as the same double
     */
    static std::string format_coordinate(double value);

    /**
     * @brief Escape &, <, >, " and ' for XML text
     */
    static std::string escape_xml(const std::string& text);

    /**
     * @brief Order layers deterministically (stable sort by label)
     */
    static std::vector<EncodedLayer> order_layers(const std::vector<EncodedLayer>& layers);

    /**
     * @brief Unique raster filename per ordered layer
     *
     * Labels that sanitize to the same name get _2, _3, ... suffixes.
     */
    static std::vector<std::string> assign_filenames(const std::vector<EncodedLayer>& ordered);

    /**
     * @brief KML manifest for already ordered layers and their filenames
     */
    std::string build_manifest(const std::vector<EncodedLayer>& ordered,
                               const std::vector<std::string>& filenames) const;

    /**
     * @brief Archive entries in emission order (manifest first)
     * @throws EmptyInputError if layers is empty
     */
    std::vector<ArchiveEntry> build_entries(const std::vector<EncodedLayer>& layers) const;

    /**
     * @brief Assemble the complete KMZ archive in memory
     * @throws EmptyInputError if layers is empty
     * @throws EncodingError if the zip writer fails
     */
    std::vector<uint8_t> assemble(const std::vector<EncodedLayer>& layers) const;

    /**
     * @brief Assemble and write the archive to disk
     * @return true if the file was written
     */
    bool write_file(const std::vector<EncodedLayer>& layers, const std::string& filename) const;

    const std::string& folder_name() const { return folder_name_; }

private:
    std::string folder_name_;

    /**
     * @brief Write entries into a zip at a GDAL virtual or real path
     */
    void write_zip(const std::string& zip_path, const std::vector<ArchiveEntry>& entries) const;
};

} // namespace dkmz
