/**
 * @file test_archive.cpp
 * @brief Tests for PNG encoding and KMZ assembly
 */

#include "density_generator.hpp"
#include "export/ArchiveAssembler.hpp"
#include "export/PngEncoder.hpp"
#include <gtest/gtest.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <string>

using namespace dkmz;

namespace {

const uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

bool has_png_signature(const std::vector<uint8_t>& bytes) {
    return bytes.size() > 8 && std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), bytes.begin());
}

/**
 * @brief Exposes an in-memory KMZ to GDAL's /vsizip/ reader for the test's lifetime
 */
class MountedArchive {
public:
    explicit MountedArchive(const std::vector<uint8_t>& bytes)
        : path_("/vsimem/test_archive_" + std::to_string(counter_++) + ".kmz"), bytes_(bytes) {
        VSILFILE* handle = VSIFileFromMemBuffer(path_.c_str(), bytes_.data(), bytes_.size(), FALSE);
        if (handle) {
            VSIFCloseL(handle);
        }
    }

    ~MountedArchive() { VSIUnlink(path_.c_str()); }

    std::vector<std::string> list() const {
        std::vector<std::string> names;
        char** entries = VSIReadDir(("/vsizip/" + path_).c_str());
        for (int i = 0; entries && entries[i]; ++i) {
            names.push_back(entries[i]);
        }
        CSLDestroy(entries);
        return names;
    }

    std::string read(const std::string& name) const {
        const std::string full = "/vsizip/" + path_ + "/" + name;
        VSILFILE* file = VSIFOpenL(full.c_str(), "rb");
        if (!file) {
            return "";
        }
        std::string content;
        char buffer[4096];
        size_t count = 0;
        while ((count = VSIFReadL(buffer, 1, sizeof(buffer), file)) > 0) {
            content.append(buffer, count);
        }
        VSIFCloseL(file);
        return content;
    }

private:
    static inline int counter_ = 0;
    std::string path_;
    std::vector<uint8_t> bytes_;
};

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

RasterLayer checkerboard_layer(const std::string& category, int size) {
    RasterLayer layer;
    layer.category = category;
    layer.width = size;
    layer.height = size;
    layer.extent = GeoBounds(-11.9, -12.2, -76.8, -77.1);
    layer.pixels.resize(static_cast<size_t>(size) * size * 4);
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            const size_t idx = (static_cast<size_t>(y) * size + x) * 4;
            const bool on = (x + y) % 2 == 0;
            layer.pixels[idx] = on ? 200 : 0;
            layer.pixels[idx + 1] = 10;
            layer.pixels[idx + 2] = static_cast<uint8_t>(x * 10);
            layer.pixels[idx + 3] = on ? 255 : 0;
        }
    }
    return layer;
}

} // namespace

TEST(PngEncoderTest, ProducesDecodablePng) {
    PngEncoder encoder;
    RasterLayer layer = checkerboard_layer("ENTEL", 8);

    std::vector<uint8_t> png = encoder.encode(layer);
    ASSERT_TRUE(has_png_signature(png));

    const std::string path = "/vsimem/png_roundtrip_check.png";
    VSILFILE* handle = VSIFileFromMemBuffer(path.c_str(), png.data(), png.size(), FALSE);
    ASSERT_NE(handle, nullptr);
    VSIFCloseL(handle);

    GDALDataset* dataset = static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly));
    ASSERT_NE(dataset, nullptr);
    EXPECT_EQ(dataset->GetRasterXSize(), 8);
    EXPECT_EQ(dataset->GetRasterYSize(), 8);
    EXPECT_EQ(dataset->GetRasterCount(), 4);

    std::vector<uint8_t> decoded(8 * 8 * 4);
    int band_map[4] = {1, 2, 3, 4};
    CPLErr err = dataset->RasterIO(GF_Read, 0, 0, 8, 8, decoded.data(), 8, 8, GDT_Byte,
                                   4, band_map, 4, 8 * 4, 1, nullptr);
    EXPECT_EQ(err, CE_None);
    EXPECT_EQ(decoded, layer.pixels);

    GDALClose(dataset);
    VSIUnlink(path.c_str());
}

TEST(PngEncoderTest, RejectsMismatchedBuffer) {
    PngEncoder encoder;
    std::vector<uint8_t> rgba(10, 0);

    EXPECT_THROW(encoder.encode(4, 4, rgba), EncodingError);
    EXPECT_THROW(encoder.encode(0, 4, rgba), EncodingError);
}

TEST(PngEncoderTest, GeotransformSpansExtent) {
    RasterLayer layer = checkerboard_layer("CLARO", 10);
    auto gt = PngEncoder::geotransform_for(layer);

    EXPECT_DOUBLE_EQ(gt[0], -77.1);
    EXPECT_DOUBLE_EQ(gt[3], -11.9);
    EXPECT_NEAR(gt[1] * 10, 0.3, 1e-12);
    EXPECT_NEAR(-gt[5] * 10, 0.3, 1e-12);
}

TEST(PngEncoderTest, WritesPngWithWorldFile) {
    auto dir = std::filesystem::temp_directory_path() / "dkmz_png_test";
    std::filesystem::remove_all(dir);

    PngEncoder encoder;
    RasterLayer layer = checkerboard_layer("BITEL", 6);
    const auto png_path = dir / "BITEL.png";

    ASSERT_TRUE(encoder.write_file(layer, png_path.string()));
    EXPECT_TRUE(std::filesystem::exists(png_path));
    EXPECT_TRUE(std::filesystem::exists(dir / "BITEL.wld"));

    std::filesystem::remove_all(dir);
}

TEST(ArchiveAssemblerTest, SanitizesWhitespaceRuns) {
    EXPECT_EQ(ArchiveAssembler::sanitize_filename("ENTEL"), "ENTEL.png");
    EXPECT_EQ(ArchiveAssembler::sanitize_filename("CLARO PERU"), "CLARO_PERU.png");
    EXPECT_EQ(ArchiveAssembler::sanitize_filename("A \t B"), "A_B.png");
}

TEST(ArchiveAssemblerTest, DuplicateFilenamesGetSuffixes) {
    std::vector<EncodedLayer> ordered = {
        {"A B", {}, GeoBounds()},
        {"A  B", {}, GeoBounds()},
        {"A\tB", {}, GeoBounds()}
    };

    auto names = ArchiveAssembler::assign_filenames(ordered);

    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "A_B.png");
    EXPECT_EQ(names[1], "A_B_2.png");
    EXPECT_EQ(names[2], "A_B_3.png");
}

TEST(ArchiveAssemblerTest, OrdersLayersByLabel) {
    std::vector<EncodedLayer> layers = {
        {"MOVISTAR", {1}, GeoBounds()},
        {"CLARO", {2}, GeoBounds()},
        {"ENTEL", {3}, GeoBounds()}
    };

    auto ordered = ArchiveAssembler::order_layers(layers);

    EXPECT_EQ(ordered[0].category, "CLARO");
    EXPECT_EQ(ordered[1].category, "ENTEL");
    EXPECT_EQ(ordered[2].category, "MOVISTAR");
}

TEST(ArchiveAssemblerTest, CoordinatesRoundTrip) {
    EXPECT_EQ(ArchiveAssembler::format_coordinate(-12.0464), "-12.0464");
    EXPECT_EQ(ArchiveAssembler::format_coordinate(0.1), "0.1");
    EXPECT_EQ(std::stod(ArchiveAssembler::format_coordinate(1.0 / 3.0)), 1.0 / 3.0);
}

TEST(ArchiveAssemblerTest, EscapesLabels) {
    EXPECT_EQ(ArchiveAssembler::escape_xml("AT&T <5G>"), "AT&amp;T &lt;5G&gt;");
}

TEST(ArchiveAssemblerTest, ManifestComesFirst) {
    ArchiveAssembler assembler;
    std::vector<EncodedLayer> layers = {
        {"B", {1, 2, 3}, GeoBounds(1, 0, 1, 0)},
        {"A", {4, 5}, GeoBounds(1, 0, 1, 0)}
    };

    auto entries = assembler.build_entries(layers);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "doc.kml");
    EXPECT_EQ(entries[1].name, "A.png");
    EXPECT_EQ(entries[2].name, "B.png");
    EXPECT_EQ(entries[1].data, (std::vector<uint8_t>{4, 5}));
}

TEST(ArchiveAssemblerTest, EmptyLayerListThrows) {
    ArchiveAssembler assembler;
    EXPECT_THROW(assembler.assemble({}), EmptyInputError);
}

TEST(ArchiveAssemblerTest, KmzHoldsManifestAndRasters) {
    PngEncoder encoder;
    GeoBounds bounds(-11.9, -12.2, -76.8, -77.1);

    std::vector<EncodedLayer> layers;
    for (const char* category : {"MOVISTAR", "ENTEL"}) {
        RasterLayer raster = checkerboard_layer(category, 16);
        raster.extent = bounds;
        layers.push_back({category, encoder.encode(raster), bounds});
    }

    ArchiveAssembler assembler("Operators Density Heatmaps");
    MountedArchive archive(assembler.assemble(layers));

    auto names = archive.list();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_NE(std::find(names.begin(), names.end(), "doc.kml"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "ENTEL.png"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "MOVISTAR.png"), names.end());

    const std::string kml = archive.read("doc.kml");
    EXPECT_NE(kml.find("<kml xmlns=\"http://www.opengis.net/kml/2.2\">"), std::string::npos);
    EXPECT_NE(kml.find("<name>Operators Density Heatmaps</name>"), std::string::npos);
    EXPECT_EQ(count_occurrences(kml, "<GroundOverlay>"), 2u);
    EXPECT_EQ(count_occurrences(kml, "<north>-11.9</north>"), 2u);
    EXPECT_EQ(count_occurrences(kml, "<south>-12.2</south>"), 2u);
    EXPECT_EQ(count_occurrences(kml, "<east>-76.8</east>"), 2u);
    EXPECT_EQ(count_occurrences(kml, "<west>-77.1</west>"), 2u);
    EXPECT_LT(kml.find("<name>ENTEL</name>"), kml.find("<name>MOVISTAR</name>"));
    EXPECT_NE(kml.find("<href>ENTEL.png</href>"), std::string::npos);

    const std::string png = archive.read("ENTEL.png");
    std::vector<uint8_t> png_bytes(png.begin(), png.end());
    EXPECT_EQ(png_bytes, layers[1].png);
}

TEST(ArchiveAssemblerTest, WritesArchiveToDisk) {
    auto path = std::filesystem::temp_directory_path() / "dkmz_archive_test" / "out.kmz";
    std::filesystem::remove_all(path.parent_path());

    ArchiveAssembler assembler;
    std::vector<EncodedLayer> layers = {{"ENTEL", {1, 2, 3}, GeoBounds(1, 0, 1, 0)}};

    ASSERT_TRUE(assembler.write_file(layers, path.string()));
    EXPECT_GT(std::filesystem::file_size(path), 0u);

    std::filesystem::remove_all(path.parent_path());
}
