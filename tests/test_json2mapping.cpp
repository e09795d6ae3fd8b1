#include "Json2Mapping.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <stdexcept>

#include "support/temp_dir.hpp"

namespace {

json::object ParseObject(const char* text) {
    return json::parse(text).as_object();
}

class MappingFileIoTest : public TempDirTest {};

std::size_t CountOccurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

}  // namespace

TEST(Json2MappingTest, ParsesObjectAndLegacyEntries) {
    auto file = parse_mapping_file(ParseObject(R"({
        "usb_mount_path": "/media/pi/MUSIC",
        "nfc_mappings": {
            "584190412345": {"album": "Abbey Road", "shuffle": true},
            "123": "Legacy Album",
            "456": {"album": "No Shuffle Key"}
        },
        "audio_settings": {"volume": 0.5}
    })"));

    EXPECT_EQ("/media/pi/MUSIC", file.music_root.string());
    ASSERT_EQ(3u, file.mappings.size());
    EXPECT_EQ((AlbumMapping{"Abbey Road", true}), file.mappings.at("584190412345"));
    EXPECT_EQ((AlbumMapping{"Legacy Album", false}), file.mappings.at("123"));
    EXPECT_EQ((AlbumMapping{"No Shuffle Key", false}), file.mappings.at("456"));
    EXPECT_DOUBLE_EQ(0.5, file.volume);
}

TEST(Json2MappingTest, OptionalSectionsDefault) {
    auto file = parse_mapping_file(ParseObject(R"({"usb_mount_path": "/mnt/MUSIC"})"));

    EXPECT_TRUE(file.mappings.empty());
    EXPECT_DOUBLE_EQ(DEFAULT_VOLUME, file.volume);
}

TEST(Json2MappingTest, RejectsMalformedDocuments) {
    // Missing music root
    EXPECT_THROW(parse_mapping_file(ParseObject(R"({"nfc_mappings": {}})")), std::runtime_error);
    // Mapping value of the wrong type
    EXPECT_THROW(parse_mapping_file(ParseObject(R"({"usb_mount_path": "/m", "nfc_mappings": {"1": 7}})")),
                 std::runtime_error);
    // Object without album
    EXPECT_THROW(
        parse_mapping_file(ParseObject(R"({"usb_mount_path": "/m", "nfc_mappings": {"1": {"shuffle": true}}})")),
        std::runtime_error);
    // Empty album name
    EXPECT_THROW(parse_mapping_file(ParseObject(R"({"usb_mount_path": "/m", "nfc_mappings": {"1": {"album": ""}}})")),
                 std::runtime_error);
    // Volume out of range
    EXPECT_THROW(
        parse_mapping_file(ParseObject(R"({"usb_mount_path": "/m", "audio_settings": {"volume": 1.5}})")),
        std::runtime_error);
}

TEST(Json2MappingTest, SerializesMappingsInObjectForm) {
    MappingFile file;
    file.music_root = "/media/pi/MUSIC";
    file.mappings["123"] = AlbumMapping{"Legacy Album", false};
    file.volume = 0.25;

    auto root = mapping_file_to_json(file);
    EXPECT_EQ("/media/pi/MUSIC", root.at("usb_mount_path").as_string());
    const auto& entry = root.at("nfc_mappings").as_object().at("123").as_object();
    EXPECT_EQ("Legacy Album", entry.at("album").as_string());
    EXPECT_FALSE(entry.at("shuffle").as_bool());
    EXPECT_DOUBLE_EQ(0.25, root.at("audio_settings").as_object().at("volume").as_double());
}

TEST(Json2MappingTest, PrettyPrintIndentsWithTwoSpaces) {
    json::value v = json::parse(R"({"a": {"b": [1, 2]}, "c": {}})");
    EXPECT_EQ("{\n  \"a\": {\n    \"b\": [\n      1,\n      2\n    ]\n  },\n  \"c\": {}\n}\n", pretty_print(v));
}

TEST_F(MappingFileIoTest, SaveThenLoadKeepsEverything) {
    MappingFile file;
    file.music_root = "/media/pi/MUSIC";
    file.mappings["111"] = AlbumMapping{"A", true};
    file.mappings["222"] = AlbumMapping{"B", false};
    file.volume = 0.9;

    const auto path = root / "config.json";
    SaveMappingFile(path, file);

    EXPECT_FALSE(std::filesystem::exists(root / "config.json.tmp"));
    auto loaded = LoadMappingFile(path);
    EXPECT_EQ(file.music_root, loaded.music_root);
    EXPECT_EQ(file.mappings, loaded.mappings);
    EXPECT_DOUBLE_EQ(0.9, loaded.volume);
}

TEST_F(MappingFileIoTest, LoadReportsMissingAndInvalidFiles) {
    EXPECT_THROW(LoadMappingFile(root / "absent.json"), std::runtime_error);

    Touch("broken.json", "{\"usb_mount_path\": ");
    EXPECT_THROW(LoadMappingFile(root / "broken.json"), std::runtime_error);

    Touch("array.json", "[1, 2]");
    EXPECT_THROW(LoadMappingFile(root / "array.json"), std::runtime_error);
}

TEST_F(MappingFileIoTest, SaveIntoMissingDirectoryFailsWithoutLeftovers) {
    MappingFile file;
    EXPECT_THROW(SaveMappingFile(root / "no_such_dir" / "config.json", file), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(root / "no_such_dir"));
}

TEST_F(MappingFileIoTest, LoadAnnouncesMappingCountOnce) {
    MappingFile file;
    file.mappings["111"] = AlbumMapping{"A", false};
    const auto path = root / "config.json";
    SaveMappingFile(path, file);

    std::ostringstream captured;
    auto previous = spdlog::default_logger();
    auto capture = std::make_shared<spdlog::logger>(
        "capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
    capture->set_level(spdlog::level::info);
    spdlog::set_default_logger(capture);

    LoadMappingFile(path);

    spdlog::set_default_logger(previous);
    EXPECT_EQ(1u, CountOccurrences(captured.str(), "Loaded 1 tag mappings"));
}
