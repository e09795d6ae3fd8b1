#include "TagCatalog.hpp"

#include <gtest/gtest.h>

#include "support/temp_dir.hpp"

namespace {

class TagCatalogTest : public TempDirTest {
   protected:
    TagCatalog MakeCatalog() {
        MappingFile file;
        file.music_root = root;
        file.mappings["111"] = AlbumMapping{"Abbey Road", false};
        file.mappings["222"] = AlbumMapping{"Missing", true};
        return TagCatalog(file, ".mp3");
    }
};

std::vector<std::string> FileNames(const TrackList& tracks) {
    std::vector<std::string> names;
    for (const auto& t : tracks) names.push_back(t.filename().string());
    return names;
}

}  // namespace

TEST_F(TagCatalogTest, ResolvesMappedTagsOnly) {
    auto catalog = MakeCatalog();

    auto mapping = catalog.Resolve("222");
    ASSERT_TRUE(mapping);
    EXPECT_EQ("Missing", mapping->album);
    EXPECT_TRUE(mapping->shuffle);

    EXPECT_FALSE(catalog.Resolve("999"));
    EXPECT_FALSE(catalog.Resolve(""));
}

TEST_F(TagCatalogTest, TracksAreSortedByFileNameBytewise) {
    Touch("Abbey Road/10 Something.mp3");
    Touch("Abbey Road/02 Come Together.mp3");
    Touch("Abbey Road/b-side.mp3");
    Touch("Abbey Road/B-side.mp3");
    Touch("Abbey Road/01 Intro.mp3");

    auto catalog = MakeCatalog();
    EXPECT_EQ((std::vector<std::string>{"01 Intro.mp3", "02 Come Together.mp3", "10 Something.mp3",
                                        "B-side.mp3", "b-side.mp3"}),
              FileNames(catalog.Tracks("Abbey Road")));
}

TEST_F(TagCatalogTest, ExtensionMatchIsCaseInsensitiveAndFiltersOtherFiles) {
    Touch("Abbey Road/01.mp3");
    Touch("Abbey Road/02.MP3");
    Touch("Abbey Road/cover.jpg");
    Touch("Abbey Road/notes.mp3.txt");
    std::filesystem::create_directories(root / "Abbey Road" / "extras.mp3");

    auto catalog = MakeCatalog();
    EXPECT_EQ((std::vector<std::string>{"01.mp3", "02.MP3"}), FileNames(catalog.Tracks("Abbey Road")));
}

TEST_F(TagCatalogTest, MissingOrEmptyAlbumIsUnplayable) {
    std::filesystem::create_directories(root / "Empty");
    Touch("Empty/readme.txt");

    auto catalog = MakeCatalog();
    EXPECT_TRUE(catalog.Tracks("Missing").empty());
    EXPECT_TRUE(catalog.Tracks("Empty").empty());
}

TEST_F(TagCatalogTest, RepeatedLookupsGiveTheSameOrder) {
    for (const char* name : {"c.mp3", "a.mp3", "d.mp3", "b.mp3"}) {
        Touch(std::filesystem::path("Abbey Road") / name);
    }

    auto catalog = MakeCatalog();
    auto first = catalog.Tracks("Abbey Road");
    auto second = catalog.Tracks("Abbey Road");
    EXPECT_EQ(first, second);
    EXPECT_EQ(4u, first.size());
}

TEST_F(TagCatalogTest, MissingMusicRootYieldsNoTracks) {
    MappingFile file;
    file.music_root = root / "unplugged";
    file.mappings["111"] = AlbumMapping{"Abbey Road", false};
    TagCatalog catalog(file, ".mp3");

    EXPECT_TRUE(catalog.Tracks("Abbey Road").empty());
    EXPECT_TRUE(catalog.Resolve("111"));
}

TEST_F(TagCatalogTest, ScanAlbumsListsFoldersWithAudioSortedByName) {
    Touch("Zeppelin/01.mp3");
    Touch("Abba/01.mp3");
    Touch("Abba/02.mp3");
    Touch("Photos/01.jpg");
    Touch("loose.mp3");

    auto albums = TagCatalog::ScanAlbums(root, ".mp3");
    ASSERT_EQ(2u, albums.size());
    EXPECT_EQ("Abba", albums[0].name);
    EXPECT_EQ(2u, albums[0].track_count);
    EXPECT_EQ(root / "Abba", albums[0].path);
    EXPECT_EQ("Zeppelin", albums[1].name);
    EXPECT_EQ(1u, albums[1].track_count);

    EXPECT_TRUE(TagCatalog::ScanAlbums(root / "nowhere", ".mp3").empty());
}
