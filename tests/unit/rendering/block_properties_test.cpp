// regionmap Rendering Tests
// block_properties_test.cpp - Tests for the block display property table

#include <gtest/gtest.h>

#include <regionmap/platform/file_io.hpp>
#include <regionmap/rendering/block_properties.hpp>

namespace regionmap::rendering {
namespace {

TEST(BlockPropertiesTest, ParseEntries) {
    auto table = BlockPropertyTable::parse(R"({
        "Soil_Grass": {"TintUp": ["#5B9E28", "#000000"], "BiomeTintUp": 100},
        "Plant_Fern": {"TintUp": ["#336633"], "ParticleColor": "#80FF00"},
        "Ore_Glow": {"ParticleColor": "0A141E"}
    })");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->size(), 3u);

    const auto* grass = table->find_exact("Soil_Grass");
    ASSERT_NE(grass, nullptr);
    ASSERT_EQ(grass->tint_colors.size(), 2u);
    EXPECT_EQ(grass->tint_colors[0], (Rgb{0x5B, 0x9E, 0x28}));
    EXPECT_EQ(grass->biome_tint_percent, 100);
    EXPECT_FALSE(grass->particle_color.has_value());

    const auto* fern = table->find_exact("Plant_Fern");
    ASSERT_NE(fern, nullptr);
    EXPECT_EQ(fern->biome_tint_percent, 0);
    EXPECT_EQ(fern->particle_color, (Rgb{0x80, 0xFF, 0x00}));

    EXPECT_EQ(table->find_exact("Ore_Glow")->particle_color, (Rgb{10, 20, 30}));
    EXPECT_EQ(table->find_exact("Ore"), nullptr);
}

TEST(BlockPropertiesTest, PreservesFileOrder) {
    auto table = BlockPropertyTable::parse(R"({"Zeta": {}, "Alpha": {}, "Mid": {}})");
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->entries().size(), 3u);
    EXPECT_EQ(table->entries()[0].first, "Zeta");
    EXPECT_EQ(table->entries()[1].first, "Alpha");
    EXPECT_EQ(table->entries()[2].first, "Mid");
}

TEST(BlockPropertiesTest, PrefixLookupFirstInOrder) {
    auto table = BlockPropertyTable::parse(R"({"Plant": {}, "Plant_Flower": {}})");
    ASSERT_TRUE(table.has_value());

    const auto* entry = table->find_prefix("Plant_Flower_Red");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->first, "Plant");
    EXPECT_EQ(table->find_prefix("Rock_Stone"), nullptr);
}

TEST(BlockPropertiesTest, MalformedValuesSkipped) {
    auto table = BlockPropertyTable::parse(R"({
        "Bad_Colors": {"TintUp": ["#12345", 7, "#ABCDEF"], "ParticleColor": "red", "BiomeTintUp": 250},
        "Not_An_Object": 5
    })");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->size(), 1u);

    const auto* props = table->find_exact("Bad_Colors");
    ASSERT_NE(props, nullptr);
    ASSERT_EQ(props->tint_colors.size(), 1u);
    EXPECT_EQ(props->tint_colors[0], (Rgb{0xAB, 0xCD, 0xEF}));
    EXPECT_FALSE(props->particle_color.has_value());
    EXPECT_EQ(props->biome_tint_percent, 100);
}

TEST(BlockPropertiesTest, InvalidDocumentsRejected) {
    EXPECT_FALSE(BlockPropertyTable::parse("{not json").has_value());
    EXPECT_FALSE(BlockPropertyTable::parse("[1, 2, 3]").has_value());
}

TEST(BlockPropertiesTest, LoadFromFile) {
    auto dir = platform::FileSystem::get_temp_directory() / "block_properties_test";
    ASSERT_TRUE(platform::FileSystem::create_directories(dir));
    auto path = dir / "block_properties.json";
    ASSERT_TRUE(platform::FileSystem::write_text(path, R"({"Rock_Stone": {"TintUp": ["#787878"]}})"));

    auto table = BlockPropertyTable::load(path);
    ASSERT_TRUE(table.has_value());
    EXPECT_NE(table->find_exact("Rock_Stone"), nullptr);

    EXPECT_FALSE(BlockPropertyTable::load(dir / "missing.json").has_value());
    platform::FileSystem::remove_all(dir);
}

}  // namespace
}  // namespace regionmap::rendering
