#include <gtest/gtest.h>
#include "ndnoise/errors.hpp"
#include "ndnoise/noise_config.hpp"

#include <filesystem>
#include <fstream>

using namespace ndnoise;

TEST(NoiseConfigTest, SeedAndGridSize) {
    auto config = parseNoiseConfig(
        "seed: 123\n"
        "grid_size: 10 12 14\n"
    );

    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 123u);
    ASSERT_TRUE(config.gridSize.has_value());
    EXPECT_EQ(*config.gridSize, (std::vector<int32_t>{10, 12, 14}));
}

TEST(NoiseConfigTest, GridSizeFromDataLines) {
    auto config = parseNoiseConfig(
        "grid_size:\n"
        "    8 8\n"
        "    4\n"
    );

    ASSERT_TRUE(config.gridSize.has_value());
    EXPECT_EQ(*config.gridSize, (std::vector<int32_t>{8, 8, 4}));
}

TEST(NoiseConfigTest, LargeSeed) {
    auto config = parseNoiseConfig("seed: 18446744073709551615\n");
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 18446744073709551615ull);
}

TEST(NoiseConfigTest, MissingKeysLeaveDefaults) {
    auto config = parseNoiseConfig("# nothing here\n");
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_FALSE(config.gridSize.has_value());
}

TEST(NoiseConfigTest, UnknownKeysAreIgnored) {
    auto config = parseNoiseConfig("octaves: 4\nseed: 1\n");
    EXPECT_EQ(config.seed, 1u);
}

TEST(NoiseConfigTest, MalformedSeedThrows) {
    EXPECT_THROW((void)parseNoiseConfig("seed: abc\n"), ConfigurationError);
    EXPECT_THROW((void)parseNoiseConfig("seed: -1\n"), ConfigurationError);
    EXPECT_THROW((void)parseNoiseConfig("seed:\n"), ConfigurationError);
}

TEST(NoiseConfigTest, MalformedGridSizeThrows) {
    EXPECT_THROW((void)parseNoiseConfig("grid_size: 4 x\n"), ConfigurationError);
    EXPECT_THROW((void)parseNoiseConfig("grid_size:\n"), ConfigurationError);
    EXPECT_THROW((void)parseNoiseConfig("grid_size:\n    2.5\n"), ConfigurationError);
    EXPECT_THROW((void)parseNoiseConfig("grid_size:\n    16 x 16\n"), ConfigurationError);
    EXPECT_THROW((void)parseNoiseConfig("grid_size: 8\n    16 x\n"), ConfigurationError);
    EXPECT_THROW((void)parseNoiseConfig("grid_size: 99999999999\n"), ConfigurationError);
}

TEST(NoiseConfigTest, ParsedConfigBuildsField) {
    auto config = parseNoiseConfig("seed: 123\ngrid_size: 10\n");
    NoiseField field(config);

    EXPECT_EQ(field.seed(), 123u);
    EXPECT_EQ(field.dimension(), 1);

    NoiseFieldConfig direct;
    direct.seed = 123;
    direct.gridSize = std::vector<int32_t>{10};
    NoiseField expected(direct);
    EXPECT_DOUBLE_EQ(field.noise(1.3), expected.noise(1.3));
}

TEST(NoiseConfigTest, ZeroCellCountRejectedByField) {
    auto config = parseNoiseConfig("grid_size: 4 0\n");
    EXPECT_THROW(NoiseField{config}, ConfigurationError);
}

class NoiseConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "ndnoise_noise_config_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    std::filesystem::path tempDir;
};

TEST_F(NoiseConfigFileTest, LoadFromFile) {
    auto path = tempDir / "field.conf";
    {
        std::ofstream file(path);
        file << "# 2D field\n";
        file << "seed: 42\n";
        file << "grid_size: 16 16\n";
    }

    auto config = loadNoiseConfig(path.string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->seed, 42u);
    EXPECT_EQ(config->gridSize, (std::vector<int32_t>{16, 16}));
}

TEST_F(NoiseConfigFileTest, IncludedDefaultsOverridden) {
    {
        std::ofstream base(tempDir / "base.conf");
        base << "seed: 1\ngrid_size: 8 8 8\n";
    }
    {
        std::ofstream top(tempDir / "main.conf");
        top << "include: base.conf\nseed: 2\n";
    }

    auto config = loadNoiseConfig((tempDir / "main.conf").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->seed, 2u);
    EXPECT_EQ(config->gridSize, (std::vector<int32_t>{8, 8, 8}));
}

TEST_F(NoiseConfigFileTest, MissingFileReturnsNullopt) {
    EXPECT_FALSE(loadNoiseConfig((tempDir / "missing.conf").string()).has_value());
}
