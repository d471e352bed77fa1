#include "test_base.hpp"
#include "core/validator_config_manager.hpp"

class ValidatorConfigTest : public TestBase
{
};

TEST_F(ValidatorConfigTest, DefaultsAreValid)
{
    ValidatorConfiguration config;
    EXPECT_TRUE(config.isValid());
    EXPECT_DOUBLE_EQ(config.thresholds.pass_threshold, 0.7);
    EXPECT_DOUBLE_EQ(config.sync.max_offset_ms, 100.0);
    EXPECT_EQ(config.visual.sample_count, 10);
}

TEST_F(ValidatorConfigTest, RangeErrorsAreReported)
{
    ValidatorConfiguration config;
    config.thresholds.pass_threshold = 1.5;
    config.visual.sample_count = 0;
    config.weights.visual = 0.0;
    config.weights.audio = 0.0;
    config.weights.sync = 0.0;
    config.log_level = "LOUD";

    std::vector<std::string> errors = config.validate();
    EXPECT_EQ(errors.size(), 4u);
    EXPECT_FALSE(config.isValid());
}

TEST_F(ValidatorConfigTest, MissingFileLeavesDefaults)
{
    ValidatorConfigManager manager;
    EXPECT_FALSE(manager.load(testPath("absent.json")));
    ValidatorConfiguration config = manager.toConfiguration();
    EXPECT_DOUBLE_EQ(config.thresholds.min_sync_score, 0.8);
    EXPECT_TRUE(config.capabilities.audio_decoding);
}

TEST_F(ValidatorConfigTest, LoadNestedFile)
{
    std::string path = createDummyFile("config.json", R"({
        "thresholds": {"pass_threshold": 0.75},
        "sync": {"max_offset_ms": 50},
        "visual": {"sample_count": 6},
        "capabilities": {"audio_decoding": false},
        "log_level": "DEBUG"
    })");

    ValidatorConfigManager manager;
    ASSERT_TRUE(manager.load(path));
    ValidatorConfiguration config = manager.toConfiguration();

    EXPECT_DOUBLE_EQ(config.thresholds.pass_threshold, 0.75);
    EXPECT_DOUBLE_EQ(config.sync.max_offset_ms, 50.0);
    EXPECT_EQ(config.visual.sample_count, 6);
    EXPECT_FALSE(config.capabilities.audio_decoding);
    EXPECT_TRUE(config.capabilities.video_decoding);
    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_DOUBLE_EQ(config.audio.window_seconds, 0.25);
}

TEST_F(ValidatorConfigTest, MalformedFileThrows)
{
    std::string path = createDummyFile("bad.json", "{ \"thresholds\": ");
    ValidatorConfigManager manager;
    EXPECT_THROW(manager.load(path), ConfigurationError);
}

TEST_F(ValidatorConfigTest, NonNumericValueIsConfigurationError)
{
    std::string path = createDummyFile("config.json", R"({"thresholds": {"pass_threshold": "high"}})");
    ValidatorConfigManager manager;
    ASSERT_TRUE(manager.load(path));
    EXPECT_THROW(manager.toConfiguration(), ConfigurationError);
}

TEST_F(ValidatorConfigTest, UpdateAppliesDottedKeys)
{
    ValidatorConfigManager manager;
    manager.update({{"sync", {{"max_offset_ms", 80.0}}}, {"log_level", "WARN"}, {"visual", {{"sample_count", 4}}}});

    EXPECT_DOUBLE_EQ(manager.getDouble("sync.max_offset_ms", 0.0), 80.0);
    EXPECT_EQ(manager.getString("log_level", ""), "WARN");
    EXPECT_EQ(manager.getInt("visual.sample_count", 0), 4);

    ValidatorConfiguration config = manager.toConfiguration();
    EXPECT_DOUBLE_EQ(config.sync.max_offset_ms, 80.0);
    EXPECT_EQ(config.visual.sample_count, 4);
}

TEST_F(ValidatorConfigTest, SaveAndReloadKeepsValues)
{
    ValidatorConfiguration original;
    original.thresholds.min_audio_quality = 0.55;
    original.capabilities.video_decoding = false;

    ValidatorConfigManager manager;
    manager.update(ValidatorConfigManager::toJson(original));
    std::string path = testPath("saved.json");
    ASSERT_TRUE(manager.save(path));

    ValidatorConfigManager reloaded;
    ASSERT_TRUE(reloaded.load(path));
    ValidatorConfiguration config = reloaded.toConfiguration();
    EXPECT_DOUBLE_EQ(config.thresholds.min_audio_quality, 0.55);
    EXPECT_FALSE(config.capabilities.video_decoding);
    EXPECT_DOUBLE_EQ(reloaded.getAll()["thresholds"]["min_audio_quality"].get<double>(), 0.55);
}
