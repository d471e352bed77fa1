#include "test_base.hpp"
#include "core/ffmpeg_media_decoder.hpp"
#include "core/quality_validator.hpp"

class FFmpegMediaDecoderTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        corrupt_path_ = createDummyFile("corrupt.mp4", "this is not an mp4 container, only plain text bytes");
    }

    std::string corrupt_path_;
};

TEST_F(FFmpegMediaDecoderTest, CorruptContainerHasNoVideoStream)
{
    FFmpegFrameDecoder decoder;
    EXPECT_TRUE(decoder.isAvailable());
    EXPECT_FALSE(decoder.probe(corrupt_path_).has_value());
    EXPECT_EQ(decoder.openReader(corrupt_path_, 320), nullptr);
}

TEST_F(FFmpegMediaDecoderTest, MissingFileCannotBeOpened)
{
    FFmpegFrameDecoder decoder;
    EXPECT_FALSE(decoder.probe(testPath("absent.mp4")).has_value());
    EXPECT_EQ(decoder.openReader(testPath("absent.mp4"), 320), nullptr);
}

TEST_F(FFmpegMediaDecoderTest, CorruptContainerYieldsNoAudio)
{
    FFmpegAudioDecoder decoder;
    AudioExtraction extraction = decoder.decode(corrupt_path_, 16000, nullptr);
    EXPECT_FALSE(extraction.available());
    EXPECT_TRUE(extraction.signal.samples.empty());
    EXPECT_FALSE(extraction.detail.empty());
}

TEST_F(FFmpegMediaDecoderTest, ValidatorDegradesOnUndecodableMedia)
{
    ValidatorConfiguration config;
    QualityValidator validator(config);

    QualityReport report = validator.validate(corrupt_path_, ProjectMetadata());

    EXPECT_TRUE(report.visual().degraded);
    EXPECT_TRUE(report.audio().degraded);
    EXPECT_DOUBLE_EQ(report.audioQualityScore(), config.defaults.audio_unavailable_score);
    EXPECT_DOUBLE_EQ(report.syncScore(), config.defaults.sync_unavailable_score);
    EXPECT_FALSE(report.hasCriticalIssue());
    EXPECT_GE(report.overallScore(), 0.0);
    EXPECT_LE(report.overallScore(), 1.0);
}
