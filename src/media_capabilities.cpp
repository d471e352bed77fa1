#include "core/media_capabilities.hpp"
#include "core/ffmpeg_media_decoder.hpp"
#include "core/quality_types.hpp"
#include "logging/logger.hpp"

void CancellationToken::throwIfCancelled(const std::string &where) const
{
    if (isCancelled())
    {
        throw ValidationCancelledError("Validation cancelled during " + where);
    }
}

std::string AudioExtraction::statusName(AudioExtractionStatus status)
{
    switch (status)
    {
    case AudioExtractionStatus::AVAILABLE:
        return "available";
    case AudioExtractionStatus::NO_AUDIO_TRACK:
        return "no_audio_track";
    case AudioExtractionStatus::DECODER_UNAVAILABLE:
        return "decoder_unavailable";
    case AudioExtractionStatus::DECODE_FAILED:
        return "decode_failed";
    }
    return "decode_failed";
}

MediaCapabilities MediaCapabilities::fromConfig(const CapabilityConfig &config)
{
    MediaCapabilities caps;
    if (config.video_decoding)
    {
        caps.frames = std::make_shared<FFmpegFrameDecoder>();
    }
    else
    {
        Logger::warn("Video decoding disabled, visual analysis will run in degraded mode");
        caps.frames = std::make_shared<UnavailableFrameDecoder>();
    }

    if (config.audio_decoding)
    {
        caps.audio = std::make_shared<FFmpegAudioDecoder>();
    }
    else
    {
        Logger::warn("Audio decoding disabled, audio analysis will run in degraded mode");
        caps.audio = std::make_shared<UnavailableAudioDecoder>();
    }
    return caps;
}
