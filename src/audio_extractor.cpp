#include "core/audio_extractor.hpp"
#include "core/quality_types.hpp"
#include "logging/logger.hpp"
#include <utility>

AudioExtractor::AudioExtractor(std::shared_ptr<const AudioDecoder> decoder, int sample_rate)
    : decoder_(std::move(decoder)), sample_rate_(sample_rate)
{
}

AudioExtraction AudioExtractor::extract(const std::string &file_path, const CancellationToken *token) const
{
    if (!decoder_ || !decoder_->isAvailable())
    {
        return AudioExtraction(AudioExtractionStatus::DECODER_UNAVAILABLE, "audio decoding capability unavailable");
    }

    AudioExtraction extraction;
    try
    {
        extraction = decoder_->decode(file_path, sample_rate_, token);
    }
    catch (const ValidationCancelledError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        Logger::error("Audio decoding failed for " + file_path + ": " + e.what());
        return AudioExtraction(AudioExtractionStatus::DECODE_FAILED, e.what());
    }

    if (!extraction.available())
    {
        Logger::warn("Audio signal unavailable for " + file_path + " (" +
                     AudioExtraction::statusName(extraction.status) + ": " + extraction.detail + ")");
    }
    return extraction;
}
