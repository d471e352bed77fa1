#include "core/audio_quality_analyzer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace
{
    double clampUnit(double value)
    {
        return std::max(0.0, std::min(1.0, value));
    }

    std::string formatSeconds(double seconds)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2fs", seconds);
        return buf;
    }
}

AudioQualityAnalyzer::AudioQualityAnalyzer(const AudioAnalysisConfig &config, const DegradedScoreConfig &defaults)
    : config_(config), defaults_(defaults)
{
}

std::vector<AudioWindow> AudioQualityAnalyzer::computeWindows(const AudioSignal &signal) const
{
    std::vector<AudioWindow> windows;
    if (signal.sample_rate <= 0 || signal.samples.empty())
    {
        return windows;
    }

    const size_t window_len = std::max<size_t>(1, static_cast<size_t>(std::lround(config_.window_seconds * signal.sample_rate)));
    const size_t total = signal.samples.size();
    for (size_t begin = 0; begin < total; begin += window_len)
    {
        size_t end = std::min(total, begin + window_len);
        // A short tail carries too few samples for a stable RMS
        if (end - begin < window_len / 2 && !windows.empty())
        {
            break;
        }
        double sum_sq = 0.0;
        for (size_t i = begin; i < end; ++i)
        {
            double v = signal.samples[i];
            sum_sq += v * v;
        }
        AudioWindow window;
        window.start_seconds = static_cast<double>(begin) / signal.sample_rate;
        window.duration_seconds = static_cast<double>(end - begin) / signal.sample_rate;
        window.rms = std::sqrt(sum_sq / static_cast<double>(end - begin));
        window.silent = window.rms < config_.silence_threshold;
        windows.push_back(window);
    }
    return windows;
}

AnalysisResult AudioQualityAnalyzer::analyze(const AudioExtraction &extraction, const ProjectMetadata &metadata) const
{
    AnalysisResult result;

    if (!extraction.available())
    {
        result.score = defaults_.audio_unavailable_score;
        result.degraded = true;
        result.metrics["duration_seconds"] = 0.0;
        std::string reason = extraction.status == AudioExtractionStatus::NO_AUDIO_TRACK
                                 ? "the artifact has no audio track"
                                 : "audio could not be decoded (" + AudioExtraction::statusName(extraction.status) + ")";
        result.issues.emplace_back(IssueKind::AUDIO_UNAVAILABLE, Severity::LOW,
                                   "No audio signal available for analysis: " + reason,
                                   IssueLocation::entireVideo());
        return result;
    }

    const AudioSignal &signal = extraction.signal;
    const double duration = signal.durationSeconds();
    std::vector<AudioWindow> windows = computeWindows(signal);
    result.metrics["duration_seconds"] = duration;

    std::vector<double> voiced;
    std::vector<double> silent;
    for (const auto &w : windows)
    {
        (w.silent ? silent : voiced).push_back(w.rms);
    }
    result.metrics["clarity"] = windows.empty() ? 0.0 : static_cast<double>(voiced.size()) / windows.size();

    // Noise: instability of the floor in silent windows
    double noise_level = 0.0;
    if (silent.size() > 1)
    {
        double mean = 0.0;
        for (double r : silent)
            mean += r;
        mean /= silent.size();
        double var = 0.0;
        for (double r : silent)
            var += (r - mean) * (r - mean);
        var /= silent.size();
        noise_level = std::min(1.0, std::sqrt(var) / config_.silence_threshold);
    }
    result.metrics["noise_level"] = noise_level;

    if (voiced.empty())
    {
        bool planned = metadata.isExpectedSilence(0.0, duration);
        double gap_seconds = planned ? 0.0 : duration;
        result.metrics["gap_seconds"] = gap_seconds;
        result.metrics["artifact_count"] = 0.0;
        result.metrics["dynamic_range_db"] = 0.0;

        double weights = config_.gap_weight + config_.artifact_weight + config_.dynamic_range_weight + config_.noise_weight;
        double gap_score = planned ? 1.0 : 0.0;
        double range_score = planned ? 1.0 : 0.0;
        result.score = clampUnit((config_.gap_weight * gap_score + config_.artifact_weight +
                                  config_.dynamic_range_weight * range_score +
                                  config_.noise_weight * (1.0 - noise_level)) /
                                 weights);
        if (!planned)
        {
            result.issues.emplace_back(IssueKind::AUDIO_SILENT_TRACK, Severity::HIGH,
                                       "Audio track is present but silent for its whole duration (" + formatSeconds(duration) + ")",
                                       IssueLocation::entireVideo());
        }
        return result;
    }

    // Gaps
    double gap_seconds = 0.0;
    size_t i = 0;
    while (i < windows.size())
    {
        if (!windows[i].silent)
        {
            ++i;
            continue;
        }
        size_t run_start = i;
        while (i < windows.size() && windows[i].silent)
        {
            ++i;
        }
        size_t run_end = i;

        double start = windows[run_start].start_seconds;
        double end = windows[run_end - 1].start_seconds + windows[run_end - 1].duration_seconds;
        double length = end - start;
        if (length <= config_.min_gap_seconds)
        {
            continue;
        }
        bool at_edge = run_start == 0 || run_end == windows.size();
        if (at_edge && length <= config_.edge_tolerance_seconds)
        {
            Logger::trace("Ignoring lead-in or tail silence starting at " + formatSeconds(start));
            continue;
        }
        if (metadata.isExpectedSilence(start, end))
        {
            Logger::trace("Ignoring planned silence starting at " + formatSeconds(start));
            continue;
        }

        gap_seconds += length;
        result.issues.emplace_back(IssueKind::AUDIO_SILENCE_GAP, Severity::HIGH,
                                   "Silence gap of " + formatSeconds(length) + " in the audio track",
                                   IssueLocation::at(start, metadata.shotIdAt(start)));
    }

    // Spikes relative to the loudest non-silent neighbour
    int artifact_count = 0;
    for (size_t w = 0; w < windows.size(); ++w)
    {
        if (windows[w].silent)
        {
            continue;
        }
        double reference = 0.0;
        bool has_neighbour = false;
        if (w > 0 && !windows[w - 1].silent)
        {
            reference = std::max(reference, windows[w - 1].rms);
            has_neighbour = true;
        }
        if (w + 1 < windows.size() && !windows[w + 1].silent)
        {
            reference = std::max(reference, windows[w + 1].rms);
            has_neighbour = true;
        }
        if (has_neighbour && windows[w].rms > config_.spike_ratio * reference)
        {
            ++artifact_count;
            double t = windows[w].start_seconds;
            char ratio[32];
            std::snprintf(ratio, sizeof(ratio), "%.1fx", windows[w].rms / reference);
            result.issues.emplace_back(IssueKind::AUDIO_SPIKE_ARTIFACT, Severity::MEDIUM,
                                       std::string("Abrupt loudness spike (") + ratio + " surrounding level)",
                                       IssueLocation::at(t, metadata.shotIdAt(t)));
        }
    }

    double range_db = 0.0;
    auto minmax = std::minmax_element(voiced.begin(), voiced.end());
    if (*minmax.first > 0.0)
    {
        range_db = 20.0 * std::log10(*minmax.second / *minmax.first);
    }

    double gap_penalty = std::min(1.0, gap_seconds / config_.max_tolerated_gap_seconds);
    double artifact_penalty = std::min(1.0, static_cast<double>(artifact_count) / config_.max_tolerated_artifacts);
    double weights = config_.gap_weight + config_.artifact_weight + config_.dynamic_range_weight + config_.noise_weight;
    result.score = clampUnit((config_.gap_weight * (1.0 - gap_penalty) +
                              config_.artifact_weight * (1.0 - artifact_penalty) +
                              config_.dynamic_range_weight * dynamicRangeScore(range_db) +
                              config_.noise_weight * (1.0 - noise_level)) /
                             weights);

    result.metrics["gap_seconds"] = gap_seconds;
    result.metrics["artifact_count"] = artifact_count;
    result.metrics["dynamic_range_db"] = range_db;

    Logger::debug("Audio quality: gaps=" + formatSeconds(gap_seconds) +
                  " artifacts=" + std::to_string(artifact_count) +
                  " range=" + std::to_string(range_db) + "dB score=" + std::to_string(result.score));
    return result;
}

double AudioQualityAnalyzer::dynamicRangeScore(double range_db) const
{
    if (range_db < config_.min_dynamic_range_db)
    {
        return clampUnit(range_db / config_.min_dynamic_range_db);
    }
    if (range_db > config_.max_dynamic_range_db)
    {
        return clampUnit(config_.max_dynamic_range_db / range_db);
    }
    return 1.0;
}
