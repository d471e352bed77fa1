#include "core/project_metadata.hpp"
#include "core/quality_validator.hpp"
#include "core/report_serializer.hpp"
#include "core/validator_config_manager.hpp"
#include "logging/logger.hpp"
#include <csignal>
#include <iostream>
#include <memory>

namespace
{
    constexpr int kExitPassed = 0;
    constexpr int kExitFailed = 1;
    constexpr int kExitFatal = 2;

    CancellationToken g_cancel_token;

    void handleSignal(int) noexcept
    {
        g_cancel_token.cancel();
    }

    void printUsage(const char *program)
    {
        std::cout << "Video QA - final output quality gate" << std::endl;
        std::cout << "Usage: " << program << " <media-file> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --metadata, -m FILE     Project metadata (.json, .yaml, .yml)" << std::endl;
        std::cout << "  --config, -c FILE       Validator configuration (.json)" << std::endl;
        std::cout << "  --output, -o FILE       Write the JSON report to FILE instead of stdout" << std::endl;
        std::cout << "  --log-level LEVEL       TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --no-video-decoding     Skip frame decoding (degraded visual analysis)" << std::endl;
        std::cout << "  --no-audio-decoding     Skip audio decoding (degraded audio analysis)" << std::endl;
        std::cout << "  --help, -h              Show this help message" << std::endl;
        std::cout << "Exit codes: 0 passed, 1 failed, 2 fatal error" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    std::string media_path;
    std::string metadata_path;
    std::string config_path;
    std::string output_path;
    std::string log_level;
    bool no_video = false;
    bool no_audio = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto needValue = [&](const std::string &flag) -> bool
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << flag << " requires a value" << std::endl;
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return kExitPassed;
        }
        else if (arg == "--metadata" || arg == "-m")
        {
            if (!needValue(arg))
                return kExitFatal;
            metadata_path = argv[++i];
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (!needValue(arg))
                return kExitFatal;
            config_path = argv[++i];
        }
        else if (arg == "--output" || arg == "-o")
        {
            if (!needValue(arg))
                return kExitFatal;
            output_path = argv[++i];
        }
        else if (arg == "--log-level")
        {
            if (!needValue(arg))
                return kExitFatal;
            log_level = argv[++i];
        }
        else if (arg == "--no-video-decoding")
        {
            no_video = true;
        }
        else if (arg == "--no-audio-decoding")
        {
            no_audio = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return kExitFatal;
        }
        else if (media_path.empty())
        {
            media_path = arg;
        }
        else
        {
            std::cerr << "Error: only one media file may be validated per run" << std::endl;
            return kExitFatal;
        }
    }

    if (media_path.empty())
    {
        printUsage(argv[0]);
        return kExitFatal;
    }

    signal(SIGINT, &handleSignal);
    signal(SIGTERM, &handleSignal);

    try
    {
        ValidatorConfigManager config_manager;
        if (!config_path.empty() && !config_manager.load(config_path))
        {
            std::cerr << "Error: configuration file not found: " << config_path << std::endl;
            return kExitFatal;
        }

        ValidatorConfiguration config = config_manager.toConfiguration();
        if (!log_level.empty())
        {
            config.log_level = log_level;
        }
        if (no_video)
        {
            config.capabilities.video_decoding = false;
        }
        if (no_audio)
        {
            config.capabilities.audio_decoding = false;
        }
        Logger::init(config.log_level);

        std::vector<std::string> errors = config.validate();
        if (!errors.empty())
        {
            for (const auto &error : errors)
            {
                Logger::error("Configuration error: " + error);
            }
            return kExitFatal;
        }

        ProjectMetadata metadata;
        if (!metadata_path.empty())
        {
            metadata = ProjectMetadata::loadFromFile(metadata_path);
            Logger::info("Loaded project metadata '" + metadata.projectName() + "' with " +
                         std::to_string(metadata.shots().size()) + " shots");
        }

        QualityValidator validator(config);
        QualityReport report = validator.validate(media_path, metadata, config, &g_cancel_token);

        if (output_path.empty())
        {
            std::cout << ReportSerializer::toString(report) << std::endl;
        }
        else if (!ReportSerializer::writeToFile(report, output_path))
        {
            return kExitFatal;
        }
        return report.passed() ? kExitPassed : kExitFailed;
    }
    catch (const MediaAccessError &e)
    {
        Logger::error(e.what());
        return kExitFatal;
    }
    catch (const ValidationCancelledError &e)
    {
        Logger::warn(e.what());
        return kExitFatal;
    }
    catch (const ConfigurationError &e)
    {
        Logger::error(e.what());
        return kExitFatal;
    }
    catch (const MetadataError &e)
    {
        Logger::error(e.what());
        return kExitFatal;
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal error: " + std::string(e.what()));
        return kExitFatal;
    }
}
