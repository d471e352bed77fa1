#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

const std::vector<std::string> FileUtils::container_extensions_ = {
    "mp4", "mov", "m4v", "mkv", "webm", "avi", "mpg", "mpeg", "ts", "flv"};

bool FileUtils::isReadableFile(const std::string &file_path)
{
    try
    {
        fs::path path(file_path);
        if (file_path.empty() || !fs::exists(path) || !fs::is_regular_file(path))
        {
            return false;
        }
        std::ifstream file(file_path, std::ios::binary);
        return file.is_open();
    }
    catch (const std::exception &e)
    {
        Logger::error("Error checking file access for " + file_path + ": " + e.what());
        return false;
    }
}

std::optional<MediaArtifact> FileUtils::describeArtifact(const std::string &file_path)
{
    if (!isReadableFile(file_path))
    {
        return std::nullopt;
    }

    try
    {
        MediaArtifact artifact;
        artifact.path = file_path;
        artifact.size_bytes = fs::file_size(fs::path(file_path));
        artifact.sha256 = computeFileHash(file_path);
        return artifact;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error describing artifact " + file_path + ": " + e.what());
        return std::nullopt;
    }
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 8192;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";
    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), bytes_read) != 1)
                return "";
        }
    }
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    size_t dot_pos = file_path.find_last_of('.');
    if (dot_pos == std::string::npos)
    {
        return "";
    }

    std::string extension = file_path.substr(dot_pos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
    return extension;
}

bool FileUtils::isSupportedContainer(const std::string &file_path)
{
    std::string ext = getFileExtension(file_path);
    return std::find(container_extensions_.begin(), container_extensions_.end(), ext) != container_extensions_.end();
}

std::vector<std::string> FileUtils::getSupportedContainers()
{
    return container_extensions_;
}
