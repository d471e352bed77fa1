#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Identity of the media artifact under validation
 */
struct MediaArtifact
{
    std::string path;    // File-system path as given by the caller
    uint64_t size_bytes; // File size in bytes
    std::string sha256;  // Hex SHA-256 of the file content (empty if unreadable)

    MediaArtifact() : size_bytes(0) {}
};

/**
 * @brief File utilities for artifact access checks and fingerprinting
 */
class FileUtils
{
public:
    /**
     * @brief Check that a path names an existing, readable regular file
     * @param file_path Path to check
     * @return true if the file can be opened for reading
     */
    static bool isReadableFile(const std::string &file_path);

    /**
     * @brief Describe the artifact at a path (size and content hash)
     * @param file_path Path to the media file
     * @return MediaArtifact, or std::nullopt if the file is not accessible
     */
    static std::optional<MediaArtifact> describeArtifact(const std::string &file_path);

    /**
     * @brief Compute the SHA-256 of a file's content
     * @param file_path Path to the file
     * @return Lowercase hex digest, or empty string on read failure
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * @brief Get the lowercase extension of a path without the dot
     */
    static std::string getFileExtension(const std::string &file_path);

    /**
     * @brief Check whether the extension names a container the decoders expect
     */
    static bool isSupportedContainer(const std::string &file_path);

    static std::vector<std::string> getSupportedContainers();

private:
    static const std::vector<std::string> container_extensions_;
};
