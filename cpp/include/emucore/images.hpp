/**
 * @file images.hpp
 * @brief Image directory layout, listing and checksum sidecars
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace emucore {
namespace images {

/**
 * @brief One image available to a backend
 */
struct ImageInfo {
    std::string filename;               ///< File name
    std::string path;                   ///< Relative to the backend directory, absolute elsewhere
    std::string md5sum;                 ///< Hex MD5 digest
    uint64_t filesize;                  ///< Size in bytes
};

/**
 * @brief MD5 of an image, cached in a "<path>.md5sum" sidecar
 *
 * A cached digest is reused when the sidecar holds 32 characters.
 *
 * @return Digest or std::nullopt if the image cannot be read
 */
std::optional<std::string> md5sum(const std::filesystem::path& path);

/**
 * @brief Delete the checksum sidecar of an image if present
 */
void remove_checksum(const std::filesystem::path& path);

/**
 * @brief Directories searched for images, by priority
 *
 * The backend directory (created if absent), the additional directories,
 * then the images root for old topologies. Missing directories are left out.
 */
std::vector<std::filesystem::path> images_directories(
    const std::filesystem::path& type_directory,
    const std::vector<std::filesystem::path>& additional_directories,
    const std::filesystem::path& images_root
);

/**
 * @brief Enumerate images of the given directories
 *
 * Hidden files, checksum sidecars and partial uploads are skipped; a file
 * name is listed once. Directories are walked recursively except the
 * images root, where only top-level files belong to old topologies.
 *
 * @param type_directory Backend directory, paths inside it are relative
 * @param directories Directories to scan (see images_directories)
 * @param images_root Images root
 */
std::vector<ImageInfo> list_images(
    const std::filesystem::path& type_directory,
    const std::vector<std::filesystem::path>& directories,
    const std::filesystem::path& images_root
);

/**
 * @brief Serialize an image list to JSON
 */
std::string to_json(const std::vector<ImageInfo>& images);

} // namespace images
} // namespace emucore
