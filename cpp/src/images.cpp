/**
 * @file images.cpp
 * @brief Implementation of image listing and checksum sidecars
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/images.hpp"
#include "emucore/server_config.hpp"
#include "emucore/utilities.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <set>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace emucore {
namespace images {

namespace {
    fs::path checksum_path(const fs::path& path) {
        return fs::path(path.string() + config::CHECKSUM_SUFFIX);
    }

    bool is_listable(const std::string& filename) {
        return !filename.empty() &&
               filename[0] != '.' &&
               !utilities::ends_with(filename, config::CHECKSUM_SUFFIX) &&
               !utilities::ends_with(filename, config::UPLOAD_SUFFIX);
    }

    bool is_inside(const fs::path& directory, const fs::path& path) {
        auto dir = directory.lexically_normal();
        auto target = path.lexically_normal();
        auto mismatch = std::mismatch(dir.begin(), dir.end(), target.begin(), target.end());
        // A trailing separator leaves an empty last element
        return mismatch.first == dir.end() || (std::next(mismatch.first) == dir.end() && mismatch.first->empty());
    }
}

std::optional<std::string> md5sum(const fs::path& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return std::nullopt;
    }

    fs::path sidecar = checksum_path(path);
    if (auto cached = utilities::read_file(sidecar.string())) {
        std::string digest = utilities::trim_string(*cached);
        if (digest.size() == config::MD5_HEX_LENGTH) {
            return digest;
        }
    }

    utilities::log_debug("Images: Calculating MD5 sum of `" + path.string() + "`");
    auto digest = utilities::calculate_file_md5(path.string());
    if (!digest) {
        utilities::log_error("Images: Can't create digest of " + path.string());
        return std::nullopt;
    }

    if (!utilities::write_file(sidecar.string(), *digest)) {
        utilities::log_error("Images: Can't write digest of " + path.string());
    }
    return digest;
}

void remove_checksum(const fs::path& path) {
    std::error_code ec;
    fs::remove(checksum_path(path), ec);
    if (ec) {
        utilities::log_warn("Images: Could not remove checksum of " + path.string() + ": " + ec.message());
    }
}

std::vector<fs::path> images_directories(
    const fs::path& type_directory,
    const std::vector<fs::path>& additional_directories,
    const fs::path& images_root)
{
    std::vector<fs::path> candidates;

    std::error_code ec;
    fs::create_directories(type_directory, ec);
    if (!ec) {
        candidates.push_back(type_directory);
    }
    for (const auto& directory : additional_directories) {
        candidates.push_back(directory);
    }
    // Old topologies keep images in the root directory
    candidates.push_back(images_root);

    std::vector<fs::path> paths;
    for (const auto& candidate : candidates) {
        if (fs::exists(candidate, ec)) {
            paths.push_back(candidate.lexically_normal());
        }
    }
    return paths;
}

std::vector<ImageInfo> list_images(
    const fs::path& type_directory,
    const std::vector<fs::path>& directories,
    const fs::path& images_root)
{
    std::set<std::string> seen;
    std::vector<ImageInfo> result;

    auto add_image = [&](const fs::path& file) {
        std::string filename = file.filename().string();
        if (!is_listable(filename) || seen.count(filename) > 0) {
            return;
        }

        std::error_code ec;
        auto size = fs::file_size(file, ec);
        if (ec) {
            utilities::log_warn("Images: Can't add image " + file.string() + ": " + ec.message());
            return;
        }
        auto digest = md5sum(file);
        if (!digest) {
            utilities::log_warn("Images: Can't add image " + file.string());
            return;
        }

        ImageInfo info;
        info.filename = filename;
        if (is_inside(type_directory, file)) {
            info.path = file.lexically_relative(type_directory.lexically_normal()).generic_string();
        } else {
            info.path = file.generic_string();
        }
        info.md5sum = *digest;
        info.filesize = static_cast<uint64_t>(size);

        seen.insert(filename);
        result.push_back(info);
    };

    for (const auto& directory : directories) {
        std::error_code ec;
        bool recurse = directory.lexically_normal() != images_root.lexically_normal();

        if (recurse) {
            fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_regular_file(ec)) {
                    add_image(it->path().lexically_normal());
                }
            }
        } else {
            fs::directory_iterator it(directory, ec);
            for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
                if (it->is_regular_file(ec)) {
                    add_image(it->path().lexically_normal());
                }
            }
        }

        if (ec) {
            utilities::log_warn("Images: error while scanning " + directory.string() + ": " + ec.message());
        }
    }

    return result;
}

std::string to_json(const std::vector<ImageInfo>& images) {
    json list = json::array();
    for (const auto& image : images) {
        json entry;
        entry["filename"] = image.filename;
        entry["path"] = image.path;
        entry["md5sum"] = image.md5sum;
        entry["filesize"] = image.filesize;
        list.push_back(entry);
    }
    return list.dump();
}

} // namespace images
} // namespace emucore
