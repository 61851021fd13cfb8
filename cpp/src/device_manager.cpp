/**
 * @file device_manager.cpp
 * @brief Implementation of the per-backend device registry
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/device_manager.hpp"
#include "emucore/port_allocator.hpp"

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <regex>

#include <sys/stat.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace emucore {

namespace {
    /// Bit of CAP_NET_RAW in the permitted capability set
    constexpr uint32_t CAP_NET_RAW_BIT = 1u << 13;

    /**
     * @brief Move a file tree, copying when a rename is not possible
     */
    void move_tree(const fs::path& source, const fs::path& destination) {
        fs::create_directories(destination.parent_path());

        std::error_code ec;
        fs::rename(source, destination, ec);
        if (!ec) {
            return;
        }
        if (ec != std::errc::cross_device_link) {
            throw fs::filesystem_error("rename", source, destination, ec);
        }

        fs::copy(source, destination, fs::copy_options::recursive | fs::copy_options::copy_symlinks);
        fs::remove_all(source);
    }

    bool is_inside(const fs::path& directory, const fs::path& path) {
        return config::is_safe_path(path, directory);
    }

    /**
     * @brief Find "<subdir>/<filename>" below a directory
     */
    std::optional<fs::path> search_image(const fs::path& directory, const fs::path& image) {
        fs::path filename = image.filename();
        fs::path subdir = image.parent_path();

        std::error_code ec;
        fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            const fs::path& candidate = it->path();
            if (candidate.filename() != filename || !it->is_regular_file(ec)) {
                continue;
            }
            if (subdir.empty() || candidate.parent_path().lexically_normal() == (directory / subdir).lexically_normal()) {
                return candidate.lexically_normal();
            }
        }
        return std::nullopt;
    }
}

// ============================================================================
// Backend Types
// ============================================================================

std::string backend_module_name(BackendType type) {
    switch (type) {
        case BackendType::Qemu:       return "qemu";
        case BackendType::Iou:        return "iou";
        case BackendType::Dynamips:   return "dynamips";
        case BackendType::Vpcs:       return "vpcs";
        case BackendType::Docker:     return "docker";
        case BackendType::VirtualBox: return "virtualbox";
        case BackendType::VMware:     return "vmware";
        case BackendType::TraceNg:    return "traceng";
    }
    return "unknown";
}

std::optional<std::string> backend_images_subdir(BackendType type) {
    switch (type) {
        case BackendType::Qemu:     return std::string("QEMU");
        case BackendType::Iou:      return std::string("IOU");
        case BackendType::Dynamips: return std::string("IOS");
        default:                    return std::nullopt;
    }
}

// ============================================================================
// Construction
// ============================================================================

DeviceManager::DeviceManager(
    BackendType backend,
    const config::ServerConfig& cfg,
    PortAllocator& allocator,
    ProjectManager& projects)
    : backend_(backend)
    , module_name_(backend_module_name(backend))
    , config_(cfg)
    , allocator_(allocator)
    , projects_(projects)
{
}

std::mutex& DeviceManager::conversion_mutex() {
    static std::mutex mutex;
    return mutex;
}

// ============================================================================
// Device Registry
// ============================================================================

void DeviceManager::register_device(const std::shared_ptr<Device>& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[device->id()] = device;
}

void DeviceManager::unregister_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.erase(device_id);
}

std::shared_ptr<Device> DeviceManager::find_device(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    return it == devices_.end() ? nullptr : it->second;
}

std::shared_ptr<Device> DeviceManager::get_device(
    const std::string& device_id,
    const std::optional<std::string>& project_id) const
{
    std::shared_ptr<Project> project;
    if (project_id) {
        project = projects_.get_project(*project_id);
    }

    if (!utilities::is_valid_uuid(device_id)) {
        throw InvalidIdentifierError("Device ID " + device_id + " is not a valid UUID");
    }

    auto device = find_device(device_id);
    if (!device) {
        throw DeviceNotFoundError("Device ID " + device_id + " doesn't exist");
    }

    if (project && device->project()->id() != project->id()) {
        throw ProjectMismatchError("Project ID " + *project_id + " doesn't belong to device " + device->name());
    }
    return device;
}

bool DeviceManager::has_device(const std::string& device_id) const {
    return find_device(device_id) != nullptr;
}

std::vector<std::shared_ptr<Device>> DeviceManager::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Device>> result;
    result.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        result.push_back(device);
    }
    return result;
}

std::shared_ptr<Device> DeviceManager::close_device(const std::string& device_id) {
    auto device = get_device(device_id);
    device->close();
    return device;
}

std::shared_ptr<Device> DeviceManager::delete_device(const std::string& device_id) {
    auto device = get_device(device_id);

    auto forget = [this, &device]() {
        device->project()->emit("node.deleted", device->to_json());
        device->project()->mark_device_for_destruction(*device);
        unregister_device(device->id());
    };

    try {
        close_device(device_id);
    } catch (const std::exception& ex) {
        utilities::log_error(module_name_ + ": error while closing device " + device_id + ": " + ex.what());
        forget();
        throw;
    }
    forget();

    utilities::log_info(module_name_ + ": device " + device_id + " deleted");
    return device;
}

std::shared_ptr<Device> DeviceManager::duplicate_device(const std::string& source_id,
                                                        const std::string& destination_id) {
    auto source = get_device(source_id);
    auto destination = get_device(destination_id);

    fs::path source_dir = source->working_dir();
    fs::path destination_dir = destination->working_path();

    std::error_code ec;
    fs::remove_all(destination_dir, ec);
    if (!ec) {
        fs::copy(source_dir, destination_dir,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    }
    if (ec) {
        throw DeviceError("Cannot duplicate device data: " + ec.message());
    }

    // Round trip through a temporary name so name dependent files are rewritten
    std::string name = destination->name();
    destination->rename(name + utilities::generate_uuid());
    destination->rename(name);

    utilities::log_info(module_name_ + ": device " + source_id + " duplicated to " + destination_id);
    return destination;
}

void DeviceManager::project_closed(const Project& project) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (it->second->project()->id() == project.id()) {
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
}

void DeviceManager::unload_all() {
    auto snapshot = devices();
    if (!snapshot.empty()) {
        asio::thread_pool pool(std::min<size_t>(snapshot.size(), 8));
        for (const auto& device : snapshot) {
            asio::post(pool, [this, device]() {
                try {
                    close_device(device->id());
                } catch (const std::exception& ex) {
                    utilities::log_error(module_name_ + ": could not close device " + device->id() +
                                         ": " + ex.what());
                }
            });
        }
        pool.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_.clear();
    }
    utilities::log_debug(module_name_ + ": module unloaded");
}

// ============================================================================
// Links and Privileges
// ============================================================================

std::shared_ptr<Nio> DeviceManager::create_nio(const std::string& settings_json) const {
    return emucore::create_nio(settings_json);
}

bool DeviceManager::has_privileged_access(const fs::path& executable) {
    if (geteuid() == 0) {
        return true;
    }

    struct stat info;
    if (stat(executable.c_str(), &info) != 0) {
        utilities::log_error("DeviceManager: cannot stat " + executable.string() + ": " + std::strerror(errno));
        return false;
    }
    if (info.st_uid == 0 && (info.st_mode & (S_ISUID | S_ISGID)) != 0) {
        return true;
    }

    std::array<uint32_t, 5> caps{};
    ssize_t size = getxattr(executable.c_str(), "security.capability", caps.data(), sizeof(caps));
    if (size < 0) {
        if (errno != ENODATA && errno != ENOTSUP) {
            utilities::log_error("DeviceManager: cannot read capabilities of " + executable.string() +
                                 ": " + std::strerror(errno));
        }
        return false;
    }

    return size >= static_cast<ssize_t>(2 * sizeof(uint32_t)) && (caps[1] & CAP_NET_RAW_BIT) != 0;
}

// ============================================================================
// Images
// ============================================================================

fs::path DeviceManager::images_root() const {
    fs::path root = config_.images_path.empty() ? config::get_images_directory() : config_.images_path;
    return fs::absolute(root).lexically_normal();
}

fs::path DeviceManager::images_directory() const {
    auto subdir = backend_images_subdir(backend_);
    if (!subdir) {
        throw DeviceError("Backend " + module_name_ + " has no images directory");
    }
    return images_root() / *subdir;
}

std::vector<fs::path> DeviceManager::images_directories() const {
    std::vector<fs::path> additional;
    for (const auto& directory : config_.additional_images_paths) {
        additional.push_back(fs::absolute(directory).lexically_normal());
    }
    return images::images_directories(images_directory(), additional, images_root());
}

fs::path DeviceManager::resolve_image_path(const std::string& path) const {
    if (path.empty() || path == ".") {
        return {};
    }

    static const std::regex drive_letter("^[A-Za-z]:");
    if (std::regex_search(path, drive_letter)) {
        throw ImagePathError("'" + path + "' is not allowed on this remote server");
    }

    fs::path image = fs::path(path).lexically_normal();
    fs::path directory = images_directory();
    auto directories = images_directories();

    if (image.is_relative()) {
        for (const auto& candidate : directories) {
            if (auto found = search_image(candidate, image)) {
                return *found;
            }
        }

        fs::path fallback = (directory / image).lexically_normal();
        std::error_code ec;
        if (fs::exists(fallback, ec) && (config_.local || is_inside(images_root(), fallback))) {
            return fallback;
        }
        throw ImageMissingError(path, "The image '" + path + "' could not be found");
    }

    for (const auto& candidate : directories) {
        if (is_inside(candidate, image)) {
            std::error_code ec;
            if (!fs::exists(image, ec)) {
                throw ImageMissingError(path, "The image '" + path + "' could not be found");
            }
            return image;
        }
    }

    if (config_.local) {
        return image;
    }

    throw ImagePathError("'" + path + "' is not allowed on this remote server. Please only use a file from '" +
                         directory.string() + "'");
}

std::string DeviceManager::resolve_relative_image_path(const std::string& path) const {
    if (path.empty() || path == ".") {
        return "";
    }

    fs::path image = resolve_image_path(path);
    fs::path directory = images_directory();

    for (const auto& candidate : images_directories()) {
        if (!is_inside(candidate, image)) {
            continue;
        }
        fs::path relative = image.lexically_relative(candidate);
        bool direct_child = relative.parent_path().empty();
        if (direct_child || candidate == directory.lexically_normal()) {
            return relative.generic_string();
        }
    }
    return image.string();
}

std::vector<images::ImageInfo> DeviceManager::list_images() const {
    return images::list_images(images_directory(), images_directories(), images_root());
}

void DeviceManager::write_image(const std::string& filename, std::istream& stream) const {
    fs::path directory = images_directory();
    fs::path path = (directory / filename).lexically_normal();

    if (filename.empty() || !is_inside(directory, path) || path == directory) {
        throw ForbiddenError("Could not write image: " + filename + ", " + path.string() + " is forbidden");
    }

    utilities::log_info(module_name_ + ": writing image file " + path.string());

    fs::path tmp_path = path.string() + config::UPLOAD_SUFFIX;
    try {
        images::remove_checksum(path);
        fs::create_directories(path.parent_path());

        {
            std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw DeviceError("Could not write image: " + filename + " because " + std::strerror(errno));
            }

            std::array<char, config::IMAGE_CHUNK_SIZE> chunk;
            while (stream) {
                stream.read(chunk.data(), chunk.size());
                std::streamsize count = stream.gcount();
                if (count > 0) {
                    out.write(chunk.data(), count);
                }
            }
            if (stream.bad() || !out) {
                throw DeviceError("Could not write image: " + filename + " because the upload was interrupted");
            }
        }

        fs::permissions(tmp_path, fs::perms::owner_all, fs::perm_options::replace);
        fs::rename(tmp_path, path);
    } catch (const fs::filesystem_error& ex) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        throw DeviceError("Could not write image: " + filename + " because " + ex.code().message());
    } catch (const DeviceError&) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        throw;
    }

    images::md5sum(path);
}

// ============================================================================
// Legacy Conversion
// ============================================================================

std::optional<fs::path> DeviceManager::legacy_device_workdir(int legacy_id, const std::string& name) const {
    switch (backend_) {
        case BackendType::Vpcs:       return fs::path("vpcs") / ("pc-" + std::to_string(legacy_id));
        case BackendType::Qemu:       return fs::path("qemu") / ("vm-" + std::to_string(legacy_id));
        case BackendType::Iou:        return fs::path("iou") / ("device-" + std::to_string(legacy_id));
        // VirtualBox directories were named after the VM
        case BackendType::VirtualBox: return fs::path("vbox") / name;
        default:                      return std::nullopt;
    }
}

std::string DeviceManager::convert_legacy_device(int legacy_id, const std::string& name, Project& project) {
    std::lock_guard<std::mutex> lock(conversion_mutex());

    std::string new_id = utilities::generate_uuid();
    fs::path legacy_files = project.path() / (project.name() + "-files");
    fs::path project_files = project.path() / "project-files";

    auto move = [](const fs::path& from, const fs::path& to, const std::string& what) {
        std::error_code ec;
        if (!fs::exists(from, ec) || fs::exists(to, ec)) {
            return;
        }
        utilities::log_info("DeviceManager: moving \"" + from.string() + "\" to \"" + to.string() + "\"");
        try {
            move_tree(from, to);
        } catch (const fs::filesystem_error& ex) {
            throw MigrationError("Could not move " + what + ": " + from.string() + " to " +
                                 to.string() + " " + ex.code().message());
        }
    };

    utilities::log_info(module_name_ + ": converting old project " + project.name());
    move(legacy_files, project_files, "project files directory");

    if (!project.is_local()) {
        fs::path legacy_remote = project.path().parent_path() / project.name() / module_name_;
        move(legacy_remote, project_files / module_name_, "remote project files directory");
    }

    if (auto workdir = legacy_device_workdir(legacy_id, name)) {
        move(project_files / *workdir, project_files / module_name_ / new_id, "device working directory");
    }

    return new_id;
}

} // namespace emucore
