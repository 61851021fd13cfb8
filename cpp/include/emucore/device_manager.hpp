/**
 * @file device_manager.hpp
 * @brief DeviceManager - per-backend registry of devices and images
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * One manager exists per backend type. It:
 * - Creates devices, converting legacy integer identifiers on the way
 * - Looks devices up by identifier, optionally checking their project
 * - Closes, deletes and duplicates devices
 * - Resolves, lists and stores the backend's disk images
 */

#pragma once

#include "emucore/device.hpp"
#include "emucore/errors.hpp"
#include "emucore/images.hpp"
#include "emucore/project.hpp"
#include "emucore/project_manager.hpp"
#include "emucore/server_config.hpp"
#include "emucore/utilities.hpp"

#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace emucore {

class PortAllocator;

// ============================================================================
// Device Identifiers
// ============================================================================

/// Integer identifier used by old topologies
struct LegacyId {
    int value;
};

/// UUID identifier
struct StableId {
    std::string value;
};

using DeviceId = std::variant<LegacyId, StableId>;

// ============================================================================
// Backend Types
// ============================================================================

enum class BackendType {
    Qemu,
    Iou,
    Dynamips,
    Vpcs,
    Docker,
    VirtualBox,
    VMware,
    TraceNg
};

/**
 * @brief Lower-case module name ("qemu", "iou", ...)
 */
std::string backend_module_name(BackendType type);

/**
 * @brief Images subdirectory of a backend ("QEMU", "IOU", "IOS")
 * @return std::nullopt for backends without disk images
 */
std::optional<std::string> backend_images_subdir(BackendType type);

/**
 * @brief DeviceManager - Registry of the devices of one backend
 *
 * Thread-safe. Creation is serialized per manager; lookups take a short
 * registry lock. Legacy conversion is serialized across all managers since
 * it moves shared project directories.
 */
class DeviceManager {
public:
    /**
     * @param backend Backend this manager serves
     * @param cfg Server configuration
     * @param allocator Port allocator shared by all managers
     * @param projects Project manager used to resolve project identifiers
     */
    DeviceManager(
        BackendType backend,
        const config::ServerConfig& cfg,
        PortAllocator& allocator,
        ProjectManager& projects
    );

    virtual ~DeviceManager() = default;

    // Disable copy and move
    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;
    DeviceManager(DeviceManager&&) = delete;
    DeviceManager& operator=(DeviceManager&&) = delete;

    BackendType backend() const { return backend_; }
    const std::string& module_name() const { return module_name_; }
    PortAllocator& port_allocator() const { return allocator_; }
    ProjectManager& project_manager() const { return projects_; }
    const config::ServerConfig& config() const { return config_; }

    // ========================================================================
    // Device Registry
    // ========================================================================

    /**
     * @brief Look up a device
     *
     * @param device_id Device UUID
     * @param project_id If set, the project must exist and own the device
     * @throws ProjectNotFoundError if project_id is unknown
     * @throws InvalidIdentifierError if device_id is not a UUID
     * @throws DeviceNotFoundError if no such device exists
     * @throws ProjectMismatchError if the device belongs to another project
     */
    std::shared_ptr<Device> get_device(
        const std::string& device_id,
        const std::optional<std::string>& project_id = std::nullopt
    ) const;

    bool has_device(const std::string& device_id) const;

    std::vector<std::shared_ptr<Device>> devices() const;

    /**
     * @brief Close a device, keeping it registered
     */
    std::shared_ptr<Device> close_device(const std::string& device_id);

    /**
     * @brief Close and unregister a device; its directory goes on project commit
     *
     * The "node.deleted" event, the destruction mark and the unregistration
     * happen even if closing fails.
     */
    std::shared_ptr<Device> delete_device(const std::string& device_id);

    /**
     * @brief Replace the files of one device with a copy of another's
     *
     * The destination is renamed away and back so backends rewrite name
     * dependent files.
     *
     * @throws DeviceError if the files cannot be copied
     */
    std::shared_ptr<Device> duplicate_device(const std::string& source_id,
                                             const std::string& destination_id);

    /**
     * @brief Forget the devices of a closed project
     */
    void project_closed(const Project& project);

    /**
     * @brief Close every device concurrently and clear the registry
     */
    void unload_all();

    // ========================================================================
    // Links and Privileges
    // ========================================================================

    /**
     * @brief Build a link from its JSON description
     * @throws NioError on invalid description or unreachable destination
     */
    std::shared_ptr<Nio> create_nio(const std::string& settings_json) const;

    /**
     * @brief Whether an executable can open raw network devices
     *
     * True when running as root, when the file is owned by root with the
     * setuid or setgid bit, or when it carries the CAP_NET_RAW capability.
     */
    static bool has_privileged_access(const std::filesystem::path& executable);

    // ========================================================================
    // Images
    // ========================================================================

    /**
     * @brief Backend images directory
     * @throws DeviceError if the backend has no images
     */
    std::filesystem::path images_directory() const;

    std::vector<std::filesystem::path> images_directories() const;

    /**
     * @brief Resolve an image path given by a client
     *
     * Relative paths are searched in every images directory. Absolute paths
     * must lie in one of them unless the server is local.
     *
     * @return Absolute path, or an empty path for an empty input
     * @throws ImagePathError on a drive letter path or a forbidden location
     * @throws ImageMissingError if the image cannot be found
     */
    std::filesystem::path resolve_image_path(const std::string& path) const;

    /**
     * @brief Shortest path that resolve_image_path maps back to the image
     */
    std::string resolve_relative_image_path(const std::string& path) const;

    std::vector<images::ImageInfo> list_images() const;

    /**
     * @brief Store an uploaded image and compute its checksum
     *
     * Data goes to "<name>.tmp" first and is renamed into place once complete.
     *
     * @throws ForbiddenError if filename escapes the images directory
     * @throws DeviceError on write failure
     */
    void write_image(const std::string& filename, std::istream& stream) const;

protected:
    /**
     * @brief Move the files of a legacy device to the current layout
     * @return New device UUID
     * @throws MigrationError if a directory cannot be moved
     */
    std::string convert_legacy_device(int legacy_id, const std::string& name, Project& project);

    /**
     * @brief Legacy working directory relative to "project-files"
     */
    virtual std::optional<std::filesystem::path> legacy_device_workdir(int legacy_id,
                                                                       const std::string& name) const;

    void register_device(const std::shared_ptr<Device>& device);
    void unregister_device(const std::string& device_id);
    std::shared_ptr<Device> find_device(const std::string& device_id) const;

    /// Serializes device creation
    std::mutex creation_mutex_;

private:
    BackendType backend_;
    std::string module_name_;
    config::ServerConfig config_;
    PortAllocator& allocator_;
    ProjectManager& projects_;

    std::map<std::string, std::shared_ptr<Device>> devices_;
    mutable std::mutex mutex_;

    std::filesystem::path images_root() const;
    static std::mutex& conversion_mutex();
};

/**
 * @brief BackendManager - Typed manager creating devices of one class
 *
 * @tparam DeviceT Device class, constructible from
 *         (name, id, project, manager, args...)
 */
template <typename DeviceT>
class BackendManager : public DeviceManager {
    static_assert(std::is_base_of<Device, DeviceT>::value, "DeviceT must derive from Device");

public:
    using DeviceManager::DeviceManager;

    /**
     * @brief Create a device, or return it if the identifier is known
     *
     * A missing identifier gets a new UUID; a legacy identifier triggers the
     * conversion of the project files. If the backend creation hook fails
     * the device is closed and the error propagates.
     *
     * @throws ProjectNotFoundError if project_id is unknown
     * @throws InvalidIdentifierError if a stable identifier is not a UUID
     */
    template <typename... Args>
    std::shared_ptr<DeviceT> create_device(
        const std::string& name,
        const std::string& project_id,
        const std::optional<DeviceId>& device_id,
        Args&&... args)
    {
        std::lock_guard<std::mutex> lock(creation_mutex_);

        std::string id;
        if (device_id && std::holds_alternative<StableId>(*device_id)) {
            id = std::get<StableId>(*device_id).value;
            if (auto existing = find_device(id)) {
                return std::dynamic_pointer_cast<DeviceT>(existing);
            }
            if (!utilities::is_valid_uuid(id)) {
                throw InvalidIdentifierError("Device ID " + id + " is not a valid UUID");
            }
        }

        auto project = project_manager().get_project(project_id);

        if (device_id && std::holds_alternative<LegacyId>(*device_id)) {
            id = convert_legacy_device(std::get<LegacyId>(*device_id).value, name, *project);
        } else if (id.empty()) {
            id = utilities::generate_uuid();
        }

        auto device = std::make_shared<DeviceT>(name, id, project, *this, std::forward<Args>(args)...);
        try {
            device->create();
        } catch (const std::exception& ex) {
            utilities::log_error(module_name() + ": creation of '" + name + "' failed: " + ex.what());
            device->close();
            throw;
        }

        register_device(device);
        project->add_device(device);
        return device;
    }

    /**
     * @brief Typed get_device
     */
    std::shared_ptr<DeviceT> get(const std::string& device_id,
                                 const std::optional<std::string>& project_id = std::nullopt) const {
        return std::dynamic_pointer_cast<DeviceT>(get_device(device_id, project_id));
    }
};

} // namespace emucore
