/**
 * @file project.hpp
 * @brief Project - devices, ports and working directories of one topology
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A Project groups the devices of one opened topology. It owns:
 * - The on-disk working tree (project-files/<backend>/<device-id>)
 * - The set of TCP/UDP ports reserved on its behalf
 * - The device set, kept consistent with the backend registries
 * - The event stream consumed by observers
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace emucore {

class Device;
class PortAllocator;

/**
 * @brief Receiver of project events
 * @param project_id Project the event belongs to
 * @param action Event name (e.g. "node.updated", "log.warning")
 * @param event_json Event payload as JSON
 */
using EventListener = std::function<void(
    const std::string& project_id,
    const std::string& action,
    const std::string& event_json)>;

/**
 * @brief Project - one opened topology on a compute server
 *
 * Devices hold a shared reference to their project; the project only
 * observes its devices, their owner is the backend manager.
 */
class Project {
public:
    /**
     * @brief Construct project and create its directory
     * @param name Project name (no path separators)
     * @param project_id UUID, generated when not given
     * @param path Project directory
     * @param local Server runs beside the controller
     * @param listener Event receiver (may be empty)
     * @throws InvalidIdentifierError if project_id is not a UUID
     * @throws ProjectError if name is invalid or the directory cannot be created
     */
    Project(
        const std::string& name,
        const std::optional<std::string>& project_id,
        const std::filesystem::path& path,
        bool local = false,
        EventListener listener = {}
    );

    ~Project() = default;

    // Disable copy and move
    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;
    Project(Project&&) = delete;
    Project& operator=(Project&&) = delete;

    const std::string& id() const { return id_; }
    std::string name() const;
    void set_name(const std::string& name);
    const std::filesystem::path& path() const { return path_; }
    bool is_local() const { return local_; }

    // ========================================================================
    // Port Bookkeeping
    // ========================================================================

    void record_tcp_port(uint16_t port);
    void remove_tcp_port(uint16_t port);
    void record_udp_port(uint16_t port);
    void remove_udp_port(uint16_t port);

    std::set<uint16_t> tcp_ports() const;
    std::set<uint16_t> udp_ports() const;

    // ========================================================================
    // Working Directories
    // ========================================================================

    /**
     * @brief Directory shared by every device of a backend
     * @return <path>/project-files/<module_name>
     */
    std::filesystem::path module_working_path(const std::string& module_name) const;

    /**
     * @brief Same as module_working_path, creating the directory
     * @throws ProjectError if the directory cannot be created
     */
    std::filesystem::path module_working_directory(const std::string& module_name) const;

    /**
     * @brief Working path of one device, not created
     * @return <path>/project-files/<module_name>/<device_id>
     */
    std::filesystem::path device_working_path(const std::string& module_name,
                                              const std::string& device_id) const;

    /**
     * @brief Working directory of one device, created if absent
     * @throws ProjectError if the directory cannot be created
     */
    std::filesystem::path device_working_directory(const std::string& module_name,
                                                   const std::string& device_id) const;

    /**
     * @brief Scratch directory, emptied on open and close
     */
    std::filesystem::path tmp_working_directory() const;

    /**
     * @brief Directory holding packet captures, created if absent
     */
    std::filesystem::path capture_working_directory() const;

    // ========================================================================
    // Devices
    // ========================================================================

    void add_device(const std::shared_ptr<Device>& device);
    void remove_device(const std::string& device_id);
    bool has_device(const std::string& device_id) const;

    /**
     * @brief Live devices of this project
     */
    std::vector<std::shared_ptr<Device>> devices() const;

    /**
     * @brief Remove a device and schedule its working directory for deletion
     *
     * The directory is deleted on the next commit().
     */
    void mark_device_for_destruction(const Device& device);

    /**
     * @brief Delete the working directories of destroyed devices
     */
    void commit();

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Close every device and release leftover ports
     *
     * Device failures are logged and never stop the other closes.
     */
    void close(PortAllocator& allocator);

    /**
     * @brief Close the project and delete its directory
     */
    void remove(PortAllocator& allocator);

    bool is_closed() const;

    /**
     * @brief Forward an event to the listener
     */
    void emit(const std::string& action, const std::string& event_json) const;

    void set_listener(EventListener listener);

    std::string to_json() const;

private:
    std::string id_;
    std::string name_;
    std::filesystem::path path_;
    bool local_;
    bool closed_;

    EventListener listener_;

    std::set<uint16_t> used_tcp_ports_;
    std::set<uint16_t> used_udp_ports_;

    /// Observed devices, owned by their manager
    std::map<std::string, std::weak_ptr<Device>> devices_;

    /// Working directories deleted on commit
    std::set<std::filesystem::path> devices_to_destroy_;

    mutable std::mutex mutex_;

    static void validate_name(const std::string& name);
    void clean_tmp_directory() const;
};

} // namespace emucore
