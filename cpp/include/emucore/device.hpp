/**
 * @file device.hpp
 * @brief Device - one emulated network device and the resources it holds
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Base class of every backend device. A device holds:
 * - Console and auxiliary console ports from the PortAllocator
 * - A status (stopped, started, suspended) observed through project events
 * - A working directory inside its project and a private temporary directory
 * - Adapters whose ports carry virtual links
 * - Optionally a bridge hypervisor process
 */

#pragma once

#include "emucore/adapter.hpp"
#include "emucore/bridge_hypervisor.hpp"
#include "emucore/nio.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace emucore {

class DeviceManager;
class Project;

/**
 * @brief Console protocols a device can expose
 */
enum class ConsoleType {
    Telnet,
    Vnc,
    Spice,
    Http,
    Https,
    None
};

std::string console_type_to_string(ConsoleType type);

/**
 * @throws DeviceError on unknown console type name
 */
ConsoleType console_type_from_string(const std::string& name);

/**
 * @brief Device status state machine
 */
enum class DeviceStatus {
    Stopped,
    Started,
    Suspended
};

std::string device_status_to_string(DeviceStatus status);

/**
 * @brief Device - Base class of emulated devices
 *
 * Devices are created by their backend manager, which owns them. A device
 * keeps its project alive; the project only observes its devices.
 *
 * Thread-safe: state is guarded by an internal mutex; project events are
 * emitted without holding it.
 */
class Device : public std::enable_shared_from_this<Device> {
public:
    /**
     * @brief Construct device and acquire its console ports
     *
     * A requested port goes through the defensive reservation (it may be
     * replaced by a free one); otherwise a free port is allocated from the
     * range matching the console type. If acquiring the auxiliary port
     * fails the console port is released before the error propagates.
     *
     * @param name Device name
     * @param device_id Device UUID
     * @param project Owning project
     * @param manager Backend manager creating the device
     * @param console Requested console port
     * @param console_type Console protocol
     * @param aux Requested auxiliary console port
     * @param aux_type Auxiliary console protocol
     */
    Device(
        const std::string& name,
        const std::string& device_id,
        std::shared_ptr<Project> project,
        DeviceManager& manager,
        std::optional<uint16_t> console = std::nullopt,
        ConsoleType console_type = ConsoleType::Telnet,
        std::optional<uint16_t> aux = std::nullopt,
        ConsoleType aux_type = ConsoleType::None
    );

    /**
     * @brief Destructor - removes the temporary directory
     */
    virtual ~Device();

    // Disable copy and move
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;
    Device(Device&&) = delete;
    Device& operator=(Device&&) = delete;

    // ========================================================================
    // Identity
    // ========================================================================

    const std::string& id() const { return id_; }
    std::string name() const;

    /**
     * @brief Change the device name
     *
     * Backends override this to rewrite name dependent files.
     */
    virtual void rename(const std::string& new_name);

    const std::shared_ptr<Project>& project() const { return project_; }
    DeviceManager& manager() const { return manager_; }

    // ========================================================================
    // Consoles
    // ========================================================================

    std::optional<uint16_t> console() const;

    /**
     * @brief Move the console to another port (std::nullopt frees it)
     * @throws InvalidConsolePortError if the console is VNC and port < 5900
     */
    void set_console(std::optional<uint16_t> port);

    ConsoleType console_type() const;

    /**
     * @brief Change console protocol, reallocating the port in the matching range
     */
    void set_console_type(ConsoleType type);

    std::optional<uint16_t> aux() const;
    void set_aux(std::optional<uint16_t> port);
    ConsoleType aux_type() const;
    void set_aux_type(ConsoleType type);

    // ========================================================================
    // Status and Lifecycle
    // ========================================================================

    DeviceStatus status() const;

    /**
     * @brief Set status and emit "node.updated"
     */
    void set_status(DeviceStatus status);

    /**
     * @brief Emit "node.updated" with the current device state
     */
    void updated() const;

    /**
     * @brief Backend creation hook, run once after construction
     */
    virtual void create();

    virtual void start() = 0;

    virtual void stop();

    /**
     * @throws DeviceError unless the backend supports suspension
     */
    virtual void suspend();

    /**
     * @throws DeviceError unless the backend supports suspension
     */
    virtual void resume();

    /**
     * @brief Release console ports, link ports and the bridge
     * @return false if the device was already closed
     */
    virtual bool close();

    bool is_closed() const { return closed_.load(); }

    // ========================================================================
    // Files
    // ========================================================================

    /**
     * @brief Working directory, created if absent
     */
    std::filesystem::path working_dir() const;

    /**
     * @brief Working directory path, not created
     */
    std::filesystem::path working_path() const;

    /**
     * @brief Private temporary directory, created on first use
     * @throws DeviceError if it cannot be created
     */
    std::filesystem::path temporary_directory();

    /**
     * @brief Delete the working directory now
     * @throws DeviceError if it cannot be deleted
     */
    void delete_working_directory();

    // ========================================================================
    // Adapters and Links
    // ========================================================================

    size_t adapter_count() const;

    /**
     * @brief Attach a link to an adapter port, replacing any existing one
     * @throws AdapterOutOfRangeError / PortOutOfRangeError on bad indices
     */
    void adapter_add_nio_binding(size_t adapter_number, size_t port_number, std::shared_ptr<Nio> nio);

    /**
     * @brief Detach a link, stopping its capture and releasing its UDP port
     * @return Detached link, nullptr if the port was free
     */
    std::shared_ptr<Nio> adapter_remove_nio_binding(size_t adapter_number, size_t port_number);

    std::shared_ptr<Nio> get_nio(size_t adapter_number, size_t port_number) const;

    /**
     * @brief Start capturing packets of a bound link
     * @param output_file File name inside the project capture directory
     * @return Full path of the capture file
     * @throws ForbiddenError if the file escapes the capture directory
     * @throws DeviceError if the port is free or already capturing
     */
    std::filesystem::path start_capture(size_t adapter_number, size_t port_number,
                                        const std::string& output_file,
                                        const std::string& data_link_type = "DLT_EN10MB");

    void stop_capture(size_t adapter_number, size_t port_number);

    /**
     * @brief Allocate two UDP ports and build links pointing at each other
     * @return Source and destination links on the loopback address
     */
    std::pair<std::shared_ptr<Nio>, std::shared_ptr<Nio>> create_local_udp_tunnel();

    /**
     * @brief Warn through a "log.warning" event if the host lacks memory
     * @param requested_mb Memory the device needs in MB
     * @return true if a warning was emitted
     */
    bool check_available_ram(uint64_t requested_mb) const;

    // ========================================================================
    // Bridge Hypervisor
    // ========================================================================

    /**
     * @brief Start and connect the bridge hypervisor if not running
     * @throws DeviceError if the bridge is missing or lacks privileges
     * @throws BridgeError if it cannot be started or reached
     */
    void start_bridge(bool require_privileged_access = false);

    void stop_bridge();

    bool bridge_running();

    /**
     * @brief Send a command to the running bridge
     * @throws BridgeError if the bridge is not running or rejects the command
     */
    std::vector<std::string> bridge_send(const std::string& command);

    /**
     * @brief Create a bridge joining two UDP links
     * @throws DeviceError if destination is not a UDP link
     */
    void add_bridge_udp_connection(const std::string& bridge_name, const Nio& source, const Nio& destination);

    /**
     * @brief Reset and apply the packet filters of a bridge
     *
     * Filters with a syntax error are skipped with a "log.warning" event.
     */
    void bridge_apply_filters(const std::string& bridge_name, const NioFilters& filters);

    void delete_bridge(const std::string& bridge_name);

    /**
     * @brief Bridge filter arguments ("filter0 delay 10 5", "filter1 bpf \"icmp\"")
     */
    static std::vector<std::string> build_filter_list(const NioFilters& filters);

    // ========================================================================
    // Serialization
    // ========================================================================

    virtual std::string to_json() const;

protected:
    /**
     * @brief Append an adapter; backends call this while building the device
     */
    void add_adapter(std::unique_ptr<Adapter> adapter);

    /**
     * @brief "<module>: '<name>' [<id>]" prefix for log lines
     */
    std::string log_prefix() const;

    /// Guards device state
    mutable std::mutex mutex_;

private:
    std::string id_;
    std::string name_;
    std::shared_ptr<Project> project_;
    DeviceManager& manager_;

    std::optional<uint16_t> console_;
    ConsoleType console_type_;
    std::optional<uint16_t> aux_;
    ConsoleType aux_type_;

    DeviceStatus status_;
    std::atomic<bool> closed_;

    std::filesystem::path temporary_directory_;

    std::vector<std::unique_ptr<Adapter>> adapters_;
    std::pair<std::shared_ptr<Nio>, std::shared_ptr<Nio>> local_udp_tunnel_;

    std::unique_ptr<BridgeHypervisor> bridge_;
    bool bridge_requires_privileges_;

    /// Serializes bridge start, stop and commands
    std::mutex bridge_mutex_;

    std::optional<uint16_t> acquire_port(std::optional<uint16_t> requested, ConsoleType type);
    void release_port(std::optional<uint16_t>& port);
    Adapter& adapter_at(size_t adapter_number) const;
    void start_bridge_locked(bool require_privileged_access);
    std::string module_name() const;
};

} // namespace emucore
