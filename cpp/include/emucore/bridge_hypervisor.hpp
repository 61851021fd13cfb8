/**
 * @file bridge_hypervisor.hpp
 * @brief Companion bridge process that moves packets between links
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The bridge hypervisor is an external program (ubridge). This class:
 * - Checks the installed version
 * - Spawns it listening on host:port
 * - Talks its line based control protocol over TCP
 * - Terminates it and releases its port
 */

#pragma once

#include "emucore/server_config.hpp"

#include <asio.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace emucore {

class PortAllocator;
class Project;

/**
 * @brief BridgeHypervisor - One bridge process and its control connection
 */
class BridgeHypervisor {
public:
    /**
     * @param project Project the control port is recorded on
     * @param allocator Allocator the control port comes from
     * @param executable Bridge executable
     * @param working_dir Directory the process runs in and logs to
     * @param host Address the process listens on
     */
    BridgeHypervisor(
        std::shared_ptr<Project> project,
        PortAllocator& allocator,
        const std::filesystem::path& executable,
        const std::filesystem::path& working_dir,
        const std::string& host
    );

    /**
     * @brief Destructor - stops the process if still running
     */
    ~BridgeHypervisor();

    // Disable copy and move
    BridgeHypervisor(const BridgeHypervisor&) = delete;
    BridgeHypervisor& operator=(const BridgeHypervisor&) = delete;
    BridgeHypervisor(BridgeHypervisor&&) = delete;
    BridgeHypervisor& operator=(BridgeHypervisor&&) = delete;

    // ========================================================================
    // Version
    // ========================================================================

    /**
     * @brief Extract the version from "ubridge version X.Y.Z" output
     * @return Version or std::nullopt if absent
     */
    static std::optional<std::string> parse_version(const std::string& output);

    /**
     * @brief Run the executable with -v and check the reported version
     * @return Reported version
     * @throws BridgeError if it cannot run, reports nothing or is too old
     */
    std::string check_version(const std::string& minimum = config::MINIMUM_BRIDGE_VERSION);

    // ========================================================================
    // Process Lifecycle
    // ========================================================================

    /**
     * @brief Check version, allocate the control port and spawn the process
     * @throws BridgeError if the process cannot be started
     */
    void start();

    /**
     * @brief Connect to the control port, retrying until timeout
     * @throws BridgeError if no connection is accepted in time
     */
    void connect(std::chrono::milliseconds timeout = config::BRIDGE_CONNECT_TIMEOUT);

    /**
     * @brief Ask the process to stop, then terminate it and release the port
     */
    void stop();

    bool is_running();

    // ========================================================================
    // Control Protocol
    // ========================================================================

    /**
     * @brief Send one command and collect its reply lines
     * @throws BridgeError on error reply or lost connection
     */
    std::vector<std::string> send(const std::string& command);

    /**
     * @brief Parse the reply received so far
     *
     * Reply lines are "1xx text" for data, "100-text" for the final line
     * and "2xx-text" for an error.
     *
     * @param buffer Raw bytes received
     * @param lines Reply lines without status codes (output)
     * @return true once the final line has been received
     * @throws BridgeError on an error reply
     */
    static bool parse_reply(const std::string& buffer, std::vector<std::string>& lines);

    /**
     * @brief Content of the process log file
     */
    std::string read_stdout() const;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    const std::string& version() const { return version_; }
    const std::filesystem::path& path() const { return executable_; }

private:
    std::shared_ptr<Project> project_;
    PortAllocator& allocator_;
    std::filesystem::path executable_;
    std::filesystem::path working_dir_;
    std::filesystem::path stdout_file_;
    std::string host_;
    uint16_t port_;
    std::string version_;

    pid_t pid_;

    asio::io_context io_context_;
    std::unique_ptr<asio::ip::tcp::socket> socket_;

    /// Serializes commands on the control connection
    std::mutex send_mutex_;

    void terminate_process();
    void release_port();
};

} // namespace emucore
