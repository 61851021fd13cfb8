/**
 * @file bridge_hypervisor.cpp
 * @brief Implementation of the bridge hypervisor process and control client
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/bridge_hypervisor.hpp"
#include "emucore/errors.hpp"
#include "emucore/port_allocator.hpp"
#include "emucore/project.hpp"
#include "emucore/utilities.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <regex>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace emucore {

// ============================================================================
// Constructor / Destructor
// ============================================================================

BridgeHypervisor::BridgeHypervisor(
    std::shared_ptr<Project> project,
    PortAllocator& allocator,
    const fs::path& executable,
    const fs::path& working_dir,
    const std::string& host)
    : project_(std::move(project))
    , allocator_(allocator)
    , executable_(executable)
    , working_dir_(working_dir)
    , host_(host)
    , port_(0)
    , pid_(-1)
{
}

BridgeHypervisor::~BridgeHypervisor() {
    try {
        stop();
    } catch (const std::exception& ex) {
        utilities::log_error("BridgeHypervisor: error while stopping: " + std::string(ex.what()));
    }
}

// ============================================================================
// Version
// ============================================================================

std::optional<std::string> BridgeHypervisor::parse_version(const std::string& output) {
    static const std::regex version_re("ubridge version ([0-9a-z\\.]+)");
    std::smatch match;
    if (std::regex_search(output, match, version_re)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::string BridgeHypervisor::check_version(const std::string& minimum) {
    int fds[2];
    if (pipe(fds) != 0) {
        throw BridgeError("Error while looking for uBridge version: " + std::string(std::strerror(errno)));
    }

    // Build argv before fork
    std::string exe = executable_.string();
    std::vector<char*> argv = {const_cast<char*>(exe.c_str()), const_cast<char*>("-v"), nullptr};

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        throw BridgeError("Error while looking for uBridge version: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        // Child process - report version on the pipe
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[1]);
        execv(argv[0], argv.data());
        _exit(127);
    }

    close(fds[1]);
    std::string output;
    char buffer[512];
    ssize_t count;
    while ((count = read(fds[0], buffer, sizeof(buffer))) > 0) {
        output.append(buffer, static_cast<size_t>(count));
    }
    close(fds[0]);

    int status = 0;
    waitpid(pid, &status, 0);
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        throw BridgeError("Error while looking for uBridge version: cannot execute " + exe);
    }

    auto version = parse_version(output);
    if (!version) {
        throw BridgeError("Could not determine uBridge version for " + exe);
    }
    if (utilities::compare_versions(*version, minimum) < 0) {
        throw BridgeError("uBridge executable version must be >= " + minimum);
    }

    version_ = *version;
    return *version;
}

// ============================================================================
// Process Lifecycle
// ============================================================================

void BridgeHypervisor::start() {
    check_version();

    if (port_ == 0) {
        port_ = allocator_.get_free_tcp_port(*project_);
    }

    std::error_code ec;
    fs::create_directories(working_dir_, ec);
    stdout_file_ = working_dir_ / "ubridge.log";

    int log_fd = open(stdout_file_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (log_fd < 0) {
        std::string reason = std::strerror(errno);
        release_port();
        throw BridgeError("Could not start ubridge: cannot open " + stdout_file_.string() + ": " + reason);
    }

    // Build argv before fork
    std::string exe = executable_.string();
    std::string listen = host_ + ":" + std::to_string(port_);
    std::string dir = working_dir_.string();
    std::vector<std::string> args = {exe, "-H", listen};
    if (spdlog::get_level() == spdlog::level::debug) {
        args.push_back("-d");
        args.push_back("1");
    }
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    utilities::log_info("BridgeHypervisor: starting ubridge: " + exe + " -H " + listen);

    pid_ = fork();
    if (pid_ < 0) {
        std::string reason = std::strerror(errno);
        close(log_fd);
        pid_ = -1;
        release_port();
        throw BridgeError("Could not start ubridge: " + reason);
    }

    if (pid_ == 0) {
        // Child process - exec the bridge with its output in the log file
        dup2(log_fd, STDOUT_FILENO);
        dup2(log_fd, STDERR_FILENO);
        close(log_fd);
        if (chdir(dir.c_str()) != 0) {
            _exit(126);
        }
        execv(argv[0], argv.data());
        _exit(127);
    }

    close(log_fd);
    utilities::log_info("BridgeHypervisor: ubridge started PID=" + std::to_string(pid_) +
                        ", logging to " + stdout_file_.string());
}

void BridgeHypervisor::connect(std::chrono::milliseconds timeout) {
    // Connect to a local address when listening on every address
    std::string target = host_;
    if (host_ == config::WILDCARD_HOST) {
        target = "127.0.0.1";
    } else if (host_ == config::WILDCARD_HOST_V6) {
        target = "::1";
    }

    auto begin = std::chrono::steady_clock::now();
    std::error_code last_error;
    bool connected = false;

    asio::ip::tcp::resolver resolver(io_context_);
    while (std::chrono::steady_clock::now() - begin < timeout) {
        std::this_thread::sleep_for(config::BRIDGE_CONNECT_RETRY);

        std::error_code ec;
        auto endpoints = resolver.resolve(target, std::to_string(port_), ec);
        if (ec) {
            last_error = ec;
            continue;
        }

        auto socket = std::make_unique<asio::ip::tcp::socket>(io_context_);
        asio::connect(*socket, endpoints, ec);
        if (ec) {
            last_error = ec;
            continue;
        }

        socket_ = std::move(socket);
        connected = true;
        break;
    }

    if (!connected) {
        throw BridgeError("Couldn't connect to hypervisor on " + target + ":" + std::to_string(port_) +
                          " :" + (last_error ? last_error.message() : std::string("timeout")));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);
    utilities::log_info("BridgeHypervisor: connected to uBridge hypervisor after " +
                        std::to_string(elapsed.count()) + " ms");

    auto reply = send("hypervisor version");
    if (!reply.empty()) {
        version_ = utilities::split_string(reply.front(), '-').front();
    } else {
        version_ = "Unknown";
    }
}

void BridgeHypervisor::stop() {
    if (is_running()) {
        utilities::log_info("BridgeHypervisor: stopping uBridge process PID=" + std::to_string(pid_));

        if (socket_) {
            try {
                send("hypervisor stop");
            } catch (const BridgeError& ex) {
                utilities::log_debug("BridgeHypervisor: stopping hypervisor " + host_ + ":" +
                                     std::to_string(port_) + " " + ex.what());
            }
        } else {
            kill(pid_, SIGTERM);
        }
        terminate_process();
    }

    if (socket_) {
        std::error_code ec;
        socket_->close(ec);
        socket_.reset();
    }

    if (!stdout_file_.empty()) {
        std::error_code ec;
        fs::remove(stdout_file_, ec);
        if (ec) {
            utilities::log_warn("BridgeHypervisor: could not delete temporary uBridge log file: " + ec.message());
        }
    }

    pid_ = -1;
    release_port();
}

bool BridgeHypervisor::is_running() {
    if (pid_ <= 0) {
        return false;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }

    // Exited (reaped now) or no longer our child
    pid_ = -1;
    return false;
}

void BridgeHypervisor::terminate_process() {
    auto deadline = std::chrono::steady_clock::now() + config::PROCESS_STOP_TIMEOUT;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result != 0) {
            pid_ = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    utilities::log_warn("BridgeHypervisor: uBridge process " + std::to_string(pid_) +
                        " is still running... killing it");
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
}

void BridgeHypervisor::release_port() {
    if (port_ != 0) {
        allocator_.release_tcp_port(port_, *project_);
        port_ = 0;
    }
}

// ============================================================================
// Control Protocol
// ============================================================================

bool BridgeHypervisor::parse_reply(const std::string& buffer, std::vector<std::string>& lines) {
    static const std::regex error_re("^2[0-9]{2}-");
    static const std::regex success_re("^1[0-9]{2}\\s");

    lines.clear();

    // A complete reply always ends a line
    if (buffer.empty() || buffer.back() != '\n') {
        return false;
    }

    std::vector<std::string> data;
    size_t start = 0;
    while (true) {
        size_t pos = buffer.find("\r\n", start);
        if (pos == std::string::npos) {
            data.push_back(buffer.substr(start));
            break;
        }
        data.push_back(buffer.substr(start, pos - start));
        start = pos + 2;
    }
    if (!data.empty() && data.back().empty()) {
        data.pop_back();
    }
    if (data.empty()) {
        return false;
    }

    if (std::regex_search(data.back(), error_re)) {
        throw BridgeError(data.back().substr(4));
    }

    if (data.back().compare(0, 4, "100-") != 0) {
        return false;
    }

    data.back() = data.back().substr(4);
    if (data.back() == "OK") {
        data.pop_back();
    }

    for (auto& line : data) {
        if (std::regex_search(line, success_re)) {
            line = line.substr(4);
        }
    }

    lines = std::move(data);
    return true;
}

std::vector<std::string> BridgeHypervisor::send(const std::string& command) {
    std::lock_guard<std::mutex> lock(send_mutex_);

    if (!socket_ || !socket_->is_open()) {
        throw BridgeError("Not connected");
    }

    std::string line = utilities::trim_string(command) + "\n";
    utilities::log_debug("BridgeHypervisor: sending " + line);

    std::error_code ec;
    asio::write(*socket_, asio::buffer(line), ec);
    if (ec) {
        throw BridgeError("Lost communication with " + host_ + ":" + std::to_string(port_) +
                          " :" + ec.message() + ", uBridge process running: " +
                          (is_running() ? "true" : "false"));
    }

    std::string buffer;
    std::vector<std::string> lines;
    std::array<char, 1024> chunk{};
    while (true) {
        size_t count = socket_->read_some(asio::buffer(chunk), ec);
        if (ec == asio::error::eof) {
            throw BridgeError("No data returned from " + host_ + ":" + std::to_string(port_) +
                              ", uBridge process running: " + (is_running() ? "true" : "false"));
        }
        if (ec) {
            throw BridgeError("Lost communication with " + host_ + ":" + std::to_string(port_) +
                              " :" + ec.message() + ", uBridge process running: " +
                              (is_running() ? "true" : "false"));
        }

        buffer.append(chunk.data(), count);
        if (parse_reply(buffer, lines)) {
            break;
        }
    }

    utilities::log_debug("BridgeHypervisor: returned " + std::to_string(lines.size()) + " lines");
    return lines;
}

std::string BridgeHypervisor::read_stdout() const {
    if (stdout_file_.empty()) {
        return "";
    }
    auto content = utilities::read_file(stdout_file_.string());
    return content ? *content : "";
}

} // namespace emucore
