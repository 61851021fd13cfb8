/**
 * @file project.cpp
 * @brief Implementation of Project bookkeeping and teardown
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/project.hpp"
#include "emucore/device.hpp"
#include "emucore/device_manager.hpp"
#include "emucore/errors.hpp"
#include "emucore/port_allocator.hpp"
#include "emucore/utilities.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace emucore {

namespace {
    std::string join_ports(const std::set<uint16_t>& ports) {
        std::string result;
        for (uint16_t port : ports) {
            if (!result.empty()) {
                result += ", ";
            }
            result += std::to_string(port);
        }
        return result;
    }

    fs::path ensure_directory(const fs::path& path, const std::string& what) {
        std::error_code ec;
        fs::create_directories(path, ec);
        if (ec) {
            throw ProjectError("Could not create " + what + ": " + ec.message());
        }
        return path;
    }
}

// ============================================================================
// Constructor
// ============================================================================

Project::Project(
    const std::string& name,
    const std::optional<std::string>& project_id,
    const fs::path& path,
    bool local,
    EventListener listener)
    : local_(local)
    , closed_(false)
    , listener_(std::move(listener))
{
    if (project_id) {
        if (!utilities::is_valid_uuid(*project_id)) {
            throw InvalidIdentifierError(*project_id + " is not a valid UUID");
        }
        id_ = *project_id;
    } else {
        id_ = utilities::generate_uuid();
    }

    validate_name(name);
    name_ = name;

    path_ = path.empty() ? config::get_projects_directory() / id_ : path;
    ensure_directory(path_, "project directory");

    clean_tmp_directory();

    utilities::log_info("Project: " + id_ + " with path '" + path_.string() + "' created");
}

std::string Project::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

void Project::set_name(const std::string& name) {
    validate_name(name);
    std::lock_guard<std::mutex> lock(mutex_);
    name_ = name;
}

// ============================================================================
// Port Bookkeeping
// ============================================================================

void Project::record_tcp_port(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_tcp_ports_.insert(port);
}

void Project::remove_tcp_port(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_tcp_ports_.erase(port);
}

void Project::record_udp_port(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_udp_ports_.insert(port);
}

void Project::remove_udp_port(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_udp_ports_.erase(port);
}

std::set<uint16_t> Project::tcp_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_tcp_ports_;
}

std::set<uint16_t> Project::udp_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_udp_ports_;
}

// ============================================================================
// Working Directories
// ============================================================================

fs::path Project::module_working_path(const std::string& module_name) const {
    return path_ / "project-files" / module_name;
}

fs::path Project::module_working_directory(const std::string& module_name) const {
    return ensure_directory(module_working_path(module_name), "module working directory");
}

fs::path Project::device_working_path(const std::string& module_name,
                                      const std::string& device_id) const {
    return module_working_path(module_name) / device_id;
}

fs::path Project::device_working_directory(const std::string& module_name,
                                           const std::string& device_id) const {
    return ensure_directory(device_working_path(module_name, device_id),
                            "the device working directory");
}

fs::path Project::tmp_working_directory() const {
    return path_ / "tmp";
}

fs::path Project::capture_working_directory() const {
    return ensure_directory(path_ / "project-files" / "captures",
                            "the capture working directory");
}

// ============================================================================
// Devices
// ============================================================================

void Project::add_device(const std::shared_ptr<Device>& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[device->id()] = device;
}

void Project::remove_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.erase(device_id);
}

bool Project::has_device(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    return it != devices_.end() && !it->second.expired();
}

std::vector<std::shared_ptr<Device>> Project::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<Device>> result;
    for (const auto& entry : devices_) {
        if (auto device = entry.second.lock()) {
            result.push_back(device);
        }
    }
    return result;
}

void Project::mark_device_for_destruction(const Device& device) {
    fs::path working_path = device.working_path();

    std::lock_guard<std::mutex> lock(mutex_);
    devices_.erase(device.id());
    devices_to_destroy_.insert(working_path);
}

void Project::commit() {
    std::set<fs::path> to_destroy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_destroy.swap(devices_to_destroy_);
    }

    for (const auto& directory : to_destroy) {
        std::error_code ec;
        fs::remove_all(directory, ec);
        if (ec) {
            throw ProjectError("Could not delete the device working directory " +
                               directory.string() + ": " + ec.message());
        }
        utilities::log_debug("Project: deleted " + directory.string());
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void Project::close(PortAllocator& allocator) {
    auto live_devices = devices();

    std::set<DeviceManager*> managers;
    for (const auto& device : live_devices) {
        managers.insert(&device->manager());
    }

    if (!live_devices.empty()) {
        asio::thread_pool pool(std::min<size_t>(live_devices.size(), 4));
        for (const auto& device : live_devices) {
            asio::post(pool, [device]() {
                try {
                    device->manager().close_device(device->id());
                } catch (const std::exception& ex) {
                    utilities::log_error("Project: Could not close device " + device->id() +
                                         ": " + ex.what());
                }
            });
        }
        pool.join();
    }

    for (auto* manager : managers) {
        manager->project_closed(*this);
    }

    try {
        clean_tmp_directory();
    } catch (const ProjectError& ex) {
        utilities::log_warn("Project: " + std::string(ex.what()));
    }

    // Release the ports their devices did not release
    auto leftover_tcp = tcp_ports();
    auto leftover_udp = udp_ports();
    if (!leftover_tcp.empty()) {
        utilities::log_warn("Project: " + id_ + " has TCP ports still in use: " + join_ports(leftover_tcp));
    }
    if (!leftover_udp.empty()) {
        utilities::log_warn("Project: " + id_ + " has UDP ports still in use: " + join_ports(leftover_udp));
    }
    for (uint16_t port : leftover_tcp) {
        allocator.release_tcp_port(port, *this);
    }
    for (uint16_t port : leftover_udp) {
        allocator.release_udp_port(port, *this);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        used_tcp_ports_.clear();
        used_udp_ports_.clear();
        closed_ = true;
    }

    utilities::log_info("Project: " + id_ + " with path '" + path_.string() + "' closed");
}

void Project::remove(PortAllocator& allocator) {
    close(allocator);

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        throw ProjectError("Could not delete the project directory: " + ec.message());
    }

    utilities::log_info("Project: " + id_ + " with path '" + path_.string() + "' deleted");
}

bool Project::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void Project::emit(const std::string& action, const std::string& event_json) const {
    EventListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }

    if (listener) {
        listener(id_, action, event_json);
    }
}

void Project::set_listener(EventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

std::string Project::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json j;
    j["name"] = name_;
    j["project_id"] = id_;
    j["path"] = path_.string();
    return j.dump();
}

// ============================================================================
// Private Helper Functions
// ============================================================================

void Project::validate_name(const std::string& name) {
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        throw ForbiddenError("Project names cannot contain path separators");
    }
}

void Project::clean_tmp_directory() const {
    std::error_code ec;
    fs::path tmp = tmp_working_directory();
    if (fs::exists(tmp, ec)) {
        fs::remove_all(tmp, ec);
        if (ec) {
            throw ProjectError("Could not clean project directory: " + ec.message());
        }
    }
}

} // namespace emucore
