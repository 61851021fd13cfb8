/**
 * @file compute_demo.cpp
 * @brief Compute demo - Two virtual PCs joined by a local link
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Loading the server configuration
 * - Creating a project and two devices with console ports
 * - Linking the devices through a loopback UDP tunnel
 * - Capturing packets on one side
 * - Closing the project and releasing every port
 */

#include "emucore/device_manager.hpp"
#include "emucore/port_allocator.hpp"
#include "emucore/project_manager.hpp"
#include "emucore/server_config.hpp"
#include "emucore/utilities.hpp"

#include <iostream>

using namespace emucore;

namespace {

/**
 * @brief Minimal virtual PC with one Ethernet port and a startup script
 */
class VirtualPc : public Device {
public:
    VirtualPc(const std::string& name, const std::string& device_id,
              std::shared_ptr<Project> project, DeviceManager& manager,
              std::optional<uint16_t> console = std::nullopt)
        : Device(name, device_id, std::move(project), manager, console)
    {
        add_adapter(std::make_unique<Adapter>(1));
    }

    void create() override {
        Device::create();
        std::string script = "set pcname " + name() + "\nip dhcp\n";
        if (!utilities::write_file((working_dir() / "startup.vpc").string(), script)) {
            throw DeviceError("Cannot write startup script of " + name());
        }
    }

    void start() override {
        set_status(DeviceStatus::Started);
    }
};

} // namespace

int main(int argc, char** argv) {
    utilities::initialize_logging("", utilities::LogLevel::INFO);

    config::ServerConfig cfg = config::ServerConfig::defaults();
    if (argc >= 2) {
        auto loaded = config::ServerConfig::load(argv[1]);
        if (!loaded) {
            std::cerr << "Invalid configuration file: " << argv[1] << "\n";
            return 1;
        }
        cfg = *loaded;
    }

    try {
        std::cout << "\n=== EmuCore Compute Demo ===\n\n";

        PortAllocator allocator(cfg);
        ProjectManager projects(cfg, allocator,
            [](const std::string& project_id, const std::string& action, const std::string& payload) {
                std::cout << "  [event " << project_id.substr(0, 8) << "] " << action << " " << payload << "\n";
            });
        BackendManager<VirtualPc> vpcs(BackendType::Vpcs, cfg, allocator, projects);

        auto project = projects.create_project("demo", std::nullopt);
        std::cout << "Project " << project->id() << " at " << project->path() << "\n";

        auto pc1 = vpcs.create_device("PC1", project->id(), std::nullopt);
        auto pc2 = vpcs.create_device("PC2", project->id(), std::nullopt);
        std::cout << "PC1 console: " << *pc1->console() << "\n";
        std::cout << "PC2 console: " << *pc2->console() << "\n";

        // Each side sends to the other's local port
        auto tunnel = pc1->create_local_udp_tunnel();
        pc1->adapter_add_nio_binding(0, 0, tunnel.first);
        pc2->adapter_add_nio_binding(0, 0, tunnel.second);
        std::cout << "Link: " << tunnel.first->to_string() << "\n";

        auto capture = pc1->start_capture(0, 0, "PC1_Ethernet0.pcap");
        std::cout << "Capturing to " << capture << "\n";

        pc1->start();
        pc2->start();

        std::cout << "\nAllocator state:\n" << allocator.to_json() << "\n\n";

        pc1->stop_capture(0, 0);
        projects.close_project(project->id());

        std::cout << "\nPorts still reserved: " << allocator.tcp_ports().size() + allocator.udp_ports().size()
                  << "\n";
        std::cout << "\nDemo complete.\n";

    } catch (const ComputeError& e) {
        std::cerr << "Error (" << e.status_code() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
