/**
 * @file test_helpers.hpp
 * @brief Devices and fixtures shared by the device tests
 */

#pragma once

#include <gtest/gtest.h>
#include "emucore/device.hpp"
#include "emucore/device_manager.hpp"
#include "emucore/port_allocator.hpp"
#include "emucore/project_manager.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace emucore {
namespace test {

/// Device with one four-port adapter
class TestDevice : public Device {
public:
    TestDevice(const std::string& name, const std::string& device_id,
               std::shared_ptr<Project> project, DeviceManager& manager,
               std::optional<uint16_t> console = std::nullopt,
               ConsoleType console_type = ConsoleType::Telnet,
               std::optional<uint16_t> aux = std::nullopt,
               ConsoleType aux_type = ConsoleType::None)
        : Device(name, device_id, std::move(project), manager, console, console_type, aux, aux_type)
        , renames(0)
    {
        add_adapter(std::make_unique<Adapter>(4));
    }

    void start() override { set_status(DeviceStatus::Started); }

    void rename(const std::string& new_name) override {
        Device::rename(new_name);
        renames++;
    }

    int renames;
};

/// Device whose creation hook fails
class FailingDevice : public Device {
public:
    using Device::Device;

    void create() override { throw DeviceError("creation failed"); }
    void start() override {}
};

struct Event {
    std::string action;
    std::string payload;
};

/**
 * @brief Fixture with an allocator that never probes, a project manager and
 *        one project, all rooted in a temporary directory
 */
class DeviceFixture : public ::testing::Test {
protected:
    static constexpr const char* PROJECT_ID = "5b0f7c3e-2a41-4d8e-9c6f-7e1d2b3a4c5f";

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("emucore_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        setenv("EMUCORE_DATA_DIR", test_dir_.c_str(), 1);

        cfg_.projects_path = test_dir_ / "projects";
        cfg_.images_path = test_dir_ / "images";
        cfg_.ubridge_path = (test_dir_ / "missing-ubridge").string();
        configure(cfg_);

        allocator_ = std::make_unique<PortAllocator>(cfg_, [](const std::string&, uint16_t, PortProtocol) {});
        projects_ = std::make_unique<ProjectManager>(cfg_, *allocator_,
            [this](const std::string&, const std::string& action, const std::string& payload) {
                std::lock_guard<std::mutex> lock(events_mutex_);
                events_.push_back({action, payload});
            });
        manager_ = std::make_unique<BackendManager<TestDevice>>(BackendType::Vpcs, cfg_, *allocator_, *projects_);
        project_ = projects_->create_project("test", std::string(PROJECT_ID));
    }

    void TearDown() override {
        manager_->unload_all();
        manager_.reset();
        project_.reset();
        projects_.reset();
        allocator_.reset();
        unsetenv("EMUCORE_DATA_DIR");
        std::filesystem::remove_all(test_dir_);
    }

    /// Hook for fixtures needing a different configuration
    virtual void configure(config::ServerConfig&) {}

    std::vector<Event> events(const std::string& action) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        std::vector<Event> result;
        for (const auto& event : events_) {
            if (event.action == action) {
                result.push_back(event);
            }
        }
        return result;
    }

    std::shared_ptr<TestDevice> create(const std::string& name,
                                       std::optional<uint16_t> console = std::nullopt,
                                       ConsoleType console_type = ConsoleType::Telnet) {
        return manager_->create_device(name, PROJECT_ID, std::nullopt, console, console_type);
    }

    std::filesystem::path test_dir_;
    config::ServerConfig cfg_;
    std::unique_ptr<PortAllocator> allocator_;
    std::unique_ptr<ProjectManager> projects_;
    std::unique_ptr<BackendManager<TestDevice>> manager_;
    std::shared_ptr<Project> project_;

    std::vector<Event> events_;
    std::mutex events_mutex_;
};

} // namespace test
} // namespace emucore
