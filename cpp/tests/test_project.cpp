/**
 * @file test_project.cpp
 * @brief Unit tests for Project and ProjectManager
 */

#include <gtest/gtest.h>
#include "emucore/errors.hpp"
#include "emucore/port_allocator.hpp"
#include "emucore/project.hpp"
#include "emucore/project_manager.hpp"
#include "emucore/utilities.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <vector>

using namespace emucore;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    const std::string PROJECT_ID = "a1b2c3d4-e5f6-4a7b-8c9d-0e1f2a3b4c5d";

    struct Event {
        std::string project_id;
        std::string action;
        std::string payload;
    };
}

class ProjectTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "emucore_project_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        setenv("EMUCORE_DATA_DIR", test_dir_.c_str(), 1);

        cfg_.projects_path = test_dir_ / "projects";
        cfg_.images_path = test_dir_ / "images";
        allocator_ = std::make_unique<PortAllocator>(cfg_, [](const std::string&, uint16_t, PortProtocol) {});
        manager_ = std::make_unique<ProjectManager>(cfg_, *allocator_,
            [this](const std::string& id, const std::string& action, const std::string& payload) {
                std::lock_guard<std::mutex> lock(events_mutex_);
                events_.push_back({id, action, payload});
            });
    }

    void TearDown() override {
        manager_.reset();
        allocator_.reset();
        unsetenv("EMUCORE_DATA_DIR");
        fs::remove_all(test_dir_);
    }

    fs::path test_dir_;
    config::ServerConfig cfg_;
    std::unique_ptr<PortAllocator> allocator_;
    std::unique_ptr<ProjectManager> manager_;
    std::vector<Event> events_;
    std::mutex events_mutex_;
};

// ============================================================================
// Project Tests
// ============================================================================

TEST_F(ProjectTest, CreateMakesDirectory) {
    auto project = manager_->create_project("lab", PROJECT_ID);

    EXPECT_EQ(project->id(), PROJECT_ID);
    EXPECT_EQ(project->name(), "lab");
    EXPECT_EQ(project->path(), test_dir_ / "projects" / PROJECT_ID);
    EXPECT_TRUE(fs::is_directory(project->path()));
    EXPECT_FALSE(project->is_local());
}

TEST_F(ProjectTest, CreateGeneratesIdentifier) {
    auto project = manager_->create_project("lab", std::nullopt);
    EXPECT_TRUE(utilities::is_valid_uuid(project->id()));
    EXPECT_EQ(manager_->get_project(project->id()), project);
}

TEST_F(ProjectTest, CreateIsIdempotent) {
    auto first = manager_->create_project("lab", PROJECT_ID);
    auto second = manager_->create_project("other", PROJECT_ID);
    EXPECT_EQ(first, second);
    EXPECT_EQ(manager_->projects().size(), 1u);
}

TEST_F(ProjectTest, InvalidIdentifierRejected) {
    EXPECT_THROW(Project("lab", std::string("1234"), test_dir_ / "bad"), InvalidIdentifierError);
    EXPECT_THROW(manager_->get_project("1234"), InvalidIdentifierError);
}

TEST_F(ProjectTest, NameWithSeparatorRejected) {
    EXPECT_THROW(Project("a/b", PROJECT_ID, test_dir_ / "bad"), ForbiddenError);
    auto project = manager_->create_project("lab", PROJECT_ID);
    EXPECT_THROW(project->set_name("a\\b"), ForbiddenError);
    EXPECT_EQ(project->name(), "lab");
}

TEST_F(ProjectTest, UnknownProjectNotFound) {
    EXPECT_THROW(manager_->get_project(PROJECT_ID), ProjectNotFoundError);
}

TEST_F(ProjectTest, WorkingDirectories) {
    auto project = manager_->create_project("lab", PROJECT_ID);

    fs::path module_dir = project->module_working_directory("qemu");
    EXPECT_EQ(module_dir, project->path() / "project-files" / "qemu");
    EXPECT_TRUE(fs::is_directory(module_dir));

    std::string device_id = utilities::generate_uuid();
    EXPECT_EQ(project->device_working_path("qemu", device_id), module_dir / device_id);
    EXPECT_FALSE(fs::exists(project->device_working_path("qemu", device_id)));
    EXPECT_TRUE(fs::is_directory(project->device_working_directory("qemu", device_id)));

    fs::path captures = project->capture_working_directory();
    EXPECT_EQ(captures, project->path() / "project-files" / "captures");
    EXPECT_TRUE(fs::is_directory(captures));
}

TEST_F(ProjectTest, TmpDirectoryCleanedOnOpen) {
    fs::path path = test_dir_ / "reopened";
    fs::create_directories(path / "tmp");
    utilities::write_file((path / "tmp" / "stale").string(), "x");

    Project project("lab", PROJECT_ID, path);
    EXPECT_FALSE(fs::exists(path / "tmp"));
}

TEST_F(ProjectTest, EmitReachesListener) {
    auto project = manager_->create_project("lab", PROJECT_ID);
    project->emit("node.updated", R"({"name": "pc1"})");

    std::lock_guard<std::mutex> lock(events_mutex_);
    ASSERT_FALSE(events_.empty());
    EXPECT_EQ(events_.back().project_id, PROJECT_ID);
    EXPECT_EQ(events_.back().action, "node.updated");
    EXPECT_EQ(json::parse(events_.back().payload)["name"], "pc1");
}

TEST_F(ProjectTest, CloseReleasesLeftoverPorts) {
    auto project = manager_->create_project("lab", PROJECT_ID);
    uint16_t tcp = allocator_->get_free_tcp_port(*project);
    uint16_t udp = allocator_->get_free_udp_port(*project);
    EXPECT_EQ(project->tcp_ports().count(tcp), 1u);

    project->close(*allocator_);

    EXPECT_TRUE(project->is_closed());
    EXPECT_FALSE(allocator_->is_tcp_port_used(tcp));
    EXPECT_FALSE(allocator_->is_udp_port_used(udp));
    EXPECT_TRUE(project->tcp_ports().empty());
    EXPECT_TRUE(project->udp_ports().empty());
}

TEST_F(ProjectTest, CloseProjectForgetsIt) {
    manager_->create_project("lab", PROJECT_ID);
    manager_->close_project(PROJECT_ID);
    EXPECT_THROW(manager_->get_project(PROJECT_ID), ProjectNotFoundError);
}

TEST_F(ProjectTest, DeleteProjectRemovesDirectory) {
    auto project = manager_->create_project("lab", PROJECT_ID);
    fs::path path = project->path();
    project->module_working_directory("vpcs");

    manager_->delete_project(PROJECT_ID);

    EXPECT_FALSE(fs::exists(path));
    EXPECT_THROW(manager_->get_project(PROJECT_ID), ProjectNotFoundError);
}

TEST_F(ProjectTest, SerializesToJson) {
    auto project = manager_->create_project("lab", PROJECT_ID);
    json j = json::parse(project->to_json());
    EXPECT_EQ(j["name"], "lab");
    EXPECT_EQ(j["project_id"], PROJECT_ID);
    EXPECT_EQ(j["path"], project->path().string());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
