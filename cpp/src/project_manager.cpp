/**
 * @file project_manager.cpp
 * @brief Implementation of the project registry
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/project_manager.hpp"
#include "emucore/errors.hpp"
#include "emucore/port_allocator.hpp"
#include "emucore/utilities.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace emucore {

ProjectManager::ProjectManager(const config::ServerConfig& cfg, PortAllocator& allocator,
                               EventListener listener)
    : projects_path_(cfg.projects_path)
    , local_(cfg.local)
    , allocator_(allocator)
    , listener_(std::move(listener))
{
}

std::shared_ptr<Project> ProjectManager::create_project(
    const std::string& name,
    const std::optional<std::string>& project_id,
    const fs::path& path)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (project_id) {
        auto it = projects_.find(*project_id);
        if (it != projects_.end()) {
            return it->second;
        }
    }

    std::string id = project_id ? *project_id : utilities::generate_uuid();
    fs::path project_path = path;
    if (project_path.empty() && !projects_path_.empty()) {
        project_path = projects_path_ / id;
    }

    auto project = std::make_shared<Project>(name, id, project_path, local_, listener_);
    check_available_disk_space(*project);
    projects_[project->id()] = project;
    return project;
}

std::shared_ptr<Project> ProjectManager::get_project(const std::string& project_id) const {
    if (!utilities::is_valid_uuid(project_id)) {
        throw InvalidIdentifierError("Project ID " + project_id + " is not a valid UUID");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        throw ProjectNotFoundError("Project ID " + project_id + " doesn't exist");
    }
    return it->second;
}

void ProjectManager::remove_project(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        throw ProjectNotFoundError("Project ID " + project_id + " doesn't exist");
    }
    projects_.erase(it);
}

void ProjectManager::close_project(const std::string& project_id) {
    auto project = get_project(project_id);
    project->close(allocator_);
    remove_project(project_id);
}

void ProjectManager::delete_project(const std::string& project_id) {
    auto project = get_project(project_id);
    project->remove(allocator_);
    remove_project(project_id);
}

std::vector<std::shared_ptr<Project>> ProjectManager::projects() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<Project>> result;
    result.reserve(projects_.size());
    for (const auto& entry : projects_) {
        result.push_back(entry.second);
    }
    return result;
}

void ProjectManager::check_available_disk_space(const Project& project) const {
    std::error_code ec;
    auto info = fs::space(project.path(), ec);
    if (ec || info.capacity == 0) {
        utilities::log_warn("ProjectManager: Could not find '" + project.path().string() +
                            "' when checking for used disk space");
        return;
    }

    double used = 100.0 * static_cast<double>(info.capacity - info.available) /
                  static_cast<double>(info.capacity);
    if (used >= 90.0) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.2f", 100.0 - used);
        std::string message = "Only " + std::string(buffer) +
                              "% or less of free disk space detected in \"" +
                              project.path().string() + "\" on \"" + utilities::get_hostname() + "\"";
        utilities::log_warn("ProjectManager: " + message);

        json event;
        event["message"] = message;
        project.emit("log.warning", event.dump());
    }
}

} // namespace emucore
