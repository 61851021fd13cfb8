/**
 * @file project_manager.hpp
 * @brief Registry of the projects opened on a compute server
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "emucore/project.hpp"
#include "emucore/server_config.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace emucore {

class PortAllocator;

/**
 * @brief ProjectManager - Registry of opened projects
 *
 * Projects are created with the server's local flag and projects root.
 */
class ProjectManager {
public:
    /**
     * @param cfg Server configuration (projects root, local flag)
     * @param allocator Port allocator used to release ports on close
     * @param listener Event receiver given to every new project
     */
    ProjectManager(const config::ServerConfig& cfg, PortAllocator& allocator,
                   EventListener listener = {});

    ~ProjectManager() = default;

    // Disable copy and move
    ProjectManager(const ProjectManager&) = delete;
    ProjectManager& operator=(const ProjectManager&) = delete;
    ProjectManager(ProjectManager&&) = delete;
    ProjectManager& operator=(ProjectManager&&) = delete;

    /**
     * @brief Create a project, or return the open one with the same id
     * @param name Project name
     * @param project_id Identifier, generated when absent
     * @param path Directory, <projects_path>/<id> when empty
     */
    std::shared_ptr<Project> create_project(
        const std::string& name,
        const std::optional<std::string>& project_id = std::nullopt,
        const std::filesystem::path& path = {}
    );

    /**
     * @brief Look up an open project
     * @throws InvalidIdentifierError if project_id is not a UUID
     * @throws ProjectNotFoundError if no such project is open
     */
    std::shared_ptr<Project> get_project(const std::string& project_id) const;

    /**
     * @brief Forget a project without closing it
     * @throws ProjectNotFoundError if no such project is open
     */
    void remove_project(const std::string& project_id);

    /**
     * @brief Close a project and forget it; its files stay on disk
     */
    void close_project(const std::string& project_id);

    /**
     * @brief Close a project, delete its directory and forget it
     */
    void delete_project(const std::string& project_id);

    std::vector<std::shared_ptr<Project>> projects() const;

private:
    /// Root for projects created without a path
    std::filesystem::path projects_path_;

    /// Server runs beside the controller
    bool local_;

    PortAllocator& allocator_;
    EventListener listener_;

    std::map<std::string, std::shared_ptr<Project>> projects_;

    mutable std::mutex mutex_;

    /// Emit a warning when the project disk is at least 90% full
    void check_available_disk_space(const Project& project) const;
};

} // namespace emucore
