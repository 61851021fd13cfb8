/**
 * @file adapter.hpp
 * @brief Device adapter - ordered ports holding virtual links
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "emucore/nio.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace emucore {

/**
 * @brief Adapter - Fixed number of ports, each with at most one link
 *
 * Not thread-safe; the owning device serializes access.
 */
class Adapter {
public:
    /**
     * @param interfaces Number of ports on this adapter
     */
    explicit Adapter(size_t interfaces = 1);

    virtual ~Adapter() = default;

    bool port_exists(size_t port_number) const;

    /**
     * @brief Attach a link to a port, replacing any existing one
     * @throws PortOutOfRangeError if the port does not exist
     */
    void add_nio(size_t port_number, std::shared_ptr<Nio> nio);

    /**
     * @brief Detach the link of a port
     * @return Link that was attached, nullptr if none
     * @throws PortOutOfRangeError if the port does not exist
     */
    std::shared_ptr<Nio> remove_nio(size_t port_number);

    /**
     * @return Link attached to the port, nullptr if none
     * @throws PortOutOfRangeError if the port does not exist
     */
    std::shared_ptr<Nio> get_nio(size_t port_number) const;

    size_t interfaces() const { return ports_.size(); }

    /**
     * @brief Links of every port (nullptr for free ports)
     */
    const std::vector<std::shared_ptr<Nio>>& ports() const { return ports_; }

private:
    std::vector<std::shared_ptr<Nio>> ports_;

    void check_port(size_t port_number) const;
};

} // namespace emucore
