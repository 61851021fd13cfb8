/**
 * @file adapter.cpp
 * @brief Implementation of device adapters
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/adapter.hpp"
#include "emucore/errors.hpp"

namespace emucore {

Adapter::Adapter(size_t interfaces)
    : ports_(interfaces)
{
}

bool Adapter::port_exists(size_t port_number) const {
    return port_number < ports_.size();
}

void Adapter::add_nio(size_t port_number, std::shared_ptr<Nio> nio) {
    check_port(port_number);
    ports_[port_number] = std::move(nio);
}

std::shared_ptr<Nio> Adapter::remove_nio(size_t port_number) {
    check_port(port_number);
    std::shared_ptr<Nio> removed;
    removed.swap(ports_[port_number]);
    return removed;
}

std::shared_ptr<Nio> Adapter::get_nio(size_t port_number) const {
    check_port(port_number);
    return ports_[port_number];
}

void Adapter::check_port(size_t port_number) const {
    if (!port_exists(port_number)) {
        throw PortOutOfRangeError("Port " + std::to_string(port_number) +
                                  " does not exist on adapter with " +
                                  std::to_string(ports_.size()) + " ports");
    }
}

} // namespace emucore
