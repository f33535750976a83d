#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace camwatch {

// The monitored devices, in configuration order. Immutable once built.
class DeviceRegistry {
public:
    DeviceRegistry() = default;
    explicit DeviceRegistry(std::vector<Device> devices);

    const std::vector<Device> &devices() const
    {
        return m_devices;
    }

    const Device *find(const std::string &id) const;
    bool contains(const std::string &id) const;
    std::size_t size() const
    {
        return m_devices.size();
    }
    bool empty() const
    {
        return m_devices.empty();
    }

    // Drops records of devices that are no longer configured.
    MonitorState prune(const MonitorState &state) const;

private:
    std::vector<Device> m_devices;
};

} // namespace camwatch
