#include "daemon/device_registry.hpp"

#include <algorithm>
#include <utility>

namespace camwatch {

DeviceRegistry::DeviceRegistry(std::vector<Device> devices)
    : m_devices(std::move(devices))
{
}

const Device *DeviceRegistry::find(const std::string &id) const
{
    auto it = std::find_if(m_devices.begin(), m_devices.end(),
                           [&id](const Device &device) { return device.id == id; });
    if (it == m_devices.end()) {
        return nullptr;
    }
    return &*it;
}

bool DeviceRegistry::contains(const std::string &id) const
{
    return find(id) != nullptr;
}

MonitorState DeviceRegistry::prune(const MonitorState &state) const
{
    MonitorState pruned;
    for (const auto &device : m_devices) {
        auto it = state.find(device.id);
        if (it != state.end()) {
            pruned.emplace(it->first, it->second);
        }
    }
    return pruned;
}

} // namespace camwatch
