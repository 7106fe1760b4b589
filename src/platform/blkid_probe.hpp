#pragma once

#include <string>

#include "platform.hpp"

namespace rdinit {

/**
 * DeviceProbe backed by libblkid.
 *
 * Every call starts from an empty cache so devices that appear between
 * polling ticks are seen. When libblkid finds nothing for a tag the udev
 * style /dev/disk/by-* links are consulted as well.
 */
class BlkidProbe : public DeviceProbe {
public:
    std::vector<std::string> find_by_tag(const std::string& tag,
                                         const std::string& value) override;
    std::vector<std::string> list_block_devices() override;
    std::optional<std::string> probe_fstype(const std::string& device) override;
};

}  // namespace rdinit
