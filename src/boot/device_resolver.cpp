#include "device_resolver.hpp"
#include "../log.hpp"

namespace rdinit {

namespace {

const char* tag_name(DeviceSpec::Kind kind) {
    switch (kind) {
    case DeviceSpec::Kind::Uuid:
        return "UUID";
    case DeviceSpec::Kind::Label:
        return "LABEL";
    case DeviceSpec::Kind::PartUuid:
        return "PARTUUID";
    case DeviceSpec::Kind::Path:
        break;
    }
    return nullptr;
}

}  // namespace

std::optional<std::string> DeviceResolver::cached(const DeviceSpec& spec) const {
    auto it = cache_.find(spec.text());
    if (it == cache_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> DeviceResolver::probe_once(const DeviceSpec& spec) {
    if (spec.kind == DeviceSpec::Kind::Path) {
        if (platform_.is_block_device(spec.value))
            return spec.value;
        return std::nullopt;
    }

    auto candidates = probe_.find_by_tag(tag_name(spec.kind), spec.value);
    if (candidates.empty())
        return std::nullopt;
    if (candidates.size() > 1) {
        LOGW("%s matches %zu devices, using %s", spec.text().c_str(), candidates.size(),
             candidates.front().c_str());
    }
    return candidates.front();
}

std::vector<std::string> DeviceResolver::snapshot() {
    auto devices = probe_.list_block_devices();
    if (devices.empty())
        devices.push_back("(no block devices visible)");
    return devices;
}

Outcome<std::string> DeviceResolver::resolve(const DeviceSpec& spec, BootStage stage) {
    if (auto hit = cached(spec)) {
        return *hit;
    }

    if (wait_forever_) {
        LOGI("Waiting for %s", spec.text().c_str());
    } else {
        LOGI("Waiting up to %us for %s", timeout_seconds_, spec.text().c_str());
    }

    unsigned waited = 0;
    for (;;) {
        auto device = probe_once(spec);
        if (device) {
            LOGI("Found %s at %s after %us", spec.text().c_str(), device->c_str(), waited);
            cache_[spec.text()] = *device;
            return *device;
        }

        if (!wait_forever_ && waited >= timeout_seconds_)
            break;

        platform_.sleep_seconds(1);
        ++waited;
        if (waited % 10 == 0) {
            LOGI("Still waiting for %s (%us)", spec.text().c_str(), waited);
        }
    }

    std::string reason =
        "timed out after " + std::to_string(waited) + "s waiting for " + spec.text();
    LOGE("%s", reason.c_str());
    return make_failure(stage, FailureKind::DeviceNotFound, reason, snapshot());
}

}  // namespace rdinit
