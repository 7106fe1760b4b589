#include "handoff.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

namespace rdinit {

Outcome<std::string> resolve_init(Platform& platform, const std::string& new_root,
                                  const std::string& configured) {
    std::vector<std::string> candidates = {configured};
    for (const auto& path : INIT_CANDIDATES) {
        if (path != configured)
            candidates.push_back(path);
    }

    for (const auto& path : candidates) {
        if (platform.is_executable_in_root(new_root, path)) {
            if (path != configured) {
                LOGW("%s not usable, falling back to %s", configured.c_str(), path.c_str());
            }
            return path;
        }
        LOGD("No executable init at %s", path.c_str());
    }

    std::string reason = "no init found in " + new_root + " (tried " + join(candidates, ", ") + ")";
    LOGE("%s", reason.c_str());
    return make_failure(BootStage::FSMoved, FailureKind::NoInitFound, reason);
}

MaybeFailure move_mounts(Platform& platform, const MountPlan& plan, const std::string& new_root) {
    for (const auto& entry : plan.handoff_entries()) {
        std::string destination = join_path(new_root, entry.target);
        if (!platform.move_mount(entry.target, destination)) {
            std::string reason = "cannot move " + entry.target + " to " + destination + ": " +
                                 platform.last_error();
            LOGE("%s", reason.c_str());
            return make_failure(BootStage::FSMoved, FailureKind::HandoffMoveFailed, reason);
        }
        LOGD("Moved %s to %s", entry.target.c_str(), destination.c_str());
    }
    return std::nullopt;
}

MaybeFailure switch_to_root(Platform& platform, const std::string& new_root,
                            const std::string& init, const std::vector<std::string>& argv) {
    LOGI("Switching to %s, running %s", new_root.c_str(), init.c_str());
    if (platform.switch_root(new_root, init, argv))
        return std::nullopt;

    std::string reason = "switch to " + new_root + " failed: " + platform.last_error();
    LOGE("%s", reason.c_str());
    return make_failure(BootStage::SwitchedRoot, FailureKind::SwitchRootFailed, reason);
}

}  // namespace rdinit
