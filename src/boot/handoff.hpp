#pragma once

#include <string>
#include <vector>

#include "../core/failure.hpp"
#include "../core/mount_plan.hpp"
#include "../platform/platform.hpp"

namespace rdinit {

// First executable of configured, then INIT_CANDIDATES, inside new_root
Outcome<std::string> resolve_init(Platform& platform, const std::string& new_root,
                                  const std::string& configured);

// Move every move-on-handoff mount below new_root, in mount order
MaybeFailure move_mounts(Platform& platform, const MountPlan& plan, const std::string& new_root);

/**
 * Switch into new_root and exec init with argv.
 *
 * On a real system this does not return unless the switch failed, in which
 * case SwitchRootFailed is reported.
 */
MaybeFailure switch_to_root(Platform& platform, const std::string& new_root,
                            const std::string& init, const std::vector<std::string>& argv);

}  // namespace rdinit
