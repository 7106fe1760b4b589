#pragma once

#include "../core/failure.hpp"
#include "../core/mount_plan.hpp"
#include "../platform/platform.hpp"

namespace rdinit {

/**
 * Mount /dev, /proc, /sys and /run in that order and record them in plan.
 *
 * Each mount is attempted once; the first failure is returned as
 * VirtualFsMountFailed. The helper mounts below /dev and /run that follow
 * are best-effort.
 */
MaybeFailure mount_virtual_filesystems(Platform& platform, MountPlan& plan);

}  // namespace rdinit
