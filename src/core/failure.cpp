#include "failure.hpp"

namespace rdinit {

const char* stage_name(BootStage stage) {
    switch (stage) {
    case BootStage::Init:
        return "Init";
    case BootStage::VirtFSMounted:
        return "VirtFSMounted";
    case BootStage::CmdlineParsed:
        return "CmdlineParsed";
    case BootStage::ModulesLoaded:
        return "ModulesLoaded";
    case BootStage::NetworkReady:
        return "NetworkReady";
    case BootStage::RootAcquired:
        return "RootAcquired";
    case BootStage::RootMounted:
        return "RootMounted";
    case BootStage::FSMoved:
        return "FSMoved";
    case BootStage::SwitchedRoot:
        return "SwitchedRoot";
    case BootStage::RescueShell:
        return "RescueShell";
    }
    return "Unknown";
}

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
    case FailureKind::MissingRootSpecifier:
        return "MissingRootSpecifier";
    case FailureKind::VirtualFsMountFailed:
        return "VirtualFsMountFailed";
    case FailureKind::DeviceNotFound:
        return "DeviceNotFound";
    case FailureKind::UnlockFailed:
        return "UnlockFailed";
    case FailureKind::LvmActivationFailed:
        return "LvmActivationFailed";
    case FailureKind::ModuleLoadFailed:
        return "ModuleLoadFailed";
    case FailureKind::NetworkFailed:
        return "NetworkFailed";
    case FailureKind::SquashfsUnavailable:
        return "SquashfsUnavailable";
    case FailureKind::OverlayLayoutInvalid:
        return "OverlayLayoutInvalid";
    case FailureKind::MountFailed:
        return "MountFailed";
    case FailureKind::HandoffMoveFailed:
        return "HandoffMoveFailed";
    case FailureKind::NoInitFound:
        return "NoInitFound";
    case FailureKind::SwitchRootFailed:
        return "SwitchRootFailed";
    }
    return "Unknown";
}

std::string Failure::summary() const {
    return std::string(failure_kind_name(kind)) + " in " + stage_name(stage) + ": " + reason;
}

Failure make_failure(BootStage stage, FailureKind kind, std::string reason,
                     std::vector<std::string> snapshot) {
    return Failure{stage, kind, std::move(reason), std::move(snapshot)};
}

}  // namespace rdinit
