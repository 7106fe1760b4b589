#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rdinit {

enum class BootStage {
    Init,
    VirtFSMounted,
    CmdlineParsed,
    ModulesLoaded,
    NetworkReady,
    RootAcquired,
    RootMounted,
    FSMoved,
    SwitchedRoot,
    RescueShell,
};

const char* stage_name(BootStage stage);

enum class FailureKind {
    MissingRootSpecifier,
    VirtualFsMountFailed,
    DeviceNotFound,
    UnlockFailed,
    LvmActivationFailed,
    ModuleLoadFailed,
    NetworkFailed,
    SquashfsUnavailable,
    OverlayLayoutInvalid,
    MountFailed,
    HandoffMoveFailed,
    NoInitFound,
    SwitchRootFailed,
};

const char* failure_kind_name(FailureKind kind);

// Structured reason carried from the failing component to the rescue shell.
struct Failure {
    BootStage stage;
    FailureKind kind;
    std::string reason;
    std::vector<std::string> snapshot;

    // "<kind> in <stage>: <reason>"
    std::string summary() const;
};

Failure make_failure(BootStage stage, FailureKind kind, std::string reason,
                     std::vector<std::string> snapshot = {});

/**
 * Either a value or the Failure that prevented producing it.
 */
template <typename T>
class Outcome {
public:
    Outcome(T value) : data_(std::move(value)) {}
    Outcome(Failure failure) : data_(std::move(failure)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const Failure& failure() const { return std::get<Failure>(data_); }

private:
    std::variant<T, Failure> data_;
};

// Operations without a result report std::nullopt on success.
using MaybeFailure = std::optional<Failure>;

}  // namespace rdinit
