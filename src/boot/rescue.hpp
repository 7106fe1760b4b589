#pragma once

#include <string>

#include "../core/failure.hpp"

namespace rdinit {

// Text shown before the rescue shell after a fatal failure
std::string failure_banner(const Failure& failure);

// Text shown before a break= checkpoint shell
std::string checkpoint_banner(const std::string& checkpoint, BootStage stage);

}  // namespace rdinit
