#ifndef REFLUO_LRSCHEDULER_HPP
#define REFLUO_LRSCHEDULER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/stepdecay.hpp"
#include "registry.hpp"

namespace Refluo::LrScheduler {
    using StepDecayOptions = Details::StepDecayOptions;
    using StepDecayDescriptor = Details::StepDecayDescriptor;

    using Descriptor = std::variant<StepDecayDescriptor>;

    [[nodiscard]] constexpr auto StepDecay(const StepDecayOptions& options = {}) noexcept
        -> StepDecayDescriptor {
        return {options};
    }
}

#endif // REFLUO_LRSCHEDULER_HPP
