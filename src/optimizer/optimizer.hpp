#ifndef REFLUO_OPTIMIZER_HPP
#define REFLUO_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/adam.hpp"
#include "registry.hpp"

namespace Refluo::Optimizer {
    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using Descriptor = std::variant<AdamDescriptor>;

    [[nodiscard]] inline constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }
}

#endif // REFLUO_OPTIMIZER_HPP
