#ifndef REFLUO_LAYER_HPP
#define REFLUO_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <utility>
#include <variant>
#include <vector>

#include "details/coupling.hpp"
#include "details/dequantization.hpp"
#include "details/invertible_conv.hpp"
#include "details/split.hpp"
#include "details/squeeze.hpp"

#include "registry.hpp"

namespace Refluo::Layer {
    using CouplingOptions = Details::CouplingOptions;
    using CouplingDescriptor = Details::CouplingDescriptor;

    using DequantizationNoise = Details::DequantizationNoise;
    using DequantizationOptions = Details::DequantizationOptions;
    using DequantizationDescriptor = Details::DequantizationDescriptor;
    using VariationalDequantizationDescriptor = Details::VariationalDequantizationDescriptor;

    using SqueezeOptions = Details::SqueezeOptions;
    using SqueezeDescriptor = Details::SqueezeDescriptor;

    using SplitOptions = Details::SplitOptions;
    using SplitDescriptor = Details::SplitDescriptor;

    using InvertibleConvForm = Details::InvertibleConvForm;
    using InvertibleConvOptions = Details::InvertibleConvOptions;
    using InvertibleConvDescriptor = Details::InvertibleConvDescriptor;

    using Descriptor = std::variant<CouplingDescriptor,
                                    DequantizationDescriptor,
                                    VariationalDequantizationDescriptor,
                                    SqueezeDescriptor,
                                    SplitDescriptor,
                                    InvertibleConvDescriptor>;

    [[nodiscard]] inline auto Coupling(CouplingOptions options) -> CouplingDescriptor {
        return {std::move(options)};
    }

    [[nodiscard]] inline auto Dequantization(const DequantizationOptions& options = {}) -> DequantizationDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto VariationalDequantization(std::vector<CouplingDescriptor> flows,
                                                        const DequantizationOptions& options = {}) -> VariationalDequantizationDescriptor {
        return {options, std::move(flows)};
    }

    [[nodiscard]] inline auto Squeeze(const SqueezeOptions& options = {}) -> SqueezeDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto Split(const SplitOptions& options = {}) -> SplitDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto InvertibleConv(const InvertibleConvOptions& options) -> InvertibleConvDescriptor {
        return {options};
    }
}

#endif // REFLUO_LAYER_HPP
