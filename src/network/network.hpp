#ifndef REFLUO_NETWORK_HPP
#define REFLUO_NETWORK_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <type_traits>
#include <variant>

#include <torch/torch.h>

#include "details/conv.hpp"
#include "details/gated.hpp"

namespace Refluo::Network {
    using ConvNetOptions = Details::ConvNetOptions;
    using ConvNetDescriptor = Details::ConvNetDescriptor;

    using GatedConvNetOptions = Details::GatedConvNetOptions;
    using GatedConvNetDescriptor = Details::GatedConvNetDescriptor;

    using Descriptor = std::variant<ConvNetDescriptor, GatedConvNetDescriptor>;

    [[nodiscard]] inline auto ConvNet(const ConvNetOptions& options) -> ConvNetDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto GatedConvNet(const GatedConvNetOptions& options) -> GatedConvNetDescriptor {
        return {options};
    }

    namespace Details {
        // Materialises an approximator; the caller registers the returned module.
        [[nodiscard]] inline torch::nn::AnyModule build_network(const Descriptor& descriptor)
        {
            return std::visit(
                [](const auto& concrete) -> torch::nn::AnyModule {
                    using DescriptorType = std::decay_t<decltype(concrete)>;
                    if constexpr (std::is_same_v<DescriptorType, ConvNetDescriptor>) {
                        return torch::nn::AnyModule(Details::ConvNet(concrete.options));
                    } else {
                        return torch::nn::AnyModule(Details::GatedConvNet(concrete.options));
                    }
                },
                descriptor);
        }
    }
}

#endif // REFLUO_NETWORK_HPP
