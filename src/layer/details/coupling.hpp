#ifndef REFLUO_LAYER_COUPLING_HPP
#define REFLUO_LAYER_COUPLING_HPP
// "Density estimation using Real NVP" https://arxiv.org/pdf/1605.08803
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/state.hpp"
#include "../../mask/mask.hpp"
#include "../../network/network.hpp"
#include "../registry.hpp"

namespace Refluo::Layer::Details {

    struct CouplingOptions {
        std::int64_t in_channels{};
        ::Refluo::Mask::Descriptor mask{};
        ::Refluo::Network::Descriptor network{};
    };

    struct CouplingDescriptor {
        CouplingOptions options{};
    };

    // Affine coupling: masked entries condition (s, t) for the unmasked ones.
    class CouplingImpl : public torch::nn::Module {
    public:
        explicit CouplingImpl(CouplingOptions options)
            : options_(std::move(options))
        {
            if (options_.in_channels <= 0) {
                throw std::invalid_argument("Coupling layers require a positive channel count.");
            }

            mask_ = register_buffer("mask", ::Refluo::Mask::build(options_.mask));
            network_ = ::Refluo::Network::Details::build_network(options_.network);
            register_module("network", network_.ptr());
            scaling_factor_ = register_parameter("scaling_factor", torch::zeros({options_.in_channels}));
        }

        FlowState forward(FlowState state, Direction direction)
        {
            return forward(std::move(state), direction, torch::Tensor{});
        }

        // `conditioning` is concatenated to the network input as-is (never masked).
        FlowState forward(FlowState state, Direction direction, const torch::Tensor& conditioning)
        {
            auto& z = state.z;
            check_input(z);

            const auto z_in = z * mask_;
            auto network_input = conditioning.defined() ? torch::cat({z_in, conditioning}, /*dim=*/1) : z_in;
            auto output = network_.forward(std::move(network_input));
            TORCH_CHECK(output.dim() == 4 && output.size(1) == 2 * options_.in_channels,
                        "Coupling network must return ", 2 * options_.in_channels, " channels, got ", output.sizes());

            auto chunks = output.chunk(2, /*dim=*/1);
            const auto scale = scaling_factor_.exp().view({1, -1, 1, 1});
            const auto inverse_mask = 1 - mask_;
            auto s = torch::tanh(chunks[0] / scale) * scale * inverse_mask;
            auto t = chunks[1] * inverse_mask;

            if (direction == Direction::Forward) {
                state.z = (z + t) * torch::exp(s);
                state.ldj = state.ldj + sum_except_batch(s);
            } else {
                state.z = z * torch::exp(-s) - t;
                state.ldj = state.ldj - sum_except_batch(s);
            }
            return state;
        }

        [[nodiscard]] const CouplingOptions& options() const noexcept { return options_; }
        [[nodiscard]] const torch::Tensor& mask() const noexcept { return mask_; }
        [[nodiscard]] const torch::Tensor& scaling_factor() const noexcept { return scaling_factor_; }

    private:
        void check_input(const torch::Tensor& z) const
        {
            TORCH_CHECK(z.dim() == 4, "Coupling layer expects (B, C, H, W) input, got ", z.sizes());
            TORCH_CHECK(z.size(1) == options_.in_channels,
                        "Coupling layer expects ", options_.in_channels, " channels, got ", z.size(1));
            for (std::int64_t dim = 1; dim < 4; ++dim) {
                TORCH_CHECK(mask_.size(dim) == 1 || mask_.size(dim) == z.size(dim),
                            "Coupling mask of shape ", mask_.sizes(), " is incompatible with input ", z.sizes());
            }
        }

        CouplingOptions options_{};
        torch::Tensor mask_{};
        torch::nn::AnyModule network_{};
        torch::Tensor scaling_factor_{};
    };

    TORCH_MODULE(Coupling);

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const CouplingDescriptor& descriptor, std::size_t index)
    {
        auto module = owner.register_module("coupling_" + std::to_string(index), Coupling(descriptor.options));

        RegisteredLayer registered_layer{};
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module(module.get());
        return registered_layer;
    }
}

#endif // REFLUO_LAYER_COUPLING_HPP
