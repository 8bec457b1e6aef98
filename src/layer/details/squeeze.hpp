#ifndef REFLUO_LAYER_SQUEEZE_HPP
#define REFLUO_LAYER_SQUEEZE_HPP

#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/state.hpp"
#include "../registry.hpp"

namespace Refluo::Layer::Details {

    struct SqueezeOptions {};

    struct SqueezeDescriptor {
        SqueezeOptions options{};
    };

    // (B, C, H, W) <-> (B, 4C, H/2, W/2): every 2x2 spatial block becomes 4 channels.
    // Volume preserving, so ldj is left untouched.
    class SqueezeImpl : public torch::nn::Module {
    public:
        SqueezeImpl() = default;

        explicit SqueezeImpl(SqueezeOptions options)
            : options_(options)
        {}

        FlowState forward(FlowState state, Direction direction)
        {
            const auto& z = state.z;
            TORCH_CHECK(z.dim() == 4, "Squeeze expects (B, C, H, W) input, got ", z.sizes());
            const auto batch = z.size(0);
            const auto channels = z.size(1);
            const auto height = z.size(2);
            const auto width = z.size(3);

            if (direction == Direction::Forward) {
                TORCH_CHECK(height % 2 == 0 && width % 2 == 0,
                            "Squeeze requires even spatial dimensions, got ", height, "x", width);
                state.z = z.reshape({batch, channels, height / 2, 2, width / 2, 2})
                              .permute({0, 1, 3, 5, 2, 4})
                              .reshape({batch, 4 * channels, height / 2, width / 2});
            } else {
                TORCH_CHECK(channels % 4 == 0,
                            "Reverse squeeze requires a channel count divisible by 4, got ", channels);
                state.z = z.reshape({batch, channels / 4, 2, 2, height, width})
                              .permute({0, 1, 4, 2, 5, 3})
                              .reshape({batch, channels / 4, height * 2, width * 2});
            }
            return state;
        }

        [[nodiscard]] const SqueezeOptions& options() const noexcept { return options_; }

    private:
        SqueezeOptions options_{};
    };

    TORCH_MODULE(Squeeze);

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const SqueezeDescriptor& descriptor, std::size_t index)
    {
        auto module = owner.register_module("squeeze_" + std::to_string(index), Squeeze(descriptor.options));

        RegisteredLayer registered_layer{};
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module(module.get());
        return registered_layer;
    }
}

#endif // REFLUO_LAYER_SQUEEZE_HPP
