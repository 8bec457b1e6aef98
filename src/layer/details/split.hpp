#ifndef REFLUO_LAYER_SPLIT_HPP
#define REFLUO_LAYER_SPLIT_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/state.hpp"
#include "../../prior/prior.hpp"
#include "../registry.hpp"

namespace Refluo::Layer::Details {

    struct SplitOptions {};

    struct SplitDescriptor {
        SplitOptions options{};
    };

    // Multi-scale factor-out: the second channel half is scored by the prior and
    // dropped. In reverse it is resampled, so only the ldj bookkeeping is exact.
    class SplitImpl : public torch::nn::Module {
    public:
        explicit SplitImpl(::Refluo::Prior::Handle prior, SplitOptions options = {})
            : prior_(std::move(prior)), options_(options)
        {
            if (!prior_) {
                throw std::invalid_argument("Split layer requires a prior.");
            }
        }

        FlowState forward(FlowState state, Direction direction)
        {
            TORCH_CHECK(state.z.dim() == 4, "Split expects (B, C, H, W) input, got ", state.z.sizes());

            if (direction == Direction::Forward) {
                TORCH_CHECK(state.z.size(1) % 2 == 0, "Split requires an even channel count, got ", state.z.size(1));
                auto halves = state.z.chunk(2, /*dim=*/1);
                state.ldj = state.ldj + sum_except_batch(prior_->log_prob(halves[1]));
                state.z = halves[0];
            } else {
                auto split = prior_->sample(state.z.sizes(), state.z.options());
                state.ldj = state.ldj - sum_except_batch(prior_->log_prob(split));
                state.z = torch::cat({state.z, split}, /*dim=*/1);
            }
            return state;
        }

        [[nodiscard]] const ::Refluo::Prior::Handle& prior() const noexcept { return prior_; }

    private:
        ::Refluo::Prior::Handle prior_{};
        SplitOptions options_{};
    };

    TORCH_MODULE(Split);

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const SplitDescriptor& descriptor, std::size_t index)
    {
        auto module = owner.register_module("split_" + std::to_string(index), Split(owner.prior(), descriptor.options));

        RegisteredLayer registered_layer{};
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module(module.get());
        return registered_layer;
    }
}

#endif // REFLUO_LAYER_SPLIT_HPP
