#ifndef REFLUO_LAYER_INVERTIBLE_CONV_HPP
#define REFLUO_LAYER_INVERTIBLE_CONV_HPP
// "Glow: Generative Flow with Invertible 1x1 Convolutions" https://arxiv.org/pdf/1807.03039
#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

#include <torch/torch.h>

#include "../../common/state.hpp"
#include "../registry.hpp"

namespace Refluo::Layer::Details {

    enum class InvertibleConvForm {
        Direct,
        LU,
    };

    struct InvertibleConvOptions {
        std::int64_t channels{};
        InvertibleConvForm form{InvertibleConvForm::LU};
    };

    struct InvertibleConvDescriptor {
        InvertibleConvOptions options{};
    };

    namespace Detail {
        // Q factor of a Gaussian matrix: uniformly distributed orthogonal matrix.
        inline torch::Tensor random_orthogonal(std::int64_t channels)
        {
            if (channels <= 0) {
                throw std::invalid_argument("Invertible 1x1 convolutions require a positive channel count.");
            }
            auto gaussian = torch::randn({channels, channels}, torch::kFloat64);
            return std::get<0>(torch::linalg_qr(gaussian)).to(torch::kFloat32);
        }

        // Inverted in float64, cast back to the weight's dtype.
        inline torch::Tensor inverse(const torch::Tensor& weight)
        {
            return torch::inverse(weight.to(torch::kFloat64)).to(weight.scalar_type());
        }

        inline torch::Tensor mix_channels(const torch::Tensor& z, const torch::Tensor& weight)
        {
            TORCH_CHECK(z.dim() == 4 && z.size(1) == weight.size(0),
                        "Invertible 1x1 convolution over ", weight.size(0), " channels received input ", z.sizes());
            return torch::conv2d(z, weight.view({weight.size(0), weight.size(1), 1, 1}));
        }

        inline FlowState apply(FlowState state, Direction direction, const torch::Tensor& weight, const torch::Tensor& log_det)
        {
            const auto spatial = static_cast<double>(state.z.size(2) * state.z.size(3));
            if (direction == Direction::Forward) {
                state.z = mix_channels(state.z, weight);
                state.ldj = state.ldj + log_det * spatial;
            } else {
                state.z = mix_channels(state.z, Detail::inverse(weight));
                state.ldj = state.ldj - log_det * spatial;
            }
            return state;
        }
    }

    class InvertibleConvImpl : public torch::nn::Module {
    public:
        explicit InvertibleConvImpl(InvertibleConvOptions options)
            : options_(std::move(options))
        {
            weight_ = register_parameter("weight", Detail::random_orthogonal(options_.channels));
        }

        FlowState forward(FlowState state, Direction direction)
        {
            return Detail::apply(std::move(state), direction, weight_, log_abs_det());
        }

        [[nodiscard]] torch::Tensor log_abs_det() const
        {
            return std::get<1>(torch::linalg_slogdet(weight_));
        }

        [[nodiscard]] const torch::Tensor& weight() const noexcept { return weight_; }
        [[nodiscard]] const InvertibleConvOptions& options() const noexcept { return options_; }

    private:
        InvertibleConvOptions options_{};
        torch::Tensor weight_{};
    };

    TORCH_MODULE(InvertibleConv);

    // W = P (L + I) (U + diag(sign_s * exp(log_s))), factored once from an
    // orthogonal init. P and sign_s stay fixed; log|det W| = sum(log_s).
    class InvertibleConvLUImpl : public torch::nn::Module {
    public:
        explicit InvertibleConvLUImpl(InvertibleConvOptions options)
            : options_(std::move(options))
        {
            const auto initial = Detail::random_orthogonal(options_.channels);
            auto [p, l, u] = torch::linalg_lu(initial);
            const auto diagonal = torch::diagonal(u);

            const auto channels = options_.channels;
            p_ = register_buffer("p", p);
            sign_s_ = register_buffer("sign_s", torch::sign(diagonal));
            l_mask_ = register_buffer("l_mask", torch::tril(torch::ones({channels, channels}), -1));
            eye_ = register_buffer("eye", torch::eye(channels));

            l_ = register_parameter("l", l);
            log_s_ = register_parameter("log_s", torch::log(torch::abs(diagonal)));
            u_ = register_parameter("u", torch::triu(u, 1));
        }

        FlowState forward(FlowState state, Direction direction)
        {
            return Detail::apply(std::move(state), direction, weight(), log_s_.sum());
        }

        [[nodiscard]] torch::Tensor weight() const
        {
            const auto lower = l_ * l_mask_ + eye_;
            const auto upper = u_ * l_mask_.transpose(0, 1).contiguous() + torch::diag(sign_s_ * torch::exp(log_s_));
            return torch::matmul(p_, torch::matmul(lower, upper));
        }

        [[nodiscard]] torch::Tensor log_abs_det() const { return log_s_.sum(); }
        [[nodiscard]] const torch::Tensor& log_s() const noexcept { return log_s_; }
        [[nodiscard]] const InvertibleConvOptions& options() const noexcept { return options_; }

    private:
        InvertibleConvOptions options_{};
        torch::Tensor p_{};
        torch::Tensor sign_s_{};
        torch::Tensor l_mask_{};
        torch::Tensor eye_{};
        torch::Tensor l_{};
        torch::Tensor log_s_{};
        torch::Tensor u_{};
    };

    TORCH_MODULE(InvertibleConvLU);

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const InvertibleConvDescriptor& descriptor, std::size_t index)
    {
        RegisteredLayer registered_layer{};
        if (descriptor.options.form == InvertibleConvForm::LU) {
            auto module = owner.register_module("invertible_conv_lu_" + std::to_string(index),
                                                InvertibleConvLU(descriptor.options));
            registered_layer.module = to_shared_module_ptr(module);
            registered_layer.bind_module(module.get());
        } else {
            auto module = owner.register_module("invertible_conv_" + std::to_string(index),
                                                InvertibleConv(descriptor.options));
            registered_layer.module = to_shared_module_ptr(module);
            registered_layer.bind_module(module.get());
        }
        return registered_layer;
    }
}

#endif // REFLUO_LAYER_INVERTIBLE_CONV_HPP
