#ifndef REFLUO_NETWORK_GATED_HPP
#define REFLUO_NETWORK_GATED_HPP
// "Flow++: Improving Flow-Based Generative Models with Variational Dequantization and Architecture Design" https://arxiv.org/pdf/1902.00275
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "conv.hpp"

namespace Refluo::Network::Details {

    struct GatedConvNetOptions {
        std::int64_t in_channels{};
        std::int64_t height{};
        std::int64_t width{};
        std::int64_t hidden_channels{32};
        std::int64_t out_channels{-1}; // <= 0 means 2 * in_channels
        std::int64_t layers{4};
    };

    struct GatedConvNetDescriptor {
        GatedConvNetOptions options{};
    };

    // x + value * sigmoid(gate), with (value, gate) predicted from x.
    class GatedConvImpl : public torch::nn::Module {
    public:
        GatedConvImpl(std::int64_t channels, std::int64_t hidden_channels)
        {
            input_ = register_module("input", make_same_conv(channels, hidden_channels));
            output_ = register_module("output", make_same_conv(hidden_channels, 2 * channels));
        }

        torch::Tensor forward(torch::Tensor input)
        {
            auto hidden = torch::gelu(input_->forward(input));
            auto chunks = output_->forward(hidden).chunk(2, /*dim=*/1);
            return input + chunks[0] * torch::sigmoid(chunks[1]);
        }

    private:
        torch::nn::Conv2d input_{nullptr};
        torch::nn::Conv2d output_{nullptr};
    };

    TORCH_MODULE(GatedConv);

    class GatedConvNetImpl : public torch::nn::Module {
    public:
        explicit GatedConvNetImpl(GatedConvNetOptions options)
            : options_(std::move(options))
        {
            if (options_.in_channels <= 0 || options_.hidden_channels <= 0) {
                throw std::invalid_argument("GatedConvNet requires positive input and hidden channel counts.");
            }
            if (options_.height <= 0 || options_.width <= 0) {
                throw std::invalid_argument("GatedConvNet requires the spatial size for its layer normalisation.");
            }
            if (options_.layers < 0) {
                throw std::invalid_argument("GatedConvNet requires a non-negative number of gated layers.");
            }

            const auto hidden = options_.hidden_channels;
            input_ = register_module("input", make_same_conv(options_.in_channels, hidden));
            for (std::int64_t index = 0; index < options_.layers; ++index) {
                const auto suffix = std::to_string(index);
                gates_.push_back(register_module("gate_" + suffix, GatedConv(hidden, hidden)));
                norms_.push_back(register_module(
                    "norm_" + suffix,
                    torch::nn::LayerNorm(torch::nn::LayerNormOptions({hidden, options_.height, options_.width}))));
            }
            output_ = register_module(
                "output", make_same_conv(hidden, resolve_out_channels(options_.in_channels, options_.out_channels)));
        }

        torch::Tensor forward(torch::Tensor input)
        {
            auto output = input_->forward(std::move(input));
            for (std::size_t index = 0; index < gates_.size(); ++index) {
                output = norms_[index]->forward(gates_[index]->forward(output));
            }
            return output_->forward(output);
        }

        [[nodiscard]] const GatedConvNetOptions& options() const noexcept { return options_; }

    private:
        GatedConvNetOptions options_{};
        torch::nn::Conv2d input_{nullptr};
        std::vector<GatedConv> gates_{};
        std::vector<torch::nn::LayerNorm> norms_{};
        torch::nn::Conv2d output_{nullptr};
    };

    TORCH_MODULE(GatedConvNet);
}

#endif // REFLUO_NETWORK_GATED_HPP
