#ifndef REFLUO_NETWORK_CONV_HPP
#define REFLUO_NETWORK_CONV_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"

namespace Refluo::Network::Details {

    struct ConvNetOptions {
        std::int64_t in_channels{};
        std::int64_t hidden_channels{32};
        std::int64_t out_channels{-1}; // <= 0 means 2 * in_channels
        ::Refluo::Activation::Descriptor activation{::Refluo::Activation::GeLU};
    };

    struct ConvNetDescriptor {
        ConvNetOptions options{};
    };

    [[nodiscard]] inline std::int64_t resolve_out_channels(std::int64_t in_channels, std::int64_t out_channels) noexcept
    {
        return out_channels > 0 ? out_channels : 2 * in_channels;
    }

    [[nodiscard]] inline torch::nn::Conv2d make_same_conv(std::int64_t in_channels, std::int64_t out_channels)
    {
        return torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, out_channels, 3).padding(1));
    }

    // Four 3x3 "same" convolutions with an activation between consecutive ones.
    class ConvNetImpl : public torch::nn::Module {
    public:
        explicit ConvNetImpl(ConvNetOptions options)
            : options_(std::move(options))
        {
            if (options_.in_channels <= 0 || options_.hidden_channels <= 0) {
                throw std::invalid_argument("ConvNet requires positive input and hidden channel counts.");
            }

            const auto out_channels = resolve_out_channels(options_.in_channels, options_.out_channels);
            const std::vector<std::pair<std::int64_t, std::int64_t>> shapes{
                {options_.in_channels, options_.hidden_channels},
                {options_.hidden_channels, options_.hidden_channels},
                {options_.hidden_channels, options_.hidden_channels},
                {options_.hidden_channels, out_channels},
            };

            convolutions_.reserve(shapes.size());
            for (std::size_t index = 0; index < shapes.size(); ++index) {
                convolutions_.push_back(register_module("conv_" + std::to_string(index),
                                                        make_same_conv(shapes[index].first, shapes[index].second)));
            }
        }

        torch::Tensor forward(torch::Tensor input)
        {
            auto output = std::move(input);
            for (std::size_t index = 0; index < convolutions_.size(); ++index) {
                output = convolutions_[index]->forward(output);
                if (index + 1 < convolutions_.size()) {
                    output = ::Refluo::Activation::Details::apply(options_.activation.type, std::move(output));
                }
            }
            return output;
        }

        [[nodiscard]] const ConvNetOptions& options() const noexcept { return options_; }

    private:
        ConvNetOptions options_{};
        std::vector<torch::nn::Conv2d> convolutions_{};
    };

    TORCH_MODULE(ConvNet);
}

#endif // REFLUO_NETWORK_CONV_HPP
