#ifndef REFLUO_ARCHITECTURE_HPP
#define REFLUO_ARCHITECTURE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../layer/layer.hpp"
#include "../mask/mask.hpp"
#include "../network/network.hpp"

// Reference layer stacks for single-channel images. Both return descriptors;
// materialise them with Flow::add.
namespace Refluo::Architecture {
    enum class Approximator {
        Conv,
        Gated,
    };

    struct SimpleFlowOptions {
        std::int64_t height{28};
        std::int64_t width{28};
        std::int64_t coupling_layers{8};
        std::int64_t hidden_channels{32};
        bool variational{true};
        std::int64_t variational_layers{1};
        Approximator approximator{Approximator::Conv};
        Layer::DequantizationOptions dequantization{};
    };

    struct MultiScaleFlowOptions {
        std::int64_t height{28};
        std::int64_t width{28};
        bool variational{true};
        std::int64_t variational_layers{4};
        bool invertible_conv{true};
        Layer::InvertibleConvForm form{Layer::InvertibleConvForm::LU};
        std::int64_t first_scale_layers{2};
        std::int64_t second_scale_layers{2};
        std::int64_t third_scale_layers{4};
        std::int64_t first_scale_hidden{32};
        std::int64_t second_scale_hidden{48};
        std::int64_t third_scale_hidden{64};
        Approximator approximator{Approximator::Conv};
        Layer::DequantizationOptions dequantization{};
    };

    namespace Detail {
        inline Network::Descriptor network(Approximator approximator,
                                           std::int64_t in_channels,
                                           std::int64_t out_channels,
                                           std::int64_t hidden_channels,
                                           std::int64_t height,
                                           std::int64_t width)
        {
            if (approximator == Approximator::Gated) {
                return Network::GatedConvNet({.in_channels = in_channels,
                                              .height = height,
                                              .width = width,
                                              .hidden_channels = hidden_channels,
                                              .out_channels = out_channels});
            }
            return Network::ConvNet({.in_channels = in_channels,
                                     .hidden_channels = hidden_channels,
                                     .out_channels = out_channels});
        }

        inline Layer::CouplingDescriptor checkerboard_coupling(Approximator approximator,
                                                               std::int64_t channels,
                                                               std::int64_t hidden_channels,
                                                               std::int64_t height,
                                                               std::int64_t width,
                                                               bool invert)
        {
            return Layer::Coupling({.in_channels = channels,
                                    .mask = {.type = Mask::Type::Checkerboard, .height = height, .width = width, .invert = invert},
                                    .network = network(approximator, channels, -1, hidden_channels, height, width)});
        }

        inline Layer::CouplingDescriptor channel_coupling(Approximator approximator,
                                                          std::int64_t channels,
                                                          std::int64_t hidden_channels,
                                                          std::int64_t height,
                                                          std::int64_t width,
                                                          bool invert)
        {
            return Layer::Coupling({.in_channels = channels,
                                    .mask = {.type = Mask::Type::Channel, .channels = channels, .invert = invert},
                                    .network = network(approximator, channels, -1, hidden_channels, height, width)});
        }

        // Noise flow of the variational dequantizer: conditioned on the image,
        // so the network sees 2 channels and predicts (s, t) for 1.
        inline Layer::Descriptor dequantization(bool variational,
                                                std::int64_t layers,
                                                Approximator approximator,
                                                std::int64_t hidden_channels,
                                                std::int64_t height,
                                                std::int64_t width,
                                                const Layer::DequantizationOptions& options)
        {
            if (!variational) {
                return Layer::Dequantization(options);
            }

            std::vector<Layer::CouplingDescriptor> flows;
            for (std::int64_t index = 0; index < layers; ++index) {
                flows.push_back(Layer::Coupling({
                    .in_channels = 1,
                    .mask = {.type = Mask::Type::Checkerboard, .height = height, .width = width, .invert = index % 2 == 1},
                    .network = network(approximator, 2, 2, hidden_channels, height, width)}));
            }
            return Layer::VariationalDequantization(std::move(flows), options);
        }
    }

    [[nodiscard]] inline std::vector<Layer::Descriptor> SimpleFlow(const SimpleFlowOptions& options = {})
    {
        if (options.height <= 0 || options.width <= 0 || options.coupling_layers < 0 || options.variational_layers < 0) {
            throw std::invalid_argument("SimpleFlow requires positive image dimensions and non-negative layer counts.");
        }

        std::vector<Layer::Descriptor> layers;
        layers.push_back(Detail::dequantization(options.variational, options.variational_layers, options.approximator,
                                                options.hidden_channels, options.height, options.width, options.dequantization));
        for (std::int64_t index = 0; index < options.coupling_layers; ++index) {
            layers.push_back(Detail::checkerboard_coupling(options.approximator, 1, options.hidden_channels,
                                                           options.height, options.width, index % 2 == 1));
        }
        return layers;
    }

    // Three scales: 1 channel at (H, W), 4 at (H/2, W/2), 8 at (H/4, W/4) after
    // factoring out half of the 4-channel latent.
    [[nodiscard]] inline std::vector<Layer::Descriptor> MultiScaleFlow(const MultiScaleFlowOptions& options = {})
    {
        if (options.height <= 0 || options.width <= 0 || options.height % 4 != 0 || options.width % 4 != 0) {
            throw std::invalid_argument("MultiScaleFlow requires image dimensions divisible by 4, got "
                                        + std::to_string(options.height) + "x" + std::to_string(options.width) + ".");
        }

        const auto approximator = options.approximator;
        const auto mixing = [&](std::int64_t channels) {
            return Layer::InvertibleConv({.channels = channels, .form = options.form});
        };

        std::vector<Layer::Descriptor> layers;
        layers.push_back(Detail::dequantization(options.variational, options.variational_layers, approximator,
                                                options.first_scale_hidden, options.height, options.width, options.dequantization));
        for (std::int64_t index = 0; index < options.first_scale_layers; ++index) {
            layers.push_back(Detail::checkerboard_coupling(approximator, 1, options.first_scale_hidden,
                                                           options.height, options.width, index % 2 == 1));
        }

        layers.push_back(Layer::Squeeze());
        const auto half_height = options.height / 2;
        const auto half_width = options.width / 2;
        for (std::int64_t index = 0; index < options.second_scale_layers; ++index) {
            if (options.invertible_conv) {
                layers.push_back(mixing(4));
            }
            layers.push_back(Detail::channel_coupling(approximator, 4, options.second_scale_hidden,
                                                      half_height, half_width, index % 2 == 1));
        }
        if (options.invertible_conv) {
            layers.push_back(mixing(4));
        }
        // Mixing before the split is unconditional.
        layers.push_back(mixing(4));
        layers.push_back(Layer::Split());
        layers.push_back(Layer::Squeeze());

        const auto quarter_height = options.height / 4;
        const auto quarter_width = options.width / 4;
        for (std::int64_t index = 0; index < options.third_scale_layers; ++index) {
            if (options.invertible_conv) {
                layers.push_back(mixing(8));
            }
            layers.push_back(Detail::channel_coupling(approximator, 8, options.third_scale_hidden,
                                                      quarter_height, quarter_width, index % 2 == 1));
        }
        return layers;
    }
}

#endif // REFLUO_ARCHITECTURE_HPP
