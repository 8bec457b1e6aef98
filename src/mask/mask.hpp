#ifndef REFLUO_MASK_HPP
#define REFLUO_MASK_HPP
// "Density estimation using Real NVP" https://arxiv.org/pdf/1605.08803 (checkerboard / channel-wise masking)
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Refluo::Mask {
    enum class Type {
        Checkerboard,
        Channel,
    };

    struct Descriptor {
        Type type{Type::Checkerboard};
        std::int64_t height{0};
        std::int64_t width{0};
        std::int64_t channels{0};
        bool invert{false};
    };

    // (1, 1, h, w) mask with cell (x, y) = (x + y) mod 2.
    [[nodiscard]] inline torch::Tensor checkerboard(std::int64_t height, std::int64_t width, bool invert = false)
    {
        if (height <= 0 || width <= 0) {
            throw std::invalid_argument("Checkerboard mask requires positive spatial dimensions, got "
                                        + std::to_string(height) + "x" + std::to_string(width) + ".");
        }

        const auto rows = torch::arange(height, torch::kInt32).view({height, 1});
        const auto cols = torch::arange(width, torch::kInt32).view({1, width});
        auto mask = torch::fmod(rows + cols, 2).to(torch::kFloat32).view({1, 1, height, width});
        if (invert) {
            mask = 1 - mask;
        }
        return mask;
    }

    // (1, c, 1, 1) mask, ones on the first ceil(c/2) channels.
    [[nodiscard]] inline torch::Tensor channel(std::int64_t channels, bool invert = false)
    {
        if (channels <= 0) {
            throw std::invalid_argument("Channel mask requires a positive channel count, got "
                                        + std::to_string(channels) + ".");
        }

        const auto conditioning = (channels + 1) / 2;
        auto mask = torch::cat({torch::ones({conditioning}, torch::kFloat32),
                                torch::zeros({channels - conditioning}, torch::kFloat32)})
                        .view({1, channels, 1, 1});
        if (invert) {
            mask = 1 - mask;
        }
        return mask;
    }

    [[nodiscard]] inline torch::Tensor build(const Descriptor& descriptor)
    {
        switch (descriptor.type) {
            case Type::Checkerboard:
                return checkerboard(descriptor.height, descriptor.width, descriptor.invert);
            case Type::Channel:
                return channel(descriptor.channels, descriptor.invert);
        }
        throw std::invalid_argument("Unsupported mask type.");
    }

    [[nodiscard]] inline Descriptor Checkerboard(std::int64_t height, std::int64_t width, bool invert = false) noexcept
    {
        return {Type::Checkerboard, height, width, 0, invert};
    }

    [[nodiscard]] inline Descriptor Channel(std::int64_t channels, bool invert = false) noexcept
    {
        return {Type::Channel, 0, 0, channels, invert};
    }
}

#endif // REFLUO_MASK_HPP
