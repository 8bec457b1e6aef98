#ifndef REFLUO_DATA_EXPORT_HPP
#define REFLUO_DATA_EXPORT_HPP
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace Refluo::Data::Export {
    struct GridOptions {
        std::int64_t columns{8};
        std::int64_t padding{2};
        std::uint8_t padding_value{128};
        std::int64_t levels{256};
    };

    namespace Details {
        // (B, 1, H, W) integer levels -> single-channel 8-bit tile sheet.
        inline torch::Tensor tile(const torch::Tensor& images, const GridOptions& options) {
            const auto count = images.size(0);
            const auto height = images.size(2);
            const auto width = images.size(3);
            const auto columns = std::min(options.columns, count);
            const auto rows = (count + columns - 1) / columns;
            const auto pad = options.padding;

            auto sheet = torch::full({rows * (height + pad) + pad, columns * (width + pad) + pad},
                                     static_cast<std::int64_t>(options.padding_value), torch::kUInt8);

            const auto scale = 255.0 / static_cast<double>(options.levels - 1);
            const auto pixels = (images.to(torch::kCPU, torch::kFloat64) * scale).round().clamp(0, 255).to(torch::kUInt8);
            for (std::int64_t index = 0; index < count; ++index) {
                const auto top = (index / columns) * (height + pad) + pad;
                const auto left = (index % columns) * (width + pad) + pad;
                sheet.narrow(0, top, height).narrow(1, left, width).copy_(pixels[index][0]);
            }
            return sheet;
        }
    }

    // Writes a grid of grayscale images; the format follows the file extension.
    inline void Grid(const torch::Tensor& images, const std::filesystem::path& path, const GridOptions& options = {}) {
        if (!images.defined() || images.dim() != 4 || images.size(1) != 1 || images.size(0) == 0) {
            throw std::invalid_argument("Grid export expects a non-empty (B, 1, H, W) tensor.");
        }
        if (options.columns <= 0 || options.padding < 0 || options.levels < 2) {
            throw std::invalid_argument("Grid export requires positive columns, non-negative padding and at least two levels.");
        }

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        auto sheet = Details::tile(images, options).contiguous();
        const cv::Mat image(static_cast<int>(sheet.size(0)), static_cast<int>(sheet.size(1)), CV_8UC1, sheet.data_ptr<std::uint8_t>());
        if (!cv::imwrite(path.string(), image)) {
            throw std::runtime_error("Failed to write image grid to: " + path.string());
        }
    }
}

#endif // REFLUO_DATA_EXPORT_HPP
