#ifndef REFLUO_DATA_LOAD_HPP
#define REFLUO_DATA_LOAD_HPP
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Refluo::Data::Load {
    namespace Details {
        inline std::filesystem::path resolve_mnist_root(const std::string& root) {
            const std::array<std::filesystem::path, 3> candidates = {
                std::filesystem::path(root),
                std::filesystem::path(root) / "MNIST",
                std::filesystem::path(root) / "MNIST" / "raw"
            };

            const std::array<const char*, 2> required_files = {
                "train-images-idx3-ubyte",
                "t10k-images-idx3-ubyte"
            };

            for (const auto& candidate : candidates) {
                if (!std::filesystem::exists(candidate)) {
                    continue;
                }

                const bool has_all_files = std::all_of(required_files.begin(), required_files.end(), [&](const char* file) {
                    return std::filesystem::exists(candidate / file);
                });

                if (has_all_files) {
                    return candidate;
                }
            }

            throw std::runtime_error("Unable to locate MNIST dataset in the provided root: " + root);
        }

        inline std::uint32_t read_big_endian_u32(std::ifstream& file, const std::filesystem::path& file_path, const char* context) {
            std::array<std::uint8_t, 4> buffer{};
            if (!file.read(reinterpret_cast<char*>(buffer.data()), 4)) {
                throw std::runtime_error("Failed to read " + std::string(context) + " from " + file_path.string());
            }

            return (static_cast<std::uint32_t>(buffer[0]) << 24U) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16U) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8U) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        // IDX3 image file -> (N, 1, rows, cols) uint8.
        inline torch::Tensor read_idx_images(const std::filesystem::path& file_path) {
            std::ifstream file(file_path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open IDX image file: " + file_path.string());
            }

            const auto magic = read_big_endian_u32(file, file_path, "magic number");
            if (magic != 2051) {
                throw std::runtime_error("Unexpected IDX image file magic number in " + file_path.string());
            }

            const auto count = static_cast<std::int64_t>(read_big_endian_u32(file, file_path, "image count"));
            const auto rows = static_cast<std::int64_t>(read_big_endian_u32(file, file_path, "rows"));
            const auto cols = static_cast<std::int64_t>(read_big_endian_u32(file, file_path, "columns"));

            if (rows == 0 || cols == 0) {
                throw std::runtime_error("IDX image dimensions must be positive in file: " + file_path.string());
            }

            const auto expected_size = static_cast<std::size_t>(count * rows * cols);
            auto tensor = torch::empty({count, 1, rows, cols}, torch::kUInt8);
            if (!file.read(reinterpret_cast<char*>(tensor.data_ptr<std::uint8_t>()), static_cast<std::streamsize>(expected_size))) {
                throw std::runtime_error("Failed to read IDX image payload from: " + file_path.string());
            }

            if (static_cast<std::size_t>(file.gcount()) != expected_size) {
                throw std::runtime_error("IDX image file truncated: " + file_path.string());
            }
            return tensor;
        }

        inline torch::Tensor apply_fraction(torch::Tensor tensor, float fraction) {
            const auto total = static_cast<std::size_t>(tensor.size(0));
            const auto count = std::clamp<std::size_t>(
                static_cast<std::size_t>(std::round(std::max(fraction, 0.0f) * static_cast<float>(total))), 0, total);
            if (count == total) {
                return tensor;
            }
            return tensor.narrow(0, 0, static_cast<std::int64_t>(count)).clone();
        }
    }

    // (train, test) as discrete (N, 1, 28, 28) kInt32 tensors with values in [0, 255].
    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor>
    MNIST(const std::string& root, float train_fraction = 1.0f, float test_fraction = 1.0f) {
        const auto dataset_root = Details::resolve_mnist_root(root);

        auto train = Details::read_idx_images(dataset_root / "train-images-idx3-ubyte");
        auto test = Details::read_idx_images(dataset_root / "t10k-images-idx3-ubyte");

        train = Details::apply_fraction(std::move(train), train_fraction);
        test = Details::apply_fraction(std::move(test), test_fraction);

        return {train.to(torch::kInt32), test.to(torch::kInt32)};
    }
}

#endif // REFLUO_DATA_LOAD_HPP
