#ifndef REFLUO_DATA_MANIPULATION_HPP
#define REFLUO_DATA_MANIPULATION_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Refluo::Data::Manipulation {
    // Random partition along dim 0 into (first_count, rest). Uses the default generator.
    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor> RandomSplit(const torch::Tensor& samples, std::int64_t first_count) {
        if (!samples.defined() || samples.dim() == 0) {
            throw std::invalid_argument("RandomSplit requires a defined, batched tensor.");
        }
        const auto total = samples.size(0);
        if (first_count < 0 || first_count > total) {
            throw std::invalid_argument("RandomSplit first_count " + std::to_string(first_count)
                                        + " is outside [0, " + std::to_string(total) + "].");
        }

        const auto order = torch::randperm(total, torch::TensorOptions().dtype(torch::kLong).device(samples.device()));
        return {samples.index_select(0, order.narrow(0, 0, first_count)),
                samples.index_select(0, order.narrow(0, first_count, total - first_count))};
    }
}

#endif // REFLUO_DATA_MANIPULATION_HPP
