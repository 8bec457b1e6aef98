#ifndef REFLUO_COMMON_STATE_HPP
#define REFLUO_COMMON_STATE_HPP

#include <cstdint>
#include <utility>

#include <torch/torch.h>

namespace Refluo {
    enum class Direction {
        Forward, // data -> latent, density evaluation
        Reverse, // latent -> data, sampling
    };

    // Value threaded through every layer: the tensor being transformed and the
    // per-sample log-det-Jacobian accumulated so far (shape: [batch]).
    struct FlowState {
        torch::Tensor z{};
        torch::Tensor ldj{};
    };

    [[nodiscard]] inline FlowState make_state(torch::Tensor z)
    {
        auto ldj = torch::zeros({z.size(0)}, torch::TensorOptions().dtype(torch::kFloat32).device(z.device()));
        return {std::move(z), std::move(ldj)};
    }

    // Sums every non-batch dimension.
    [[nodiscard]] inline torch::Tensor sum_except_batch(const torch::Tensor& tensor)
    {
        return tensor.flatten(1).sum(1);
    }

    [[nodiscard]] inline std::int64_t dimensions_per_sample(const torch::Tensor& tensor)
    {
        std::int64_t count{1};
        for (std::int64_t dim = 1; dim < tensor.dim(); ++dim) {
            count *= tensor.size(dim);
        }
        return count;
    }
}

#endif // REFLUO_COMMON_STATE_HPP
