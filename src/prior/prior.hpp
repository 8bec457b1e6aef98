#ifndef REFLUO_PRIOR_HPP
#define REFLUO_PRIOR_HPP

#include <cmath>
#include <memory>

#include <torch/torch.h>

namespace Refluo::Prior {
    // N(0, 1) applied element-wise. Stateless; shared by the pipeline and every split.
    class StandardNormal {
    public:
        [[nodiscard]] torch::Tensor log_prob(const torch::Tensor& z) const
        {
            return -0.5 * z.pow(2) - kLogSqrtTwoPi;
        }

        [[nodiscard]] torch::Tensor sample(torch::IntArrayRef shape, const torch::TensorOptions& options = {}) const
        {
            return torch::randn(shape, options.dtype(torch::kFloat32));
        }

    private:
        static constexpr double kLogSqrtTwoPi = 0.91893853320467274178; // 0.5 * log(2 * pi)
    };

    using Handle = std::shared_ptr<const StandardNormal>;

    [[nodiscard]] inline Handle make_standard_normal()
    {
        return std::make_shared<const StandardNormal>();
    }
}

#endif // REFLUO_PRIOR_HPP
