#ifndef REFLUO_OPTIMIZER_ADAM_HPP
#define REFLUO_OPTIMIZER_ADAM_HPP
// "Adam: A Method for Stochastic Optimization" https://arxiv.org/pdf/1412.6980
#include <tuple>

#include <torch/torch.h>

namespace Refluo::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }
}

#endif // REFLUO_OPTIMIZER_ADAM_HPP
