#ifndef REFLUO_LRSCHEDULER_STEPDECAY_HPP
#define REFLUO_LRSCHEDULER_STEPDECAY_HPP
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"

namespace Refluo::LrScheduler::Details {
    // lr = base_lr * gamma^(floor(step / step_size)), stepped once per epoch.
    struct StepDecayOptions {
        std::size_t step_size{1};
        double gamma{0.98};
    };

    struct StepDecayDescriptor {
        StepDecayOptions options{};
    };

    class StepDecayScheduler final : public Scheduler {
    public:
        StepDecayScheduler(torch::optim::Optimizer& optimizer, StepDecayOptions options)
            : optimizer_(optimizer),
              options_(std::move(options)),
              base_lrs_(capture_base_lrs(optimizer)),
              step_count_(0) {
            if (options_.step_size == 0) {
                throw std::invalid_argument("StepDecayScheduler requires step_size to be greater than zero.");
            }
            if (!(options_.gamma > 0.0)) {
                throw std::invalid_argument("StepDecayScheduler gamma must be positive.");
            }
        }

        void step() override {
            if (step_count_ < std::numeric_limits<std::size_t>::max()) {
                ++step_count_;
            }

            auto& param_groups = optimizer_.param_groups();
            if (base_lrs_.size() != param_groups.size()) {
                throw std::runtime_error("Optimizer param group count changed after scheduler creation.");
            }

            const auto decays = static_cast<double>(step_count_ / options_.step_size);
            for (std::size_t index = 0; index < param_groups.size(); ++index) {
                param_groups[index].options().set_lr(base_lrs_[index] * std::pow(options_.gamma, decays));
            }
        }

    private:
        static std::vector<double> capture_base_lrs(torch::optim::Optimizer& optimizer) {
            std::vector<double> base_lrs;
            base_lrs.reserve(optimizer.param_groups().size());
            for (auto& group : optimizer.param_groups()) {
                base_lrs.push_back(group.options().get_lr());
            }
            return base_lrs;
        }

        torch::optim::Optimizer& optimizer_;
        StepDecayOptions options_{};
        std::vector<double> base_lrs_{};
        std::size_t step_count_{};
    };
}

#endif // REFLUO_LRSCHEDULER_STEPDECAY_HPP
