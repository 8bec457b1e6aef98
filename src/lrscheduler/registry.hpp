#ifndef REFLUO_LRSCHEDULER_REGISTRY_HPP
#define REFLUO_LRSCHEDULER_REGISTRY_HPP

#include <memory>

#include <torch/torch.h>

#include "details/stepdecay.hpp"

namespace Refluo::LrScheduler::Details {
    template <class Descriptor>
    std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported scheduler descriptor provided to build_scheduler.");
        return nullptr;
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const StepDecayDescriptor& descriptor) {
        return std::make_unique<StepDecayScheduler>(optimizer, descriptor.options);
    }
}

#endif // REFLUO_LRSCHEDULER_REGISTRY_HPP
