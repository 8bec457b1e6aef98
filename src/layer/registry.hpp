#ifndef REFLUO_LAYER_REGISTRY_HPP
#define REFLUO_LAYER_REGISTRY_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <torch/torch.h>

#include "../common/state.hpp"

namespace Refluo::Layer::Details {
    template <class Impl>
    [[nodiscard]] inline std::shared_ptr<torch::nn::Module>
    to_shared_module_ptr(const torch::nn::ModuleHolder<Impl>& holder)
    {
        static_assert(std::is_base_of_v<torch::nn::Module, Impl>, "ModuleHolder implementation must derive from torch::nn::Module.");
        return std::static_pointer_cast<torch::nn::Module>(holder.ptr());
    }

    // Type-erased handle on one pipeline stage. Every concrete layer exposes
    // `FlowState forward(FlowState, Direction)`; the binding dispatches to it
    // without the pipeline knowing the concrete type.
    struct RegisteredLayer {
        struct FlowBinding {
            using Invoker = FlowState (*)(void*, FlowState, Direction);

            Invoker invoke{nullptr};
            void* context{nullptr};

            [[nodiscard]] explicit operator bool() const noexcept { return invoke != nullptr; }

            FlowState operator()(FlowState state, Direction direction) const
            {
                if (!invoke) {
                    throw std::logic_error("Attempted to invoke an empty flow binding.");
                }
                return invoke(context, std::move(state), direction);
            }
        };

        template <class Module>
        void bind_module(Module* module)
        {
            apply = FlowBinding{&dispatch_module<Module>, module};
        }

        FlowBinding apply{};
        std::shared_ptr<torch::nn::Module> module{};
        std::string name{};

    private:
        template <class Module>
        static FlowState dispatch_module(void* context, FlowState state, Direction direction)
        {
            auto* module = static_cast<Module*>(context);
            return module->forward(std::move(state), direction);
        }
    };
}

#endif // REFLUO_LAYER_REGISTRY_HPP
