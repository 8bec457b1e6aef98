#ifndef REFLUO_LAYER_DEQUANTIZATION_HPP
#define REFLUO_LAYER_DEQUANTIZATION_HPP
// "Flow++: Improving Flow-Based Generative Models with Variational Dequantization and Architecture Design" https://arxiv.org/pdf/1902.00275
#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/state.hpp"
#include "../registry.hpp"
#include "coupling.hpp"

namespace Refluo::Layer::Details {

    enum class DequantizationNoise {
        Uniform,  // u ~ U[0, 1)
        Midpoint, // u = 0.5, deterministic evaluation
    };

    struct DequantizationOptions {
        double alpha{1e-5};
        std::int64_t levels{256};
        DequantizationNoise noise{DequantizationNoise::Uniform};
    };

    struct DequantizationDescriptor {
        DequantizationOptions options{};
    };

    struct VariationalDequantizationDescriptor {
        DequantizationOptions options{};
        std::vector<CouplingDescriptor> flows{};
    };

    inline void validate(const DequantizationOptions& options)
    {
        if (!(options.alpha > 0.0 && options.alpha < 1.0)) {
            throw std::invalid_argument("Dequantization alpha must lie in (0, 1), got " + std::to_string(options.alpha) + ".");
        }
        if (options.levels < 2) {
            throw std::invalid_argument("Dequantization requires at least two quantisation levels.");
        }
    }

    namespace Detail {
        // [0, 1) -> R. Blends away from the boundary by alpha before the logit.
        inline FlowState logit(FlowState state, double alpha)
        {
            auto z = state.z * (1.0 - alpha) + 0.5 * alpha;
            state.ldj = state.ldj + std::log(1.0 - alpha) * static_cast<double>(dimensions_per_sample(z));
            state.ldj = state.ldj + sum_except_batch(-torch::log(z) - torch::log(1 - z));
            state.z = torch::log(z) - torch::log(1 - z);
            return state;
        }

        // R -> (0, 1).
        inline FlowState sigmoid(FlowState state)
        {
            state.ldj = state.ldj + sum_except_batch(-state.z - 2 * torch::softplus(-state.z));
            state.z = torch::sigmoid(state.z);
            return state;
        }
    }

    // Strategy producing the dequantisation noise u in [0, 1) for a batch of
    // (float) pixel values, adding log q(u)'s change-of-variables terms to ldj.
    class NoiseModelImpl : public torch::nn::Module {
    public:
        ~NoiseModelImpl() override = default;

        virtual FlowState sample(const torch::Tensor& pixels, torch::Tensor ldj) = 0;
    };

    class UniformNoiseImpl final : public NoiseModelImpl {
    public:
        FlowState sample(const torch::Tensor& pixels, torch::Tensor ldj) override
        {
            return {torch::rand_like(pixels), std::move(ldj)};
        }
    };

    class MidpointNoiseImpl final : public NoiseModelImpl {
    public:
        FlowState sample(const torch::Tensor& pixels, torch::Tensor ldj) override
        {
            return {torch::full_like(pixels, 0.5), std::move(ldj)};
        }
    };

    [[nodiscard]] inline std::shared_ptr<NoiseModelImpl> make_noise_model(DequantizationNoise noise)
    {
        switch (noise) {
            case DequantizationNoise::Uniform:
                return std::make_shared<UniformNoiseImpl>();
            case DequantizationNoise::Midpoint:
                return std::make_shared<MidpointNoiseImpl>();
        }
        throw std::invalid_argument("Unsupported dequantization noise.");
    }

    // Base noise (options.noise) pushed through a conditional flow of coupling
    // layers, all conditioned on the image rescaled to [-1, 1].
    class VariationalNoiseImpl final : public NoiseModelImpl {
    public:
        VariationalNoiseImpl(DequantizationOptions options, const std::vector<CouplingDescriptor>& flows)
            : options_(std::move(options)), base_(make_noise_model(options_.noise))
        {
            validate(options_);
            flows_.reserve(flows.size());
            for (std::size_t index = 0; index < flows.size(); ++index) {
                flows_.push_back(register_module("flow_" + std::to_string(index), Coupling(flows[index].options)));
            }
        }

        FlowState sample(const torch::Tensor& pixels, torch::Tensor ldj) override
        {
            const auto image = pixels / static_cast<double>(options_.levels - 1) * 2 - 1;

            auto state = Detail::logit(base_->sample(pixels, std::move(ldj)), options_.alpha);
            for (auto& flow : flows_) {
                state = flow->forward(std::move(state), Direction::Forward, image);
            }
            return Detail::sigmoid(std::move(state));
        }

        [[nodiscard]] const std::vector<Coupling>& flows() const noexcept { return flows_; }

    private:
        DequantizationOptions options_{};
        std::shared_ptr<NoiseModelImpl> base_{};
        std::vector<Coupling> flows_{};
    };

    class DequantizationImpl : public torch::nn::Module {
    public:
        DequantizationImpl(DequantizationOptions options, std::shared_ptr<NoiseModelImpl> noise)
            : options_(std::move(options))
        {
            validate(options_);
            if (!noise) {
                throw std::invalid_argument("Dequantization requires a noise model.");
            }
            noise_ = register_module("noise", std::move(noise));
        }

        FlowState forward(FlowState state, Direction direction)
        {
            if (direction == Direction::Forward) {
                state = dequantize(std::move(state));
                return Detail::logit(std::move(state), options_.alpha);
            }

            state = Detail::sigmoid(std::move(state));
            const auto levels = static_cast<double>(options_.levels);
            state.z = torch::floor(state.z * levels).clamp(0.0, levels - 1.0).to(torch::kInt32);
            return state;
        }

        [[nodiscard]] const DequantizationOptions& options() const noexcept { return options_; }

    private:
        FlowState dequantize(FlowState state)
        {
            const auto pixels = state.z.to(torch::kFloat32);
            auto noise = noise_->sample(pixels, std::move(state.ldj));

            const auto levels = static_cast<double>(options_.levels);
            state.z = (pixels + noise.z) / levels;
            state.ldj = noise.ldj - std::log(levels) * static_cast<double>(dimensions_per_sample(pixels));
            return state;
        }

        DequantizationOptions options_{};
        std::shared_ptr<NoiseModelImpl> noise_{};
    };

    TORCH_MODULE(Dequantization);

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const DequantizationDescriptor& descriptor, std::size_t index)
    {
        auto module = owner.register_module(
            "dequantization_" + std::to_string(index),
            Dequantization(descriptor.options, make_noise_model(descriptor.options.noise)));

        RegisteredLayer registered_layer{};
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module(module.get());
        return registered_layer;
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const VariationalDequantizationDescriptor& descriptor, std::size_t index)
    {
        auto noise = std::make_shared<VariationalNoiseImpl>(descriptor.options, descriptor.flows);
        auto module = owner.register_module("variational_dequantization_" + std::to_string(index),
                                            Dequantization(descriptor.options, std::move(noise)));

        RegisteredLayer registered_layer{};
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.bind_module(module.get());
        return registered_layer;
    }
}

#endif // REFLUO_LAYER_DEQUANTIZATION_HPP
