#include <cmath>
#include <memory>
#include <vector>

#include <torch/torch.h>

#include "../include/Refluo.h"
#include "common.hpp"

using namespace Refluo::Test;
using Refluo::Direction;
using Refluo::Layer::DequantizationNoise;
using Refluo::Layer::DequantizationOptions;
using Refluo::Layer::Details::Dequantization;
using Refluo::Layer::Details::make_noise_model;

int main() {
    torch::manual_seed(5);

    {
        auto layer = Dequantization(DequantizationOptions{}, make_noise_model(DequantizationNoise::Uniform));
        const auto images = torch::randint(0, 256, {4, 1, 8, 8}, torch::kInt32);
        const auto forward = layer->forward(Refluo::make_state(images), Direction::Forward);
        expect(forward.z.scalar_type() == torch::kFloat32, "forward produces a continuous latent");
        expect(torch::isfinite(forward.z).all().item<bool>(), "latent is finite");

        const auto reverse = layer->forward(forward, Direction::Reverse);
        expect(reverse.z.scalar_type() == torch::kInt32, "reverse produces integer pixels");
        expect((reverse.z - images).abs().max().item<int>() <= 1, "uniform-noise round trip is exact up to one level");
    }

    {
        const double alpha = 1e-5;
        auto layer = Dequantization(DequantizationOptions{.alpha = alpha, .noise = DequantizationNoise::Midpoint},
                                    make_noise_model(DequantizationNoise::Midpoint));
        const auto images = torch::arange(256, torch::kInt32).view({1, 1, 16, 16});
        const auto forward = layer->forward(Refluo::make_state(images), Direction::Forward);

        const auto reverse = layer->forward(forward, Direction::Reverse);
        expect(torch::equal(reverse.z, images), "every level is recovered exactly from the midpoint latent");

        const auto dimensions = 256.0;
        const auto y = ((images.to(torch::kFloat64) + 0.5) / 256.0) * (1.0 - alpha) + 0.5 * alpha;
        const auto expected_ldj = -std::log(256.0) * dimensions
                                + std::log(1.0 - alpha) * dimensions
                                + (-torch::log(y) - torch::log(1 - y)).sum().item<double>();
        expect_close(forward.ldj[0].item<double>(), expected_ldj, 1e-2, "forward ldj matches the closed form");

        const auto expected_z = torch::log(y) - torch::log(1 - y);
        expect_all_close(forward.z, expected_z, 1e-4, "latent is the logit of the blended value");

        const auto residual = (-std::log(256.0) + std::log(1.0 - alpha)) * dimensions;
        expect_close(reverse.ldj[0].item<double>(), residual, 1e-2, "round trip leaves only the scaling terms in ldj");
    }

    {
        std::vector<Refluo::Layer::CouplingDescriptor> flows;
        for (int index = 0; index < 2; ++index) {
            flows.push_back(Refluo::Layer::Coupling({
                .in_channels = 1,
                .mask = Refluo::Mask::Checkerboard(8, 8, index % 2 == 1),
                .network = Refluo::Network::ConvNet({.in_channels = 2, .hidden_channels = 8, .out_channels = 2})}));
        }
        const DequantizationOptions options{};
        auto noise = std::make_shared<Refluo::Layer::Details::VariationalNoiseImpl>(options, flows);
        auto layer = Dequantization(options, noise);
        expect(noise->flows().size() == 2, "variational noise owns its coupling flows");
        expect(layer->parameters().size() > 0, "variational dequantization is trainable");

        const auto images = torch::randint(0, 256, {3, 1, 8, 8}, torch::kInt32);
        const auto forward = layer->forward(Refluo::make_state(images), Direction::Forward);
        expect(torch::isfinite(forward.z).all().item<bool>(), "variational latent is finite");
        expect(torch::isfinite(forward.ldj).all().item<bool>(), "variational ldj is finite");

        const auto reverse = layer->forward(forward, Direction::Reverse);
        expect((reverse.z - images).abs().max().item<int>() <= 1, "variational round trip is exact up to one level");

        auto loss = forward.ldj.sum();
        loss.backward();
        bool any_gradient = false;
        for (const auto& parameter : layer->parameters()) {
            any_gradient = any_gradient || (parameter.grad().defined() && parameter.grad().abs().sum().item<double>() > 0.0);
        }
        expect(any_gradient, "gradients reach the noise flow");
    }

    {
        std::vector<Refluo::Layer::CouplingDescriptor> flows;
        for (int index = 0; index < 2; ++index) {
            flows.push_back(Refluo::Layer::Coupling({
                .in_channels = 1,
                .mask = Refluo::Mask::Checkerboard(6, 6, index % 2 == 1),
                .network = Refluo::Network::ConvNet({.in_channels = 2, .hidden_channels = 8, .out_channels = 2})}));
        }
        const DequantizationOptions options{.alpha = 1e-4, .noise = DequantizationNoise::Midpoint};
        auto noise = std::make_shared<Refluo::Layer::Details::VariationalNoiseImpl>(options, flows);
        auto layer = Dequantization(options, noise);

        const auto images = torch::randint(0, 256, {2, 1, 6, 6}, torch::kInt32);
        const auto forward = layer->forward(Refluo::make_state(images), Direction::Forward);
        const auto again = layer->forward(Refluo::make_state(images), Direction::Forward);
        expect(torch::equal(forward.z, again.z), "midpoint base noise makes variational dequantization deterministic");

        // Replay every sub-step by hand and add up the ldj terms.
        torch::NoGradGuard guard;
        namespace Detail = Refluo::Layer::Details::Detail;
        const auto pixels = images.to(torch::kFloat32);
        const auto image = pixels / 255.0 * 2 - 1;
        const auto zero = torch::zeros({2});
        const auto dimensions = 36.0;

        auto state = Detail::logit({torch::full_like(pixels, 0.5), zero}, options.alpha);
        auto total = state.ldj.clone();
        for (auto flow : noise->flows()) {
            const auto before = state.ldj.clone();
            state = flow->forward(std::move(state), Direction::Forward, image);
            const auto step = state.ldj - before;
            expect(step.abs().max().item<double>() > 0.0, "each noise coupling contributes to ldj");
            total = total + step;
        }
        const auto squashed = Detail::sigmoid({state.z, zero});
        total = total + squashed.ldj;

        total = total - std::log(256.0) * dimensions;
        const auto latent = Detail::logit({(pixels + squashed.z) / 256.0, zero}, options.alpha);
        total = total + latent.ldj;

        expect_all_close(forward.z, latent.z, 1e-4, "variational latent matches the replayed sub-steps");
        expect_all_close(forward.ldj, total, 1e-2, "variational ldj is the sum of every sub-step's ldj");
    }

    expect_throws<std::invalid_argument>([] {
        (void)Dequantization(DequantizationOptions{.alpha = 0.0}, make_noise_model(DequantizationNoise::Uniform));
    }, "alpha of zero is rejected");
    expect_throws<std::invalid_argument>([] {
        (void)Dequantization(DequantizationOptions{.alpha = 1.0}, make_noise_model(DequantizationNoise::Uniform));
    }, "alpha of one is rejected");
    expect_throws<std::invalid_argument>([] {
        (void)Dequantization(DequantizationOptions{.levels = 1}, make_noise_model(DequantizationNoise::Uniform));
    }, "a single quantisation level is rejected");
    expect_throws<std::invalid_argument>([] {
        (void)Dequantization(DequantizationOptions{}, std::shared_ptr<Refluo::Layer::Details::NoiseModelImpl>{});
    }, "missing noise model is rejected");

    return report("dequantization");
}
