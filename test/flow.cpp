#include <cmath>
#include <vector>

#include <torch/torch.h>

#include "../include/Refluo.h"
#include "common.hpp"

using namespace Refluo::Test;

namespace {
    // Deterministic dequantization so repeated passes agree exactly.
    std::vector<Refluo::Layer::Descriptor> simple_layers() {
        return Refluo::Architecture::SimpleFlow({
            .hidden_channels = 16,
            .variational = false,
            .dequantization = {.noise = Refluo::Layer::DequantizationNoise::Midpoint}});
    }
}

int main() {
    Refluo::Core::set_seed(42);

    {
        Refluo::Flow empty;
        expect_throws<std::logic_error>([&] { (void)empty.sample({1, 1, 28, 28}); }, "sampling an empty flow is rejected");
    }

    Refluo::Flow flow("simple");
    flow.add(simple_layers());
    expect(flow.size() == 9, "simple flow is dequantization plus eight couplings");
    expect(flow.descriptors().size() == 9, "every added layer keeps its descriptor");

    const auto images = torch::randint(0, 256, {6, 1, 28, 28}, torch::kInt32);

    {
        const auto bpd = flow.log_likelihood(images);
        expect(bpd.sizes() == torch::IntArrayRef({6}), "one bits-per-dimension value per image");
        expect(torch::isfinite(bpd).all().item<bool>(), "bits per dimension are finite");
        expect((bpd > 0).all().item<bool>(), "bits per dimension are positive");

        const auto nll = flow.negative_log_likelihood(images);
        expect_all_close(bpd, nll * (1.0 / std::log(2.0)) / 784.0, 1e-4, "bpd is nll in bits over the pixel count");

        const auto permutation = torch::randperm(6, torch::kLong);
        const auto permuted = flow.log_likelihood(images.index_select(0, permutation));
        expect_all_close(permuted, bpd.index_select(0, permutation), 1e-4, "per-image likelihood ignores batch order");
    }

    {
        const auto state = flow.encode(images);
        expect(state.z.sizes() == images.sizes(), "encode keeps the image shape for a single-scale flow");
        const auto decoded = flow.decode(state);
        expect(decoded.scalar_type() == torch::kInt32, "decode returns integer pixels");
        expect((decoded - images).abs().max().item<int>() <= 1, "encode then decode recovers the images up to one level");
    }

    {
        const auto samples = flow.sample({4, 1, 28, 28});
        expect(samples.sizes() == torch::IntArrayRef({4, 1, 28, 28}), "samples have the requested shape");
        expect(samples.scalar_type() == torch::kInt32, "samples are integer pixels");
        expect(samples.min().item<int>() >= 0 && samples.max().item<int>() <= 255, "samples stay within [0, 255]");
        expect(!samples.requires_grad(), "sampling records no graph");
    }

    {
        const auto weighted = flow.evaluate(images, 4);
        expect(weighted.sizes() == torch::IntArrayRef({6}), "evaluate returns one value per image");
        // Midpoint noise is deterministic, so every importance sample agrees.
        expect_all_close(weighted, flow.log_likelihood(images).detach(), 1e-4, "importance weighting of identical samples is a no-op");
        expect(flow.is_training(), "evaluate restores the training flag");
        expect_throws<std::invalid_argument>([&] { (void)flow.evaluate(images, 0); }, "zero importance samples are rejected");

        expect_throws<c10::Error>([&] { (void)flow.evaluate(torch::randint(0, 256, {2, 1, 28}, torch::kInt32), 2); },
                                  "malformed images are rejected");
        expect(flow.is_training(), "a failed evaluate still restores the training flag");
    }

    {
        Refluo::Flow multiscale("multiscale");
        multiscale.add(Refluo::Architecture::MultiScaleFlow({
            .variational_layers = 1,
            .first_scale_hidden = 8,
            .second_scale_hidden = 8,
            .third_scale_hidden = 8}));

        const auto batch = torch::randint(0, 256, {2, 1, 28, 28}, torch::kInt32);
        const auto state = multiscale.encode(batch);
        expect(state.z.sizes() == torch::IntArrayRef({2, 8, 7, 7}), "multi-scale latent is (B, 8, H/4, W/4)");

        const auto bpd = multiscale.log_likelihood(batch);
        expect(torch::isfinite(bpd).all().item<bool>(), "multi-scale bits per dimension are finite");

        const auto samples = multiscale.sample({2, 8, 7, 7});
        expect(samples.sizes() == torch::IntArrayRef({2, 1, 28, 28}), "multi-scale samples decode to full-size images");
        expect(samples.min().item<int>() >= 0 && samples.max().item<int>() <= 255, "multi-scale samples stay in range");
    }

    {
        Refluo::Flow gated("gated");
        gated.add(Refluo::Architecture::MultiScaleFlow({
            .variational = false,
            .invertible_conv = false,
            .form = Refluo::Layer::InvertibleConvForm::Direct,
            .first_scale_layers = 1,
            .second_scale_layers = 1,
            .third_scale_layers = 1,
            .first_scale_hidden = 8,
            .second_scale_hidden = 8,
            .third_scale_hidden = 8,
            .approximator = Refluo::Architecture::Approximator::Gated}));
        const auto bpd = gated.log_likelihood(torch::randint(0, 256, {2, 1, 28, 28}, torch::kInt32));
        expect(torch::isfinite(bpd).all().item<bool>(), "gated multi-scale flow evaluates");
    }

    {
        Refluo::Flow named;
        named.add(Refluo::Layer::Squeeze(), "squeeze");
        expect_throws<std::invalid_argument>([&] { named.add(Refluo::Layer::Squeeze(), "squeeze"); },
                                             "duplicate layer names are rejected");
    }

    expect_throws<std::invalid_argument>([] {
        (void)Refluo::Architecture::MultiScaleFlow({.height = 30, .width = 28});
    }, "multi-scale flow needs dimensions divisible by four");

    return report("flow");
}
