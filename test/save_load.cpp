#include <filesystem>
#include <fstream>

#include <torch/torch.h>

#include "../include/Refluo.h"
#include "common.hpp"

using namespace Refluo::Test;
namespace fs = std::filesystem;

namespace {
    std::vector<Refluo::Layer::Descriptor> small_multiscale(std::int64_t hidden) {
        return Refluo::Architecture::MultiScaleFlow({
            .variational_layers = 2,
            .first_scale_layers = 1,
            .second_scale_layers = 1,
            .third_scale_layers = 2,
            .first_scale_hidden = hidden,
            .second_scale_hidden = hidden,
            .third_scale_hidden = hidden});
    }

    void perturb(torch::nn::Module& module) {
        torch::NoGradGuard guard;
        for (auto& parameter : module.parameters()) {
            parameter.add_(0.05 * torch::randn_like(parameter));
        }
    }
}

int main() {
    Refluo::Core::set_seed(17);
    const auto root = fs::temp_directory_path() / "refluo_save_load";
    fs::remove_all(root);

    Refluo::Flow flow("checkpoint");
    flow.add(small_multiscale(8));
    perturb(flow);

    const auto target = flow.save(root);
    expect(target == root / "checkpoint", "save writes into <directory>/<model name>");
    expect(fs::exists(target / "architecture.json"), "architecture description is written");
    expect(fs::exists(target / "parameters.binary"), "parameter archive is written");

    const auto architecture = Refluo::Common::SaveLoad::read_json_file(target / "architecture.json");
    expect(architecture.get<std::string>("name", "") == "checkpoint", "architecture records the model name");
    expect(architecture.get_child("layers").size() == flow.size(), "architecture lists every layer");

    Refluo::Flow restored;
    restored.load(target);
    expect(restored.size() == flow.size(), "load rebuilds the same number of layers");
    expect(restored.model_name() == "checkpoint", "load restores the model name");

    {
        const auto original = flow.named_parameters(/*recurse=*/true);
        const auto loaded = restored.named_parameters(/*recurse=*/true);
        expect(original.size() == loaded.size(), "parameter count survives the round trip");
        for (const auto& item : original) {
            const auto* match = loaded.find(item.key());
            expect(match != nullptr && torch::equal(*match, item.value()), "parameter '" + item.key() + "' is restored");
        }

        const auto buffers = flow.named_buffers(/*recurse=*/true);
        const auto loaded_buffers = restored.named_buffers(/*recurse=*/true);
        for (const auto& item : buffers) {
            const auto* match = loaded_buffers.find(item.key());
            expect(match != nullptr && torch::equal(*match, item.value()), "buffer '" + item.key() + "' is restored");
        }
    }

    {
        const auto images = torch::randint(0, 256, {3, 1, 28, 28}, torch::kInt32);
        Refluo::Core::set_seed(99);
        const auto expected = flow.log_likelihood(images).detach();
        Refluo::Core::set_seed(99);
        const auto actual = restored.log_likelihood(images).detach();
        expect_all_close(actual, expected, 1e-5, "restored flow reproduces the likelihood under the same seed");
    }

    // Loading twice replaces the layers instead of appending.
    restored.load(target);
    expect(restored.size() == flow.size(), "reloading does not duplicate layers");

    {
        Refluo::Flow wider("wider");
        wider.add(small_multiscale(16));
        const auto wider_target = wider.save(root);

        const auto mismatched = root / "mismatched";
        fs::create_directories(mismatched);
        fs::copy_file(target / "architecture.json", mismatched / "architecture.json", fs::copy_options::overwrite_existing);
        fs::copy_file(wider_target / "parameters.binary", mismatched / "parameters.binary", fs::copy_options::overwrite_existing);

        Refluo::Flow broken;
        expect_throws<std::runtime_error>([&] { broken.load(mismatched); }, "parameter shape mismatch is rejected");
    }

    {
        const auto corrupt = root / "corrupt";
        fs::create_directories(corrupt);
        fs::copy_file(target / "parameters.binary", corrupt / "parameters.binary", fs::copy_options::overwrite_existing);
        std::ofstream(corrupt / "architecture.json") << R"({"name": "corrupt", "layers": [{"type": "attention"}]})";

        Refluo::Flow broken;
        expect_throws<std::runtime_error>([&] { broken.load(corrupt); }, "unknown layer type is rejected");
    }

    {
        // A checkpoint that fails to load leaves the current model untouched.
        const auto truncated = root / "truncated";
        fs::create_directories(truncated);
        fs::copy_file(target / "architecture.json", truncated / "architecture.json", fs::copy_options::overwrite_existing);
        std::ofstream(truncated / "parameters.binary", std::ios::binary) << "not an archive";

        Refluo::Flow live("live");
        live.add(Refluo::Architecture::SimpleFlow({
            .hidden_channels = 8,
            .variational = false,
            .dequantization = {.noise = Refluo::Layer::DequantizationNoise::Midpoint}}));
        perturb(live);

        const auto images = torch::randint(0, 256, {2, 1, 28, 28}, torch::kInt32);
        const auto size_before = live.size();
        const auto parameters_before = live.parameters().size();
        const auto first_before = live.parameters().front().detach().clone();
        const auto likelihood_before = live.log_likelihood(images).detach();

        expect_throws<std::runtime_error>([&] { live.load(truncated); }, "unreadable parameter archive is rejected");
        expect(live.size() == size_before, "failed load keeps the layer count");
        expect(live.parameters().size() == parameters_before, "failed load keeps the parameter list");
        expect(torch::equal(live.parameters().front(), first_before), "failed load keeps the parameter values");
        expect(live.model_name() == "live", "failed load keeps the model name");
        expect_all_close(live.log_likelihood(images).detach(), likelihood_before, 1e-6, "failed load keeps the likelihood");

        const auto mismatched_parameters = live.parameters().size();
        expect_throws<std::runtime_error>([&] { live.load(root / "mismatched"); }, "shape mismatch is rejected on a live flow");
        expect(live.parameters().size() == mismatched_parameters, "shape mismatch leaves the live flow untouched");
        expect_all_close(live.log_likelihood(images).detach(), likelihood_before, 1e-6,
                         "shape mismatch keeps the likelihood");
    }

    {
        Refluo::Flow missing;
        expect_throws<std::runtime_error>([&] { missing.load(root / "does_not_exist"); }, "missing checkpoint is rejected");
        expect_throws<std::invalid_argument>([&] { (void)flow.save(fs::path{}); }, "empty save directory is rejected");
    }

    fs::remove_all(root);
    return report("save_load");
}
