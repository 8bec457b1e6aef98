#ifndef REFLUO_CORE_HPP
#define REFLUO_CORE_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "common/save_load.hpp"
#include "common/state.hpp"
#include "layer/layer.hpp"
#include "prior/prior.hpp"

namespace Refluo {
    namespace Core {
        inline void set_seed(std::uint64_t seed)
        {
            torch::manual_seed(seed);
            if (torch::cuda::is_available()) {
                torch::cuda::manual_seed_all(seed);
            }
        }

        inline constexpr std::int64_t kDefaultImportanceSamples = 8;
    }

    // Ordered pipeline of invertible layers over a standard normal prior.
    // Forward maps images to latents; Reverse maps latents back to images.
    class Flow : public torch::nn::Module {
    public:
        using LayerDescriptor = Layer::Descriptor;
        using NamedLayerDescriptor = Common::SaveLoad::NamedLayerDescriptor;

        explicit Flow(std::string_view name = {}) : name_(name) {}

        void add(LayerDescriptor descriptor, std::string name = {})
        {
            if (!name.empty()) {
                for (const auto& layer : layers_) {
                    if (layer.name == name) {
                        throw std::invalid_argument("Layer name '" + name + "' is already registered.");
                    }
                }
            }

            LayerDescriptor preserved_descriptor = descriptor;
            auto registered = std::visit(
                [&](const auto& concrete_descriptor) {
                    return Layer::Details::build_registered_layer(*this, concrete_descriptor, next_layer_index());
                },
                descriptor);
            registered.name = name;
            registered.module->to(device_);

            layers_.push_back(std::move(registered));
            descriptors_.emplace_back(std::move(preserved_descriptor), std::move(name));
        }

        void add(std::vector<LayerDescriptor> descriptors)
        {
            for (auto& descriptor : descriptors) {
                add(std::move(descriptor));
            }
        }

        Flow& to_device(bool use_cuda = true)
        {
            if (use_cuda) {
                if (!torch::cuda::is_available()) {
                    throw std::runtime_error("CUDA device requested but is unavailable.");
                }
                device_ = torch::Device(torch::kCUDA, /*index=*/0);
            } else {
                device_ = torch::Device(torch::kCPU, /*index=*/0);
            }

            this->to(device_);
            return *this;
        }

        [[nodiscard]] const torch::Device& device() const noexcept { return device_; }
        [[nodiscard]] const Prior::Handle& prior() const noexcept { return prior_; }
        [[nodiscard]] const std::vector<NamedLayerDescriptor>& descriptors() const noexcept { return descriptors_; }
        [[nodiscard]] std::size_t size() const noexcept { return layers_.size(); }
        [[nodiscard]] bool empty() const noexcept { return layers_.empty(); }

        void set_model_name(std::string name) { model_name_ = std::move(name); }

        [[nodiscard]] std::string model_name() const
        {
            if (model_name_.empty()) {
                return name_.empty() ? std::string("flow") : name_;
            }
            return model_name_;
        }

        // Images -> (latent, log|det J|).
        [[nodiscard]] FlowState encode(const torch::Tensor& images)
        {
            TORCH_CHECK(images.defined() && images.dim() == 4, "Flow expects (B, C, H, W) images, got ", images.sizes());
            auto state = make_state(images.to(device_));
            for (auto& layer : layers_) {
                state = layer.apply(std::move(state), Direction::Forward);
            }
            return state;
        }

        [[nodiscard]] torch::Tensor decode(FlowState state)
        {
            for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
                state = it->apply(std::move(state), Direction::Reverse);
            }
            return state.z;
        }

        // -log p(x) in nats, per image.
        [[nodiscard]] torch::Tensor negative_log_likelihood(const torch::Tensor& images)
        {
            auto state = encode(images);
            const auto log_pz = sum_except_batch(prior_->log_prob(state.z));
            return -(state.ldj + log_pz);
        }

        // Bits per dimension, per image.
        [[nodiscard]] torch::Tensor log_likelihood(const torch::Tensor& images)
        {
            const auto nll = negative_log_likelihood(images);
            return to_bits_per_dimension(nll, images);
        }

        [[nodiscard]] torch::Tensor sample(std::vector<std::int64_t> shape)
        {
            if (layers_.empty()) {
                throw std::logic_error("Cannot sample from a flow without layers.");
            }
            if (shape.size() != 4) {
                throw std::invalid_argument("Flow::sample expects a (B, C, H, W) latent shape.");
            }

            torch::NoGradGuard guard;
            auto z = prior_->sample(shape, torch::TensorOptions().device(device_));
            auto ldj = torch::zeros({shape.front()}, torch::TensorOptions().dtype(torch::kFloat32).device(device_));
            return decode({std::move(z), std::move(ldj)});
        }

        // Importance-weighted bits per dimension: each image is dequantised
        // `importance_samples` times and the likelihoods are averaged in
        // probability space.
        [[nodiscard]] torch::Tensor evaluate(const torch::Tensor& images,
                                             std::int64_t importance_samples = Core::kDefaultImportanceSamples)
        {
            if (importance_samples <= 0) {
                throw std::invalid_argument("Importance sampling requires at least one sample.");
            }

            torch::NoGradGuard guard;
            EvalModeGuard mode_guard(*this);

            std::vector<torch::Tensor> samples;
            samples.reserve(static_cast<std::size_t>(importance_samples));
            for (std::int64_t index = 0; index < importance_samples; ++index) {
                samples.push_back(negative_log_likelihood(images));
            }
            const auto stacked = torch::stack(samples, /*dim=*/-1);
            const auto nll = -(torch::logsumexp(-stacked, /*dim=*/-1) - std::log(static_cast<double>(importance_samples)));

            return to_bits_per_dimension(nll, images);
        }

        std::filesystem::path save(const std::filesystem::path& directory) const
        {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("Flow::save requires a non-empty directory path.");
            }

            const auto target_dir = directory / model_name();
            fs::create_directories(target_dir);

            const auto architecture_path = target_dir / "architecture.json";
            const auto parameters_path = target_dir / "parameters.binary";

            Common::SaveLoad::PropertyTree architecture;
            architecture.put("name", model_name());
            architecture.add_child("layers", Common::SaveLoad::serialize_layer_list(descriptors_));

            try {
                Common::SaveLoad::write_json_file(architecture_path, architecture);
            } catch (const std::exception& error) {
                throw std::runtime_error(std::string("Failed to write architecture description to '")
                                         + architecture_path.string() + "': " + error.what());
            }

            torch::serialize::OutputArchive archive;
            torch::nn::Module::save(archive);
            archive.save_to(parameters_path.string());
            return target_dir;
        }

        void load(const std::filesystem::path& directory)
        {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("Flow::load requires a non-empty directory path.");
            }

            const auto architecture_path = directory / "architecture.json";
            const auto parameters_path = directory / "parameters.binary";

            if (!fs::exists(architecture_path)) {
                throw std::runtime_error(std::string("Architecture file not found at '")
                                         + architecture_path.string() + "'.");
            }
            if (!fs::exists(parameters_path)) {
                throw std::runtime_error(std::string("Parameter archive not found at '")
                                         + parameters_path.string() + "'.");
            }

            Common::SaveLoad::PropertyTree architecture;
            try {
                architecture = Common::SaveLoad::read_json_file(architecture_path);
            } catch (const std::exception& error) {
                throw std::runtime_error(std::string("Failed to read architecture description from '")
                                         + architecture_path.string() + "': " + error.what());
            }

            auto layers_node = architecture.get_child_optional("layers");
            if (!layers_node) {
                throw std::runtime_error(std::string("Architecture description '") + architecture_path.string()
                                         + "' is missing the 'layers' entry.");
            }

            auto descriptors = Common::SaveLoad::deserialize_layer_list(*layers_node, "layer");

            // Everything is built and loaded into a staging flow; this flow is
            // only touched once the checkpoint has been fully validated.
            Flow staged(name_);
            staged.device_ = device_;
            staged.prior_ = prior_;
            for (auto& descriptor : descriptors) {
                staged.add(std::move(descriptor.descriptor), std::move(descriptor.name));
            }

            torch::serialize::InputArchive archive;
            try {
                archive.load_from(parameters_path.string(), device_);
            } catch (const c10::Error& error) {
                throw std::runtime_error(std::string("Failed to open parameter archive '")
                                         + parameters_path.string() + "': " + error.what());
            }

            const auto expected = staged.tensor_shapes();
            try {
                staged.torch::nn::Module::load(archive);
            } catch (const c10::Error& error) {
                throw std::runtime_error(std::string("Failed to load parameters from '")
                                         + parameters_path.string() + "': " + error.what());
            }

            // Archive tensors replace ours wholesale; reject any that changed shape.
            const auto restored = staged.tensor_shapes();
            for (const auto& [key, shape] : expected) {
                const auto it = restored.find(key);
                if (it == restored.end() || it->second != shape) {
                    throw std::runtime_error("Checkpoint tensor '" + key + "' shape mismatch: expected "
                                             + format_shape(shape) + " but found "
                                             + (it == restored.end() ? std::string("nothing") : format_shape(it->second)) + ".");
                }
            }

            adopt_layers(staged);
            if (auto name_value = architecture.get_optional<std::string>("name")) {
                model_name_ = std::move(*name_value);
            } else {
                model_name_.clear();
            }
        }

    private:
        [[nodiscard]] static torch::Tensor to_bits_per_dimension(const torch::Tensor& nll, const torch::Tensor& images)
        {
            constexpr double kLog2E = 1.44269504088896340736;
            return nll * kLog2E / static_cast<double>(dimensions_per_sample(images));
        }

        [[nodiscard]] std::size_t next_layer_index() noexcept { return layer_index_++; }

        struct EvalModeGuard {
            explicit EvalModeGuard(torch::nn::Module& module)
                : module_(module), was_training_(module.is_training())
            {
                module_.eval();
            }

            EvalModeGuard(const EvalModeGuard&) = delete;
            EvalModeGuard& operator=(const EvalModeGuard&) = delete;

            ~EvalModeGuard() { module_.train(was_training_); }

        private:
            torch::nn::Module& module_;
            bool was_training_{false};
        };

        // Takes over the staged flow's modules under their registered names.
        void adopt_layers(Flow& staged)
        {
            reset_layers();
            for (const auto& child : staged.named_children()) {
                register_module(child.key(), child.value());
            }
            layers_ = std::move(staged.layers_);
            descriptors_ = std::move(staged.descriptors_);
            layer_index_ = staged.layer_index_;
            train(is_training());
        }

        void reset_layers()
        {
            std::vector<std::string> children;
            for (const auto& child : named_children()) {
                children.push_back(child.key());
            }
            for (const auto& key : children) {
                unregister_module(key);
            }
            layers_.clear();
            descriptors_.clear();
            layer_index_ = 0;
        }

        [[nodiscard]] std::map<std::string, std::vector<std::int64_t>> tensor_shapes() const
        {
            std::map<std::string, std::vector<std::int64_t>> shapes;
            for (const auto& item : named_parameters(/*recurse=*/true)) {
                shapes.emplace(item.key(), item.value().sizes().vec());
            }
            for (const auto& item : named_buffers(/*recurse=*/true)) {
                if (item.value().defined()) {
                    shapes.emplace(item.key(), item.value().sizes().vec());
                }
            }
            return shapes;
        }

        static std::string format_shape(const std::vector<std::int64_t>& sizes)
        {
            std::ostringstream stream;
            stream << '(';
            for (std::size_t index = 0; index < sizes.size(); ++index) {
                if (index > 0) {
                    stream << ", ";
                }
                stream << sizes[index];
            }
            stream << ')';
            return stream.str();
        }

        std::string name_{};
        std::string model_name_{};
        torch::Device device_{torch::kCPU, 0};
        Prior::Handle prior_{Prior::make_standard_normal()};
        std::vector<Layer::Details::RegisteredLayer> layers_{};
        std::vector<NamedLayerDescriptor> descriptors_{};
        std::size_t layer_index_{0};
    };
}

#endif // REFLUO_CORE_HPP
