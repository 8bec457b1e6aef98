#ifndef REFLUO_COMMON_SAVE_LOAD_HPP
#define REFLUO_COMMON_SAVE_LOAD_HPP
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"
#include "../layer/layer.hpp"
#include "../mask/mask.hpp"
#include "../network/network.hpp"

namespace Refluo::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    struct NamedLayerDescriptor {
        Layer::Descriptor descriptor{};
        std::string name{};

        NamedLayerDescriptor() = default;

        NamedLayerDescriptor(Layer::Descriptor descriptor, std::string name = {})
            : descriptor(std::move(descriptor)), name(std::move(name))
        {}
    };

    namespace Detail {
        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing boolean field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline const PropertyTree& get_child(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                throw std::runtime_error("Missing section '" + key + "' in " + context);
            }
            return *child;
        }

        inline std::string mask_type_to_string(Mask::Type type)
        {
            switch (type) {
                case Mask::Type::Checkerboard: return "checkerboard";
                case Mask::Type::Channel: return "channel";
            }
            return "checkerboard";
        }

        inline Mask::Type mask_type_from_string(const std::string& value, const std::string& context)
        {
            if (value == "checkerboard") return Mask::Type::Checkerboard;
            if (value == "channel") return Mask::Type::Channel;
            throw std::runtime_error("Unknown mask type '" + value + "' in " + context);
        }

        inline std::string noise_to_string(Layer::DequantizationNoise noise)
        {
            switch (noise) {
                case Layer::DequantizationNoise::Uniform: return "uniform";
                case Layer::DequantizationNoise::Midpoint: return "midpoint";
            }
            return "uniform";
        }

        inline Layer::DequantizationNoise noise_from_string(const std::string& value, const std::string& context)
        {
            if (value == "uniform") return Layer::DequantizationNoise::Uniform;
            if (value == "midpoint") return Layer::DequantizationNoise::Midpoint;
            throw std::runtime_error("Unknown dequantization noise '" + value + "' in " + context);
        }

        inline std::string form_to_string(Layer::InvertibleConvForm form)
        {
            return form == Layer::InvertibleConvForm::LU ? "lu" : "direct";
        }

        inline Layer::InvertibleConvForm form_from_string(const std::string& value, const std::string& context)
        {
            if (value == "lu") return Layer::InvertibleConvForm::LU;
            if (value == "direct") return Layer::InvertibleConvForm::Direct;
            throw std::runtime_error("Unknown invertible convolution form '" + value + "' in " + context);
        }

        inline PropertyTree serialize_mask(const Mask::Descriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", mask_type_to_string(descriptor.type));
            tree.put("height", descriptor.height);
            tree.put("width", descriptor.width);
            tree.put("channels", descriptor.channels);
            tree.put("invert", descriptor.invert);
            return tree;
        }

        inline Mask::Descriptor deserialize_mask(const PropertyTree& tree, const std::string& context)
        {
            Mask::Descriptor descriptor{};
            descriptor.type = mask_type_from_string(get_string(tree, "type", context), context);
            descriptor.height = get_numeric<std::int64_t>(tree, "height", context);
            descriptor.width = get_numeric<std::int64_t>(tree, "width", context);
            descriptor.channels = get_numeric<std::int64_t>(tree, "channels", context);
            descriptor.invert = get_boolean(tree, "invert", context);
            return descriptor;
        }

        inline PropertyTree serialize_network(const Network::Descriptor& descriptor)
        {
            PropertyTree tree;
            std::visit(
                [&](const auto& concrete) {
                    using DescriptorType = std::decay_t<decltype(concrete)>;
                    if constexpr (std::is_same_v<DescriptorType, Network::ConvNetDescriptor>) {
                        tree.put("type", "conv_net");
                        tree.put("options.in_channels", concrete.options.in_channels);
                        tree.put("options.hidden_channels", concrete.options.hidden_channels);
                        tree.put("options.out_channels", concrete.options.out_channels);
                        tree.put("options.activation", Activation::Details::to_string(concrete.options.activation.type));
                    } else if constexpr (std::is_same_v<DescriptorType, Network::GatedConvNetDescriptor>) {
                        tree.put("type", "gated_conv_net");
                        tree.put("options.in_channels", concrete.options.in_channels);
                        tree.put("options.height", concrete.options.height);
                        tree.put("options.width", concrete.options.width);
                        tree.put("options.hidden_channels", concrete.options.hidden_channels);
                        tree.put("options.out_channels", concrete.options.out_channels);
                        tree.put("options.layers", concrete.options.layers);
                    } else {
                        static_assert(sizeof(DescriptorType) == 0, "Unsupported network descriptor provided to serialize_network.");
                    }
                },
                descriptor);
            return tree;
        }

        inline Network::Descriptor deserialize_network(const PropertyTree& tree, const std::string& context)
        {
            const auto type = get_string(tree, "type", context);
            if (type == "conv_net") {
                Network::ConvNetOptions options{};
                options.in_channels = get_numeric<std::int64_t>(tree, "options.in_channels", context);
                options.hidden_channels = get_numeric<std::int64_t>(tree, "options.hidden_channels", context);
                options.out_channels = get_numeric<std::int64_t>(tree, "options.out_channels", context);
                options.activation = {Activation::Details::from_string(get_string(tree, "options.activation", context))};
                return Network::ConvNet(options);
            }
            if (type == "gated_conv_net") {
                Network::GatedConvNetOptions options{};
                options.in_channels = get_numeric<std::int64_t>(tree, "options.in_channels", context);
                options.height = get_numeric<std::int64_t>(tree, "options.height", context);
                options.width = get_numeric<std::int64_t>(tree, "options.width", context);
                options.hidden_channels = get_numeric<std::int64_t>(tree, "options.hidden_channels", context);
                options.out_channels = get_numeric<std::int64_t>(tree, "options.out_channels", context);
                options.layers = get_numeric<std::int64_t>(tree, "options.layers", context);
                return Network::GatedConvNet(options);
            }
            throw std::runtime_error("Unknown network type '" + type + "' in " + context);
        }

        inline PropertyTree serialize_coupling(const Layer::CouplingDescriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", "coupling");
            tree.put("options.in_channels", descriptor.options.in_channels);
            tree.add_child("options.mask", serialize_mask(descriptor.options.mask));
            tree.add_child("options.network", serialize_network(descriptor.options.network));
            return tree;
        }

        inline Layer::CouplingDescriptor deserialize_coupling(const PropertyTree& tree, const std::string& context)
        {
            Layer::CouplingOptions options{};
            options.in_channels = get_numeric<std::int64_t>(tree, "options.in_channels", context);
            options.mask = deserialize_mask(get_child(tree, "options.mask", context), context + ".mask");
            options.network = deserialize_network(get_child(tree, "options.network", context), context + ".network");
            return Layer::Coupling(std::move(options));
        }

        inline void serialize_dequantization_options(PropertyTree& tree, const Layer::DequantizationOptions& options)
        {
            tree.put("options.alpha", options.alpha);
            tree.put("options.levels", options.levels);
            tree.put("options.noise", noise_to_string(options.noise));
        }

        inline Layer::DequantizationOptions deserialize_dequantization_options(const PropertyTree& tree, const std::string& context)
        {
            Layer::DequantizationOptions options{};
            options.alpha = get_numeric<double>(tree, "options.alpha", context);
            options.levels = get_numeric<std::int64_t>(tree, "options.levels", context);
            options.noise = noise_from_string(get_string(tree, "options.noise", context), context);
            return options;
        }
    }

    inline PropertyTree serialize_layer_descriptor(const Layer::Descriptor& descriptor)
    {
        PropertyTree tree;
        std::visit(
            [&](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<DescriptorType, Layer::CouplingDescriptor>) {
                    tree = Detail::serialize_coupling(concrete);
                } else if constexpr (std::is_same_v<DescriptorType, Layer::DequantizationDescriptor>) {
                    tree.put("type", "dequantization");
                    Detail::serialize_dequantization_options(tree, concrete.options);
                } else if constexpr (std::is_same_v<DescriptorType, Layer::VariationalDequantizationDescriptor>) {
                    tree.put("type", "variational_dequantization");
                    Detail::serialize_dequantization_options(tree, concrete.options);
                    PropertyTree flows;
                    for (const auto& flow : concrete.flows) {
                        flows.push_back({"", Detail::serialize_coupling(flow)});
                    }
                    tree.add_child("flows", flows);
                } else if constexpr (std::is_same_v<DescriptorType, Layer::SqueezeDescriptor>) {
                    tree.put("type", "squeeze");
                } else if constexpr (std::is_same_v<DescriptorType, Layer::SplitDescriptor>) {
                    tree.put("type", "split");
                } else if constexpr (std::is_same_v<DescriptorType, Layer::InvertibleConvDescriptor>) {
                    tree.put("type", "invertible_conv");
                    tree.put("options.channels", concrete.options.channels);
                    tree.put("options.form", Detail::form_to_string(concrete.options.form));
                } else {
                    static_assert(sizeof(DescriptorType) == 0, "Unsupported layer descriptor provided to serialize_layer_descriptor.");
                }
            },
            descriptor);
        return tree;
    }

    inline Layer::Descriptor deserialize_layer_descriptor(const PropertyTree& tree, const std::string& context)
    {
        const auto type = Detail::get_string(tree, "type", context);
        if (type == "coupling") {
            return Detail::deserialize_coupling(tree, context);
        }
        if (type == "dequantization") {
            return Layer::Dequantization(Detail::deserialize_dequantization_options(tree, context));
        }
        if (type == "variational_dequantization") {
            std::vector<Layer::CouplingDescriptor> flows;
            std::size_t index{0};
            for (const auto& child : Detail::get_child(tree, "flows", context)) {
                flows.push_back(Detail::deserialize_coupling(child.second, context + ".flows[" + std::to_string(index++) + "]"));
            }
            return Layer::VariationalDequantization(std::move(flows), Detail::deserialize_dequantization_options(tree, context));
        }
        if (type == "squeeze") {
            return Layer::Squeeze();
        }
        if (type == "split") {
            return Layer::Split();
        }
        if (type == "invertible_conv") {
            Layer::InvertibleConvOptions options{};
            options.channels = Detail::get_numeric<std::int64_t>(tree, "options.channels", context);
            options.form = Detail::form_from_string(Detail::get_string(tree, "options.form", context), context);
            return Layer::InvertibleConv(options);
        }
        throw std::runtime_error("Unknown layer type '" + type + "' in " + context);
    }

    inline PropertyTree serialize_layer_list(const std::vector<NamedLayerDescriptor>& layers)
    {
        PropertyTree list;
        for (const auto& layer : layers) {
            auto node = serialize_layer_descriptor(layer.descriptor);
            if (!layer.name.empty()) {
                node.put("name", layer.name);
            }
            list.push_back({"", std::move(node)});
        }
        return list;
    }

    inline std::vector<NamedLayerDescriptor> deserialize_layer_list(const PropertyTree& tree, const std::string& context)
    {
        std::vector<NamedLayerDescriptor> layers;
        layers.reserve(tree.size());
        std::size_t index{0};
        for (const auto& child : tree) {
            const auto layer_context = context + "[" + std::to_string(index++) + "]";
            layers.emplace_back(deserialize_layer_descriptor(child.second, layer_context),
                                child.second.get<std::string>("name", ""));
        }
        return layers;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }
}
#endif // REFLUO_COMMON_SAVE_LOAD_HPP
