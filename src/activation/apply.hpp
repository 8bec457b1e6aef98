#ifndef REFLUO_ACTIVATION_APPLY_HPP
#define REFLUO_ACTIVATION_APPLY_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "activation.hpp"

namespace Refluo::Activation::Details {
    inline torch::Tensor apply(::Refluo::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Refluo::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Refluo::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Refluo::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Refluo::Activation::Type::ELU:
                return torch::elu(std::move(input));
            case ::Refluo::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Refluo::Activation::Type::Identity:
            default:
                return input;
        }
    }

    inline std::string to_string(::Refluo::Activation::Type type)
    {
        switch (type) {
            case ::Refluo::Activation::Type::Identity: return "identity";
            case ::Refluo::Activation::Type::ReLU: return "relu";
            case ::Refluo::Activation::Type::GeLU: return "gelu";
            case ::Refluo::Activation::Type::SiLU: return "silu";
            case ::Refluo::Activation::Type::ELU: return "elu";
            case ::Refluo::Activation::Type::Tanh: return "tanh";
        }
        return "identity";
    }

    inline ::Refluo::Activation::Type from_string(const std::string& value)
    {
        if (value == "identity") return ::Refluo::Activation::Type::Identity;
        if (value == "relu") return ::Refluo::Activation::Type::ReLU;
        if (value == "gelu") return ::Refluo::Activation::Type::GeLU;
        if (value == "silu") return ::Refluo::Activation::Type::SiLU;
        if (value == "elu") return ::Refluo::Activation::Type::ELU;
        if (value == "tanh") return ::Refluo::Activation::Type::Tanh;
        throw std::invalid_argument("Unknown activation type '" + value + "'.");
    }
}
#endif // REFLUO_ACTIVATION_APPLY_HPP
