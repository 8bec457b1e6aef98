#ifndef REFLUO_ACTIVATION_HPP
#define REFLUO_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Refluo::Activation {
    enum class Type {
        Identity,
        ReLU,
        GeLU,
        SiLU,
        ELU,
        Tanh,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor GeLU{Type::GeLU};
    inline constexpr Descriptor SiLU{Type::SiLU};
    inline constexpr Descriptor ELU{Type::ELU};
    inline constexpr Descriptor Tanh{Type::Tanh};
}

#endif // REFLUO_ACTIVATION_HPP
