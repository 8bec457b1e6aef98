#include <cmath>

#include <torch/torch.h>

#include "../include/Refluo.h"
#include "common.hpp"

using namespace Refluo::Test;
using Refluo::Direction;
using Refluo::Layer::InvertibleConvForm;

int main() {
    torch::manual_seed(3);

    {
        auto mixing = Refluo::Layer::Details::InvertibleConvLU(Refluo::Layer::InvertibleConvOptions{.channels = 4, .form = InvertibleConvForm::LU});
        const auto initial = mixing->weight().detach();
        expect_all_close(torch::matmul(initial, initial.transpose(0, 1)), torch::eye(4), 1e-5,
                         "LU factors reconstruct an orthogonal initial weight");
        expect_close(mixing->log_abs_det().item<double>(), 0.0, 1e-5, "orthogonal init has zero log|det|");

        {
            torch::NoGradGuard guard;
            for (auto& parameter : mixing->parameters()) {
                parameter.add_(0.2 * torch::randn_like(parameter));
            }
        }

        const auto weight = mixing->weight().detach();
        const auto slogdet = std::get<1>(torch::linalg_slogdet(weight.to(torch::kFloat64))).item<double>();
        expect_close(mixing->log_s().sum().item<double>(), slogdet, 1e-4, "log_s sums to log|det W|");

        const auto z = torch::randn({2, 4, 3, 5});
        const auto forward = mixing->forward(Refluo::make_state(z), Direction::Forward);
        expect_close(forward.ldj[0].item<double>(), slogdet * 15.0, 1e-3,
                     "LU ldj equals log|det W| times the spatial size");
        expect_all_close(forward.ldj, forward.ldj[0].expand({2}), 1e-6, "ldj is the same for every sample");

        const auto reverse = mixing->forward(forward, Direction::Reverse);
        expect_all_close(reverse.z, z, 1e-4, "LU mixing round-trips");
        expect_all_close(reverse.ldj, torch::zeros({2}), 1e-3, "LU round trip restores ldj");
    }

    {
        auto mixing = Refluo::Layer::Details::InvertibleConv(Refluo::Layer::InvertibleConvOptions{.channels = 3, .form = InvertibleConvForm::Direct});
        const auto initial = mixing->weight().detach().clone();
        expect_all_close(torch::matmul(initial, initial.transpose(0, 1)), torch::eye(3), 1e-5,
                         "direct weight starts orthogonal");

        {
            torch::NoGradGuard guard;
            mixing->weight().add_(0.2 * torch::randn_like(mixing->weight()));
        }

        const auto weight = mixing->weight().detach();
        const auto slogdet = std::get<1>(torch::linalg_slogdet(weight.to(torch::kFloat64))).item<double>();
        expect(std::abs(slogdet) > 1e-3, "perturbed direct weight is no longer volume preserving");

        const auto z = torch::randn({2, 3, 4, 4});
        const auto forward = mixing->forward(Refluo::make_state(z), Direction::Forward);
        const auto expected = torch::einsum("oc,bchw->bohw", {weight, z});
        expect_all_close(forward.z, expected, 1e-5, "forward is a per-pixel matrix product over channels");
        expect_all_close(forward.ldj, torch::full({2}, slogdet * 16.0), 1e-3,
                         "direct ldj equals log|det W| times the spatial size");

        const auto reverse = mixing->forward(forward, Direction::Reverse);
        expect_all_close(reverse.z, z, 1e-4, "direct mixing round-trips");
        expect_all_close(reverse.ldj, torch::zeros({2}), 1e-3, "direct round trip restores ldj");
    }

    expect_throws<std::invalid_argument>([] {
        (void)Refluo::Layer::Details::InvertibleConvLU(Refluo::Layer::InvertibleConvOptions{.channels = 0});
    }, "zero channels are rejected");

    {
        auto mixing = Refluo::Layer::Details::InvertibleConvLU(Refluo::Layer::InvertibleConvOptions{.channels = 4});
        expect_throws<c10::Error>([&] {
            (void)mixing->forward(Refluo::make_state(torch::randn({1, 2, 3, 3})), Direction::Forward);
        }, "channel mismatch is rejected");
    }

    return report("invertible_conv");
}
