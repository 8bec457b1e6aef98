#ifndef REFLUO_TEST_COMMON_HPP
#define REFLUO_TEST_COMMON_HPP

#include <cmath>
#include <exception>
#include <iostream>
#include <string>

#include <torch/torch.h>

namespace Refluo::Test {
    inline int failures = 0;

    inline bool expect(bool condition, const std::string& message) {
        if (!condition) {
            std::cerr << "[FAIL] " << message << std::endl;
            ++failures;
        }
        return condition;
    }

    inline bool expect_close(double actual, double expected, double tolerance, const std::string& message) {
        const bool ok = std::isfinite(actual) && std::abs(actual - expected) <= tolerance;
        if (!ok) {
            std::cerr << "[FAIL] " << message << ": expected " << expected << " got " << actual
                      << " (tolerance " << tolerance << ")" << std::endl;
            ++failures;
        }
        return ok;
    }

    inline bool expect_all_close(const torch::Tensor& actual, const torch::Tensor& expected, double tolerance,
                                 const std::string& message) {
        const auto difference = (actual.to(torch::kFloat64) - expected.to(torch::kFloat64)).abs().max().item<double>();
        return expect_close(difference, 0.0, tolerance, message + " (max abs difference)");
    }

    template <class Exception, class Callable>
    bool expect_throws(Callable&& callable, const std::string& message) {
        try {
            callable();
        } catch (const Exception&) {
            return true;
        } catch (const std::exception& error) {
            std::cerr << "[FAIL] " << message << ": unexpected exception: " << error.what() << std::endl;
            ++failures;
            return false;
        }
        std::cerr << "[FAIL] " << message << ": no exception thrown" << std::endl;
        ++failures;
        return false;
    }

    inline int report(const std::string& suite) {
        if (failures == 0) {
            std::cout << "[Refluo] " << suite << ": all checks passed" << std::endl;
            return 0;
        }
        std::cerr << "[Refluo] " << suite << ": " << failures << " check(s) failed" << std::endl;
        return 1;
    }
}

#endif // REFLUO_TEST_COMMON_HPP
