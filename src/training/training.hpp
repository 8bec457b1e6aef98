#ifndef REFLUO_TRAINING_HPP
#define REFLUO_TRAINING_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../core.hpp"
#include "../lrscheduler/lrscheduler.hpp"
#include "../optimizer/optimizer.hpp"
#include "../utils/terminal.hpp"

namespace Refluo::Training {
    struct TrainOptions {
        std::size_t epochs{200};
        std::size_t batch_size{128};
        bool shuffle{true};
        bool drop_last{true}; // skip the trailing partial batch
        Optimizer::Descriptor optimizer{Optimizer::Adam({.learning_rate = 1e-3})};
        std::optional<LrScheduler::Descriptor> scheduler{LrScheduler::StepDecay()};
        double max_gradient_norm{1.0};
        std::int64_t importance_samples{Core::kDefaultImportanceSamples};
        std::size_t evaluation_batch_size{256};
        std::optional<std::filesystem::path> checkpoint_directory{}; // best epoch is saved here
        std::size_t sample_every{0}; // 0 disables the sample callback
        std::function<void(Flow&, std::size_t)> on_sample{};
        bool monitor{true};
        std::ostream* stream{&std::cout};
    };

    struct TrainReport {
        std::vector<double> train_bpd{};      // EMA-smoothed, end of epoch
        std::vector<double> validation_bpd{}; // importance-weighted
        std::optional<std::size_t> best_epoch{};
        double best_validation_bpd{std::numeric_limits<double>::infinity()};
        std::optional<std::filesystem::path> checkpoint{};
        std::size_t optimizer_steps{0};
    };

    namespace Detail {
        inline constexpr double kSmoothingDecay = 0.9;
        inline constexpr double kInitialSmoothedBpd = 8.0;

        inline void log_epoch(std::ostream& stream,
                              std::size_t epoch_index,
                              std::size_t total_epochs,
                              double train_bpd,
                              const std::optional<double>& validation_bpd,
                              bool improved,
                              double duration_seconds)
        {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightGreen;
            using Utils::Terminal::Colors::kBrightYellow;
            using Utils::Terminal::Colors::kReset;

            std::ostringstream line;
            line << Utils::Terminal::kPrefix;
            line << "Epoch [" << epoch_index << "/" << total_epochs << "] | ";
            line << ApplyColor("Train", kBrightYellow) << " bpd: "
                 << std::fixed << std::setprecision(4) << train_bpd << " | ";
            line << ApplyColor("Validation", kBrightBlue) << " bpd: ";
            if (validation_bpd) {
                line << std::fixed << std::setprecision(4) << *validation_bpd;
            } else {
                line << "N/A";
            }

            const std::string grey{kBrightBlack};
            const std::string green{kBrightGreen};
            const std::string reset{kReset};
            if (improved) {
                line << grey << " (" << green << Utils::Terminal::Symbols::kCheck << grey << ")" << reset;
            }

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << duration_seconds << "sec";
            line << " | " << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);

            stream << line.str() << '\n';
        }

        inline void check_images(const torch::Tensor& images, const char* what)
        {
            if (!images.defined() || images.dim() != 4 || images.size(0) == 0) {
                throw std::invalid_argument(std::string(what) + " images must be a non-empty (N, C, H, W) tensor.");
            }
        }
    }

    // Mean importance-weighted bits per dimension over a dataset.
    inline double test(Flow& flow,
                       const torch::Tensor& images,
                       std::size_t batch_size = 256,
                       std::int64_t importance_samples = Core::kDefaultImportanceSamples)
    {
        Detail::check_images(images, "Test");
        if (batch_size == 0) {
            throw std::invalid_argument("Evaluation batch size must be positive.");
        }

        const auto count = images.size(0);
        const auto step = static_cast<std::int64_t>(batch_size);
        double total{0.0};
        for (std::int64_t begin = 0; begin < count; begin += step) {
            const auto end = std::min(begin + step, count);
            const auto batch = images.slice(/*dim=*/0, begin, end);
            total += flow.evaluate(batch, importance_samples).sum().item<double>();
        }
        return total / static_cast<double>(count);
    }

    inline TrainReport fit(Flow& flow,
                           const torch::Tensor& train_images,
                           const std::optional<torch::Tensor>& validation_images = std::nullopt,
                           TrainOptions options = {})
    {
        Detail::check_images(train_images, "Training");
        if (validation_images) {
            Detail::check_images(*validation_images, "Validation");
        }
        if (options.batch_size == 0) {
            throw std::invalid_argument("Training batch size must be positive.");
        }
        if (options.drop_last && static_cast<std::size_t>(train_images.size(0)) < options.batch_size) {
            throw std::invalid_argument("Training set holds fewer images than one batch while drop_last is set.");
        }
        if (flow.empty()) {
            throw std::logic_error("Cannot train a flow without layers.");
        }
        if (options.stream == nullptr) {
            options.monitor = false;
        }

        auto optimizer = std::visit(
            [&](const auto& descriptor) { return Optimizer::Details::build_optimizer(flow, descriptor); },
            options.optimizer);
        if (!optimizer) {
            throw std::logic_error("Optimizer construction failed.");
        }

        std::unique_ptr<LrScheduler::Details::Scheduler> scheduler{};
        if (options.scheduler) {
            scheduler = std::visit(
                [&](const auto& descriptor) { return LrScheduler::Details::build_scheduler(*optimizer, descriptor); },
                *options.scheduler);
        }

        TrainReport report{};
        const auto count = train_images.size(0);
        const auto step = static_cast<std::int64_t>(options.batch_size);
        const auto limit = options.drop_last ? count - count % step : count;
        double smoothed_bpd = Detail::kInitialSmoothedBpd;

        for (std::size_t epoch = 1; epoch <= options.epochs; ++epoch) {
            const auto started = std::chrono::steady_clock::now();
            flow.train();

            const auto order = options.shuffle
                ? torch::randperm(count, torch::TensorOptions().dtype(torch::kLong))
                : torch::arange(count, torch::TensorOptions().dtype(torch::kLong));

            for (std::int64_t begin = 0; begin < limit; begin += step) {
                const auto end = std::min(begin + step, count);
                const auto batch = train_images.index_select(0, order.slice(/*dim=*/0, begin, end));

                optimizer->zero_grad();
                auto loss = flow.log_likelihood(batch).mean();
                loss.backward();
                if (options.max_gradient_norm > 0.0) {
                    torch::nn::utils::clip_grad_norm_(flow.parameters(), options.max_gradient_norm);
                }
                optimizer->step();
                ++report.optimizer_steps;

                smoothed_bpd = Detail::kSmoothingDecay * smoothed_bpd
                             + (1.0 - Detail::kSmoothingDecay) * loss.item<double>();
            }
            report.train_bpd.push_back(smoothed_bpd);

            if (scheduler) {
                scheduler->step();
            }

            std::optional<double> validation_bpd{};
            bool improved{false};
            if (validation_images) {
                validation_bpd = test(flow, *validation_images, options.evaluation_batch_size, options.importance_samples);
                report.validation_bpd.push_back(*validation_bpd);
                if (*validation_bpd < report.best_validation_bpd) {
                    improved = true;
                    report.best_validation_bpd = *validation_bpd;
                    report.best_epoch = epoch;
                    if (options.checkpoint_directory) {
                        report.checkpoint = flow.save(*options.checkpoint_directory);
                    }
                }
            }

            if (options.sample_every > 0 && options.on_sample && epoch % options.sample_every == 0) {
                options.on_sample(flow, epoch);
            }

            if (options.monitor) {
                const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
                Detail::log_epoch(*options.stream, epoch, options.epochs, smoothed_bpd, validation_bpd, improved, elapsed);
            }
        }

        return report;
    }
}

#endif // REFLUO_TRAINING_HPP
