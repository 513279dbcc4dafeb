#include "trainer.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace {
std::vector<float> column(const std::vector<EpochMetrics>& records,
                          float EpochMetrics::*field) {
    std::vector<float> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        out.push_back(r.*field);
    }
    return out;
}

// Copies the rows listed in `order[begin, end)` into a contiguous batch.
void gather_rows(const std::vector<float>& src, std::size_t row_size,
                 const std::vector<std::size_t>& order, std::size_t begin,
                 std::size_t end, std::vector<float>& dst) {
    dst.resize((end - begin) * row_size);
    for (std::size_t i = begin; i < end; ++i) {
        const float* from = src.data() + order[i] * row_size;
        std::copy(from, from + row_size, dst.data() + (i - begin) * row_size);
    }
}

std::size_t argmax_row(const float* row, std::size_t classes) {
    return static_cast<std::size_t>(std::max_element(row, row + classes) - row);
}
}  // namespace

std::vector<float> TrainingHistory::losses() const {
    return column(records_, &EpochMetrics::loss);
}

std::vector<float> TrainingHistory::accuracies() const {
    return column(records_, &EpochMetrics::accuracy);
}

std::vector<float> TrainingHistory::val_losses() const {
    return column(records_, &EpochMetrics::val_loss);
}

std::vector<float> TrainingHistory::val_accuracies() const {
    return column(records_, &EpochMetrics::val_accuracy);
}

std::size_t count_correct(const std::vector<float>& probs,
                          const std::vector<float>& targets,
                          std::size_t batch, std::size_t classes) {
    if (probs.size() != batch * classes || targets.size() != batch * classes) {
        throw std::runtime_error("count_correct size mismatch");
    }
    std::size_t correct = 0;
    for (std::size_t n = 0; n < batch; ++n) {
        if (argmax_row(probs.data() + n * classes, classes) ==
            argmax_row(targets.data() + n * classes, classes)) {
            ++correct;
        }
    }
    return correct;
}

Trainer::Trainer(ConvNet& net, TrainConfig cfg)
    : net_(net),
      cfg_(std::move(cfg)),
      adam_(cfg_.lr),
      rng_(cfg_.seed) {
    if (cfg_.batch_size == 0) {
        throw std::invalid_argument("batch_size must be positive");
    }
    if (!(cfg_.validation_split >= 0.0 && cfg_.validation_split < 1.0)) {
        throw std::invalid_argument("validation_split must be in [0, 1)");
    }
    if (cfg_.num_classes != net_.num_classes()) {
        throw std::invalid_argument("TrainConfig num_classes does not match the network");
    }
    if (cfg_.data_format != net_.data_format()) {
        throw std::invalid_argument("TrainConfig data_format does not match the network");
    }
}

TrainingHistory Trainer::fit(const std::vector<float>& images,
                             const std::vector<float>& targets,
                             std::size_t num_samples) {
    const std::size_t classes = net_.num_classes();
    if (images.size() != num_samples * ConvNet::kImageSize ||
        targets.size() != num_samples * classes) {
        throw std::runtime_error("fit: images/targets do not match num_samples");
    }

    // Validation rows are the tail of the data, fixed for the whole run.
    const std::size_t split_at = static_cast<std::size_t>(
        static_cast<double>(num_samples) * (1.0 - cfg_.validation_split));
    if (split_at == 0) {
        throw std::invalid_argument("fit: no training samples after validation split");
    }
    const bool has_validation = split_at < num_samples;

    std::vector<std::size_t> order(split_at);
    std::iota(order.begin(), order.end(), 0);

    const std::size_t num_batches = (split_at + cfg_.batch_size - 1) / cfg_.batch_size;
    if (cfg_.verbosity > 0) {
        std::cout << "Train on " << split_at << " samples, validate on "
                  << (num_samples - split_at) << " samples\n";
    }

    TrainingHistory history;
    std::vector<float> batch_images;
    std::vector<float> batch_targets;

    for (std::size_t epoch = 0; epoch < cfg_.epochs; ++epoch) {
        auto start = std::chrono::high_resolution_clock::now();
        net_.set_training(true);
        std::shuffle(order.begin(), order.end(), rng_);

        double loss_sum = 0.0;
        std::size_t correct = 0;
        std::size_t seen = 0;

        for (std::size_t b = 0; b < num_batches; ++b) {
            const std::size_t start_idx = b * cfg_.batch_size;
            const std::size_t end_idx = std::min(start_idx + cfg_.batch_size, split_at);
            const std::size_t batch_sz = end_idx - start_idx;

            gather_rows(images, ConvNet::kImageSize, order, start_idx, end_idx,
                        batch_images);
            gather_rows(targets, classes, order, start_idx, end_idx, batch_targets);

            const auto& probs = net_.forward(batch_images, batch_sz);
            const float loss = loss_fn_.forward(probs, batch_targets, batch_sz);
            correct += count_correct(probs, batch_targets, batch_sz, classes);
            const auto grad_out = loss_fn_.backward(probs, batch_targets, batch_sz);

            net_.zero_grad();
            net_.backward(grad_out);
            adam_.step(net_.parameters());

            loss_sum += static_cast<double>(loss) * static_cast<double>(batch_sz);
            seen += batch_sz;

            if (cfg_.verbosity == 1 && cfg_.log_interval > 0 &&
                (b + 1) % cfg_.log_interval == 0) {
                std::chrono::duration<double> elapsed_b =
                    std::chrono::high_resolution_clock::now() - start;
                std::cout << "  Batch " << (b + 1) << "/" << num_batches
                          << " - loss: " << loss_sum / static_cast<double>(seen)
                          << " - accuracy: "
                          << static_cast<double>(correct) / static_cast<double>(seen)
                          << " - elapsed: " << elapsed_b.count() << "s\n";
            }
        }

        EpochMetrics metrics;
        metrics.loss = static_cast<float>(loss_sum / static_cast<double>(seen));
        metrics.accuracy =
            static_cast<float>(static_cast<double>(correct) / static_cast<double>(seen));
        if (has_validation) {
            const EvalResult val = evaluate_range(images, targets, split_at, num_samples);
            metrics.val_loss = val.loss;
            metrics.val_accuracy = val.accuracy;
        } else {
            metrics.val_loss = std::numeric_limits<float>::quiet_NaN();
            metrics.val_accuracy = std::numeric_limits<float>::quiet_NaN();
        }

        std::chrono::duration<double> elapsed =
            std::chrono::high_resolution_clock::now() - start;
        metrics.seconds = elapsed.count();

        if (cfg_.verbosity > 0) {
            std::cout << "Epoch " << (epoch + 1) << "/" << cfg_.epochs
                      << " - loss: " << metrics.loss
                      << " - accuracy: " << metrics.accuracy;
            if (has_validation) {
                std::cout << " - val_loss: " << metrics.val_loss
                          << " - val_accuracy: " << metrics.val_accuracy;
            }
            std::cout << " - time: " << metrics.seconds << "s\n";
        }
        history.append(metrics);
    }

    net_.set_training(false);
    return history;
}

EvalResult Trainer::evaluate(const std::vector<float>& images,
                             const std::vector<float>& targets,
                             std::size_t num_samples) {
    if (images.size() != num_samples * ConvNet::kImageSize ||
        targets.size() != num_samples * net_.num_classes()) {
        throw std::runtime_error("evaluate: images/targets do not match num_samples");
    }
    if (num_samples == 0) {
        throw std::invalid_argument("evaluate: empty split");
    }
    return evaluate_range(images, targets, 0, num_samples);
}

EvalResult Trainer::evaluate_range(const std::vector<float>& images,
                                   const std::vector<float>& targets,
                                   std::size_t begin, std::size_t end) {
    const std::size_t classes = net_.num_classes();
    const bool was_training = net_.training();
    net_.set_training(false);

    double loss_sum = 0.0;
    std::size_t correct = 0;
    std::vector<float> batch_images;
    std::vector<float> batch_targets;

    for (std::size_t start_idx = begin; start_idx < end; start_idx += cfg_.batch_size) {
        const std::size_t end_idx = std::min(start_idx + cfg_.batch_size, end);
        const std::size_t batch_sz = end_idx - start_idx;

        batch_images.assign(images.begin() + start_idx * ConvNet::kImageSize,
                            images.begin() + end_idx * ConvNet::kImageSize);
        batch_targets.assign(targets.begin() + start_idx * classes,
                             targets.begin() + end_idx * classes);

        const auto& probs = net_.forward(batch_images, batch_sz);
        loss_sum += static_cast<double>(loss_fn_.forward(probs, batch_targets, batch_sz)) *
                    static_cast<double>(batch_sz);
        correct += count_correct(probs, batch_targets, batch_sz, classes);
    }

    net_.set_training(was_training);

    const double total = static_cast<double>(end - begin);
    EvalResult result;
    result.loss = static_cast<float>(loss_sum / total);
    result.accuracy = static_cast<float>(static_cast<double>(correct) / total);
    return result;
}
