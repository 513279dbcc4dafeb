#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include "convnet.h"
#include "layers.h"
#include "optimizer.h"
#include "train_config.h"

struct EpochMetrics {
    float loss = 0.0f;
    float accuracy = 0.0f;
    float val_loss = 0.0f;
    float val_accuracy = 0.0f;
    double seconds = 0.0;
};

// Per-epoch metrics in epoch order. Append-only.
class TrainingHistory {
public:
    void append(const EpochMetrics& metrics) { records_.push_back(metrics); }

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const std::vector<EpochMetrics>& records() const { return records_; }

    std::vector<float> losses() const;
    std::vector<float> accuracies() const;
    std::vector<float> val_losses() const;
    std::vector<float> val_accuracies() const;

private:
    std::vector<EpochMetrics> records_;
};

struct EvalResult {
    float loss = 0.0f;
    float accuracy = 0.0f;
};

// Minibatch training with categorical cross-entropy and Adam.
class Trainer {
public:
    Trainer(ConvNet& net, TrainConfig cfg);

    // images: num_samples images in the network's layout. targets: one-hot
    // num_samples x num_classes. The trailing validation_split fraction is
    // held out for per-epoch validation.
    TrainingHistory fit(const std::vector<float>& images,
                        const std::vector<float>& targets,
                        std::size_t num_samples);

    // Forward-only loss/accuracy in inference mode.
    EvalResult evaluate(const std::vector<float>& images,
                        const std::vector<float>& targets,
                        std::size_t num_samples);

    const Adam& optimizer() const { return adam_; }

private:
    // Runs evaluate over samples [begin, end).
    EvalResult evaluate_range(const std::vector<float>& images,
                              const std::vector<float>& targets,
                              std::size_t begin, std::size_t end);

    ConvNet& net_;
    TrainConfig cfg_;
    Adam adam_;
    CategoricalCrossEntropy loss_fn_;
    std::mt19937 rng_;
};

// Number of rows whose argmax in `probs` matches the argmax in `targets`.
std::size_t count_correct(const std::vector<float>& probs,
                          const std::vector<float>& targets,
                          std::size_t batch, std::size_t classes);
