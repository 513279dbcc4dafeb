#include "activations.h"
#include "convnet.h"
#include "dataset.h"
#include "layers.h"
#include "report.h"
#include "train_config.h"
#include "trainer.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

int main() {
    const std::size_t classes = 10;
    const std::size_t num_samples = 10;

    std::mt19937 rng(99);
    std::uniform_real_distribution<float> pixel(0.0f, 1.0f);
    std::vector<float> images(num_samples * ConvNet::kImageSize);
    for (auto& v : images) v = pixel(rng);
    std::vector<int> labels(num_samples);
    for (std::size_t i = 0; i < num_samples; ++i) {
        labels[i] = static_cast<int>(i % classes);
    }
    const auto targets = to_categorical(labels, classes);

    {
        // Adam on a fixed batch with dropout off: loss goes down.
        ConvNet net(std::make_shared<FTSwish>(), classes,
                    DataFormat::kChannelsFirst, 3);
        net.set_training(false);
        CategoricalCrossEntropy cce;
        Adam adam(1e-4f);

        float first_loss = 0.0f;
        float last_loss = 0.0f;
        float best_loss = std::numeric_limits<float>::infinity();
        for (int step = 0; step < 8; ++step) {
            const auto& probs = net.forward(images, num_samples);
            const float loss = cce.forward(probs, targets, num_samples);
            if (step == 0) first_loss = loss;
            last_loss = loss;
            best_loss = std::min(best_loss, loss);
            const auto grad = cce.backward(probs, targets, num_samples);
            net.zero_grad();
            net.backward(grad);
            adam.step(net.parameters());
        }
        std::cout << "Loss before: " << first_loss << ", after 8 Adam steps: "
                  << last_loss << " (best " << best_loss << ")" << std::endl;
        assert(std::isfinite(last_loss));
        assert(best_loss < first_loss);
        assert(last_loss < first_loss);
        std::cout << "ConvNet Adam steps: OK\n";
    }

    {
        // fit(): 8 train / 2 validation samples, batches of 3 (last one
        // partial), two epochs.
        TrainConfig cfg;
        cfg.batch_size = 3;
        cfg.epochs = 2;
        cfg.verbosity = 2;
        cfg.seed = 5;

        ConvNet net(std::make_shared<FTSwish>(cfg.threshold), cfg.num_classes,
                    cfg.data_format, cfg.seed);
        Trainer trainer(net, cfg);
        const TrainingHistory history = trainer.fit(images, targets, num_samples);

        assert(history.size() == cfg.epochs);
        for (const auto& m : history.records()) {
            assert(std::isfinite(m.loss) && m.loss > 0.0f);
            assert(m.accuracy >= 0.0f && m.accuracy <= 1.0f);
            assert(std::isfinite(m.val_loss) && m.val_loss > 0.0f);
            // Validation split holds 2 samples.
            assert(m.val_accuracy == 0.0f || m.val_accuracy == 0.5f ||
                   m.val_accuracy == 1.0f);
            assert(m.seconds >= 0.0);
        }
        // ceil(8 / 3) batches per epoch.
        assert(trainer.optimizer().iterations() == 2 * 3);
        assert(!net.training());

        const EvalResult test = trainer.evaluate(images, targets, num_samples);
        assert(std::isfinite(test.loss));
        assert(test.accuracy >= 0.0f && test.accuracy <= 1.0f);
        print_test_result(std::cout, cfg.model_name, test);
        print_history_charts(std::cout, cfg.model_name, history);
        std::cout << "Trainer fit/evaluate: OK\n";
    }

    {
        // No validation split: val metrics are NaN and not plotted.
        TrainConfig cfg;
        cfg.batch_size = 5;
        cfg.epochs = 1;
        cfg.verbosity = 0;
        cfg.validation_split = 0.0;
        ConvNet net(make_activation("relu", cfg.threshold), cfg.num_classes,
                    cfg.data_format, 1);
        Trainer trainer(net, cfg);
        const auto history = trainer.fit(images, targets, num_samples);
        assert(history.size() == 1);
        assert(std::isnan(history.records()[0].val_loss));
        assert(trainer.optimizer().iterations() == 2);
        std::cout << "Trainer without validation: OK\n";
    }

    {
        TrainConfig cfg;
        cfg.batch_size = 0;
        ConvNet net(std::make_shared<FTSwish>(), classes,
                    DataFormat::kChannelsFirst, 1);
        bool threw = false;
        try {
            Trainer bad(net, cfg);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        // Config layout must match the layout the network expects.
        cfg.batch_size = 4;
        cfg.data_format = DataFormat::kChannelsLast;
        threw = false;
        try {
            Trainer bad(net, cfg);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        cfg.data_format = DataFormat::kChannelsFirst;
        Trainer trainer(net, cfg);
        threw = false;
        try {
            trainer.fit(images, targets, num_samples - 1);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::cout << "Trainer validation: OK\n";
    }

    std::cout << "All training sanity tests passed.\n";
    return 0;
}
