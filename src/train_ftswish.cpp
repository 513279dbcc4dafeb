#include "activations.h"
#include "convnet.h"
#include "dataset.h"
#include "report.h"
#include "train_config.h"
#include "trainer.h"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string data_dir = "cifar-10-batches-bin";
    if (argc > 1) {
        data_dir = argv[1];
    }

    try {
        TrainConfig cfg;

        CIFAR10Dataset ds(data_dir, /*normalize=*/true, cfg.data_format);
        ds.load();
        ds.limit_train(cfg.sample);
        ds.limit_test(cfg.test_sample);
        if (cfg.verbosity > 0) {
            std::cout << "Loaded CIFAR-10 from " << data_dir << ": "
                      << ds.train_size() << " train / " << ds.test_size()
                      << " test images\n";
        }

        const auto train_targets = to_categorical(ds.train_labels(), cfg.num_classes);
        const auto test_targets = to_categorical(ds.test_labels(), cfg.num_classes);

        ConvNet net(make_activation(cfg.activation, cfg.threshold), cfg.num_classes,
                    cfg.data_format, cfg.seed);
        Trainer trainer(net, cfg);

        const TrainingHistory history =
            trainer.fit(ds.train_images(), train_targets, ds.train_size());
        const EvalResult test =
            trainer.evaluate(ds.test_images(), test_targets, ds.test_size());

        print_test_result(std::cout, cfg.model_name, test);
        print_history_charts(std::cout, cfg.model_name, history);

        if (!append_run_log(cfg.log_path, cfg, history, test, ds.train_size(),
                            ds.test_size())) {
            std::cerr << "Warning: failed to write " << cfg.log_path << "\n";
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
