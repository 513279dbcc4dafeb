#pragma once

#include <cstddef>
#include <string>

#include "layers.h"

struct TrainConfig {
    std::size_t batch_size = 250;
    std::size_t epochs = 100;
    std::size_t num_classes = 10;
    // Fraction of the training samples (taken from the end) held out for
    // validation. Fixed for the whole run.
    double validation_split = 0.2;
    // Floor of the FTSwish activation.
    float threshold = -1.0f;
    float lr = 0.001f;
    // 0 = silent, 1 = batch progress + epoch summary, 2 = epoch summary only.
    int verbosity = 1;
    // Print batch progress every `log_interval` batches when verbosity == 1.
    std::size_t log_interval = 20;
    // If >0, only use the first `sample` train examples.
    std::size_t sample = 0;
    // If >0, only use the first `test_sample` test examples.
    std::size_t test_sample = 0;
    unsigned int seed = 42;
    DataFormat data_format = DataFormat::kChannelsFirst;
    std::string activation = "ftswish";
    std::string model_name = "FTSwish CNN";
    std::string log_path = "log.txt";
};
