#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "train_config.h"
#include "trainer.h"

// One curve of a chart.
struct Series {
    std::string label;
    std::vector<float> values;  // one point per epoch; non-finite points are skipped
    char marker;
};

// Renders curves against epoch as a text chart. Throws std::invalid_argument
// if height or width is below 2.
std::string render_chart(const std::string& title, const std::string& y_label,
                         const std::vector<Series>& series,
                         std::size_t height = 12, std::size_t width = 60);

// "Test loss for <name>: <loss> / Test accuracy: <accuracy>"
void print_test_result(std::ostream& os, const std::string& name,
                       const EvalResult& result);

// Accuracy chart then loss chart, training and validation curves on each.
void print_history_charts(std::ostream& os, const std::string& name,
                          const TrainingHistory& history);

// Peak resident memory of this process in MB (0 if unavailable).
double get_peak_memory_usage_mb();

// Appends a run summary block to `path`. Returns false if the file could not
// be opened.
bool append_run_log(const std::string& path, const TrainConfig& cfg,
                    const TrainingHistory& history, const EvalResult& test,
                    std::size_t train_samples, std::size_t test_samples);
