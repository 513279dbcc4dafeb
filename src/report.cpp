#include "report.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <numeric>
#include <ostream>
#include <sstream>
#include <stdexcept>

#if defined(_WIN32) || defined(_WIN64)
    #include <windows.h>
    #include <psapi.h>
    #pragma comment(lib, "psapi.lib")
#else
    #include <sys/resource.h>
    #include <unistd.h>
#endif

namespace {
std::string format_value(float v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << v;
    return oss.str();
}
}  // namespace

std::string render_chart(const std::string& title, const std::string& y_label,
                         const std::vector<Series>& series, std::size_t height,
                         std::size_t width) {
    if (height < 2 || width < 2) {
        throw std::invalid_argument("render_chart needs height and width >= 2");
    }

    std::size_t epochs = 0;
    float lo = std::numeric_limits<float>::infinity();
    float hi = -std::numeric_limits<float>::infinity();
    for (const auto& s : series) {
        epochs = std::max(epochs, s.values.size());
        for (float v : s.values) {
            if (!std::isfinite(v)) continue;
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }

    std::ostringstream out;
    out << title << "\n";
    if (epochs == 0 || lo > hi) {
        out << "  (no data)\n";
        return out.str();
    }
    if (hi == lo) {
        hi = lo + 1.0f;
    }

    const std::size_t cols = std::min(width, epochs);
    std::vector<std::string> grid(height, std::string(cols, ' '));
    for (const auto& s : series) {
        for (std::size_t e = 0; e < s.values.size(); ++e) {
            const float v = s.values[e];
            if (!std::isfinite(v)) continue;
            const std::size_t col =
                epochs == 1 ? 0 : e * (cols - 1) / (epochs - 1);
            const float frac = (v - lo) / (hi - lo);
            const std::size_t row = static_cast<std::size_t>(
                std::lround((1.0f - frac) * static_cast<float>(height - 1)));
            char& cell = grid[row][col];
            cell = (cell == ' ' || cell == s.marker) ? s.marker : '#';
        }
    }

    const std::string hi_label = format_value(hi);
    const std::string lo_label = format_value(lo);
    const std::size_t pad = std::max(hi_label.size(), lo_label.size());
    out << std::string(pad, ' ') << "  " << y_label << "\n";
    for (std::size_t r = 0; r < height; ++r) {
        std::string label;
        if (r == 0) label = hi_label;
        if (r == height - 1) label = lo_label;
        out << std::setw(static_cast<int>(pad)) << label << " |" << grid[r] << "\n";
    }
    out << std::string(pad, ' ') << " +" << std::string(cols, '-') << "\n";
    out << std::string(pad + 2, ' ') << "Epoch 1.." << epochs << "\n";
    for (const auto& s : series) {
        out << std::string(pad + 2, ' ') << s.marker << " " << s.label << "\n";
    }
    return out.str();
}

void print_test_result(std::ostream& os, const std::string& name,
                       const EvalResult& result) {
    os << "Test loss for " << name << ": " << result.loss
       << " / Test accuracy: " << result.accuracy << "\n";
}

void print_history_charts(std::ostream& os, const std::string& name,
                          const TrainingHistory& history) {
    os << render_chart(name + " training / validation accuracies", "Accuracy",
                       {{"Training accuracy", history.accuracies(), '*'},
                        {"Validation accuracy", history.val_accuracies(), 'o'}})
       << "\n";
    os << render_chart(name + " training / validation loss values", "Loss value",
                       {{"Training loss", history.losses(), '*'},
                        {"Validation loss", history.val_losses(), 'o'}})
       << "\n";
}

double get_peak_memory_usage_mb() {
#if defined(_WIN32) || defined(_WIN64)
    PROCESS_MEMORY_COUNTERS pmc;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        return static_cast<double>(pmc.PeakWorkingSetSize) / (1024.0 * 1024.0);
    }
#else
    struct rusage r_usage;
    if (getrusage(RUSAGE_SELF, &r_usage) == 0) {
    // ru_maxrss is bytes on macOS, kilobytes on Linux.
    #ifdef __APPLE__
        return static_cast<double>(r_usage.ru_maxrss) / (1024.0 * 1024.0);
    #else
        return static_cast<double>(r_usage.ru_maxrss) / 1024.0;
    #endif
    }
#endif
    return 0.0;
}

bool append_run_log(const std::string& path, const TrainConfig& cfg,
                    const TrainingHistory& history, const EvalResult& test,
                    std::size_t train_samples, std::size_t test_samples) {
    std::ofstream logf(path, std::ios::out | std::ios::app);
    if (!logf) {
        return false;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now;
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_now, &now_c);
#else
    localtime_r(&now_c, &tm_now);
#endif

    const auto& records = history.records();
    const double avg_epoch_time =
        records.empty()
            ? 0.0
            : std::accumulate(records.begin(), records.end(), 0.0,
                              [](double acc, const EpochMetrics& m) {
                                  return acc + m.seconds;
                              }) /
                  static_cast<double>(records.size());

    logf << "==============\n";
    logf << "<<<General>>>\n";
    logf << "Time: " << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S") << "\n";
    logf << "Model: " << cfg.model_name << "\n";
    logf << "Activation: " << cfg.activation << "\n";
    logf << "Threshold: " << cfg.threshold << "\n";
    logf << "<<<Input>>>\n";
    logf << "Sample: " << train_samples << "\n";
    logf << "Test_sample: " << test_samples << "\n";
    logf << "Batch_size: " << cfg.batch_size << "\n";
    logf << "Epochs: " << cfg.epochs << "\n";
    logf << "Validation_split: " << cfg.validation_split << "\n";
    logf << "Lr: " << cfg.lr << "\n";
    logf << "Seed: " << cfg.seed << "\n";
    logf << "<<<Result>>>\n";
    if (!records.empty()) {
        const auto& last = records.back();
        logf << "Last_epoch_loss: " << last.loss << "\n";
        logf << "Last_epoch_accuracy: " << last.accuracy << "\n";
        logf << "Last_epoch_val_loss: " << last.val_loss << "\n";
        logf << "Last_epoch_val_accuracy: " << last.val_accuracy << "\n";
    }
    logf << "Test_loss: " << test.loss << "\n";
    logf << "Test_accuracy: " << test.accuracy << "\n";
    logf << "Avg_epoch_time: " << avg_epoch_time << "\n";
    logf << "Memory_usage: " << get_peak_memory_usage_mb() << " MB\n";
    logf << "==============\n";
    return true;
}
