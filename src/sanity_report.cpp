#include "report.h"
#include "train_config.h"
#include "trainer.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

std::size_t count_char(const std::string& s, char ch) {
    std::size_t n = 0;
    for (char c : s) {
        if (c == ch) ++n;
    }
    return n;
}

int main() {
    const float nan = std::numeric_limits<float>::quiet_NaN();

    {
        // Rising and falling series on a 5 x 4 grid.
        const std::string chart = render_chart(
            "Demo", "Value",
            {{"up", {0.0f, 1.0f, 2.0f, 3.0f}, '*'},
             {"down", {3.0f, 2.0f, 1.0f, nan}, '@'}},
            5, 10);
        std::cout << chart;
        assert(chart.rfind("Demo\n", 0) == 0);
        assert(chart.find("3.0000") != std::string::npos);
        assert(chart.find("0.0000") != std::string::npos);
        assert(chart.find("Epoch 1..4") != std::string::npos);
        assert(chart.find("* up") != std::string::npos);
        assert(chart.find("@ down") != std::string::npos);
        // The NaN point is skipped. No cell is shared at this resolution.
        assert(count_char(chart, '*') == 4 + 1);
        assert(count_char(chart, '@') == 3 + 1);
        std::cout << "Chart rendering: OK\n";
    }

    {
        const std::string empty = render_chart("Empty", "Value", {{"none", {}, '*'}});
        assert(empty.find("(no data)") != std::string::npos);
        const std::string all_nan =
            render_chart("NaN", "Value", {{"val", {nan, nan}, 'o'}});
        assert(all_nan.find("(no data)") != std::string::npos);

        bool threw = false;
        try {
            render_chart("Bad", "Value", {{"x", {1.0f}, '*'}}, 1, 10);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        std::cout << "Chart edge cases: OK\n";
    }

    TrainingHistory history;
    for (int e = 0; e < 3; ++e) {
        EpochMetrics m;
        m.loss = 2.0f - 0.5f * static_cast<float>(e);
        m.accuracy = 0.2f + 0.1f * static_cast<float>(e);
        m.val_loss = 2.1f - 0.4f * static_cast<float>(e);
        m.val_accuracy = 0.15f + 0.1f * static_cast<float>(e);
        m.seconds = 1.5;
        history.append(m);
    }

    {
        EvalResult test;
        test.loss = 1.25f;
        test.accuracy = 0.5f;
        std::ostringstream oss;
        print_test_result(oss, "FTSwish CNN", test);
        assert(oss.str() == "Test loss for FTSwish CNN: 1.25 / Test accuracy: 0.5\n");

        std::ostringstream charts;
        print_history_charts(charts, "FTSwish CNN", history);
        const std::string out = charts.str();
        assert(out.find("FTSwish CNN training / validation accuracies") != std::string::npos);
        assert(out.find("FTSwish CNN training / validation loss values") != std::string::npos);
        assert(out.find("Validation loss") != std::string::npos);
        std::cout << "Result printing: OK\n";
    }

    {
        const std::string path = "tmp_sanity_report_log.txt";
        std::remove(path.c_str());
        TrainConfig cfg;
        cfg.epochs = 3;
        EvalResult test;
        test.loss = 1.0f;
        test.accuracy = 0.75f;
        assert(append_run_log(path, cfg, history, test, 40, 8));
        assert(append_run_log(path, cfg, history, test, 40, 8));

        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        const std::string log = ss.str();
        std::size_t blocks = 0;
        for (std::size_t pos = log.find("<<<General>>>"); pos != std::string::npos;
             pos = log.find("<<<General>>>", pos + 1)) {
            ++blocks;
        }
        assert(blocks == 2);
        assert(log.find("Model: FTSwish CNN") != std::string::npos);
        assert(log.find("Activation: ftswish") != std::string::npos);
        assert(log.find("Sample: 40") != std::string::npos);
        assert(log.find("Test_accuracy: 0.75") != std::string::npos);
        assert(log.find("Avg_epoch_time: 1.5") != std::string::npos);
        in.close();
        std::remove(path.c_str());

        assert(!append_run_log("no_such_dir/log.txt", cfg, history, test, 40, 8));
        assert(get_peak_memory_usage_mb() >= 0.0);
        std::cout << "Run log: OK\n";
    }

    std::cout << "All report sanity tests passed.\n";
    return 0;
}
