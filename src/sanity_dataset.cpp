#include "dataset.h"
#include "layers.h"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

bool nearly_equal(float a, float b, float eps = 1e-6f) {
    return std::abs(a - b) <= eps;
}

// Pixel value that encodes both the pixel index and the channel.
uint8_t pixel_value(std::size_t c, std::size_t p) {
    return static_cast<uint8_t>((p + 85 * c) % 256);
}

void write_batch(const fs::path& path, const std::vector<uint8_t>& labels) {
    std::ofstream out(path, std::ios::binary);
    for (uint8_t label : labels) {
        out.put(static_cast<char>(label));
        for (std::size_t c = 0; c < 3; ++c) {
            for (std::size_t p = 0; p < 32 * 32; ++p) {
                out.put(static_cast<char>(pixel_value(c, p)));
            }
        }
    }
}

void write_meta(const fs::path& path, std::size_t count) {
    static const char* names[] = {"airplane", "automobile", "bird", "cat", "deer",
                                  "dog", "frog", "horse", "ship", "truck", "extra"};
    std::ofstream out(path);
    for (std::size_t i = 0; i < count; ++i) {
        out << names[i] << "\r\n";
    }
    out << "\n";
}

int main() {
    const fs::path root = fs::temp_directory_path() / "ftswish_sanity_dataset";
    fs::remove_all(root);
    fs::create_directories(root);

    for (std::size_t f = 0; f < 5; ++f) {
        write_batch(root / ("data_batch_" + std::to_string(f + 1) + ".bin"),
                    {static_cast<uint8_t>((f * 2) % 10),
                     static_cast<uint8_t>((f * 2 + 1) % 10)});
    }
    write_batch(root / "test_batch.bin", {3, 7, 9});
    write_meta(root / "batches.meta.txt", 10);

    {
        CIFAR10Dataset ds(root);
        ds.load();
        assert(ds.train_size() == 10);
        assert(ds.test_size() == 3);
        assert(ds.train_images().size() == 10 * 3072);
        assert(ds.label_names().size() == 10);
        assert(ds.label_names()[0] == "airplane");
        assert(ds.label_names()[9] == "truck");
        for (std::size_t i = 0; i < 10; ++i) {
            assert(ds.train_labels()[i] == static_cast<int>(i));
        }
        assert(ds.test_labels()[2] == 9);

        // Channel-first, scaled to [0, 1].
        const float* img = ds.train_images().data() + 4 * 3072;
        assert(nearly_equal(img[0], 0.0f));
        assert(nearly_equal(img[200], 200.0f / 255.0f));
        assert(nearly_equal(img[1024 + 5], pixel_value(1, 5) / 255.0f));
        assert(nearly_equal(img[2048 + 1000], pixel_value(2, 1000) / 255.0f));
        std::cout << "Channel-first decode: OK\n";

        ds.limit_train(4);
        ds.limit_test(0);
        assert(ds.train_size() == 4);
        assert(ds.train_images().size() == 4 * 3072);
        assert(ds.test_size() == 3);
        std::cout << "Split limits: OK\n";
    }

    {
        CIFAR10Dataset ds(root, /*normalize=*/false, DataFormat::kChannelsLast);
        ds.load();
        assert(ds.data_format() == DataFormat::kChannelsLast);
        const float* img = ds.test_images().data();
        for (std::size_t p : {0u, 17u, 1023u}) {
            for (std::size_t c = 0; c < 3; ++c) {
                assert(img[p * 3 + c] == static_cast<float>(pixel_value(c, p)));
            }
        }

        // Re-ordering the channel-last copy gives the channel-first layout.
        const auto planar = to_channels_first(ds.test_images(), ds.test_size(), 3, 32, 32);
        CIFAR10Dataset raw(root, false);
        raw.load();
        assert(planar == raw.test_images());
        std::cout << "Channel-last decode: OK\n";
    }

    {
        const auto one_hot = to_categorical({2, 0, 9}, 10);
        assert(one_hot.size() == 30);
        assert(one_hot[2] == 1.0f);
        assert(one_hot[10] == 1.0f);
        assert(one_hot[29] == 1.0f);
        float sum = 0.0f;
        for (float v : one_hot) sum += v;
        assert(sum == 3.0f);

        bool threw = false;
        try {
            to_categorical({1, 10}, 10);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);
        std::cout << "to_categorical: OK\n";
    }

    {
        // Truncated record.
        {
            std::ofstream out(root / "test_batch.bin", std::ios::binary | std::ios::app);
            out.put('\0');
        }
        CIFAR10Dataset ds(root);
        bool threw = false;
        try {
            ds.load();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        // Label outside [0, 10).
        write_batch(root / "test_batch.bin", {12});
        threw = false;
        try {
            ds.load();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        // Wrong number of label names.
        write_batch(root / "test_batch.bin", {1});
        write_meta(root / "batches.meta.txt", 11);
        threw = false;
        try {
            ds.load();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        fs::remove(root / "data_batch_3.bin");
        threw = false;
        try {
            ds.load();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::cout << "Malformed data rejected: OK\n";
    }

    fs::remove_all(root);
    std::cout << "All dataset sanity tests passed.\n";
    return 0;
}
