#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "layers.h"

// CIFAR-10 binary release: data_batch_{1..5}.bin, test_batch.bin and
// batches.meta.txt. Images are stored per sample as 3 x 32 x 32
// (channel-first) or 32 x 32 x 3 (channel-last).
class CIFAR10Dataset {
public:
    explicit CIFAR10Dataset(std::filesystem::path root_dir, bool normalize = true,
                            DataFormat format = DataFormat::kChannelsFirst);

    // Load all training and test batches + label names.
    void load();

    // Keep only the first n samples of a split (0 = keep all).
    void limit_train(std::size_t n);
    void limit_test(std::size_t n);

    std::size_t train_size() const;
    std::size_t test_size() const;
    DataFormat data_format() const { return format_; }

    const std::vector<float>& train_images() const;
    const std::vector<int>& train_labels() const;
    const std::vector<float>& test_images() const;
    const std::vector<int>& test_labels() const;
    const std::vector<std::string>& label_names() const;

private:
    void load_split(const std::vector<std::string>& files,
                    std::vector<float>& images_out,
                    std::vector<int>& labels_out);
    std::vector<uint8_t> read_file_bytes(const std::filesystem::path& path) const;
    void decode_records(const std::vector<uint8_t>& buffer,
                        std::size_t num_records,
                        std::vector<float>& images_out,
                        std::vector<int>& labels_out);
    void load_label_names();

    std::filesystem::path root_dir_;
    bool normalize_;
    DataFormat format_;

    std::vector<float> train_images_;
    std::vector<int> train_labels_;
    std::vector<float> test_images_;
    std::vector<int> test_labels_;
    std::vector<std::string> label_names_;
};

// Labels -> N x num_classes one-hot rows. Throws std::out_of_range for a
// label outside [0, num_classes).
std::vector<float> to_categorical(const std::vector<int>& labels,
                                  std::size_t num_classes);
