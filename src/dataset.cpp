#include "dataset.h"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace {
constexpr std::size_t kImageWidth = 32;
constexpr std::size_t kImageHeight = 32;
constexpr std::size_t kChannels = 3;
constexpr std::size_t kNumClasses = 10;
constexpr std::size_t kPixelsPerImage = kImageWidth * kImageHeight;
constexpr std::size_t kBytesPerImage = kChannels * kPixelsPerImage;  // 3072
constexpr std::size_t kBytesPerRecord = 1 + kBytesPerImage;          // label + image

void truncate_split(std::size_t n, std::vector<float>& images,
                    std::vector<int>& labels) {
    if (n == 0 || n >= labels.size()) {
        return;
    }
    labels.resize(n);
    images.resize(n * kBytesPerImage);
}
}  // namespace

CIFAR10Dataset::CIFAR10Dataset(std::filesystem::path root_dir, bool normalize,
                               DataFormat format)
    : root_dir_(std::move(root_dir)), normalize_(normalize), format_(format) {}

void CIFAR10Dataset::load() {
    const std::vector<std::string> train_files = {
        "data_batch_1.bin", "data_batch_2.bin", "data_batch_3.bin",
        "data_batch_4.bin", "data_batch_5.bin"};
    const std::vector<std::string> test_files = {"test_batch.bin"};

    load_split(train_files, train_images_, train_labels_);
    load_split(test_files, test_images_, test_labels_);
    load_label_names();
}

void CIFAR10Dataset::limit_train(std::size_t n) {
    truncate_split(n, train_images_, train_labels_);
}

void CIFAR10Dataset::limit_test(std::size_t n) {
    truncate_split(n, test_images_, test_labels_);
}

std::size_t CIFAR10Dataset::train_size() const { return train_labels_.size(); }

std::size_t CIFAR10Dataset::test_size() const { return test_labels_.size(); }

const std::vector<float>& CIFAR10Dataset::train_images() const {
    return train_images_;
}

const std::vector<int>& CIFAR10Dataset::train_labels() const {
    return train_labels_;
}

const std::vector<float>& CIFAR10Dataset::test_images() const {
    return test_images_;
}

const std::vector<int>& CIFAR10Dataset::test_labels() const {
    return test_labels_;
}

const std::vector<std::string>& CIFAR10Dataset::label_names() const {
    return label_names_;
}

void CIFAR10Dataset::load_split(const std::vector<std::string>& files,
                                std::vector<float>& images_out,
                                std::vector<int>& labels_out) {
    images_out.clear();
    labels_out.clear();

    for (const auto& file : files) {
        const auto path = root_dir_ / file;
        const auto buffer = read_file_bytes(path);
        const std::size_t num_records = buffer.size() / kBytesPerRecord;
        decode_records(buffer, num_records, images_out, labels_out);
    }
}

std::vector<uint8_t> CIFAR10Dataset::read_file_bytes(
    const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    file.seekg(0, std::ios::end);
    const std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    if (size <= 0 || size % static_cast<std::streamsize>(kBytesPerRecord) != 0) {
        throw std::runtime_error("Unexpected file size for: " + path.string());
    }

    std::vector<uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return buffer;
}

void CIFAR10Dataset::decode_records(const std::vector<uint8_t>& buffer,
                                    std::size_t num_records,
                                    std::vector<float>& images_out,
                                    std::vector<int>& labels_out) {
    const std::size_t current_images = labels_out.size();
    images_out.resize((current_images + num_records) * kBytesPerImage);
    labels_out.resize(current_images + num_records);

    const float norm = normalize_ ? 1.0f / 255.0f : 1.0f;
    for (std::size_t i = 0; i < num_records; ++i) {
        const std::size_t src_offset = i * kBytesPerRecord;
        const std::size_t dst_image = (current_images + i) * kBytesPerImage;

        const uint8_t label = buffer[src_offset];
        if (label >= kNumClasses) {
            throw std::runtime_error("Label out of range in CIFAR-10 record: " +
                                     std::to_string(label));
        }
        labels_out[current_images + i] = label;

        // Records are planar R, G, B.
        const uint8_t* src = buffer.data() + src_offset + 1;
        float* dst = images_out.data() + dst_image;

        for (std::size_t c = 0; c < kChannels; ++c) {
            const std::size_t channel_offset = c * kPixelsPerImage;
            for (std::size_t p = 0; p < kPixelsPerImage; ++p) {
                const std::size_t dst_idx = format_ == DataFormat::kChannelsLast
                                                ? p * kChannels + c
                                                : channel_offset + p;
                dst[dst_idx] = static_cast<float>(src[channel_offset + p]) * norm;
            }
        }
    }
}

void CIFAR10Dataset::load_label_names() {
    const auto path = root_dir_ / "batches.meta.txt";
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open label names: " + path.string());
    }
    label_names_.clear();
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            label_names_.push_back(line);
        }
    }
    if (label_names_.size() != kNumClasses) {
        throw std::runtime_error("Expected 10 label names, got " +
                                 std::to_string(label_names_.size()));
    }
}

std::vector<float> to_categorical(const std::vector<int>& labels,
                                  std::size_t num_classes) {
    std::vector<float> one_hot(labels.size() * num_classes, 0.0f);
    for (std::size_t i = 0; i < labels.size(); ++i) {
        const int label = labels[i];
        if (label < 0 || static_cast<std::size_t>(label) >= num_classes) {
            throw std::out_of_range("Label " + std::to_string(label) +
                                    " outside [0, " + std::to_string(num_classes) +
                                    ")");
        }
        one_hot[i * num_classes + static_cast<std::size_t>(label)] = 1.0f;
    }
    return one_hot;
}
