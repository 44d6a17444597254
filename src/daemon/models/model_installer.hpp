#pragma once

#include "models/model_catalog.hpp"
#include "models/model_provisioner.hpp"
#include "util/error.hpp"

#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

// Installs catalog models into the cache:
// <cache_root>/<family>/<model-id>/...
class ModelInstaller {
public:
    static constexpr double kFileSpaceFactor = 1.2;
    static constexpr double kArchiveSpaceFactor = 2.5;
    static constexpr int kExtractAttempts = 2;

    // (model, downloaded, total)
    using ProgressCallback = std::function<void(const ModelInfo&, uint64_t, uint64_t)>;

    struct Entry {
        const ModelInfo* info = nullptr;
        bool installed = false;
        std::string path;
    };

    ModelInstaller(std::string cache_root, ModelProvisioner& provisioner,
                   std::vector<ModelInfo> catalog = model_catalog::builtin());

    const ModelInfo* find(ModelFamily family, std::string_view id) const;

    std::string family_dir(ModelFamily family) const;
    std::string model_dir(const ModelInfo& model) const;
    // The path handed to the inference server: the weights file or the model directory.
    std::string model_path(const ModelInfo& model) const;

    bool is_installed(const ModelInfo& model) const;
    std::vector<Entry> list() const;

    Result<std::string> install(const ModelInfo& model, std::stop_token stop = {},
                                ProgressCallback on_progress = {},
                                RetryPolicy retry = {});
    Result<void> remove(const ModelInfo& model);

    // Clears stale download and extraction leftovers from every cache directory.
    int sweep() const;

private:
    Result<std::string> install_file(const ModelInfo& model, std::stop_token stop,
                                     const DownloadOptions& options);
    Result<std::string> install_archive(const ModelInfo& model, std::stop_token stop,
                                        const DownloadOptions& options);
    Result<void> extract(const ModelInfo& model, const std::string& archive);

    std::string cache_root_;
    ModelProvisioner& provisioner_;
    std::vector<ModelInfo> catalog_;
};
