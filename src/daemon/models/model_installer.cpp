#include "models/model_installer.hpp"
#include "inference/binary_locator.hpp"
#include "inference/child_process.hpp"
#include "util/log.hpp"
#include "util/strings.hpp"

#include <filesystem>
#include <format>

namespace fs = std::filesystem;

ModelInstaller::ModelInstaller(std::string cache_root, ModelProvisioner& provisioner,
                               std::vector<ModelInfo> catalog)
    : cache_root_(std::move(cache_root)), provisioner_(provisioner), catalog_(std::move(catalog)) {}

const ModelInfo* ModelInstaller::find(ModelFamily family, std::string_view id) const {
    return model_catalog::find(catalog_, family, id);
}

std::string ModelInstaller::family_dir(ModelFamily family) const {
    return (fs::path(cache_root_) / to_string(family)).string();
}

std::string ModelInstaller::model_dir(const ModelInfo& model) const {
    return (fs::path(family_dir(model.family)) / model.id).string();
}

std::string ModelInstaller::model_path(const ModelInfo& model) const {
    if (model.is_archive()) return model_dir(model);
    return (fs::path(model_dir(model)) / model.file_name).string();
}

bool ModelInstaller::is_installed(const ModelInfo& model) const {
    std::error_code ec;
    fs::path dir(model_dir(model));
    for (auto& file : model.required_files) {
        auto size = fs::file_size(dir / file, ec);
        if (ec || size == 0) return false;
    }
    return true;
}

std::vector<ModelInstaller::Entry> ModelInstaller::list() const {
    std::vector<Entry> out;
    out.reserve(catalog_.size());
    for (auto& m : catalog_) {
        out.push_back({.info = &m, .installed = is_installed(m), .path = model_path(m)});
    }
    return out;
}

Result<std::string> ModelInstaller::install(const ModelInfo& model, std::stop_token stop,
                                            ProgressCallback on_progress, RetryPolicy retry) {
    std::error_code ec;
    fs::create_directories(model.is_archive() ? family_dir(model.family) : model_dir(model), ec);
    if (ec) {
        return make_error(ErrorCode::Io, "cannot create " + model_dir(model) + ": " + ec.message());
    }

    if (is_installed(model)) {
        logging::info("models: {} already installed", model.id);
        return model_path(model);
    }

    DownloadOptions options;
    options.expected_size = model.size_bytes;
    options.retry = retry;
    if (on_progress) {
        options.on_progress = [&model, on_progress](uint64_t done, uint64_t total) {
            on_progress(model, done, total);
        };
    }

    return model.is_archive() ? install_archive(model, stop, options)
                              : install_file(model, stop, options);
}

Result<std::string> ModelInstaller::install_file(const ModelInfo& model, std::stop_token stop,
                                                 const DownloadOptions& options) {
    auto space = provisioner_.check_disk_space(model_dir(model),
                                               static_cast<uint64_t>(model.size_bytes * kFileSpaceFactor));
    if (!space) return std::unexpected(space.error());

    auto path = model_path(model);
    auto downloaded = provisioner_.download(model.url, path, options, stop);
    if (!downloaded) return std::unexpected(downloaded.error());

    auto size = ModelProvisioner::validate_file_size(path, model.size_bytes);
    if (!size) return std::unexpected(size.error());

    logging::info("models: installed {} ({} bytes)", model.id, *size);
    return path;
}

Result<std::string> ModelInstaller::install_archive(const ModelInfo& model, std::stop_token stop,
                                                    const DownloadOptions& options) {
    auto dir = family_dir(model.family);
    auto space = provisioner_.check_disk_space(dir, static_cast<uint64_t>(model.size_bytes * kArchiveSpaceFactor));
    if (!space) return std::unexpected(space.error());

    auto archive = (fs::path(dir) / (model.id + ".tar.bz2")).string();

    std::error_code ec;
    auto existing = fs::file_size(archive, ec);
    if (!ec && existing > 0) {
        logging::info("models: reusing archive from a previous attempt ({} bytes)", existing);
    } else {
        auto downloaded = provisioner_.download(model.url, archive, options, stop);
        if (!downloaded) return std::unexpected(downloaded.error());

        auto size = ModelProvisioner::validate_file_size(archive, model.size_bytes);
        if (!size) return std::unexpected(size.error());
    }

    Result<void> extracted;
    for (int attempt = 1; attempt <= kExtractAttempts; ++attempt) {
        if (stop.stop_requested()) {
            return make_error(ErrorCode::Cancelled, "installation of " + model.id + " cancelled");
        }
        extracted = extract(model, archive);
        if (extracted) break;
        logging::warn("models: extraction attempt {}/{} failed: {}", attempt, kExtractAttempts,
                      extracted.error().message);
    }
    if (!extracted) {
        return make_error(ErrorCode::InstallFailed, "model installation failed: " + extracted.error().message);
    }

    fs::remove(archive, ec);
    logging::info("models: installed {}", model.id);
    return model_path(model);
}

Result<void> ModelInstaller::extract(const ModelInfo& model, const std::string& archive) {
    fs::path family(family_dir(model.family));
    fs::path staging = family / ("temp-extract-" + model.id);
    fs::path target(model_dir(model));

    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) return make_error(ErrorCode::Io, "cannot create " + staging.string() + ": " + ec.message());

    auto fail = [&staging](Error err) -> Result<void> {
        std::error_code ignored;
        fs::remove_all(staging, ignored);
        return std::unexpected(std::move(err));
    };

    auto tar = binaries::find("tar");
    if (!tar) return fail({.code = ErrorCode::BinaryNotFound, .message = "tar not found on PATH"});

    auto proc = ChildProcess::spawn(*tar, {"-xjf", archive, "-C", staging.string()}, "tar");
    if (!proc) return fail(proc.error());
    auto status = (*proc)->wait();
    if (status.signaled || status.code != 0) {
        return fail({.code = ErrorCode::InstallFailed,
                     .message = std::format("tar extraction failed ({}): {}", status.describe(),
                                            trim((*proc)->stderr_head(500)))});
    }

    fs::path unpacked = staging / model.file_name;
    if (!fs::is_directory(unpacked, ec)) {
        // Archive layout differs from the catalog; take a directory named after the model family
        unpacked.clear();
        std::string found;
        for (const auto& entry : fs::directory_iterator(staging, ec)) {
            auto name = entry.path().filename().string();
            if (!found.empty()) found += ", ";
            found += name;
            if (unpacked.empty() && entry.is_directory() && name.find(to_string(model.family)) != std::string::npos) {
                unpacked = entry.path();
            }
        }
        if (unpacked.empty()) {
            return fail({.code = ErrorCode::InstallFailed,
                         .message = std::format("could not find model directory in archive; expected \"{}\", found: [{}]",
                                                model.file_name, found)});
        }
        logging::warn("models: using {} from archive", unpacked.filename().string());
    }

    fs::remove_all(target, ec);
    fs::rename(unpacked, target, ec);
    if (ec) {
        return fail({.code = ErrorCode::Io, .message = "move into " + target.string() + ": " + ec.message()});
    }

    std::string missing;
    for (auto& file : model.required_files) {
        if (!fs::exists(target / file, ec)) {
            if (!missing.empty()) missing += ", ";
            missing += file;
        }
    }
    if (!missing.empty()) {
        fs::remove_all(target, ec);
        return fail({.code = ErrorCode::InstallFailed,
                     .message = "extracted model is missing required files: " + missing});
    }

    fs::remove_all(staging, ec);
    return {};
}

Result<void> ModelInstaller::remove(const ModelInfo& model) {
    std::error_code ec;
    auto removed = fs::remove_all(model_dir(model), ec);
    if (ec) return make_error(ErrorCode::Io, "cannot remove " + model_dir(model) + ": " + ec.message());
    if (removed == 0) {
        return make_error(ErrorCode::InvalidArgument, "model " + model.id + " is not installed");
    }
    logging::info("models: removed {}", model.id);
    return {};
}

int ModelInstaller::sweep() const {
    int removed = 0;
    for (auto family : {ModelFamily::Whisper, ModelFamily::Parakeet}) {
        auto dir = family_dir(family);
        removed += ModelProvisioner::sweep_stale(dir);

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::error_code type_ec;
            if (entry.is_directory(type_ec) && !entry.path().filename().string().starts_with("temp-extract-")) {
                removed += ModelProvisioner::sweep_stale(entry.path().string());
            }
        }
    }
    return removed;
}
