#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class ModelFamily {
    Whisper,    // single ggml weights file, served by whisper-server
    Parakeet,   // tar.bz2 archive of onnx files, served by sherpa-onnx
};

std::string_view to_string(ModelFamily family);
std::optional<ModelFamily> parse_model_family(std::string_view name);

struct ModelInfo {
    std::string id;
    ModelFamily family = ModelFamily::Whisper;
    std::string url;
    uint64_t size_bytes = 0;
    // Whisper: the weights file name. Parakeet: the directory the archive unpacks to.
    std::string file_name;
    std::vector<std::string> required_files;

    bool is_archive() const { return family == ModelFamily::Parakeet; }
};

namespace model_catalog {

const std::vector<ModelInfo>& builtin();

const ModelInfo* find(const std::vector<ModelInfo>& catalog, ModelFamily family, std::string_view id);

} // namespace model_catalog
