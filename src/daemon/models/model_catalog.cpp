#include "models/model_catalog.hpp"

namespace {

ModelInfo whisper(std::string id, uint64_t size_bytes) {
    std::string file = "ggml-" + id + ".bin";
    return ModelInfo{
        .id = std::move(id),
        .family = ModelFamily::Whisper,
        .url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/" + file,
        .size_bytes = size_bytes,
        .file_name = file,
        .required_files = {file},
    };
}

} // namespace

std::string_view to_string(ModelFamily family) {
    switch (family) {
        case ModelFamily::Whisper: return "whisper";
        case ModelFamily::Parakeet: return "parakeet";
    }
    return "unknown";
}

std::optional<ModelFamily> parse_model_family(std::string_view name) {
    if (name == "whisper") return ModelFamily::Whisper;
    if (name == "parakeet") return ModelFamily::Parakeet;
    return std::nullopt;
}

namespace model_catalog {

const std::vector<ModelInfo>& builtin() {
    static const std::vector<ModelInfo> catalog = {
        whisper("tiny", 77'691'713),
        whisper("base", 147'951'465),
        whisper("small", 487'601'967),
        whisper("medium", 1'533'763'059),
        whisper("large-v3-turbo", 1'624'555'275),
        ModelInfo{
            .id = "parakeet-tdt-0.6b-v3",
            .family = ModelFamily::Parakeet,
            .url = "https://github.com/k2-fsa/sherpa-onnx/releases/download/asr-models/"
                   "sherpa-onnx-nemo-parakeet-tdt-0.6b-v3-int8.tar.bz2",
            .size_bytes = 680'000'000,
            .file_name = "sherpa-onnx-nemo-parakeet-tdt-0.6b-v3-int8",
            .required_files = {"encoder.int8.onnx", "decoder.int8.onnx", "joiner.int8.onnx", "tokens.txt"},
        },
    };
    return catalog;
}

const ModelInfo* find(const std::vector<ModelInfo>& catalog, ModelFamily family, std::string_view id) {
    for (auto& m : catalog) {
        if (m.family == family && m.id == id) return &m;
    }
    return nullptr;
}

} // namespace model_catalog
