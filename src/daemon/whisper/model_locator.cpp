#include "model_locator.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace models {

std::string_view tier_name(ModelTier tier) {
    switch (tier) {
        case ModelTier::Tiny: return "tiny";
        case ModelTier::Base: return "base";
        case ModelTier::Small: return "small";
    }
    return "tiny";
}

std::optional<ModelTier> tier_from_string(std::string_view name) {
    if (name == "tiny") return ModelTier::Tiny;
    if (name == "base") return ModelTier::Base;
    if (name == "small") return ModelTier::Small;
    return std::nullopt;
}

ModelTier parse_tier(std::string_view name) {
    return tier_from_string(name).value_or(kFallbackTier);
}

std::string model_filename(ModelTier tier) {
    return "ggml-" + std::string(tier_name(tier)) + ".bin";
}

std::string model_url(ModelTier tier) {
    return "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/" + model_filename(tier);
}

std::vector<std::string> search_dirs(const std::string& configured_dir,
                                     const std::string& data_dir,
                                     const std::string& exe_dir,
                                     const std::string& working_dir) {
    std::vector<std::string> dirs;
    auto add = [&dirs](const std::string& dir) {
        if (!dir.empty()) dirs.push_back(dir);
    };

    add(configured_dir);
    if (!data_dir.empty()) add((fs::path(data_dir) / "models").string());
    add(exe_dir);
    if (!exe_dir.empty()) {
        auto parent = fs::path(exe_dir).parent_path();
        if (!parent.empty() && parent != fs::path(exe_dir)) add(parent.string());
    }
    add(working_dir);
    if (!working_dir.empty()) add((fs::path(working_dir) / "models").string());
    return dirs;
}

std::optional<std::string> find_model(const std::string& filename,
                                      const std::vector<std::string>& dirs) {
    for (const auto& dir : dirs) {
        auto candidate = fs::path(dir) / filename;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::optional<ResolvedModel> resolve(ModelTier requested, const std::vector<std::string>& dirs) {
    if (auto path = find_model(model_filename(requested), dirs)) {
        return ResolvedModel{.tier = requested, .path = *path};
    }

    std::println(stderr, "engine: {} not found in:", model_filename(requested));
    for (const auto& dir : dirs) {
        std::println(stderr, "  - {}", dir);
    }

    if (requested == kFallbackTier) return std::nullopt;

    std::println(stderr, "engine: falling back to the {} model", tier_name(kFallbackTier));
    if (auto path = find_model(model_filename(kFallbackTier), dirs)) {
        return ResolvedModel{.tier = kFallbackTier, .path = *path};
    }
    return std::nullopt;
}

} // namespace models
