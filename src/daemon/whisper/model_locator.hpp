#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Model quality tiers and where their ggml files are found on disk.
namespace models {

enum class ModelTier { Tiny, Base, Small };

inline constexpr ModelTier kFallbackTier = ModelTier::Tiny;

std::string_view tier_name(ModelTier tier);

// nullopt for names that are not a known tier.
std::optional<ModelTier> tier_from_string(std::string_view name);

// Unknown names map to the fallback tier.
ModelTier parse_tier(std::string_view name);

std::string model_filename(ModelTier tier);
std::string model_url(ModelTier tier);

// Search order: configured dir, <data_dir>/models, executable dir, its parent,
// working dir, <working dir>/models. Empty entries are skipped.
std::vector<std::string> search_dirs(const std::string& configured_dir,
                                     const std::string& data_dir,
                                     const std::string& exe_dir,
                                     const std::string& working_dir);

std::optional<std::string> find_model(const std::string& filename,
                                      const std::vector<std::string>& dirs);

struct ResolvedModel {
    ModelTier tier;
    std::string path;
};

// Looks for `requested`; when it is missing everywhere, retries with the
// fallback tier. nullopt when neither is present.
std::optional<ResolvedModel> resolve(ModelTier requested, const std::vector<std::string>& dirs);

} // namespace models
