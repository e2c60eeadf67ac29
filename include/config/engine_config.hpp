// File: include/config/engine_config.hpp
//
// YAML Configuration Support for the pitchsim engine
// Groups every runtime setting of the similarity engine and loads them from
// YAML configuration files

#ifndef PITCHSIM_ENGINE_CONFIG_HPP
#define PITCHSIM_ENGINE_CONFIG_HPP

#include <string>
#include <optional>
#include <vector>

namespace pitchsim {

/// Configuration structure for the similarity engine
struct EngineConfig {
    // === Event Cost Weights ===
    struct Cost {
        float ball_position = 1.0f;
        float event_type = 1.0f;
        float player_formation = 1.0f;
        float pass_type = 0.5f;
        float shot_type = 0.5f;
        float pressure_type = 0.3f;
    } cost;

    // === Optional Sub-costs ===
    struct Features {
        bool pass_type = false;
        bool shot_type = false;
        bool pressure_type = false;
    } features;

    // === Search Settings ===
    struct Search {
        float near_ball_radius = 15.0f;
        size_t default_top_n = 10;
        float max_distance = 150.0f;          // per-step distance mapped to similarity 0
        float min_lexical_similarity = 0.01f; // lexical results below are dropped
    } search;

    // === Alignment Settings ===
    struct Alignment {
        size_t radius = 1;                    // approximation radius
    } alignment;

    // === Vocabulary Settings ===
    struct Lexical {
        size_t min_document_count = 2;
        float max_document_ratio = 0.95f;
    } lexical;

    // === Hybrid Fusion Settings ===
    struct Hybrid {
        float alignment_weight = 0.6f;
        float lexical_weight = 0.4f;
        size_t candidate_count = 50;
    } hybrid;

    // === Logging Settings ===
    struct Logging {
        bool verbose = false;
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig structure if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig structure if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    /// @return YAML representation of configuration
    std::string ToYamlString() const;

    /// Validate configuration values
    /// @return true if configuration is valid, false otherwise
    bool Validate() const;

    /// Get validation errors (if any)
    /// @return Vector of error messages
    std::vector<std::string> GetValidationErrors() const;

    /// Set a cost weight by component name ("ball_position", "event_type",
    /// "player_formation", "pass_type", "shot_type", "pressure_type")
    /// @return false if the name is unknown
    bool SetWeight(const std::string& name, float value);

    /// Enable or disable an optional sub-cost ("pass_type", "shot_type",
    /// "pressure_type")
    /// @return false if the name is unknown
    bool SetFeature(const std::string& name, bool enabled);

    /// Create default configuration
    static EngineConfig Default();
};

} // namespace pitchsim

#endif // PITCHSIM_ENGINE_CONFIG_HPP
