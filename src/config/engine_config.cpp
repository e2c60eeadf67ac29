// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for the pitchsim engine

#include "config/engine_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace pitchsim {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static const char* BoolString(bool value) {
    return value ? "true" : "false";
}

// Apply one `section.key: value` pair; unknown sections and keys are ignored.
// Throws std::invalid_argument / std::out_of_range on malformed numbers.
static void ApplySetting(EngineConfig& config, const std::string& section,
                         const std::string& key, const std::string& value) {
    if (section == "cost") {
        config.SetWeight(key, std::stof(value));
    }
    else if (section == "features") {
        config.SetFeature(key, ParseBool(value));
    }
    else if (section == "search") {
        if (key == "near_ball_radius") config.search.near_ball_radius = std::stof(value);
        else if (key == "default_top_n") config.search.default_top_n = std::stoul(value);
        else if (key == "max_distance") config.search.max_distance = std::stof(value);
        else if (key == "min_lexical_similarity") config.search.min_lexical_similarity = std::stof(value);
    }
    else if (section == "alignment") {
        if (key == "radius") config.alignment.radius = std::stoul(value);
    }
    else if (section == "lexical") {
        if (key == "min_document_count") config.lexical.min_document_count = std::stoul(value);
        else if (key == "max_document_ratio") config.lexical.max_document_ratio = std::stof(value);
    }
    else if (section == "hybrid") {
        if (key == "alignment_weight") config.hybrid.alignment_weight = std::stof(value);
        else if (key == "lexical_weight") config.hybrid.lexical_weight = std::stof(value);
        else if (key == "candidate_count") config.hybrid.candidate_count = std::stoul(value);
    }
    else if (section == "logging") {
        if (key == "verbose") config.logging.verbose = ParseBool(value);
    }
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "[Config] Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "[Config] YAML parse error";
            if (parser.problem != nullptr) {
                std::cerr << ": " << parser.problem << " (line "
                          << parser.problem_mark.line + 1 << ")";
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            std::cerr << "[Config] Invalid value for " << current_section
                                      << "." << current_key << ": \"" << value << "\" ("
                                      << e.what() << ")" << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "[Config] Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return true;
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# pitchsim Engine Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "cost:\n";
    ss << "  ball_position: " << cost.ball_position << "\n";
    ss << "  event_type: " << cost.event_type << "\n";
    ss << "  player_formation: " << cost.player_formation << "\n";
    ss << "  pass_type: " << cost.pass_type << "\n";
    ss << "  shot_type: " << cost.shot_type << "\n";
    ss << "  pressure_type: " << cost.pressure_type << "\n\n";

    ss << "features:\n";
    ss << "  pass_type: " << BoolString(features.pass_type) << "\n";
    ss << "  shot_type: " << BoolString(features.shot_type) << "\n";
    ss << "  pressure_type: " << BoolString(features.pressure_type) << "\n\n";

    ss << "search:\n";
    ss << "  near_ball_radius: " << search.near_ball_radius << "\n";
    ss << "  default_top_n: " << search.default_top_n << "\n";
    ss << "  max_distance: " << search.max_distance << "\n";
    ss << "  min_lexical_similarity: " << search.min_lexical_similarity << "\n\n";

    ss << "alignment:\n";
    ss << "  radius: " << alignment.radius << "\n\n";

    ss << "lexical:\n";
    ss << "  min_document_count: " << lexical.min_document_count << "\n";
    ss << "  max_document_ratio: " << lexical.max_document_ratio << "\n\n";

    ss << "hybrid:\n";
    ss << "  alignment_weight: " << hybrid.alignment_weight << "\n";
    ss << "  lexical_weight: " << hybrid.lexical_weight << "\n";
    ss << "  candidate_count: " << hybrid.candidate_count << "\n\n";

    ss << "logging:\n";
    ss << "  verbose: " << BoolString(logging.verbose) << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate weights
    if (cost.ball_position < 0.0f || cost.event_type < 0.0f ||
        cost.player_formation < 0.0f || cost.pass_type < 0.0f ||
        cost.shot_type < 0.0f || cost.pressure_type < 0.0f) {
        errors.push_back("cost weights must be non-negative");
    }

    // Validate search settings
    if (search.near_ball_radius < 0.0f) {
        errors.push_back("near_ball_radius must be non-negative");
    }
    if (search.default_top_n == 0) {
        errors.push_back("default_top_n must be greater than 0");
    }
    if (search.max_distance <= 0.0f) {
        errors.push_back("max_distance must be greater than 0");
    }
    if (search.min_lexical_similarity < 0.0f || search.min_lexical_similarity > 1.0f) {
        errors.push_back("min_lexical_similarity must be between 0.0 and 1.0");
    }

    // Validate vocabulary bounds
    if (lexical.max_document_ratio <= 0.0f || lexical.max_document_ratio > 1.0f) {
        errors.push_back("max_document_ratio must be in (0.0, 1.0]");
    }

    // Validate hybrid fusion
    if (hybrid.alignment_weight < 0.0f || hybrid.lexical_weight < 0.0f) {
        errors.push_back("hybrid weights must be non-negative");
    }
    if (hybrid.alignment_weight + hybrid.lexical_weight > 1.0f + 1e-5f) {
        errors.push_back("alignment_weight + lexical_weight must not exceed 1.0");
    }
    if (hybrid.candidate_count == 0) {
        errors.push_back("candidate_count must be greater than 0");
    }

    return errors;
}

bool EngineConfig::SetWeight(const std::string& name, float value) {
    if (name == "ball_position") cost.ball_position = value;
    else if (name == "event_type") cost.event_type = value;
    else if (name == "player_formation") cost.player_formation = value;
    else if (name == "pass_type") cost.pass_type = value;
    else if (name == "shot_type") cost.shot_type = value;
    else if (name == "pressure_type") cost.pressure_type = value;
    else return false;
    return true;
}

bool EngineConfig::SetFeature(const std::string& name, bool enabled) {
    if (name == "pass_type") features.pass_type = enabled;
    else if (name == "shot_type") features.shot_type = enabled;
    else if (name == "pressure_type") features.pressure_type = enabled;
    else return false;
    return true;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

} // namespace pitchsim
