// File: src/config/framework_config.cpp
//
// YAML Configuration Implementation for the P3IF framework engine

#include "config/framework_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace p3if {

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

// Helper to parse a non-negative count; std::stoul alone accepts "-5"
static size_t ParseCount(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos || value[start] == '-') {
        throw std::invalid_argument("expected a non-negative integer: " + value);
    }
    return std::stoul(value);
}

// Apply one "section.key: value" entry
// Throws std::invalid_argument / std::out_of_range for malformed numbers
static void ApplySetting(FrameworkConfig& config,
                         const std::string& section,
                         const std::string& key,
                         const std::string& value) {
    if (section == "framework") {
        if (key == "metrics_cache_timeout_seconds") config.framework.metrics_cache_timeout_seconds = ParseCount(value);
        else if (key == "removal_policy") config.framework.removal_policy = value;
        else if (key == "verbose") config.framework.verbose = ParseBool(value);
    }
    else if (section == "storage") {
        if (key == "type") config.storage.type = value;
        else if (key == "path") config.storage.path = value;
    }
    else if (section == "multiplex") {
        if (key == "worker_threads") config.multiplex.worker_threads = ParseCount(value);
        else if (key == "queue_capacity") config.multiplex.queue_capacity = ParseCount(value);
        else if (key == "match_by_name") config.multiplex.match_by_name = ParseBool(value);
    }
    else if (section == "interface") {
        if (key == "prompt") config.interface.prompt = value;
        else if (key == "colors_enabled") config.interface.colors_enabled = ParseBool(value);
    }
}

std::optional<FrameworkConfig> FrameworkConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<FrameworkConfig> FrameworkConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    FrameworkConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " (line " << parser.problem_mark.line + 1 << ")";
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
                        } catch (const std::logic_error&) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": " << value << std::endl;
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
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool FrameworkConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string FrameworkConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# P3IF Framework Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "framework:\n";
    ss << "  metrics_cache_timeout_seconds: " << framework.metrics_cache_timeout_seconds << "\n";
    ss << "  removal_policy: \"" << framework.removal_policy << "\"\n";
    ss << "  verbose: " << (framework.verbose ? "true" : "false") << "\n\n";

    ss << "storage:\n";
    ss << "  type: \"" << storage.type << "\"\n";
    ss << "  path: \"" << storage.path << "\"\n\n";

    ss << "multiplex:\n";
    ss << "  worker_threads: " << multiplex.worker_threads << "\n";
    ss << "  queue_capacity: " << multiplex.queue_capacity << "\n";
    ss << "  match_by_name: " << (multiplex.match_by_name ? "true" : "false") << "\n\n";

    ss << "interface:\n";
    ss << "  prompt: \"" << interface.prompt << "\"\n";
    ss << "  colors_enabled: " << (interface.colors_enabled ? "true" : "false") << "\n";

    return ss.str();
}

bool FrameworkConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> FrameworkConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (framework.removal_policy != "restrict" && framework.removal_policy != "cascade") {
        errors.push_back("removal_policy must be one of: restrict, cascade");
    }

    if (framework.metrics_cache_timeout_seconds > kMaxMetricsCacheTimeoutSeconds) {
        errors.push_back("metrics_cache_timeout_seconds must be at most " +
                         std::to_string(kMaxMetricsCacheTimeoutSeconds));
    }

    if (storage.type != "memory" && storage.type != "json" && storage.type != "sqlite") {
        errors.push_back("storage type must be one of: memory, json, sqlite");
    }
    if (storage.type != "memory" && storage.path.empty()) {
        errors.push_back("storage path is required for json and sqlite storage");
    }

    if (multiplex.worker_threads == 0) {
        errors.push_back("worker_threads must be greater than 0");
    }
    if (multiplex.worker_threads > kMaxWorkerThreads) {
        errors.push_back("worker_threads must be at most " + std::to_string(kMaxWorkerThreads));
    }
    if (multiplex.queue_capacity == 0) {
        errors.push_back("queue_capacity must be greater than 0");
    }

    return errors;
}

FrameworkConfig FrameworkConfig::Default() {
    return FrameworkConfig{};  // Uses default member initializers
}

} // namespace p3if
