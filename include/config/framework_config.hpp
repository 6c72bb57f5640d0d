// File: include/config/framework_config.hpp
//
// YAML Configuration Support for the P3IF framework engine
// Loads engine, storage, multiplex and CLI settings from YAML configuration files

#ifndef P3IF_FRAMEWORK_CONFIG_HPP
#define P3IF_FRAMEWORK_CONFIG_HPP

#include <cstddef>
#include <string>
#include <optional>
#include <vector>

namespace p3if {

/// Configuration structure for a Framework instance and its collaborators
struct FrameworkConfig {
    static constexpr size_t kMaxMetricsCacheTimeoutSeconds = 7 * 24 * 3600;
    static constexpr size_t kMaxWorkerThreads = 256;

    // === Engine Settings ===
    struct Core {
        size_t metrics_cache_timeout_seconds = 300;  // 5 minutes default
        std::string removal_policy = "restrict";     // restrict | cascade
        bool verbose = false;
    } framework;

    // === Persistence Settings ===
    struct Storage {
        std::string type = "memory";                 // memory | json | sqlite
        std::string path = "p3if-data.json";
    } storage;

    // === Multiplex Settings ===
    struct Multiplex {
        size_t worker_threads = 4;
        size_t queue_capacity = 64;
        bool match_by_name = true;
    } multiplex;

    // === Interface Settings ===
    struct Interface {
        std::string prompt = "p3if> ";
        bool colors_enabled = true;
    } interface;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return FrameworkConfig structure if successful, std::nullopt on error
    static std::optional<FrameworkConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return FrameworkConfig structure if successful, std::nullopt on error
    static std::optional<FrameworkConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static FrameworkConfig Default();
};

} // namespace p3if

#endif // P3IF_FRAMEWORK_CONFIG_HPP
