#pragma once

/// @file config.hpp
/// @brief Layered configuration for the bridge
///
/// Provides layered configuration with:
/// - Default values
/// - TOML configuration files
/// - Environment variables
/// - Command-line arguments

#include "fwd.hpp"
#include <strata/core/error.hpp>
#include <strata/core/log.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata_bridge {

// =============================================================================
// Config Value
// =============================================================================

/// Configuration value variant
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    File = 0,               ///< Configuration file
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::File)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);

    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Bridge Config
// =============================================================================

/// Settings the CLI and the dispatcher run with
struct BridgeConfig {
    std::string document_title = "Untitled";
    std::string default_batch_name = "Batch Operation";
    bool stop_on_error = true;
    bool continue_on_warning = true;
    bool allow_partial_success = false;
    std::string script_path;                // Empty reads requests from stdin
    strata_core::LogConfig log;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value from the highest priority layer that has it
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    /// Set value in a layer, creating the layer if needed
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "file");

    // =========================================================================
    // Sources
    // =========================================================================

    /// Load a TOML file into a layer; nested tables become dotted keys
    [[nodiscard]] strata_core::Result<void> load_toml(const std::filesystem::path& path,
                                                      const std::string& layer_name = "file");

    /// Load TOML text into a layer
    [[nodiscard]] strata_core::Result<void> load_toml_string(const std::string& content,
                                                             const std::string& layer_name = "file",
                                                             const std::string& source_name = "config");

    /// Parse --key=value, --key value and --flag arguments
    [[nodiscard]] strata_core::Result<void> parse_args(int argc, char** argv);
    [[nodiscard]] strata_core::Result<void> parse_args(const std::vector<std::string>& args);

    /// Read STRATA_* environment variables
    void load_environment();

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create the default layers and fill the defaults layer
    void setup_defaults();

    /// Build BridgeConfig from current values
    [[nodiscard]] BridgeConfig build_bridge_config() const;

private:
    /// Existing layer by name, or a new one at the given priority
    [[nodiscard]] ConfigLayer* find_or_create_layer(const std::string& name, ConfigLayerPriority priority);

    /// Get layers sorted by priority (highest to lowest)
    [[nodiscard]] std::vector<ConfigLayer*> sorted_layers() const;

    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    mutable std::mutex m_mutex;
};

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {
    inline constexpr const char* BATCH_DEFAULT_NAME = "batch.default_name";
    inline constexpr const char* BATCH_STOP_ON_ERROR = "batch.stop_on_error";
    inline constexpr const char* BATCH_CONTINUE_ON_WARNING = "batch.continue_on_warning";
    inline constexpr const char* BATCH_ALLOW_PARTIAL_SUCCESS = "batch.allow_partial_success";
    inline constexpr const char* LOG_LEVEL = "log.level";
    inline constexpr const char* LOG_DIRECTORY = "log.directory";
    inline constexpr const char* LOG_FILE = "log.file";
    inline constexpr const char* BRIDGE_DOCUMENT_TITLE = "bridge.document_title";
    inline constexpr const char* BRIDGE_SCRIPT = "script";
    inline constexpr const char* CONFIG_PATH = "config";
} // namespace config_keys

} // namespace strata_bridge
