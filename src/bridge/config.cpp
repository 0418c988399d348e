/// @file config.cpp
/// @brief Configuration system implementation for the bridge

#include <strata/bridge/config.hpp>

#include <toml++/toml.hpp>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace strata_bridge {

namespace {

/// Type a command-line or environment string the way a TOML value would be
ConfigValue typed_value(const std::string& value) {
    if (value == "true" || value == "false") {
        return ConfigValue{value == "true"};
    }

    std::int64_t int_val = 0;
    auto [int_end, int_ec] = std::from_chars(value.data(), value.data() + value.size(), int_val);
    if (int_ec == std::errc{} && int_end == value.data() + value.size() && !value.empty()) {
        return ConfigValue{int_val};
    }

    double float_val = 0.0;
    auto [float_end, float_ec] = std::from_chars(value.data(), value.data() + value.size(), float_val);
    if (float_ec == std::errc{} && float_end == value.data() + value.size() && !value.empty()) {
        return ConfigValue{float_val};
    }

    return ConfigValue{value};
}

void flatten_table(const toml::table& tbl, const std::string& prefix, ConfigLayer& layer) {
    for (auto&& [k, node] : tbl) {
        std::string key = prefix.empty() ? std::string(k.str()) : prefix + "." + std::string(k.str());

        if (auto sub = node.as_table()) {
            flatten_table(*sub, key, layer);
        } else if (node.is_boolean()) {
            layer.set(key, ConfigValue{node.value_or(false)});
        } else if (node.is_integer()) {
            layer.set(key, ConfigValue{node.value_or(std::int64_t{0})});
        } else if (node.is_floating_point()) {
            layer.set(key, ConfigValue{node.value_or(0.0)});
        } else if (node.is_string()) {
            layer.set(key, ConfigValue{node.value_or(std::string{})});
        } else if (auto arr = node.as_array()) {
            std::vector<std::string> items;
            for (const auto& item : *arr) {
                if (auto s = item.value<std::string>()) {
                    items.push_back(*s);
                }
            }
            layer.set(key, ConfigValue{std::move(items)});
        }
    }
}

} // anonymous namespace

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

// =============================================================================
// ConfigManager
// =============================================================================

ConfigLayer* ConfigManager::find_or_create_layer(const std::string& name, ConfigLayerPriority priority) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    auto layers = sorted_layers();
    for (auto* layer : layers) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    // Environment values arrive as strings
    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v == "true" || *v == "1" || *v == "yes";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        std::int64_t parsed = 0;
        auto [end, ec] = std::from_chars(v->data(), v->data() + v->size(), parsed);
        return ec == std::errc{} && end == v->data() + v->size() ? parsed : default_value;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    find_or_create_layer(layer_name, ConfigLayerPriority::File)->set(key, std::move(value));
}

// =============================================================================
// Sources
// =============================================================================

strata_core::Result<void> ConfigManager::load_toml(
    const std::filesystem::path& path,
    const std::string& layer_name)
{
    std::ifstream file(path);
    if (!file) {
        return strata_core::Err(strata_core::Error(strata_core::ErrorCode::IOError,
            "Failed to open file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return load_toml_string(buffer.str(), layer_name, path.string());
}

strata_core::Result<void> ConfigManager::load_toml_string(
    const std::string& content,
    const std::string& layer_name,
    const std::string& source_name)
{
    try {
        toml::table tbl = toml::parse(content, source_name);
        ConfigLayer* layer = find_or_create_layer(layer_name, ConfigLayerPriority::File);
        flatten_table(tbl, {}, *layer);
    } catch (const toml::parse_error& err) {
        return strata_core::Err(strata_core::Error(strata_core::ErrorCode::ParseError,
            "TOML parse error: " + std::string(err.what())));
    }

    return strata_core::Ok();
}

strata_core::Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

strata_core::Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    ConfigLayer* layer = find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (!arg.starts_with("--") || arg.size() == 2) {
            return strata_core::Err(strata_core::Error(strata_core::ErrorCode::InvalidArgument,
                "Unexpected argument: " + arg));
        }

        std::string key_value = arg.substr(2);
        auto eq_pos = key_value.find('=');

        std::string key;
        std::string value;

        if (eq_pos != std::string::npos) {
            // --key=value format
            key = key_value.substr(0, eq_pos);
            value = key_value.substr(eq_pos + 1);
        } else if (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
            // --key value format
            key = key_value;
            value = args[++i];
        } else {
            // --flag format (boolean true)
            key = key_value;
            value = "true";
        }

        // Convert - to . for config keys (e.g., --log-level -> log.level)
        std::replace(key.begin(), key.end(), '-', '.');

        layer->set(key, typed_value(value));
    }

    return strata_core::Ok();
}

void ConfigManager::load_environment() {
    ConfigLayer* layer = find_or_create_layer("environment", ConfigLayerPriority::Environment);

    const std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"STRATA_LOG_LEVEL", config_keys::LOG_LEVEL},
        {"STRATA_LOG_DIR", config_keys::LOG_DIRECTORY},
    };

    for (const auto& [env_name, config_key] : env_mappings) {
#ifdef _WIN32
        char* value = nullptr;
        std::size_t size = 0;
        if (_dupenv_s(&value, &size, env_name.c_str()) == 0 && value != nullptr) {
            layer->set(config_key, ConfigValue{std::string(value)});
            free(value);
        }
#else
        const char* value = std::getenv(env_name.c_str());
        if (value) {
            layer->set(config_key, ConfigValue{std::string(value)});
        }
#endif
    }
}

// =============================================================================
// Defaults
// =============================================================================

void ConfigManager::setup_defaults() {
    find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);
    find_or_create_layer("environment", ConfigLayerPriority::Environment);
    find_or_create_layer("file", ConfigLayerPriority::File);
    auto* defaults = find_or_create_layer("defaults", ConfigLayerPriority::Default);

    defaults->set(config_keys::BATCH_DEFAULT_NAME, ConfigValue{std::string("Batch Operation")});
    defaults->set(config_keys::BATCH_STOP_ON_ERROR, ConfigValue{true});
    defaults->set(config_keys::BATCH_CONTINUE_ON_WARNING, ConfigValue{true});
    defaults->set(config_keys::BATCH_ALLOW_PARTIAL_SUCCESS, ConfigValue{false});
    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string("logs")});
    defaults->set(config_keys::LOG_FILE, ConfigValue{false});
    defaults->set(config_keys::BRIDGE_DOCUMENT_TITLE, ConfigValue{std::string("Untitled")});
}

BridgeConfig ConfigManager::build_bridge_config() const {
    BridgeConfig config;

    config.document_title = get_string(config_keys::BRIDGE_DOCUMENT_TITLE, "Untitled");
    config.default_batch_name = get_string(config_keys::BATCH_DEFAULT_NAME, "Batch Operation");
    config.stop_on_error = get_bool(config_keys::BATCH_STOP_ON_ERROR, true);
    config.continue_on_warning = get_bool(config_keys::BATCH_CONTINUE_ON_WARNING, true);
    config.allow_partial_success = get_bool(config_keys::BATCH_ALLOW_PARTIAL_SUCCESS, false);
    config.script_path = get_string(config_keys::BRIDGE_SCRIPT, "");

    auto level_name = get_string(config_keys::LOG_LEVEL, "info");
    if (auto level = strata_core::parse_log_level(level_name)) {
        config.log.level = *level;
    } else {
        strata_core::bridge_logger()->warn("Unknown log level '{}', using info", level_name);
    }
    config.log.log_directory = get_string(config_keys::LOG_DIRECTORY, "logs");
    config.log.file_enabled = get_bool(config_keys::LOG_FILE, false);

    return config;
}

std::vector<ConfigLayer*> ConfigManager::sorted_layers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ConfigLayer*> result;
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Sort by priority (lower value = higher priority)
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

} // namespace strata_bridge
