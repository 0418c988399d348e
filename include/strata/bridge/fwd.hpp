#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_bridge module

#include <cstdint>

namespace strata_bridge {

// =============================================================================
// Configuration
// =============================================================================

enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigManager;
struct BridgeConfig;

// =============================================================================
// Dispatch
// =============================================================================

class ResponseBuilder;
class CommandDispatcher;

} // namespace strata_bridge
