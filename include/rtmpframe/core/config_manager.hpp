// RtmpFrame - RTMP message framing library
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse JSON configuration files
// - Support environment variable overrides (RTMPFRAME_* prefix)
// - Validate values with field-level error messages
// - Apply defaults when no configuration is supplied
// - Log the effective configuration

#ifndef RTMPFRAME_CORE_CONFIG_MANAGER_HPP
#define RTMPFRAME_CORE_CONFIG_MANAGER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include "rtmpframe/core/result.hpp"
#include "rtmpframe/pal/log_pal.hpp"
#include "rtmpframe/pal/pal_types.hpp"

namespace rtmpframe {
namespace core {

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Per-connection protocol settings.
 */
struct ProtocolConfig {
    /// Chunk size announced to the peer with SetChunkSize after the handshake.
    uint32_t outChunkSize = 128;
    /// Window announced to the peer with WindowAckSize; 0 sends nothing.
    uint32_t windowAckSize = 2500000;
    /// Try the digest handshake before the plain one.
    bool complexHandshake = true;
    /// Largest payload the reader accepts for one message.
    uint32_t maxMessageSize = 0xFFFFFF;
};

/**
 * @brief Logging settings consumed by createLogger().
 */
struct LoggingConfig {
    pal::LogLevel level = pal::LogLevel::Info;
    bool json = false;
    bool console = true;
    bool syslog = false;
};

/**
 * @brief Complete configuration.
 */
struct Configuration {
    ProtocolConfig protocol;
    LoggingConfig logging;
};

// =============================================================================
// Configuration Limits
// =============================================================================

namespace config_limits {
    constexpr uint32_t MIN_CHUNK_SIZE = 128;
    constexpr uint32_t MAX_CHUNK_SIZE = 65536;
    constexpr uint32_t MAX_MESSAGE_SIZE = 0xFFFFFF;
}

// =============================================================================
// Configuration Error
// =============================================================================

/**
 * @brief Configuration error details.
 */
struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
};

// =============================================================================
// Configuration Manager
// =============================================================================

/**
 * @brief Loads and validates the library configuration.
 *
 * JSON layout:
 * @code
 * {
 *   "protocol": {
 *     "outChunkSize": 4096,
 *     "windowAckSize": 2500000,
 *     "complexHandshake": true,
 *     "maxMessageSize": 16777215
 *   },
 *   "logging": { "level": "debug", "json": false, "console": true, "syslog": false }
 * }
 * @endcode
 *
 * Unknown keys are ignored. Loading is all-or-nothing: a document that
 * fails to parse or validate leaves the previous configuration in place.
 *
 * ## Thread Safety
 * Reads and loads may run concurrently; the configuration is guarded by
 * a shared mutex.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable and non-movable (contains mutex)
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Load configuration from a JSON file.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    /**
     * @brief Load configuration from a JSON string.
     */
    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Reset to the built-in defaults.
     */
    Result<void, ConfigError> loadDefaults();

    /**
     * @brief Apply RTMPFRAME_* environment variables on top of the current values.
     *
     * Recognized variables: RTMPFRAME_OUT_CHUNK_SIZE, RTMPFRAME_WINDOW_ACK_SIZE,
     * RTMPFRAME_COMPLEX_HANDSHAKE, RTMPFRAME_LOG_LEVEL, RTMPFRAME_LOG_JSON.
     * Malformed values are logged and skipped.
     */
    void applyEnvironmentOverrides();

    /**
     * @brief Check the current configuration against the limits.
     */
    Result<void, ConfigError> validate() const;

    /**
     * @brief Snapshot of the current configuration.
     */
    Configuration getConfig() const;

    /**
     * @brief Serialize the current configuration as JSON.
     */
    std::string dumpConfig() const;

    /**
     * @brief Logger used for override notices and the effective configuration.
     */
    void setLogger(std::shared_ptr<pal::ILogPAL> logger);

private:
    Result<Configuration, ConfigError> parseJson(const std::string& content) const;
    static Result<void, ConfigError> validateConfig(const Configuration& config);
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;
    std::optional<std::string> getEnvVar(const std::string& name) const;
    void logEffectiveConfig() const;

    mutable std::shared_mutex configMutex_;
    Configuration config_;
    std::shared_ptr<pal::ILogPAL> logger_;
};

} // namespace core
} // namespace rtmpframe

#endif // RTMPFRAME_CORE_CONFIG_MANAGER_HPP
