// RtmpFrame - RTMP message framing library
// Configuration Manager Implementation

#include "rtmpframe/core/config_manager.hpp"
#include "rtmpframe/core/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace rtmpframe {
namespace core {

// =============================================================================
// Configuration Document Parser
// =============================================================================

namespace {

/**
 * @brief Parsed JSON node. Only the shapes a configuration file uses are
 * kept; arrays are accepted by the grammar and then ignored.
 */
struct JsonValue {
    enum class Kind { Null, Boolean, Number, String, Array, Object };

    Kind kind = Kind::Null;
    bool flag = false;
    double number = 0.0;
    std::string text;
    std::vector<JsonValue> items;
    std::map<std::string, JsonValue> members;

    bool isBool() const { return kind == Kind::Boolean; }
    bool isNumber() const { return kind == Kind::Number; }
    bool isString() const { return kind == Kind::String; }
    bool isObject() const { return kind == Kind::Object; }

    bool contains(const std::string& key) const {
        return isObject() && members.count(key) != 0;
    }

    const JsonValue& operator[](const std::string& key) const {
        static const JsonValue missing;
        auto it = isObject() ? members.find(key) : members.end();
        return it == members.end() ? missing : it->second;
    }

    static JsonValue of(Kind kind) {
        JsonValue value;
        value.kind = kind;
        return value;
    }
};

using JsonResult = Result<JsonValue, ConfigError>;

JsonResult parseFailure(const std::string& message) {
    return JsonResult::error(ConfigError(ConfigError::Code::ParseError, message));
}

/**
 * @brief Recursive-descent reader over a whole document held in memory.
 */
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input) {}

    JsonResult parse() {
        auto result = parseValue(0);
        if (result.isSuccess() && skipSpace() != '\0') {
            return parseFailure("Unexpected characters after JSON value");
        }
        return result;
    }

private:
    static constexpr size_t MAX_DEPTH = 16;

    // Skips whitespace and returns the next character without consuming it.
    char skipSpace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            ++pos_;
        }
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    bool accept(char expected) {
        if (skipSpace() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool acceptWord(const char* word) {
        size_t length = std::char_traits<char>::length(word);
        if (input_.compare(pos_, length, word) != 0) {
            return false;
        }
        pos_ += length;
        return true;
    }

    JsonResult parseValue(size_t depth) {
        if (depth > MAX_DEPTH) {
            return parseFailure("JSON nesting too deep");
        }

        char c = skipSpace();
        switch (c) {
            case '"': return parseString();
            case '{': return parseObject(depth);
            case '[': return parseArray(depth);
            case '\0': return parseFailure("Unexpected end of JSON input");
            default: break;
        }

        if (acceptWord("true") || acceptWord("false")) {
            JsonValue value = JsonValue::of(JsonValue::Kind::Boolean);
            value.flag = c == 't';
            return JsonResult::success(std::move(value));
        }
        if (acceptWord("null")) {
            return JsonResult::success(JsonValue{});
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parseNumber();
        }
        return parseFailure("Unexpected character: " + std::string(1, c));
    }

    JsonResult parseString() {
        if (!accept('"')) {
            return parseFailure("Expected '\"'");
        }

        // Pairs of escape letter and the character it stands for.
        static const char ESCAPES[] = "\"\"\\\\//b\bf\fn\nr\rt\t";

        JsonValue value = JsonValue::of(JsonValue::Kind::String);
        while (pos_ < input_.size() && input_[pos_] != '"') {
            char c = input_[pos_++];
            if (c == '\\' && pos_ < input_.size()) {
                c = input_[pos_++];
                for (size_t i = 0; i + 1 < sizeof(ESCAPES); i += 2) {
                    if (ESCAPES[i] == c) {
                        c = ESCAPES[i + 1];
                        break;
                    }
                }
            }
            value.text += c;
        }

        if (pos_ >= input_.size()) {
            return parseFailure("Unterminated string");
        }
        ++pos_;
        return JsonResult::success(std::move(value));
    }

    JsonResult parseNumber() {
        size_t start = pos_;
        while (pos_ < input_.size() &&
               std::strchr("+-.eE0123456789", input_[pos_]) != nullptr) {
            ++pos_;
        }

        std::string literal = input_.substr(start, pos_ - start);
        char* end = nullptr;
        errno = 0;
        double number = std::strtod(literal.c_str(), &end);
        if (end == literal.c_str() || *end != '\0' || errno == ERANGE) {
            return parseFailure("Invalid number: " + literal);
        }

        JsonValue value = JsonValue::of(JsonValue::Kind::Number);
        value.number = number;
        return JsonResult::success(std::move(value));
    }

    JsonResult parseArray(size_t depth) {
        accept('[');
        JsonValue value = JsonValue::of(JsonValue::Kind::Array);
        if (accept(']')) {
            return JsonResult::success(std::move(value));
        }

        do {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.items.push_back(std::move(element.value()));
        } while (accept(','));

        if (!accept(']')) {
            return parseFailure("Expected ',' or ']' in array");
        }
        return JsonResult::success(std::move(value));
    }

    JsonResult parseObject(size_t depth) {
        accept('{');
        JsonValue value = JsonValue::of(JsonValue::Kind::Object);
        if (accept('}')) {
            return JsonResult::success(std::move(value));
        }

        do {
            if (skipSpace() != '"') {
                return parseFailure("Expected string key in object");
            }
            auto key = parseString();
            if (key.isError()) {
                return key;
            }
            if (!accept(':')) {
                return parseFailure("Expected ':' after key");
            }
            auto member = parseValue(depth + 1);
            if (member.isError()) {
                return member;
            }
            value.members[key.value().text] = std::move(member.value());
        } while (accept(','));

        if (!accept('}')) {
            return parseFailure("Expected ',' or '}' in object");
        }
        return JsonResult::success(std::move(value));
    }

    const std::string& input_;
    size_t pos_ = 0;
};

// =============================================================================
// Field Helpers
// =============================================================================

Result<void, ConfigError> readUint32(
    const JsonValue& section, const std::string& key, const std::string& field, uint32_t& out)
{
    if (!section.contains(key)) {
        return Result<void, ConfigError>::success();
    }
    const JsonValue& value = section[key];
    if (!value.isNumber() || value.number < 0 ||
        value.number > 4294967295.0 ||
        std::floor(value.number) != value.number) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ValidationError,
                        field + " must be a non-negative integer", field));
    }
    out = static_cast<uint32_t>(value.number);
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> readBool(
    const JsonValue& section, const std::string& key, const std::string& field, bool& out)
{
    if (!section.contains(key)) {
        return Result<void, ConfigError>::success();
    }
    const JsonValue& value = section[key];
    if (!value.isBool()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ValidationError,
                        field + " must be a boolean", field));
    }
    out = value.flag;
    return Result<void, ConfigError>::success();
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<bool> parseBoolText(const std::string& text) {
    std::string lower = toLower(text);
    if (lower == "true" || lower == "1" || lower == "yes") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no") {
        return false;
    }
    return std::nullopt;
}

std::optional<uint32_t> parseUint32Text(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
            [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE || value > 0xFFFFFFFFULL) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

} // namespace

// =============================================================================
// ConfigManager
// =============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return Result<void, ConfigError>::error(contentResult.error());
    }
    return loadFromJsonString(contentResult.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto parsed = parseJson(jsonContent);
    if (parsed.isError()) {
        RTMPFRAME_LOG_ERROR(logger_, "Config", "Configuration rejected: " + parsed.error().message);
        return Result<void, ConfigError>::error(parsed.error());
    }

    auto valid = validateConfig(parsed.value());
    if (valid.isError()) {
        RTMPFRAME_LOG_ERROR(logger_, "Config", "Configuration rejected: " + valid.error().message);
        return valid;
    }

    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = parsed.value();
    }
    logEffectiveConfig();
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
    }
    RTMPFRAME_LOG_INFO(logger_, "Config", "Configuration loaded with default values");
    logEffectiveConfig();
    return Result<void, ConfigError>::success();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    if (auto val = getEnvVar("RTMPFRAME_OUT_CHUNK_SIZE")) {
        auto size = parseUint32Text(*val);
        if (size && *size >= config_limits::MIN_CHUNK_SIZE && *size <= config_limits::MAX_CHUNK_SIZE) {
            config_.protocol.outChunkSize = *size;
            RTMPFRAME_LOG_INFO(logger_, "Config", "Environment override: RTMPFRAME_OUT_CHUNK_SIZE=" + *val);
        } else {
            RTMPFRAME_LOG_WARNING(logger_, "Config", "Invalid RTMPFRAME_OUT_CHUNK_SIZE value: " + *val);
        }
    }

    if (auto val = getEnvVar("RTMPFRAME_WINDOW_ACK_SIZE")) {
        if (auto size = parseUint32Text(*val)) {
            config_.protocol.windowAckSize = *size;
            RTMPFRAME_LOG_INFO(logger_, "Config", "Environment override: RTMPFRAME_WINDOW_ACK_SIZE=" + *val);
        } else {
            RTMPFRAME_LOG_WARNING(logger_, "Config", "Invalid RTMPFRAME_WINDOW_ACK_SIZE value: " + *val);
        }
    }

    if (auto val = getEnvVar("RTMPFRAME_COMPLEX_HANDSHAKE")) {
        if (auto enabled = parseBoolText(*val)) {
            config_.protocol.complexHandshake = *enabled;
            RTMPFRAME_LOG_INFO(logger_, "Config", "Environment override: RTMPFRAME_COMPLEX_HANDSHAKE=" + *val);
        } else {
            RTMPFRAME_LOG_WARNING(logger_, "Config", "Invalid RTMPFRAME_COMPLEX_HANDSHAKE value: " + *val);
        }
    }

    if (auto val = getEnvVar("RTMPFRAME_LOG_LEVEL")) {
        if (auto level = parseLogLevel(*val)) {
            config_.logging.level = *level;
            RTMPFRAME_LOG_INFO(logger_, "Config", "Environment override: RTMPFRAME_LOG_LEVEL=" + *val);
        } else {
            RTMPFRAME_LOG_WARNING(logger_, "Config", "Invalid RTMPFRAME_LOG_LEVEL value: " + *val);
        }
    }

    if (auto val = getEnvVar("RTMPFRAME_LOG_JSON")) {
        if (auto enabled = parseBoolText(*val)) {
            config_.logging.json = *enabled;
            RTMPFRAME_LOG_INFO(logger_, "Config", "Environment override: RTMPFRAME_LOG_JSON=" + *val);
        } else {
            RTMPFRAME_LOG_WARNING(logger_, "Config", "Invalid RTMPFRAME_LOG_JSON value: " + *val);
        }
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return validateConfig(config_);
}

Result<void, ConfigError> ConfigManager::validateConfig(const Configuration& config) {
    const ProtocolConfig& protocol = config.protocol;

    if (protocol.outChunkSize < config_limits::MIN_CHUNK_SIZE ||
        protocol.outChunkSize > config_limits::MAX_CHUNK_SIZE) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ValidationError,
                        "protocol.outChunkSize must be between 128 and 65536",
                        "protocol.outChunkSize"));
    }

    if (protocol.maxMessageSize == 0 ||
        protocol.maxMessageSize > config_limits::MAX_MESSAGE_SIZE) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ValidationError,
                        "protocol.maxMessageSize must be between 1 and 16777215",
                        "protocol.maxMessageSize"));
    }

    return Result<void, ConfigError>::success();
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    std::ostringstream ss;
    ss << "{\n";
    ss << "  \"protocol\": {\n";
    ss << "    \"outChunkSize\": " << config_.protocol.outChunkSize << ",\n";
    ss << "    \"windowAckSize\": " << config_.protocol.windowAckSize << ",\n";
    ss << "    \"complexHandshake\": " << (config_.protocol.complexHandshake ? "true" : "false") << ",\n";
    ss << "    \"maxMessageSize\": " << config_.protocol.maxMessageSize << "\n";
    ss << "  },\n";
    ss << "  \"logging\": {\n";
    ss << "    \"level\": \"" << logLevelToString(config_.logging.level) << "\",\n";
    ss << "    \"json\": " << (config_.logging.json ? "true" : "false") << ",\n";
    ss << "    \"console\": " << (config_.logging.console ? "true" : "false") << ",\n";
    ss << "    \"syslog\": " << (config_.logging.syslog ? "true" : "false") << "\n";
    ss << "  }\n";
    ss << "}\n";
    return ss.str();
}

void ConfigManager::setLogger(std::shared_ptr<pal::ILogPAL> logger) {
    logger_ = std::move(logger);
}

Result<Configuration, ConfigError> ConfigManager::parseJson(const std::string& content) const {
    JsonParser parser(content);
    auto result = parser.parse();
    if (result.isError()) {
        return Result<Configuration, ConfigError>::error(result.error());
    }

    const JsonValue& root = result.value();
    if (!root.isObject()) {
        return Result<Configuration, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError,
                        "Configuration root must be an object"));
    }

    Configuration config = getConfig();

    if (root.contains("protocol")) {
        const JsonValue& protocol = root["protocol"];
        Result<void, ConfigError> steps[] = {
            readUint32(protocol, "outChunkSize", "protocol.outChunkSize", config.protocol.outChunkSize),
            readUint32(protocol, "windowAckSize", "protocol.windowAckSize", config.protocol.windowAckSize),
            readBool(protocol, "complexHandshake", "protocol.complexHandshake", config.protocol.complexHandshake),
            readUint32(protocol, "maxMessageSize", "protocol.maxMessageSize", config.protocol.maxMessageSize),
        };
        for (const auto& step : steps) {
            if (step.isError()) {
                return Result<Configuration, ConfigError>::error(step.error());
            }
        }
    }

    if (root.contains("logging")) {
        const JsonValue& logging = root["logging"];
        if (logging.contains("level")) {
            const JsonValue& levelValue = logging["level"];
            auto level = levelValue.isString() ? parseLogLevel(levelValue.text) : std::nullopt;
            if (!level) {
                return Result<Configuration, ConfigError>::error(
                    ConfigError(ConfigError::Code::ValidationError,
                                "Invalid logging.level. Valid values: trace, debug, info, warning, error, off",
                                "logging.level"));
            }
            config.logging.level = *level;
        }
        Result<void, ConfigError> steps[] = {
            readBool(logging, "json", "logging.json", config.logging.json),
            readBool(logging, "console", "logging.console", config.logging.console),
            readBool(logging, "syslog", "logging.syslog", config.logging.syslog),
        };
        for (const auto& step : steps) {
            if (step.isError()) {
                return Result<Configuration, ConfigError>::error(step.error());
            }
        }
    }

    return Result<Configuration, ConfigError>::success(std::move(config));
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

void ConfigManager::logEffectiveConfig() const {
    if (logger_ == nullptr || !logger_->isEnabled(pal::LogLevel::Debug)) {
        return;
    }
    Configuration config = getConfig();
    RTMPFRAME_LOG_DEBUG(logger_, "Config", "Effective configuration:");
    RTMPFRAME_LOG_DEBUG(logger_, "Config", "  protocol.outChunkSize: " + std::to_string(config.protocol.outChunkSize));
    RTMPFRAME_LOG_DEBUG(logger_, "Config", "  protocol.windowAckSize: " + std::to_string(config.protocol.windowAckSize));
    RTMPFRAME_LOG_DEBUG(logger_, "Config", std::string("  protocol.complexHandshake: ") +
                        (config.protocol.complexHandshake ? "true" : "false"));
    RTMPFRAME_LOG_DEBUG(logger_, "Config", "  protocol.maxMessageSize: " + std::to_string(config.protocol.maxMessageSize));
    RTMPFRAME_LOG_DEBUG(logger_, "Config", "  logging.level: " + logLevelToString(config.logging.level));
}

} // namespace core
} // namespace rtmpframe
