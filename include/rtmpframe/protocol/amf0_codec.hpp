// RtmpFrame - RTMP message framing library
// AMF0 (Action Message Format) Codec - command and data message payloads
//
// AMF0 Type Markers:
// - 0x00: Number (IEEE 754 double)
// - 0x01: Boolean
// - 0x02: String (16-bit length prefix)
// - 0x03: Object (key-value pairs)
// - 0x05: Null
// - 0x06: Undefined
// - 0x08: ECMA Array (associative array with count hint)
// - 0x09: Object End marker
// - 0x0A: Strict Array (indexed array)
// - 0x0B: Date (milliseconds since epoch)
// - 0x0C: Long String (32-bit length prefix)

#ifndef RTMPFRAME_PROTOCOL_AMF0_CODEC_HPP
#define RTMPFRAME_PROTOCOL_AMF0_CODEC_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "rtmpframe/core/buffer.hpp"
#include "rtmpframe/core/result.hpp"

namespace rtmpframe {
namespace protocol {

// =============================================================================
// AMF0 Type Markers
// =============================================================================

namespace amf0 {
    constexpr uint8_t NUMBER_MARKER = 0x00;
    constexpr uint8_t BOOLEAN_MARKER = 0x01;
    constexpr uint8_t STRING_MARKER = 0x02;
    constexpr uint8_t OBJECT_MARKER = 0x03;
    constexpr uint8_t NULL_MARKER = 0x05;
    constexpr uint8_t UNDEFINED_MARKER = 0x06;
    constexpr uint8_t ECMA_ARRAY_MARKER = 0x08;
    constexpr uint8_t OBJECT_END_MARKER = 0x09;
    constexpr uint8_t STRICT_ARRAY_MARKER = 0x0A;
    constexpr uint8_t DATE_MARKER = 0x0B;
    constexpr uint8_t LONG_STRING_MARKER = 0x0C;

    constexpr size_t MAX_NESTING_DEPTH = 32;
    constexpr size_t MAX_SHORT_STRING_LENGTH = 0xFFFF;
}

// =============================================================================
// AMF Error Type
// =============================================================================

/**
 * @brief Error information for AMF codec operations.
 */
struct AMFError {
    enum class Code {
        UnexpectedEnd,      ///< Truncated data - more bytes expected
        InvalidType,        ///< Unknown, unsupported or unexpected type marker
        NestingTooDeep,     ///< Object nesting exceeds maximum depth
        MalformedData       ///< Generic malformed data error
    };

    Code code;              ///< Error code
    size_t offset;          ///< Byte offset where error occurred
    std::string message;    ///< Human-readable error message

    AMFError(Code c = Code::MalformedData, size_t off = 0, std::string msg = "")
        : code(c), offset(off), message(std::move(msg)) {}
};

// =============================================================================
// AMF Value Type
// =============================================================================

struct AMFValue;

using AMFObject = std::map<std::string, AMFValue>;
using AMFArray = std::vector<AMFValue>;

/**
 * @brief Variant type representing any AMF0 value.
 */
struct AMFValue {
    enum class Type {
        Null,           ///< Null value
        Undefined,      ///< Undefined value
        Boolean,        ///< Boolean (true/false)
        Number,         ///< IEEE 754 double-precision float
        String,         ///< UTF-8 string (short or long on the wire)
        Object,         ///< Key-value object
        ECMAArray,      ///< Associative array
        StrictArray,    ///< Strict indexed array
        Date            ///< Date (milliseconds since epoch)
    };

    Type type = Type::Null;

    std::variant<
        std::nullptr_t,                          // Null/Undefined
        bool,                                    // Boolean
        double,                                  // Number
        std::string,                             // String
        AMFObject,                               // Object/ECMAArray
        AMFArray,                                // StrictArray
        std::chrono::milliseconds                // Date
    > data = nullptr;

    // -------------------------------------------------------------------------
    // Constructors
    // -------------------------------------------------------------------------

    AMFValue() = default;

    static AMFValue makeNull() {
        return AMFValue{};
    }

    static AMFValue makeUndefined() {
        AMFValue v;
        v.type = Type::Undefined;
        return v;
    }

    static AMFValue makeBoolean(bool value) {
        AMFValue v;
        v.type = Type::Boolean;
        v.data = value;
        return v;
    }

    static AMFValue makeNumber(double value) {
        AMFValue v;
        v.type = Type::Number;
        v.data = value;
        return v;
    }

    static AMFValue makeString(std::string value) {
        AMFValue v;
        v.type = Type::String;
        v.data = std::move(value);
        return v;
    }

    static AMFValue makeObject(AMFObject value) {
        AMFValue v;
        v.type = Type::Object;
        v.data = std::move(value);
        return v;
    }

    static AMFValue makeECMAArray(AMFObject value) {
        AMFValue v;
        v.type = Type::ECMAArray;
        v.data = std::move(value);
        return v;
    }

    static AMFValue makeArray(AMFArray value) {
        AMFValue v;
        v.type = Type::StrictArray;
        v.data = std::move(value);
        return v;
    }

    static AMFValue makeDate(std::chrono::milliseconds value) {
        AMFValue v;
        v.type = Type::Date;
        v.data = value;
        return v;
    }

    // -------------------------------------------------------------------------
    // Type Checkers
    // -------------------------------------------------------------------------

    [[nodiscard]] bool isNull() const {
        return type == Type::Null || type == Type::Undefined;
    }

    [[nodiscard]] bool isBoolean() const { return type == Type::Boolean; }
    [[nodiscard]] bool isNumber() const { return type == Type::Number; }
    [[nodiscard]] bool isString() const { return type == Type::String; }

    [[nodiscard]] bool isObject() const {
        return type == Type::Object || type == Type::ECMAArray;
    }

    [[nodiscard]] bool isArray() const { return type == Type::StrictArray; }
    [[nodiscard]] bool isDate() const { return type == Type::Date; }

    // -------------------------------------------------------------------------
    // Value Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] bool asBool() const {
        return type == Type::Boolean ? std::get<bool>(data) : false;
    }

    [[nodiscard]] double asNumber() const {
        return type == Type::Number ? std::get<double>(data) : 0.0;
    }

    [[nodiscard]] const std::string& asString() const {
        static const std::string empty;
        return type == Type::String ? std::get<std::string>(data) : empty;
    }

    [[nodiscard]] const AMFObject& asObject() const {
        static const AMFObject empty;
        return isObject() ? std::get<AMFObject>(data) : empty;
    }

    [[nodiscard]] const AMFArray& asArray() const {
        static const AMFArray empty;
        return type == Type::StrictArray ? std::get<AMFArray>(data) : empty;
    }

    [[nodiscard]] std::chrono::milliseconds asDate() const {
        return type == Type::Date ? std::get<std::chrono::milliseconds>(data)
                                  : std::chrono::milliseconds{0};
    }

    /**
     * @brief Property of an object value, or a null value if absent.
     */
    [[nodiscard]] const AMFValue& get(const std::string& key) const;

    bool operator==(const AMFValue& other) const;
    bool operator!=(const AMFValue& other) const { return !(*this == other); }
};

// =============================================================================
// AMF0 Codec
// =============================================================================

/**
 * @brief AMF0 reader and writer over the shared byte cursor.
 *
 * Typed readers check the marker and fail with InvalidType when another
 * type is found; readValue() accepts any supported marker. On failure
 * the cursor position is unspecified. Callers that need to retry keep a
 * mark. Writers never fail.
 *
 * Safety features:
 * - Maximum nesting depth of 32 levels
 * - Error reporting with byte offset for debugging
 */
class Amf0Codec {
public:
    // -------------------------------------------------------------------------
    // Decoding
    // -------------------------------------------------------------------------

    static core::Result<std::string, AMFError> readString(core::BufferReader& reader);
    static core::Result<double, AMFError> readNumber(core::BufferReader& reader);
    static core::Result<bool, AMFError> readBoolean(core::BufferReader& reader);

    /**
     * @brief Read a null or undefined marker.
     */
    static core::Result<void, AMFError> readNull(core::BufferReader& reader);

    /**
     * @brief Read an object (ECMA arrays are accepted too).
     */
    static core::Result<AMFObject, AMFError> readObject(core::BufferReader& reader);

    static core::Result<AMFValue, AMFError> readValue(core::BufferReader& reader);

    // -------------------------------------------------------------------------
    // Encoding
    // -------------------------------------------------------------------------

    /**
     * @brief Write a string, as a long string when over 65535 bytes.
     */
    static void writeString(core::BufferWriter& writer, const std::string& value);
    static void writeNumber(core::BufferWriter& writer, double value);
    static void writeBoolean(core::BufferWriter& writer, bool value);
    static void writeNull(core::BufferWriter& writer);
    static void writeObject(core::BufferWriter& writer, const AMFObject& object);
    static void writeValue(core::BufferWriter& writer, const AMFValue& value);

    // -------------------------------------------------------------------------
    // Encoded sizes
    // -------------------------------------------------------------------------

    static size_t sizeOfString(const std::string& value);
    static size_t sizeOfNumber();
    static size_t sizeOfBoolean();
    static size_t sizeOfNull();
    static size_t sizeOfObject(const AMFObject& object);
    static size_t sizeOfValue(const AMFValue& value);

private:
    static core::Result<AMFValue, AMFError> readValueAt(core::BufferReader& reader, size_t depth);
    static core::Result<AMFObject, AMFError> readProperties(core::BufferReader& reader, size_t depth);
    static core::Result<std::string, AMFError> readUtf8(core::BufferReader& reader, size_t lengthBytes);
    static core::Result<uint8_t, AMFError> readMarker(core::BufferReader& reader);

    static void writeUtf8(core::BufferWriter& writer, const std::string& value);
    static void writeProperties(core::BufferWriter& writer, const AMFObject& object);
    static void writeDouble(core::BufferWriter& writer, double value);
    static size_t sizeOfProperties(const AMFObject& object);
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_AMF0_CODEC_HPP
