// RtmpFrame - RTMP message framing library
// AMF0 Codec Implementation

#include "rtmpframe/protocol/amf0_codec.hpp"

#include <cstring>

namespace rtmpframe {
namespace protocol {

namespace {

template <typename T>
core::Result<T, AMFError> unexpectedEnd(const core::BufferReader& reader, const char* what) {
    return core::Result<T, AMFError>::error(
        AMFError(AMFError::Code::UnexpectedEnd, reader.position(),
                 std::string("Not enough data for AMF0 ") + what));
}

template <typename T>
core::Result<T, AMFError> wrongMarker(size_t offset, uint8_t marker, const char* expected) {
    return core::Result<T, AMFError>::error(
        AMFError(AMFError::Code::InvalidType, offset,
                 "Expected AMF0 " + std::string(expected) + ", found marker " +
                 std::to_string(marker)));
}

} // namespace

// =============================================================================
// AMFValue
// =============================================================================

const AMFValue& AMFValue::get(const std::string& key) const {
    static const AMFValue null;
    if (!isObject()) {
        return null;
    }
    const auto& object = std::get<AMFObject>(data);
    auto it = object.find(key);
    return it != object.end() ? it->second : null;
}

bool AMFValue::operator==(const AMFValue& other) const {
    return type == other.type && data == other.data;
}

// =============================================================================
// Decoding
// =============================================================================

core::Result<uint8_t, AMFError> Amf0Codec::readMarker(core::BufferReader& reader) {
    if (!reader.hasRemaining(1)) {
        return unexpectedEnd<uint8_t>(reader, "type marker");
    }
    return core::Result<uint8_t, AMFError>::success(reader.readUint8());
}

core::Result<std::string, AMFError> Amf0Codec::readUtf8(core::BufferReader& reader, size_t lengthBytes) {
    if (!reader.hasRemaining(lengthBytes)) {
        return unexpectedEnd<std::string>(reader, "string length");
    }
    size_t length = lengthBytes == 2 ? reader.readUint16BE() : reader.readUint32BE();
    if (!reader.hasRemaining(length)) {
        return unexpectedEnd<std::string>(reader, "string content");
    }
    std::string value(reinterpret_cast<const char*>(reader.current()), length);
    reader.skip(length);
    return core::Result<std::string, AMFError>::success(std::move(value));
}

core::Result<std::string, AMFError> Amf0Codec::readString(core::BufferReader& reader) {
    size_t offset = reader.position();
    auto marker = readMarker(reader);
    if (marker.isError()) {
        return core::Result<std::string, AMFError>::error(marker.error());
    }
    if (marker.value() == amf0::STRING_MARKER) {
        return readUtf8(reader, 2);
    }
    if (marker.value() == amf0::LONG_STRING_MARKER) {
        return readUtf8(reader, 4);
    }
    return wrongMarker<std::string>(offset, marker.value(), "string");
}

core::Result<double, AMFError> Amf0Codec::readNumber(core::BufferReader& reader) {
    size_t offset = reader.position();
    auto marker = readMarker(reader);
    if (marker.isError()) {
        return core::Result<double, AMFError>::error(marker.error());
    }
    if (marker.value() != amf0::NUMBER_MARKER) {
        return wrongMarker<double>(offset, marker.value(), "number");
    }
    if (!reader.hasRemaining(8)) {
        return unexpectedEnd<double>(reader, "number");
    }
    uint64_t bits = (static_cast<uint64_t>(reader.readUint32BE()) << 32);
    bits |= reader.readUint32BE();
    double value;
    std::memcpy(&value, &bits, sizeof(double));
    return core::Result<double, AMFError>::success(value);
}

core::Result<bool, AMFError> Amf0Codec::readBoolean(core::BufferReader& reader) {
    size_t offset = reader.position();
    auto marker = readMarker(reader);
    if (marker.isError()) {
        return core::Result<bool, AMFError>::error(marker.error());
    }
    if (marker.value() != amf0::BOOLEAN_MARKER) {
        return wrongMarker<bool>(offset, marker.value(), "boolean");
    }
    if (!reader.hasRemaining(1)) {
        return unexpectedEnd<bool>(reader, "boolean");
    }
    return core::Result<bool, AMFError>::success(reader.readUint8() != 0);
}

core::Result<void, AMFError> Amf0Codec::readNull(core::BufferReader& reader) {
    size_t offset = reader.position();
    auto marker = readMarker(reader);
    if (marker.isError()) {
        return core::Result<void, AMFError>::error(marker.error());
    }
    if (marker.value() != amf0::NULL_MARKER && marker.value() != amf0::UNDEFINED_MARKER) {
        return core::Result<void, AMFError>::error(
            AMFError(AMFError::Code::InvalidType, offset,
                     "Expected AMF0 null, found marker " + std::to_string(marker.value())));
    }
    return core::Result<void, AMFError>::success();
}

core::Result<AMFObject, AMFError> Amf0Codec::readObject(core::BufferReader& reader) {
    size_t offset = reader.position();
    auto marker = readMarker(reader);
    if (marker.isError()) {
        return core::Result<AMFObject, AMFError>::error(marker.error());
    }
    if (marker.value() == amf0::ECMA_ARRAY_MARKER) {
        if (!reader.hasRemaining(4)) {
            return unexpectedEnd<AMFObject>(reader, "ECMA array count");
        }
        reader.skip(4);
    } else if (marker.value() != amf0::OBJECT_MARKER) {
        return wrongMarker<AMFObject>(offset, marker.value(), "object");
    }
    return readProperties(reader, 1);
}

core::Result<AMFValue, AMFError> Amf0Codec::readValue(core::BufferReader& reader) {
    return readValueAt(reader, 0);
}

core::Result<AMFObject, AMFError> Amf0Codec::readProperties(core::BufferReader& reader, size_t depth) {
    AMFObject properties;

    while (true) {
        // Object end marker (00 00 09)
        if (reader.hasRemaining(3) &&
            reader.current()[0] == 0x00 && reader.current()[1] == 0x00 &&
            reader.current()[2] == amf0::OBJECT_END_MARKER) {
            reader.skip(3);
            return core::Result<AMFObject, AMFError>::success(std::move(properties));
        }

        auto name = readUtf8(reader, 2);
        if (name.isError()) {
            return core::Result<AMFObject, AMFError>::error(name.error());
        }

        auto value = readValueAt(reader, depth);
        if (value.isError()) {
            return core::Result<AMFObject, AMFError>::error(value.error());
        }

        properties[name.value()] = std::move(value.value());
    }
}

core::Result<AMFValue, AMFError> Amf0Codec::readValueAt(core::BufferReader& reader, size_t depth) {
    using ValueResult = core::Result<AMFValue, AMFError>;

    if (depth > amf0::MAX_NESTING_DEPTH) {
        return ValueResult::error(
            AMFError(AMFError::Code::NestingTooDeep, reader.position(),
                     "Maximum nesting depth exceeded"));
    }

    size_t offset = reader.position();
    auto marker = readMarker(reader);
    if (marker.isError()) {
        return ValueResult::error(marker.error());
    }

    switch (marker.value()) {
        case amf0::NUMBER_MARKER:
        case amf0::BOOLEAN_MARKER:
        case amf0::STRING_MARKER:
        case amf0::LONG_STRING_MARKER: {
            reader.seek(offset);
            if (marker.value() == amf0::NUMBER_MARKER) {
                auto number = readNumber(reader);
                if (number.isError()) return ValueResult::error(number.error());
                return ValueResult::success(AMFValue::makeNumber(number.value()));
            }
            if (marker.value() == amf0::BOOLEAN_MARKER) {
                auto boolean = readBoolean(reader);
                if (boolean.isError()) return ValueResult::error(boolean.error());
                return ValueResult::success(AMFValue::makeBoolean(boolean.value()));
            }
            auto str = readString(reader);
            if (str.isError()) return ValueResult::error(str.error());
            return ValueResult::success(AMFValue::makeString(std::move(str.value())));
        }

        case amf0::NULL_MARKER:
            return ValueResult::success(AMFValue::makeNull());

        case amf0::UNDEFINED_MARKER:
            return ValueResult::success(AMFValue::makeUndefined());

        case amf0::OBJECT_MARKER: {
            auto properties = readProperties(reader, depth + 1);
            if (properties.isError()) return ValueResult::error(properties.error());
            return ValueResult::success(AMFValue::makeObject(std::move(properties.value())));
        }

        case amf0::ECMA_ARRAY_MARKER: {
            if (!reader.hasRemaining(4)) {
                return unexpectedEnd<AMFValue>(reader, "ECMA array count");
            }
            reader.skip(4);  // count is only a hint
            auto properties = readProperties(reader, depth + 1);
            if (properties.isError()) return ValueResult::error(properties.error());
            return ValueResult::success(AMFValue::makeECMAArray(std::move(properties.value())));
        }

        case amf0::STRICT_ARRAY_MARKER: {
            if (!reader.hasRemaining(4)) {
                return unexpectedEnd<AMFValue>(reader, "strict array count");
            }
            uint32_t count = reader.readUint32BE();
            AMFArray elements;
            for (uint32_t i = 0; i < count; ++i) {
                auto element = readValueAt(reader, depth + 1);
                if (element.isError()) return ValueResult::error(element.error());
                elements.push_back(std::move(element.value()));
            }
            return ValueResult::success(AMFValue::makeArray(std::move(elements)));
        }

        case amf0::DATE_MARKER: {
            if (!reader.hasRemaining(10)) {
                return unexpectedEnd<AMFValue>(reader, "date");
            }
            uint64_t bits = (static_cast<uint64_t>(reader.readUint32BE()) << 32);
            bits |= reader.readUint32BE();
            double millis;
            std::memcpy(&millis, &bits, sizeof(double));
            reader.skip(2);  // timezone, always zero
            // Also false for NaN.
            if (!(millis >= -9223372036854775808.0 && millis < 9223372036854775808.0)) {
                return ValueResult::error(
                    AMFError(AMFError::Code::InvalidType, offset,
                             "Date value outside the millisecond range"));
            }
            return ValueResult::success(AMFValue::makeDate(
                std::chrono::milliseconds(static_cast<int64_t>(millis))));
        }

        default:
            return ValueResult::error(
                AMFError(AMFError::Code::InvalidType, offset,
                         "Unsupported AMF0 type marker " + std::to_string(marker.value())));
    }
}

// =============================================================================
// Encoding
// =============================================================================

void Amf0Codec::writeDouble(core::BufferWriter& writer, double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(double));
    writer.writeUint32BE(static_cast<uint32_t>(bits >> 32));
    writer.writeUint32BE(static_cast<uint32_t>(bits & 0xFFFFFFFF));
}

void Amf0Codec::writeUtf8(core::BufferWriter& writer, const std::string& value) {
    writer.writeUint16BE(static_cast<uint16_t>(value.size()));
    writer.writeBytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

void Amf0Codec::writeString(core::BufferWriter& writer, const std::string& value) {
    if (value.size() > amf0::MAX_SHORT_STRING_LENGTH) {
        writer.writeUint8(amf0::LONG_STRING_MARKER);
        writer.writeUint32BE(static_cast<uint32_t>(value.size()));
        writer.writeBytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
        return;
    }
    writer.writeUint8(amf0::STRING_MARKER);
    writeUtf8(writer, value);
}

void Amf0Codec::writeNumber(core::BufferWriter& writer, double value) {
    writer.writeUint8(amf0::NUMBER_MARKER);
    writeDouble(writer, value);
}

void Amf0Codec::writeBoolean(core::BufferWriter& writer, bool value) {
    writer.writeUint8(amf0::BOOLEAN_MARKER);
    writer.writeUint8(value ? 1 : 0);
}

void Amf0Codec::writeNull(core::BufferWriter& writer) {
    writer.writeUint8(amf0::NULL_MARKER);
}

void Amf0Codec::writeProperties(core::BufferWriter& writer, const AMFObject& object) {
    for (const auto& [key, value] : object) {
        writeUtf8(writer, key);
        writeValue(writer, value);
    }
    writer.writeUint8(0x00);
    writer.writeUint8(0x00);
    writer.writeUint8(amf0::OBJECT_END_MARKER);
}

void Amf0Codec::writeObject(core::BufferWriter& writer, const AMFObject& object) {
    writer.writeUint8(amf0::OBJECT_MARKER);
    writeProperties(writer, object);
}

void Amf0Codec::writeValue(core::BufferWriter& writer, const AMFValue& value) {
    switch (value.type) {
        case AMFValue::Type::Null:
            writeNull(writer);
            break;
        case AMFValue::Type::Undefined:
            writer.writeUint8(amf0::UNDEFINED_MARKER);
            break;
        case AMFValue::Type::Boolean:
            writeBoolean(writer, value.asBool());
            break;
        case AMFValue::Type::Number:
            writeNumber(writer, value.asNumber());
            break;
        case AMFValue::Type::String:
            writeString(writer, value.asString());
            break;
        case AMFValue::Type::Object:
            writeObject(writer, value.asObject());
            break;
        case AMFValue::Type::ECMAArray:
            writer.writeUint8(amf0::ECMA_ARRAY_MARKER);
            writer.writeUint32BE(static_cast<uint32_t>(value.asObject().size()));
            writeProperties(writer, value.asObject());
            break;
        case AMFValue::Type::StrictArray:
            writer.writeUint8(amf0::STRICT_ARRAY_MARKER);
            writer.writeUint32BE(static_cast<uint32_t>(value.asArray().size()));
            for (const auto& element : value.asArray()) {
                writeValue(writer, element);
            }
            break;
        case AMFValue::Type::Date:
            writer.writeUint8(amf0::DATE_MARKER);
            writeDouble(writer, static_cast<double>(value.asDate().count()));
            writer.writeUint16BE(0);
            break;
    }
}

// =============================================================================
// Encoded sizes
// =============================================================================

size_t Amf0Codec::sizeOfString(const std::string& value) {
    return value.size() > amf0::MAX_SHORT_STRING_LENGTH ? 1 + 4 + value.size() : 1 + 2 + value.size();
}

size_t Amf0Codec::sizeOfNumber() {
    return 1 + 8;
}

size_t Amf0Codec::sizeOfBoolean() {
    return 1 + 1;
}

size_t Amf0Codec::sizeOfNull() {
    return 1;
}

size_t Amf0Codec::sizeOfProperties(const AMFObject& object) {
    size_t size = 3;  // end marker
    for (const auto& [key, value] : object) {
        size += 2 + key.size() + sizeOfValue(value);
    }
    return size;
}

size_t Amf0Codec::sizeOfObject(const AMFObject& object) {
    return 1 + sizeOfProperties(object);
}

size_t Amf0Codec::sizeOfValue(const AMFValue& value) {
    switch (value.type) {
        case AMFValue::Type::Null:
        case AMFValue::Type::Undefined:
            return sizeOfNull();
        case AMFValue::Type::Boolean:
            return sizeOfBoolean();
        case AMFValue::Type::Number:
            return sizeOfNumber();
        case AMFValue::Type::String:
            return sizeOfString(value.asString());
        case AMFValue::Type::Object:
            return sizeOfObject(value.asObject());
        case AMFValue::Type::ECMAArray:
            return 1 + 4 + sizeOfProperties(value.asObject());
        case AMFValue::Type::StrictArray: {
            size_t size = 1 + 4;
            for (const auto& element : value.asArray()) {
                size += sizeOfValue(element);
            }
            return size;
        }
        case AMFValue::Type::Date:
            return 1 + 8 + 2;
    }
    return 0;
}

} // namespace protocol
} // namespace rtmpframe
