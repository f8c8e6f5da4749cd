// RtmpFrame - RTMP message framing library
// Typed RTMP packet implementation

#include "rtmpframe/protocol/packets.hpp"

namespace rtmpframe {
namespace protocol {

namespace {

core::Error codecError(const std::string& packet, const AMFError& error) {
    return core::Error(core::ErrorCode::CodecError,
                       packet + ": " + error.message,
                       "offset=" + std::to_string(error.offset));
}

core::Error codecError(const std::string& packet, const std::string& message) {
    return core::Error(core::ErrorCode::CodecError, packet + ": " + message);
}

} // namespace

// =============================================================================
// ConnectAppPacket
// =============================================================================

core::Result<void, core::Error> ConnectAppPacket::decode(core::BufferReader& reader) {
    using DecodeResult = core::Result<void, core::Error>;

    auto name = Amf0Codec::readString(reader);
    if (name.isError()) {
        return DecodeResult::error(codecError("connect", name.error()));
    }
    if (name.value() != COMMAND_NAME) {
        return DecodeResult::error(codecError("connect",
            "command name must be \"connect\", got \"" + name.value() + "\""));
    }

    auto transactionId = Amf0Codec::readNumber(reader);
    if (transactionId.isError()) {
        return DecodeResult::error(codecError("connect", transactionId.error()));
    }
    if (transactionId.value() != TRANSACTION_ID) {
        return DecodeResult::error(codecError("connect",
            "transaction id must be 1, got " + std::to_string(transactionId.value())));
    }

    auto commandObject = Amf0Codec::readObject(reader);
    if (commandObject.isError()) {
        return DecodeResult::error(codecError("connect", commandObject.error()));
    }

    commandName_ = std::move(name.value());
    transactionId_ = transactionId.value();
    commandObject_ = std::move(commandObject.value());
    arguments_.reset();

    if (reader.remaining() > 0) {
        auto arguments = Amf0Codec::readValue(reader);
        if (arguments.isError()) {
            return DecodeResult::error(codecError("connect", arguments.error()));
        }
        if (arguments.value().isObject()) {
            arguments_ = arguments.value().asObject();
        }
    }

    return DecodeResult::success();
}

void ConnectAppPacket::encode(core::BufferWriter& writer) const {
    Amf0Codec::writeString(writer, commandName_);
    Amf0Codec::writeNumber(writer, transactionId_);
    Amf0Codec::writeObject(writer, commandObject_);
    if (arguments_) {
        Amf0Codec::writeObject(writer, *arguments_);
    }
}

size_t ConnectAppPacket::getSize() const {
    size_t size = Amf0Codec::sizeOfString(commandName_) +
                  Amf0Codec::sizeOfNumber() +
                  Amf0Codec::sizeOfObject(commandObject_);
    if (arguments_) {
        size += Amf0Codec::sizeOfObject(*arguments_);
    }
    return size;
}

std::string ConnectAppPacket::getProperty(const std::string& name) const {
    auto it = commandObject_.find(name);
    if (it == commandObject_.end() || !it->second.isString()) {
        return std::string();
    }
    return it->second.asString();
}

// =============================================================================
// ControlPacket
// =============================================================================

core::Result<void, core::Error> ControlPacket::decode(core::BufferReader& reader) {
    if (!reader.hasRemaining(4)) {
        return core::Result<void, core::Error>::error(codecError(getName(),
            "need 4 bytes, have " + std::to_string(reader.remaining())));
    }
    value_ = normalize(reader.readUint32BE());
    return core::Result<void, core::Error>::success();
}

void ControlPacket::encode(core::BufferWriter& writer) const {
    writer.writeUint32BE(value_);
}

} // namespace protocol
} // namespace rtmpframe
