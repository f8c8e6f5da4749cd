// RtmpFrame - RTMP message framing library
// rtmpframe_dump - replay a captured client byte stream through a session
//
// The capture holds what a client sent to a server: C0+C1, C2, then chunks.
// Every received message is logged along with the packet it decodes to.

#include <iostream>
#include <memory>
#include <string>

#include "rtmpframe/core/config_manager.hpp"
#include "rtmpframe/core/structured_logger.hpp"
#include "rtmpframe/protocol/rtmp_protocol.hpp"
#include "rtmpframe/protocol/transport.hpp"

namespace {

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <capture-file>\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     JSON configuration file\n"
              << "  -v, --verbose         Log at debug level\n"
              << "  -h, --help            Show this help\n"
              << "\nEnvironment:\n"
              << "  RTMPFRAME_OUT_CHUNK_SIZE, RTMPFRAME_WINDOW_ACK_SIZE,\n"
              << "  RTMPFRAME_COMPLEX_HANDSHAKE, RTMPFRAME_LOG_LEVEL, RTMPFRAME_LOG_JSON\n"
              << std::endl;
}

std::string describePacket(const rtmpframe::protocol::Packet& packet) {
    using namespace rtmpframe::protocol;

    if (auto* connect = dynamic_cast<const ConnectAppPacket*>(&packet)) {
        return std::string("connect app=\"") + connect->getProperty("app") +
               "\" tcUrl=\"" + connect->getProperty("tcUrl") + "\"";
    }
    if (auto* chunkSize = dynamic_cast<const SetChunkSizePacket*>(&packet)) {
        return "SetChunkSize " + std::to_string(chunkSize->getChunkSize());
    }
    if (auto* window = dynamic_cast<const SetWindowAckSizePacket*>(&packet)) {
        return "WindowAckSize " + std::to_string(window->getAckWindowSize());
    }
    if (auto* ack = dynamic_cast<const AcknowledgementPacket*>(&packet)) {
        return "Acknowledgement " + std::to_string(ack->getSequenceNumber());
    }
    if (auto* abort = dynamic_cast<const AbortMessagePacket*>(&packet)) {
        return "Abort cid=" + std::to_string(abort->getChunkStreamId());
    }
    return packet.getName();
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace rtmpframe;

    std::string configPath;
    std::string capturePath;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (capturePath.empty()) {
            capturePath = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    if (capturePath.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    core::ConfigManager configManager;
    if (!configPath.empty()) {
        auto loaded = configManager.loadFromFile(configPath);
        if (loaded.isError()) {
            std::cerr << "[ERROR] " << configPath << ": " << loaded.error().message;
            if (!loaded.error().field.empty()) {
                std::cerr << " (" << loaded.error().field << ")";
            }
            std::cerr << std::endl;
            return 1;
        }
    }
    configManager.applyEnvironmentOverrides();

    core::Configuration config = configManager.getConfig();
    if (verbose) {
        config.logging.level = pal::LogLevel::Debug;
    }

    std::shared_ptr<core::StructuredLogger> logger = core::createLogger(config.logging);
    configManager.setLogger(logger);

    protocol::FileByteSource source(capturePath);
    if (!source.isOpen()) {
        logger->error("Cannot open capture " + capturePath, "Dump");
        return 1;
    }

    protocol::MemoryByteSink sink;
    protocol::RtmpProtocol session(source, sink, config.protocol, logger);

    auto shaken = session.handshakeWithClient();
    if (shaken.isError()) {
        logger->error("Handshake: " + shaken.error().toString(), "Dump");
        return 1;
    }
    if (!shaken.value()) {
        logger->error("Capture ends inside the handshake", "Dump");
        return 1;
    }
    logger->info(std::string("Handshake complete (") +
                 (session.usedComplexHandshake() ? "complex" : "simple") + ")", "Dump");

    auto announced = session.sendInitialControlMessages();
    if (announced.isError()) {
        logger->error("Initial control messages: " + announced.error().toString(), "Dump");
        return 1;
    }

    size_t messageCount = 0;
    while (true) {
        auto received = session.recvMessage();
        if (received.isError()) {
            if (received.error().code == core::ErrorCode::ConnectionClosed) {
                break;
            }
            logger->error("Receive: " + received.error().toString(), "Dump");
            return 1;
        }
        if (!received.value()) {
            break;
        }

        const protocol::RtmpMessage& message = *received.value();
        messageCount++;

        std::string line = "#" + std::to_string(messageCount) +
            " type=" + std::to_string(message.header.messageType) +
            " stream=" + std::to_string(message.header.streamId) +
            " ts=" + std::to_string(message.header.timestamp) +
            " len=" + std::to_string(message.header.payloadLength);

        auto decoded = session.decodeMessage(message);
        if (decoded.isError()) {
            line += " undecodable: " + decoded.error().toString();
        } else if (decoded.value()) {
            line += " " + describePacket(*decoded.value());
        }
        logger->info(line, "Dump");
    }

    logger->info(std::to_string(messageCount) + " messages, " +
                 std::to_string(sink.data().size()) + " bytes answered, " +
                 std::to_string(session.getAckWindow().getReceivedTotal()) + " chunk bytes read",
                 "Dump");
    logger->flush();
    return 0;
}
