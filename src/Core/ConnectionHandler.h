#pragma once
/**
 * @file ConnectionHandler.h
 * @brief Per-connection reassembly loop for the sigma TCP protocol.
 *
 * The handler owns a fixed-capacity receive buffer. Each read appends bytes,
 * then the Draining phase decodes and executes as many complete commands as
 * the buffer holds, replying to each before parsing the next one. Leftover
 * bytes are compacted to the front of the buffer for the next read.
 */

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "Core/ByteStream.h"
#include "Core/ErrorCodes.h"
#include "Core/SigmaCodec.h"
#include "Core/Services/IRegisterBackend.h"

/** What to discard after an unknown opcode. */
enum class ResyncPolicy : uint8_t {
    DropByte = 0,    ///< drop the offending byte, keep draining
    DropBuffer = 1   ///< drop every unconsumed byte, stop draining
};

/** How the trailer declared by a read's total_len is treated. */
enum class ReadPaddingPolicy : uint8_t {
    SkipDeclared = 0,  ///< skip up to the declared count of 0x00 bytes
    ParseAsFrame = 1   ///< hand trailer bytes to the codec
};

/** What the peer sees when a backend call fails. */
enum class BackendFailureReply : uint8_t {
    LogOnly = 0,
    FailureResponse = 1  ///< response header with success = 1, no payload
};

struct ConnectionOptions {
    size_t bufferSize = SigmaTcpProtocol::DefaultBufferSize;
    ResyncPolicy resync = ResyncPolicy::DropByte;
    ReadPaddingPolicy readPadding = ReadPaddingPolicy::SkipDeclared;
    BackendFailureReply failureReply = BackendFailureReply::LogOnly;
};

struct ConnectionStats {
    uint32_t commands = 0;
    uint32_t reads = 0;
    uint32_t writes = 0;
    uint32_t invalidOpcodes = 0;
    uint32_t backendFailures = 0;
    uint32_t oversizedFrames = 0;
    uint32_t paddingSkipped = 0;
    uint32_t bufferResets = 0;  ///< full buffer with no complete command, contents dropped
    uint64_t bytesIn = 0;
    uint64_t bytesOut = 0;
};

enum class ConnectionState : uint8_t {
    Reading = 0,
    Draining = 1,
    Closed = 2
};

class ConnectionHandler {
public:
    ConnectionHandler(IRegisterBackend& backend, const ConnectionOptions& opts);

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    /**
     * @brief Serve the stream until the peer closes or an I/O error occurs.
     *
     * Returns ConnectionClosed on orderly EOF, ConnectionIOError otherwise.
     */
    ErrorCode run(IByteStream& stream);

    /**
     * @brief Append received bytes and drain every complete command.
     *
     * Returns false only when writing a response failed; the handler is then
     * Closed.
     */
    bool feed(IByteStream& stream, const uint8_t* data, size_t len);

    ConnectionState state() const { return state_; }
    const ConnectionStats& stats() const { return stats_; }
    size_t pending() const { return count_; }
    size_t capacity() const { return rx_.size(); }

private:
    IRegisterBackend& backend_;
    ConnectionOptions opts_;
    ConnectionState state_ = ConnectionState::Reading;
    ConnectionStats stats_{};

    std::vector<uint8_t> rx_;
    std::vector<uint8_t> tx_;
    size_t count_ = 0;

    size_t discardRemaining_ = 0;  ///< bytes of an oversized frame still to drop
    size_t paddingRemaining_ = 0;  ///< declared read trailer still allowed to skip

    bool drain_(IByteStream& stream);
    void dropIfFull_(IByteStream& stream);
    size_t skipPending_(const uint8_t* buf, size_t len);
    bool dispatch_(IByteStream& stream, const Command& cmd);
    bool handleRead_(IByteStream& stream, const ReadCommand& cmd);
    bool handleWrite_(IByteStream& stream, const WriteCommand& cmd);
    bool replyFailure_(IByteStream& stream, uint8_t chipAddr, uint32_t dataLen, uint16_t paramAddr,
                       const BackendError& err);
    bool send_(IByteStream& stream, const Response& resp);
    void compact_(size_t consumed);
};
