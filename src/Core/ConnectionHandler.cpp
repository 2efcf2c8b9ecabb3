/**
 * @file ConnectionHandler.cpp
 * @brief Receive, drain, dispatch and compact loop.
 */

#include "Core/ConnectionHandler.h"

#include <string.h>

#define LOG_TAG "ConnHdlr"
#include "Core/ModuleLog.h"

using namespace SigmaTcpProtocol;

ConnectionHandler::ConnectionHandler(IRegisterBackend& backend, const ConnectionOptions& opts)
    : backend_(backend),
      opts_(opts)
{
    // A buffer smaller than a write header could never make progress.
    if (opts_.bufferSize < WriteHeaderSize) opts_.bufferSize = WriteHeaderSize;
    if (opts_.bufferSize > MaxBufferSize) {
        LOGW("buffer of %lu bytes clamped to %u",
             (unsigned long)opts_.bufferSize,
             (unsigned)MaxBufferSize);
        opts_.bufferSize = MaxBufferSize;
    }
    rx_.resize(opts_.bufferSize);
    // Grown on demand by large reads, bounded by bufferSize.
    tx_.resize(ResponseHeaderSize);
}

ErrorCode ConnectionHandler::run(IByteStream& stream)
{
    state_ = ConnectionState::Reading;
    while (state_ != ConnectionState::Closed) {
        dropIfFull_(stream);

        const int n = stream.read(rx_.data() + count_, rx_.size() - count_);
        if (n == 0) {
            state_ = ConnectionState::Closed;
            LOGI("%s closed by peer cmds=%lu reads=%lu writes=%lu invalid=%lu failures=%lu in=%llu out=%llu",
                 stream.peerName(),
                 (unsigned long)stats_.commands,
                 (unsigned long)stats_.reads,
                 (unsigned long)stats_.writes,
                 (unsigned long)stats_.invalidOpcodes,
                 (unsigned long)stats_.backendFailures,
                 (unsigned long long)stats_.bytesIn,
                 (unsigned long long)stats_.bytesOut);
            return ErrorCode::ConnectionClosed;
        }
        if (n < 0) {
            state_ = ConnectionState::Closed;
            LOGW("%s read failed, closing", stream.peerName());
            return ErrorCode::ConnectionIOError;
        }

        LOG_HEXD("rx", rx_.data() + count_, (size_t)n);
        count_ += (size_t)n;
        stats_.bytesIn += (uint64_t)n;
        if (!drain_(stream)) {
            LOGW("%s write failed, closing", stream.peerName());
            return ErrorCode::ConnectionIOError;
        }
    }
    return ErrorCode::ConnectionClosed;
}

bool ConnectionHandler::feed(IByteStream& stream, const uint8_t* data, size_t len)
{
    if (state_ == ConnectionState::Closed) return false;
    size_t off = 0;
    while (off < len) {
        dropIfFull_(stream);
        size_t chunk = rx_.size() - count_;
        if (chunk > len - off) chunk = len - off;
        memcpy(rx_.data() + count_, data + off, chunk);
        count_ += chunk;
        off += chunk;
        stats_.bytesIn += chunk;
        if (!drain_(stream)) return false;
    }
    return true;
}

void ConnectionHandler::dropIfFull_(IByteStream& stream)
{
    if (count_ < rx_.size()) return;
    // Unreachable while oversized frames are discarded; never spin on a full buffer.
    ++stats_.bufferResets;
    LOGE("%s rx buffer full (%u bytes) without a complete command, dropping",
         stream.peerName(),
         (unsigned)count_);
    count_ = 0;
}

size_t ConnectionHandler::skipPending_(const uint8_t* buf, size_t len)
{
    size_t skipped = 0;
    if (discardRemaining_ > 0) {
        const size_t n = (discardRemaining_ < len) ? discardRemaining_ : len;
        discardRemaining_ -= n;
        skipped += n;
        if (discardRemaining_ == 0) {
            LOGW("oversized frame discarded");
        }
    }

    while (paddingRemaining_ > 0 && skipped < len) {
        if (buf[skipped] != 0x00) {
            // Not padding after all: this is the next frame.
            paddingRemaining_ = 0;
            break;
        }
        --paddingRemaining_;
        ++skipped;
        ++stats_.paddingSkipped;
    }
    return skipped;
}

bool ConnectionHandler::drain_(IByteStream& stream)
{
    state_ = ConnectionState::Draining;
    size_t off = 0;

    while (off < count_) {
        off += skipPending_(rx_.data() + off, count_ - off);
        if (off >= count_) break;

        const ParseResult r = SigmaCodec::parse(rx_.data() + off, count_ - off);

        if (r.status == ParseStatus::Complete) {
            if (!dispatch_(stream, r.command)) {
                state_ = ConnectionState::Closed;
                return false;
            }
            off += r.consumed;
            if (r.command.kind == CommandKind::Read && opts_.readPadding == ReadPaddingPolicy::SkipDeclared) {
                paddingRemaining_ = r.paddingDeclared;
            }
            continue;
        }

        if (r.status == ParseStatus::Incomplete) {
            if (r.required > rx_.size()) {
                ++stats_.oversizedFrames;
                LOGE("frame of %lu bytes exceeds buffer of %u bytes, discarding (%s)",
                     (unsigned long)r.required,
                     (unsigned)rx_.size(),
                     errorCodeStr(ErrorCode::Overflow));
                discardRemaining_ = r.required;
                continue;
            }
            break;
        }

        ++stats_.invalidOpcodes;
        const Response diag = SigmaCodec::makeErrorResponse("Unknown command: 0x%02x", (unsigned)r.command.opcode);
        if (opts_.resync == ResyncPolicy::DropByte) {
            LOGW("%s, dropping 1 byte", diag.message);
            off += 1;
            continue;
        }
        LOGW("%s, dropping %u buffered bytes", diag.message, (unsigned)(count_ - off));
        off = count_;
        break;
    }

    compact_(off);
    state_ = ConnectionState::Reading;
    return true;
}

void ConnectionHandler::compact_(size_t consumed)
{
    if (consumed == 0) return;
    if (consumed < count_) {
        memmove(rx_.data(), rx_.data() + consumed, count_ - consumed);
        count_ -= consumed;
    } else {
        count_ = 0;
    }
}

bool ConnectionHandler::dispatch_(IByteStream& stream, const Command& cmd)
{
    ++stats_.commands;
    switch (cmd.kind) {
    case CommandKind::Read: return handleRead_(stream, cmd.read);
    case CommandKind::Write: return handleWrite_(stream, cmd.write);
    default:
        // parse() reports unknown opcodes as Invalid; nothing to execute.
        return true;
    }
}

bool ConnectionHandler::handleRead_(IByteStream& stream, const ReadCommand& cmd)
{
    ++stats_.reads;
    LOGD("read chip=0x%02X addr=0x%04X len=%lu",
         (unsigned)cmd.chipAddr,
         (unsigned)cmd.paramAddr,
         (unsigned long)cmd.dataLen);

    BackendError err{};
    if ((size_t)cmd.dataLen > opts_.bufferSize) {
        err.set(ErrorCode::Overflow, "read of %lu bytes exceeds limit %u",
                (unsigned long)cmd.dataLen,
                (unsigned)opts_.bufferSize);
        return replyFailure_(stream, cmd.chipAddr, cmd.dataLen, cmd.paramAddr, err);
    }

    const size_t needed = ResponseHeaderSize + (size_t)cmd.dataLen;
    if (tx_.size() < needed) tx_.resize(needed);

    uint8_t* payload = tx_.data() + ResponseHeaderSize;
    if (!backend_.read(cmd.paramAddr, payload, cmd.dataLen, err)) {
        if (err.code == ErrorCode::Ok) err.code = ErrorCode::BackendFailure;
        return replyFailure_(stream, cmd.chipAddr, cmd.dataLen, cmd.paramAddr, err);
    }

    const Response resp = SigmaCodec::makeReadResponse(cmd.chipAddr, cmd.dataLen, cmd.paramAddr,
                                                       payload, cmd.dataLen);
    return send_(stream, resp);
}

bool ConnectionHandler::handleWrite_(IByteStream& stream, const WriteCommand& cmd)
{
    ++stats_.writes;
    LOGD("write chip=0x%02X addr=0x%04X len=%lu safeload=%u channel=%u",
         (unsigned)cmd.chipAddr,
         (unsigned)cmd.paramAddr,
         (unsigned long)cmd.dataLen,
         (unsigned)cmd.safeload,
         (unsigned)cmd.channel);

    BackendError err{};
    if (!backend_.write(cmd.paramAddr, cmd.payload, cmd.dataLen, err)) {
        if (err.code == ErrorCode::Ok) err.code = ErrorCode::BackendFailure;
        return replyFailure_(stream, cmd.chipAddr, cmd.dataLen, cmd.paramAddr, err);
    }

    return send_(stream, SigmaCodec::makeWriteResponse(cmd.chipAddr, cmd.dataLen, cmd.paramAddr));
}

bool ConnectionHandler::replyFailure_(IByteStream& stream, uint8_t chipAddr, uint32_t dataLen, uint16_t paramAddr,
                                      const BackendError& err)
{
    ++stats_.backendFailures;
    const Response diag = SigmaCodec::makeErrorResponse("%s at 0x%04X len=%lu: %s",
                                                        errorCodeStr(err.code),
                                                        (unsigned)paramAddr,
                                                        (unsigned long)dataLen,
                                                        err.message);
    LOGE("%s", diag.message);

    if (opts_.failureReply != BackendFailureReply::FailureResponse) return true;
    return send_(stream, SigmaCodec::makeFailureResponse(chipAddr, dataLen, paramAddr));
}

bool ConnectionHandler::send_(IByteStream& stream, const Response& resp)
{
    const size_t n = SigmaCodec::encodeResponse(resp, tx_.data(), tx_.size());
    if (n == 0) {
        LOGE("response encoding failed kind=%u", (unsigned)resp.kind);
        return true;
    }
    if (!stream.writeAll(tx_.data(), n) || !stream.flush()) {
        state_ = ConnectionState::Closed;
        return false;
    }
    stats_.bytesOut += n;
    return true;
}
