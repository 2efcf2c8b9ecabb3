/**
 * @file MockBackend.cpp
 * @brief Mock backend implementation.
 */

#include "Backends/MockBackend.h"

#include <string.h>

#define LOG_TAG "MockBknd"
#include "Core/ModuleLog.h"

bool MockBackend::read(uint16_t address, uint8_t* out, size_t len, BackendError& err)
{
    if (!out && len > 0) {
        err.set(ErrorCode::BadRequest, "null read buffer");
        return false;
    }
    std::lock_guard<std::mutex> guard(mutex_);
    HookScope scope(hook_, hookCtx_);
    LOGI("read: 0x%04x %u", (unsigned)address, (unsigned)len);
    if (len > 0) memset(out, fill_, len);
    ++reads_;
    return true;
}

bool MockBackend::write(uint16_t address, const uint8_t* data, size_t len, BackendError& err)
{
    if (!data && len > 0) {
        err.set(ErrorCode::BadRequest, "null write buffer");
        return false;
    }
    std::lock_guard<std::mutex> guard(mutex_);
    HookScope scope(hook_, hookCtx_);
    LOGI("write: 0x%04x %u", (unsigned)address, (unsigned)len);

    MockWriteRecord rec{};
    rec.address = address;
    rec.length = len;
    const size_t head = (len < sizeof(rec.head)) ? len : sizeof(rec.head);
    if (head > 0) memcpy(rec.head, data, head);

    if (journal_.size() >= JournalDepth) journal_.erase(journal_.begin());
    journal_.push_back(rec);
    ++writes_;
    return true;
}

std::vector<MockWriteRecord> MockBackend::journal() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return journal_;
}

uint32_t MockBackend::readCount() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return reads_;
}

uint32_t MockBackend::writeCount() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return writes_;
}

void MockBackend::setTransactionHook(TransactionHook hook, void* ctx)
{
    std::lock_guard<std::mutex> guard(mutex_);
    hook_ = hook;
    hookCtx_ = ctx;
}
