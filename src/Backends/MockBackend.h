#pragma once
/**
 * @file MockBackend.h
 * @brief Hardware-free backend: constant fill reads, accepted writes.
 */

#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "Core/Services/IRegisterBackend.h"

struct MockWriteRecord {
    uint16_t address = 0;
    size_t length = 0;
    uint8_t head[8] = {0};  ///< first bytes of the payload
};

class MockBackend final : public IRegisterBackend {
public:
    /** entering is true on the way in, false on the way out. */
    using TransactionHook = void (*)(void* ctx, bool entering);

    static constexpr uint8_t DefaultFill = 12;
    static constexpr size_t JournalDepth = 64;

    explicit MockBackend(uint8_t fill = DefaultFill) : fill_(fill) {}

    const char* backendId() const override { return "mock"; }
    bool read(uint16_t address, uint8_t* out, size_t len, BackendError& err) override;
    bool write(uint16_t address, const uint8_t* data, size_t len, BackendError& err) override;

    uint8_t fill() const { return fill_; }

    /** Writes seen so far, oldest first, bounded to JournalDepth entries. */
    std::vector<MockWriteRecord> journal() const;
    uint32_t readCount() const;
    uint32_t writeCount() const;

    /** Observe every transaction from inside the backend lock. */
    void setTransactionHook(TransactionHook hook, void* ctx);

private:
    const uint8_t fill_;
    mutable std::mutex mutex_;
    std::vector<MockWriteRecord> journal_;
    uint32_t reads_ = 0;
    uint32_t writes_ = 0;
    TransactionHook hook_ = nullptr;
    void* hookCtx_ = nullptr;

    struct HookScope {
        HookScope(TransactionHook h, void* c) : hook(h), ctx(c)
        {
            if (hook) hook(ctx, true);
        }
        ~HookScope()
        {
            if (hook) hook(ctx, false);
        }
        TransactionHook hook;
        void* ctx;
    };
};
