#pragma once
/**
 * @file SigmaTcpProtocol.h
 * @brief Wire constants for the sigma TCP register protocol.
 *
 * All multi-byte fields are big-endian.
 */

#include <stddef.h>
#include <stdint.h>

namespace SigmaTcpProtocol {

constexpr uint8_t OpWrite = 0x09;
constexpr uint8_t OpRead = 0x0A;
constexpr uint8_t OpResponse = 0x0B;

constexpr size_t ReadHeaderSize = 12;      // control, total_len, chip, data_len, param
constexpr size_t WriteHeaderSize = 14;     // control, safeload, channel, total_len, chip, data_len, param
// The response header carries 14 bytes on the wire while its total_len field
// counts 13 + payload, matching what DSP authoring tools send and expect.
constexpr size_t ResponseHeaderSize = 14;  // control, total_len, chip, data_len, param, success, reserved
constexpr uint32_t ResponseDeclaredBase = 13;

// Read command field offsets.
constexpr size_t ReadOffTotalLen = 1;
constexpr size_t ReadOffChipAddr = 5;
constexpr size_t ReadOffDataLen = 6;
constexpr size_t ReadOffParamAddr = 10;

// Write command field offsets.
constexpr size_t WriteOffSafeload = 1;
constexpr size_t WriteOffChannel = 2;
constexpr size_t WriteOffTotalLen = 3;
constexpr size_t WriteOffChipAddr = 7;
constexpr size_t WriteOffDataLen = 8;
constexpr size_t WriteOffParamAddr = 12;

// Response field offsets.
constexpr size_t RespOffTotalLen = 1;
constexpr size_t RespOffChipAddr = 5;
constexpr size_t RespOffDataLen = 6;
constexpr size_t RespOffParamAddr = 10;
constexpr size_t RespOffSuccess = 12;
constexpr size_t RespOffReserved = 13;

constexpr uint8_t SuccessOk = 0;
constexpr uint8_t SuccessFailed = 1;

constexpr uint16_t DefaultTcpPort = 8086;

// One ADAU1452 memory partition (20480 words of 4 bytes) plus a write header.
constexpr size_t DspPartitionBytes = 20480U * 4U;
constexpr size_t DefaultBufferSize = DspPartitionBytes + WriteHeaderSize;
// Largest per-connection receive buffer a configuration may ask for.
constexpr size_t MaxBufferSize = DefaultBufferSize;

}  // namespace SigmaTcpProtocol
