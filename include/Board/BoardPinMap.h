#pragma once

#include <stdint.h>

namespace Board {
namespace PinMap {

// I2C master wired to the DSP control port.
static constexpr int8_t I2cSda = 2;
static constexpr int8_t I2cScl = 5;
static constexpr uint32_t I2cFreqHz = 400000;

// 7-bit bus address of the DSP (ADAU1452 with ADDR0/ADDR1 strapped high).
static constexpr uint8_t DspAddress = 0x3B;

static constexpr uint32_t LogBaud = 115200;

}  // namespace PinMap
}  // namespace Board
