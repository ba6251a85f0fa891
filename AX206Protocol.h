#ifndef AX206_PROTOCOL_H
#define AX206_PROTOCOL_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// USB identity
const uint16_t AX206_VID = 0x1908;
const uint16_t AX206_PID = 0x0102;
const int AX206_INTERFACE = 0;
const int AX206_CONFIGURATION = 1;
const uint8_t AX206_EP_OUT = 0x01;
const uint8_t AX206_EP_IN = 0x81;

// Bulk-only command/status wrappers
const size_t AX206_CDB_SIZE = 16;
const size_t AX206_CBW_SIZE = 31;
const size_t AX206_CSW_SIZE = 13;
const uint8_t AX206_CBW_FLAG_IN = 0x80;
const uint8_t AX206_CBW_FLAG_OUT = 0x00;
const uint8_t AX206_CBW_TAG[4] = {0xde, 0xad, 0xbe, 0xef};

// Vendor CDB
const uint8_t AX206_CDB_SIGNATURE = 0xcd;
const uint8_t AX206_CDB_GET_LCD_PARAMS = 0x02;
const uint8_t AX206_CDB_USBCMD = 0x06;
const uint8_t AX206_USBCMD_SETPROPERTY = 0x01;
const uint8_t AX206_USBCMD_BLIT = 0x12;
const uint16_t AX206_PROPERTY_BRIGHTNESS = 0x01;
const uint16_t AX206_PROPERTY_ORIENTATION = 0x10;
const size_t AX206_LCD_PARAMS_SIZE = 5;

const int AX206_BRIGHTNESS_MIN = 0;
const int AX206_BRIGHTNESS_MAX = 7;
const int AX206_ORIENTATION_MAX = 3;

// Transfer timeouts (ms)
const unsigned int AX206_TIMEOUT_CBW_MS = 1000;
const unsigned int AX206_TIMEOUT_DATA_OUT_MS = 3000;
const unsigned int AX206_TIMEOUT_DATA_IN_MS = 4000;
const unsigned int AX206_TIMEOUT_CSW_MS = 5000;

// Largest single bulk transfer in the data phase
const size_t AX206_MAX_BULK_CHUNK = 64 * 1024;

const size_t AX206_BYTES_PER_PIXEL = 2;

enum class TransferDirection {
    Out,
    In
};

struct Command {
    const char* name = "";
    std::array<uint8_t, AX206_CDB_SIZE> cdb{};
    TransferDirection direction = TransferDirection::Out;
    uint32_t data_length = 0;
};

Command MakeGetLcdParamsCommand();
Command MakeSetPropertyCommand(uint16_t property, uint16_t value);
// Inclusive corners; data phase carries (x1-x0+1)*(y1-y0+1) pixels.
Command MakeBlitCommand(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1);

std::array<uint8_t, AX206_CBW_SIZE> EncodeCommandBlock(const Command& cmd);

// Returns false when the signature is missing or the length is wrong.
bool ParseStatusBlock(const uint8_t* csw, size_t len, uint8_t& status);

bool ParseLcdParams(const uint8_t* buf, size_t len, uint16_t& width, uint16_t& height);

// Native RGB565 to the panel's big-endian wire order.
inline void EncodeWirePixel(uint16_t px, uint8_t* out) {
    out[0] = static_cast<uint8_t>(px >> 8);
    out[1] = static_cast<uint8_t>(px & 0xFF);
}

std::string HexDump(const uint8_t* data, size_t len);

#endif // AX206_PROTOCOL_H
