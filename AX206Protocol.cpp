#include "AX206Protocol.h"
#include <cstdio>
#include <cstring>

namespace {
void put_le16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>(v >> 8);
}

void put_le32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}
}

Command MakeGetLcdParamsCommand() {
    Command cmd;
    cmd.name = "get_lcd_params";
    cmd.cdb[0] = AX206_CDB_SIGNATURE;
    cmd.cdb[5] = AX206_CDB_GET_LCD_PARAMS;
    cmd.direction = TransferDirection::In;
    cmd.data_length = static_cast<uint32_t>(AX206_LCD_PARAMS_SIZE);
    return cmd;
}

Command MakeSetPropertyCommand(uint16_t property, uint16_t value) {
    Command cmd;
    cmd.name = "set_property";
    cmd.cdb[0] = AX206_CDB_SIGNATURE;
    cmd.cdb[5] = AX206_CDB_USBCMD;
    cmd.cdb[6] = AX206_USBCMD_SETPROPERTY;
    put_le16(&cmd.cdb[7], property);
    put_le16(&cmd.cdb[9], value);
    cmd.direction = TransferDirection::Out;
    cmd.data_length = 0;
    return cmd;
}

Command MakeBlitCommand(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) {
    Command cmd;
    cmd.name = "blit";
    cmd.cdb[0] = AX206_CDB_SIGNATURE;
    cmd.cdb[5] = AX206_CDB_USBCMD;
    cmd.cdb[6] = AX206_USBCMD_BLIT;
    put_le16(&cmd.cdb[7], x0);
    put_le16(&cmd.cdb[9], y0);
    put_le16(&cmd.cdb[11], x1);
    put_le16(&cmd.cdb[13], y1);
    cmd.direction = TransferDirection::Out;
    uint32_t w = static_cast<uint32_t>(x1 - x0 + 1);
    uint32_t h = static_cast<uint32_t>(y1 - y0 + 1);
    cmd.data_length = w * h * static_cast<uint32_t>(AX206_BYTES_PER_PIXEL);
    return cmd;
}

std::array<uint8_t, AX206_CBW_SIZE> EncodeCommandBlock(const Command& cmd) {
    std::array<uint8_t, AX206_CBW_SIZE> cbw{};
    cbw[0] = 'U';
    cbw[1] = 'S';
    cbw[2] = 'B';
    cbw[3] = 'C';
    std::memcpy(&cbw[4], AX206_CBW_TAG, sizeof(AX206_CBW_TAG));
    put_le32(&cbw[8], cmd.data_length);
    cbw[12] = (cmd.direction == TransferDirection::In) ? AX206_CBW_FLAG_IN : AX206_CBW_FLAG_OUT;
    cbw[13] = 0x00; // LUN
    cbw[14] = static_cast<uint8_t>(AX206_CDB_SIZE);
    std::memcpy(&cbw[15], cmd.cdb.data(), AX206_CDB_SIZE);
    return cbw;
}

bool ParseStatusBlock(const uint8_t* csw, size_t len, uint8_t& status) {
    if (!csw || len != AX206_CSW_SIZE) return false;
    if (csw[0] != 'U' || csw[1] != 'S' || csw[2] != 'B' || csw[3] != 'S') return false;
    status = csw[12];
    return true;
}

bool ParseLcdParams(const uint8_t* buf, size_t len, uint16_t& width, uint16_t& height) {
    if (!buf || len < AX206_LCD_PARAMS_SIZE) return false;
    uint16_t w = static_cast<uint16_t>(buf[0] | (buf[1] << 8));
    uint16_t h = static_cast<uint16_t>(buf[2] | (buf[3] << 8));
    if (w == 0 || h == 0) return false;
    width = w;
    height = h;
    return true;
}

std::string HexDump(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 3);
    char buf[4];
    for (size_t i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), i == 0 ? "%02x" : " %02x", data[i]);
        out += buf;
    }
    return out;
}
