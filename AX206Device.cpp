#include "AX206Device.h"
#include "Log.h"
#include "utils.h"
#include <algorithm>

std::unique_ptr<AX206Device> AX206Device::Open(UsbBus& bus, const DeviceSelector& selector) {
    std::unique_ptr<UsbHandle> handle = bus.Open(selector);
    std::string description = handle->Describe();
    std::unique_ptr<AX206Device> device(new AX206Device(std::move(handle), description));
    device->handshake();
    return device;
}

AX206Device::AX206Device(std::unique_ptr<UsbHandle> handle, const std::string& description)
    : handle_(std::move(handle)), description_(description), valid_(true) {
    trace_ = ProtocolTraceEnabled();
}

AX206Device::~AX206Device() {
    Close();
}

void AX206Device::handshake() {
    uint8_t params[AX206_LCD_PARAMS_SIZE] = {0};
    try {
        execute(MakeGetLcdParamsCommand(), nullptr, params, sizeof(params));
    } catch (const DeviceError&) {
        Close();
        throw;
    }
    uint16_t w = 0, h = 0;
    if (!ParseLcdParams(params, sizeof(params), w, h)) {
        invalidate("bad LCD parameters " + HexDump(params, sizeof(params)));
        Close();
        throw DeviceError(DeviceErrorCode::ProtocolError,
                          "device reported invalid dimensions: " + HexDump(params, sizeof(params)));
    }
    width_ = w;
    height_ = h;
    LogInfo("AX206", "Got LCD dimensions " + std::to_string(width_) + "x" + std::to_string(height_) +
                         " on " + description_);
}

void AX206Device::requireValid() const {
    if (!valid_ || !handle_) {
        throw DeviceError(DeviceErrorCode::SessionInvalid, "session for " + description_ + " is no longer valid");
    }
}

void AX206Device::invalidate(const std::string& reason) {
    if (valid_) {
        LogDebug("AX206", "session invalidated: " + reason);
    }
    valid_ = false;
}

// Command block, optional data phase, status block.
void AX206Device::execute(const Command& cmd, const uint8_t* data_out, uint8_t* data_in, size_t data_len) {
    requireValid();
    auto cbw = EncodeCommandBlock(cmd);
    if (trace_) {
        LogInfo("AX206", std::string(cmd.name) + " CBW " + HexDump(cbw.data(), cbw.size()));
    }

    try {
        size_t n = handle_->BulkWrite(AX206_EP_OUT, cbw.data(), cbw.size(), AX206_TIMEOUT_CBW_MS);
        if (n != cbw.size()) {
            throw DeviceError(DeviceErrorCode::IoError,
                              std::string(cmd.name) + ": short command write " + std::to_string(n));
        }

        if (cmd.direction == TransferDirection::Out && data_len > 0) {
            size_t offset = 0;
            while (offset < data_len) {
                size_t chunk = std::min(AX206_MAX_BULK_CHUNK, data_len - offset);
                size_t sent = handle_->BulkWrite(AX206_EP_OUT, data_out + offset, chunk, AX206_TIMEOUT_DATA_OUT_MS);
                if (sent != chunk) {
                    throw DeviceError(DeviceErrorCode::IoError,
                                      std::string(cmd.name) + ": short data write at offset " +
                                          std::to_string(offset) + " (" + std::to_string(sent) + "/" +
                                          std::to_string(chunk) + ")");
                }
                offset += chunk;
            }
        } else if (cmd.direction == TransferDirection::In && data_len > 0) {
            size_t got = handle_->BulkRead(AX206_EP_IN, data_in, data_len, AX206_TIMEOUT_DATA_IN_MS);
            if (got != data_len) {
                throw DeviceError(DeviceErrorCode::ProtocolError,
                                  std::string(cmd.name) + ": expected " + std::to_string(data_len) +
                                      " bytes, got " + std::to_string(got));
            }
        }

        uint8_t csw[AX206_CSW_SIZE] = {0};
        size_t got = handle_->BulkRead(AX206_EP_IN, csw, sizeof(csw), AX206_TIMEOUT_CSW_MS);
        uint8_t status = 0;
        if (!ParseStatusBlock(csw, got, status)) {
            throw DeviceError(DeviceErrorCode::ProtocolError,
                              std::string(cmd.name) + ": invalid status block " + HexDump(csw, got));
        }
        if (status != 0) {
            throw DeviceError(DeviceErrorCode::ProtocolError,
                              std::string(cmd.name) + ": command failed, status " + std::to_string(status));
        }
    } catch (const DeviceError& e) {
        invalidate(e.what());
        throw;
    }
}

void AX206Device::SetBacklight(int level) {
    if (level < AX206_BRIGHTNESS_MIN || level > AX206_BRIGHTNESS_MAX) {
        throw DeviceError(DeviceErrorCode::InvalidArgument,
                          "backlight " + std::to_string(level) + " outside 0.." + std::to_string(AX206_BRIGHTNESS_MAX));
    }
    execute(MakeSetPropertyCommand(AX206_PROPERTY_BRIGHTNESS, static_cast<uint16_t>(level)), nullptr, nullptr, 0);
    LogDebug("AX206", "backlight=" + std::to_string(level));
}

void AX206Device::SetOrientation(int orientation) {
    if (orientation < 0 || orientation > AX206_ORIENTATION_MAX) {
        throw DeviceError(DeviceErrorCode::InvalidArgument,
                          "orientation " + std::to_string(orientation) + " outside 0.." +
                              std::to_string(AX206_ORIENTATION_MAX));
    }
    execute(MakeSetPropertyCommand(AX206_PROPERTY_ORIENTATION, static_cast<uint16_t>(orientation)),
            nullptr, nullptr, 0);
    LogDebug("AX206", "orientation=" + std::to_string(orientation));
}

void AX206Device::Display(const Frame& frame) {
    requireValid();
    if (frame.Width() != width_ || frame.Height() != height_) {
        throw DeviceError(DeviceErrorCode::InvalidArgument,
                          "frame " + std::to_string(frame.Width()) + "x" + std::to_string(frame.Height()) +
                              " does not match panel " + std::to_string(width_) + "x" + std::to_string(height_));
    }
    UpdateRect(frame, frame.Bounds());
    ++frames_sent_;
}

void AX206Device::UpdateRect(const Frame& frame, const Rect& rect) {
    requireValid();
    if (frame.Width() != width_ || frame.Height() != height_) {
        throw DeviceError(DeviceErrorCode::InvalidArgument, "frame does not match panel size");
    }
    Rect r = Intersect(rect, frame.Bounds());
    if (r.Empty()) return;

    // Encode the whole region before the first transfer.
    size_t bytes = static_cast<size_t>(r.w) * r.h * AX206_BYTES_PER_PIXEL;
    tx_buf_.resize(bytes);
    uint8_t* out = tx_buf_.data();
    for (int row = 0; row < r.h; ++row) {
        const color_t* src = frame.Pixels().data() + static_cast<size_t>(r.y + row) * frame.Width() + r.x;
        for (int i = 0; i < r.w; ++i) {
            EncodeWirePixel(src[i], out);
            out += AX206_BYTES_PER_PIXEL;
        }
    }

    Command cmd = MakeBlitCommand(static_cast<uint16_t>(r.x), static_cast<uint16_t>(r.y),
                                  static_cast<uint16_t>(r.x + r.w - 1), static_cast<uint16_t>(r.y + r.h - 1));
    execute(cmd, tx_buf_.data(), nullptr, bytes);
    bytes_sent_ += bytes;
}

void AX206Device::Clear(color_t color) {
    Frame frame(width_, height_, color);
    Display(frame);
}

void AX206Device::Close() {
    valid_ = false;
    if (handle_) {
        handle_->Release();
        handle_.reset();
        LogDebug("AX206", "closed " + description_);
    }
}
