#ifndef AX206_DEVICE_H
#define AX206_DEVICE_H

#include "AX206Protocol.h"
#include "Frame.h"
#include "UsbTransport.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// An open, handshaken AX206 frame. Any transport failure invalidates the
// session; every later call then fails with SessionInvalid without touching USB.
class AX206Device {
public:
    // Opens the selected device and queries its panel size.
    static std::unique_ptr<AX206Device> Open(UsbBus& bus, const DeviceSelector& selector);
    ~AX206Device();

    AX206Device(const AX206Device&) = delete;
    AX206Device& operator=(const AX206Device&) = delete;

    int Width() const { return width_; }
    int Height() const { return height_; }
    bool IsValid() const { return valid_; }
    const std::string& Description() const { return description_; }

    void SetBacklight(int level);
    void SetOrientation(int orientation);

    // Whole-frame blit. The frame must match the panel size.
    void Display(const Frame& frame);
    void UpdateRect(const Frame& frame, const Rect& rect);
    void Clear(color_t color);

    // Releases the interface. Idempotent.
    void Close();

    uint64_t FramesSent() const { return frames_sent_; }
    uint64_t BytesSent() const { return bytes_sent_; }

private:
    AX206Device(std::unique_ptr<UsbHandle> handle, const std::string& description);

    void handshake();
    void execute(const Command& cmd, const uint8_t* data_out, uint8_t* data_in, size_t data_len);
    void requireValid() const;
    void invalidate(const std::string& reason);

    std::unique_ptr<UsbHandle> handle_;
    std::string description_;
    int width_ = 0;
    int height_ = 0;
    bool valid_ = false;
    bool trace_ = false;
    std::vector<uint8_t> tx_buf_;
    uint64_t frames_sent_ = 0;
    uint64_t bytes_sent_ = 0;
};

#endif // AX206_DEVICE_H
