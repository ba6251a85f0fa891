#ifndef USB_TRANSPORT_H
#define USB_TRANSPORT_H

#include "Errors.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Which frame to open. Empty serial/port path matches any device with the id.
struct DeviceSelector {
    uint16_t vid = 0;
    uint16_t pid = 0;
    std::string serial;
    std::string port_path; // "<bus>-<port>[.<port>...]"

    std::string ToString() const;
};

// Parses "[VID:PID][@SERIAL][#BUS-PORT.PORT]"; ids default to `vid`/`pid`.
// Throws DeviceError(InvalidArgument) on malformed input.
DeviceSelector ParseDeviceSelector(const std::string& text, uint16_t vid, uint16_t pid);

// One claimed interface. Transfers throw DeviceError on failure and
// return the number of bytes actually moved.
class UsbHandle {
public:
    virtual ~UsbHandle() = default;

    virtual size_t BulkWrite(uint8_t endpoint, const uint8_t* data, size_t len, unsigned int timeout_ms) = 0;
    virtual size_t BulkRead(uint8_t endpoint, uint8_t* data, size_t len, unsigned int timeout_ms) = 0;

    // Releases the interface; later transfers fail. Safe to call twice.
    virtual void Release() = 0;
    virtual std::string Describe() const = 0;
};

class UsbBus {
public:
    virtual ~UsbBus() = default;

    // Throws DeviceError(NotFound | PermissionDenied | IoError).
    virtual std::unique_ptr<UsbHandle> Open(const DeviceSelector& selector) = 0;

    // Dispatches pending hotplug events without blocking.
    virtual void PollEvents() {}
    // True once after a matching device was plugged in.
    virtual bool TakeArrival() { return false; }
};

#endif // USB_TRANSPORT_H
