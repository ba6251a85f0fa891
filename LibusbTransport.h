#ifndef LIBUSB_TRANSPORT_H
#define LIBUSB_TRANSPORT_H

#include "UsbTransport.h"
#include <atomic>
#include <libusb-1.0/libusb.h>

class LibusbHandle : public UsbHandle {
public:
    LibusbHandle(libusb_device_handle* handle, int interface_number, bool reattach_kernel_driver,
                 const std::string& description);
    ~LibusbHandle() override;

    size_t BulkWrite(uint8_t endpoint, const uint8_t* data, size_t len, unsigned int timeout_ms) override;
    size_t BulkRead(uint8_t endpoint, uint8_t* data, size_t len, unsigned int timeout_ms) override;
    void Release() override;
    std::string Describe() const override { return description_; }

private:
    size_t transfer(uint8_t endpoint, uint8_t* data, size_t len, unsigned int timeout_ms);

    libusb_device_handle* handle_;
    int interface_;
    bool reattach_;
    std::string description_;
};

class LibusbBus : public UsbBus {
public:
    // Throws DeviceError(IoError) when libusb cannot be initialised.
    LibusbBus(uint16_t vid, uint16_t pid);
    ~LibusbBus() override;

    LibusbBus(const LibusbBus&) = delete;
    LibusbBus& operator=(const LibusbBus&) = delete;

    std::unique_ptr<UsbHandle> Open(const DeviceSelector& selector) override;
    void PollEvents() override;
    bool TakeArrival() override;

private:
    static int LIBUSB_CALL hotplug_callback(libusb_context* ctx, libusb_device* device,
                                            libusb_hotplug_event event, void* user_data);

    libusb_context* ctx_ = nullptr;
    libusb_hotplug_callback_handle hotplug_handle_ = 0;
    bool hotplug_registered_ = false;
    std::atomic<bool> arrival_{false};
};

DeviceError MapLibusbError(int rc, const std::string& what);
std::string PortPath(libusb_device* device);

#endif // LIBUSB_TRANSPORT_H
