#include "LibusbTransport.h"
#include "AX206Protocol.h"
#include "Log.h"
#include <cstdio>
#include <limits>

DeviceError MapLibusbError(int rc, const std::string& what) {
    std::string msg = what + ": " + libusb_error_name(rc);
    switch (rc) {
        case LIBUSB_ERROR_NOT_FOUND:
        case LIBUSB_ERROR_NO_DEVICE:
            return DeviceError(rc == LIBUSB_ERROR_NO_DEVICE ? DeviceErrorCode::IoError : DeviceErrorCode::NotFound, msg);
        case LIBUSB_ERROR_ACCESS:
            return DeviceError(DeviceErrorCode::PermissionDenied, msg);
        case LIBUSB_ERROR_INVALID_PARAM:
            return DeviceError(DeviceErrorCode::InvalidArgument, msg);
        default:
            return DeviceError(DeviceErrorCode::IoError, msg);
    }
}

std::string PortPath(libusb_device* device) {
    uint8_t ports[8];
    int n = libusb_get_port_numbers(device, ports, sizeof(ports));
    std::string path = std::to_string(libusb_get_bus_number(device));
    for (int i = 0; i < n; ++i) {
        path += (i == 0 ? "-" : ".") + std::to_string(ports[i]);
    }
    return path;
}

// --- LibusbHandle ---

LibusbHandle::LibusbHandle(libusb_device_handle* handle, int interface_number, bool reattach_kernel_driver,
                           const std::string& description)
    : handle_(handle), interface_(interface_number), reattach_(reattach_kernel_driver),
      description_(description) {}

LibusbHandle::~LibusbHandle() {
    Release();
}

size_t LibusbHandle::transfer(uint8_t endpoint, uint8_t* data, size_t len, unsigned int timeout_ms) {
    if (!handle_) {
        throw DeviceError(DeviceErrorCode::SessionInvalid, "interface already released");
    }
    if (len > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw DeviceError(DeviceErrorCode::InvalidArgument, "transfer too large");
    }
    int transferred = 0;
    int rc = libusb_bulk_transfer(handle_, endpoint, data, static_cast<int>(len), &transferred, timeout_ms);
    if (rc != 0) {
        char ep[8];
        std::snprintf(ep, sizeof(ep), "0x%02x", endpoint);
        throw MapLibusbError(rc, std::string("bulk transfer on ") + ep);
    }
    return static_cast<size_t>(transferred);
}

size_t LibusbHandle::BulkWrite(uint8_t endpoint, const uint8_t* data, size_t len, unsigned int timeout_ms) {
    return transfer(endpoint, const_cast<uint8_t*>(data), len, timeout_ms);
}

size_t LibusbHandle::BulkRead(uint8_t endpoint, uint8_t* data, size_t len, unsigned int timeout_ms) {
    return transfer(endpoint, data, len, timeout_ms);
}

void LibusbHandle::Release() {
    if (!handle_) return;
    int rc = libusb_release_interface(handle_, interface_);
    if (rc != 0 && rc != LIBUSB_ERROR_NO_DEVICE) {
        LogWarn("usb", std::string("release_interface: ") + libusb_error_name(rc));
    }
    if (reattach_) {
        rc = libusb_attach_kernel_driver(handle_, interface_);
        if (rc != 0 && rc != LIBUSB_ERROR_NO_DEVICE && rc != LIBUSB_ERROR_NOT_FOUND) {
            LogDebug("usb", std::string("attach_kernel_driver: ") + libusb_error_name(rc));
        }
    }
    libusb_close(handle_);
    handle_ = nullptr;
    LogDebug("usb", "released " + description_);
}

// --- LibusbBus ---

LibusbBus::LibusbBus(uint16_t vid, uint16_t pid) {
    int rc = libusb_init(&ctx_);
    if (rc != 0) {
        ctx_ = nullptr;
        throw MapLibusbError(rc, "libusb_init");
    }
    if (libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG)) {
        rc = libusb_hotplug_register_callback(ctx_, LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED,
                                              LIBUSB_HOTPLUG_NO_FLAGS, vid, pid,
                                              LIBUSB_HOTPLUG_MATCH_ANY,
                                              &LibusbBus::hotplug_callback, this, &hotplug_handle_);
        hotplug_registered_ = (rc == LIBUSB_SUCCESS);
        if (!hotplug_registered_) {
            LogDebug("usb", std::string("hotplug unavailable: ") + libusb_error_name(rc));
        }
    }
}

LibusbBus::~LibusbBus() {
    if (!ctx_) return;
    if (hotplug_registered_) {
        libusb_hotplug_deregister_callback(ctx_, hotplug_handle_);
    }
    libusb_exit(ctx_);
}

int LIBUSB_CALL LibusbBus::hotplug_callback(libusb_context*, libusb_device*,
                                            libusb_hotplug_event event, void* user_data) {
    auto* self = static_cast<LibusbBus*>(user_data);
    if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED) {
        self->arrival_ = true;
    }
    return 0;
}

void LibusbBus::PollEvents() {
    if (!hotplug_registered_) return;
    struct timeval tv = {0, 0};
    libusb_handle_events_timeout_completed(ctx_, &tv, nullptr);
}

bool LibusbBus::TakeArrival() {
    return arrival_.exchange(false);
}

std::unique_ptr<UsbHandle> LibusbBus::Open(const DeviceSelector& selector) {
    libusb_device** devs = nullptr;
    ssize_t cnt = libusb_get_device_list(ctx_, &devs);
    if (cnt < 0) {
        throw MapLibusbError(static_cast<int>(cnt), "get_device_list");
    }

    libusb_device_handle* handle = nullptr;
    std::string description;
    int last_error = 0;
    for (ssize_t i = 0; i < cnt && !handle; ++i) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(devs[i], &desc) != 0) continue;
        if (desc.idVendor != selector.vid || desc.idProduct != selector.pid) continue;

        std::string path = PortPath(devs[i]);
        if (!selector.port_path.empty() && path != selector.port_path) continue;

        libusb_device_handle* candidate = nullptr;
        int rc = libusb_open(devs[i], &candidate);
        if (rc != 0) {
            last_error = rc;
            LogDebug("usb", "open " + path + ": " + libusb_error_name(rc));
            continue;
        }
        if (!selector.serial.empty()) {
            unsigned char serial[128] = {0};
            int n = desc.iSerialNumber
                        ? libusb_get_string_descriptor_ascii(candidate, desc.iSerialNumber, serial, sizeof(serial))
                        : 0;
            if (n <= 0 || selector.serial != reinterpret_cast<char*>(serial)) {
                libusb_close(candidate);
                continue;
            }
        }
        handle = candidate;
        description = selector.ToString() + " at " + path;
    }
    libusb_free_device_list(devs, 1);

    if (!handle) {
        if (last_error == LIBUSB_ERROR_ACCESS) {
            throw DeviceError(DeviceErrorCode::PermissionDenied,
                              "no permission to open " + selector.ToString() + " (check udev rules)");
        }
        if (last_error != 0) {
            throw MapLibusbError(last_error, "open " + selector.ToString());
        }
        throw DeviceError(DeviceErrorCode::NotFound, "no device matching " + selector.ToString());
    }

    bool reattach = false;
    if (libusb_kernel_driver_active(handle, AX206_INTERFACE) == 1) {
        int rc = libusb_detach_kernel_driver(handle, AX206_INTERFACE);
        if (rc != 0) {
            libusb_close(handle);
            throw MapLibusbError(rc, "detach_kernel_driver");
        }
        reattach = true;
    }

    int rc = libusb_set_configuration(handle, AX206_CONFIGURATION);
    if (rc != 0 && rc != LIBUSB_ERROR_BUSY) {
        if (reattach) libusb_attach_kernel_driver(handle, AX206_INTERFACE);
        libusb_close(handle);
        throw MapLibusbError(rc, "set_configuration");
    }

    rc = libusb_claim_interface(handle, AX206_INTERFACE);
    if (rc != 0) {
        if (reattach) libusb_attach_kernel_driver(handle, AX206_INTERFACE);
        libusb_close(handle);
        throw MapLibusbError(rc, "claim_interface");
    }

    LogDebug("usb", "claimed interface " + std::to_string(AX206_INTERFACE) + " on " + description);
    return std::unique_ptr<UsbHandle>(new LibusbHandle(handle, AX206_INTERFACE, reattach, description));
}
