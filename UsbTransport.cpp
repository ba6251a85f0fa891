#include "UsbTransport.h"
#include "utils.h"
#include <cstdio>

std::string DeviceSelector::ToString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04x:%04x", vid, pid);
    std::string out = buf;
    if (!serial.empty()) out += "@" + serial;
    if (!port_path.empty()) out += "#" + port_path;
    return out;
}

static bool parse_hex16(const std::string& text, uint16_t& out) {
    std::string t = trim(text);
    if (t.rfind("0x", 0) == 0 || t.rfind("0X", 0) == 0) t = t.substr(2);
    if (t.empty() || t.size() > 4) return false;
    unsigned long v = 0;
    for (char c : t) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    v = std::stoul(t, nullptr, 16);
    out = static_cast<uint16_t>(v);
    return true;
}

DeviceSelector ParseDeviceSelector(const std::string& text, uint16_t vid, uint16_t pid) {
    DeviceSelector sel;
    sel.vid = vid;
    sel.pid = pid;
    std::string rest = trim(text);

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        sel.port_path = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
        if (sel.port_path.empty()) {
            throw DeviceError(DeviceErrorCode::InvalidArgument, "empty port path in selector '" + text + "'");
        }
        for (char c : sel.port_path) {
            if (!std::isdigit(static_cast<unsigned char>(c)) && c != '-' && c != '.') {
                throw DeviceError(DeviceErrorCode::InvalidArgument, "bad port path in selector '" + text + "'");
            }
        }
    }
    auto at = rest.find('@');
    if (at != std::string::npos) {
        sel.serial = rest.substr(at + 1);
        rest = rest.substr(0, at);
        if (sel.serial.empty()) {
            throw DeviceError(DeviceErrorCode::InvalidArgument, "empty serial in selector '" + text + "'");
        }
    }
    if (!rest.empty()) {
        auto colon = rest.find(':');
        if (colon == std::string::npos ||
            !parse_hex16(rest.substr(0, colon), sel.vid) ||
            !parse_hex16(rest.substr(colon + 1), sel.pid)) {
            throw DeviceError(DeviceErrorCode::InvalidArgument, "bad VID:PID in selector '" + text + "'");
        }
    }
    return sel;
}
