#include <cstdint>
#include <iostream>
#include <memory>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "AX206Device.h"
#include "AX206Protocol.h"
#include "Errors.h"
#include "Frame.h"
#include "MockUsb.h"

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

uint32_t le32(const uint8_t* p) {
  return p[0] | (p[1] << 8) | (p[2] << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t le16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

int test_blit_command_block_layout() {
  auto cbw = EncodeCommandBlock(MakeBlitCommand(0, 0, 319, 239));
  if (cbw.size() != 31 || cbw[0] != 'U' || cbw[1] != 'S' || cbw[2] != 'B' || cbw[3] != 'C') {
    return fail("test_blit_command_block_layout", "missing USBC signature");
  }
  if (cbw[4] != 0xDE || cbw[5] != 0xAD || cbw[6] != 0xBE || cbw[7] != 0xEF) {
    return fail("test_blit_command_block_layout", "tag mismatch");
  }
  if (le32(&cbw[8]) != 320u * 240u * 2u) {
    return fail("test_blit_command_block_layout", "data length should cover the rectangle in RGB565");
  }
  if (cbw[12] != 0x00 || cbw[13] != 0 || cbw[14] != 16) {
    return fail("test_blit_command_block_layout", "flags, lun or cdb length mismatch");
  }
  const uint8_t* cdb = &cbw[15];
  if (cdb[0] != 0xCD || cdb[5] != 0x06 || cdb[6] != 0x12) {
    return fail("test_blit_command_block_layout", "blit opcode mismatch");
  }
  if (le16(cdb + 7) != 0 || le16(cdb + 9) != 0 || le16(cdb + 11) != 319 || le16(cdb + 13) != 239) {
    return fail("test_blit_command_block_layout", "inclusive coordinates mismatch");
  }

  auto get = EncodeCommandBlock(MakeGetLcdParamsCommand());
  if (get[12] != 0x80 || le32(&get[8]) != 5 || get[15 + 5] != 0x02) {
    return fail("test_blit_command_block_layout", "get-params block should be a 5 byte IN transfer");
  }
  return 0;
}

int test_status_and_params_parsing() {
  uint8_t csw[13] = {'U', 'S', 'B', 'S', 0xDE, 0xAD, 0xBE, 0xEF, 0, 0, 0, 0, 0};
  uint8_t status = 0xFF;
  if (!ParseStatusBlock(csw, sizeof(csw), status) || status != 0) {
    return fail("test_status_and_params_parsing", "valid status block rejected");
  }
  csw[12] = 1;
  if (!ParseStatusBlock(csw, sizeof(csw), status) || status != 1) {
    return fail("test_status_and_params_parsing", "status byte not reported");
  }
  csw[0] = 'X';
  if (ParseStatusBlock(csw, sizeof(csw), status)) {
    return fail("test_status_and_params_parsing", "bad signature accepted");
  }
  csw[0] = 'U';
  if (ParseStatusBlock(csw, 12, status)) {
    return fail("test_status_and_params_parsing", "short status block accepted");
  }

  const uint8_t params[5] = {0x40, 0x01, 0xF0, 0x00, 0x00};
  uint16_t w = 0, h = 0;
  if (!ParseLcdParams(params, sizeof(params), w, h) || w != 320 || h != 240) {
    return fail("test_status_and_params_parsing", "320x240 params not decoded");
  }
  const uint8_t zero[5] = {0, 0, 0xF0, 0, 0};
  if (ParseLcdParams(zero, sizeof(zero), w, h)) {
    return fail("test_status_and_params_parsing", "zero width accepted");
  }
  return 0;
}

int test_wire_pixel_is_big_endian() {
  uint8_t out[2] = {0, 0};
  EncodeWirePixel(RGB(255, 0, 0), out);
  if (out[0] != 0xF8 || out[1] != 0x00) {
    return fail("test_wire_pixel_is_big_endian", "red should encode as F8 00");
  }
  EncodeWirePixel(0x1234, out);
  if (out[0] != 0x12 || out[1] != 0x34) {
    return fail("test_wire_pixel_is_big_endian", "high byte must go first");
  }
  return 0;
}

int test_handshake_reports_panel_size() {
  MockUsbBus bus;
  bus.State().width = 480;
  bus.State().height = 320;
  auto device = AX206Device::Open(bus, DeviceSelector());
  if (device->Width() != 480 || device->Height() != 320 || !device->IsValid()) {
    return fail("test_handshake_reports_panel_size", "dimensions not taken from the device");
  }

  MockUsbBus broken;
  broken.State().width = 0;
  try {
    AX206Device::Open(broken, DeviceSelector());
    return fail("test_handshake_reports_panel_size", "zero width should fail the handshake");
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::ProtocolError) {
      return fail("test_handshake_reports_panel_size", "expected ProtocolError");
    }
  }
  if (broken.State().release_count != 1) {
    return fail("test_handshake_reports_panel_size", "failed handshake should release the interface");
  }
  return 0;
}

int test_open_missing_device() {
  MockUsbBus bus;
  bus.State().present = false;
  try {
    AX206Device::Open(bus, DeviceSelector());
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::NotFound) {
      return fail("test_open_missing_device", "expected NotFound");
    }
    return 0;
  }
  return fail("test_open_missing_device", "open should throw");
}

int test_frame_upload_matches_panel() {
  MockUsbBus bus;
  auto device = AX206Device::Open(bus, DeviceSelector());
  Frame frame(device->Width(), device->Height(), RGB(0, 0, 255));
  frame.Set(0, 0, RGB(255, 0, 0));
  if (frame.Format() != PixelFormat::RGB565) {
    return fail("test_frame_upload_matches_panel", "frames are RGB565");
  }
  device->Display(frame);

  const MockUsbState& s = bus.State();
  if (s.blits.size() != 1) {
    return fail("test_frame_upload_matches_panel", "expected one blit");
  }
  const MockBlit& b = s.blits[0];
  if (b.x0 != 0 || b.y0 != 0 || b.Width() != 320 || b.Height() != 240) {
    return fail("test_frame_upload_matches_panel", "blit rectangle should cover the panel");
  }
  if (b.data.size() != 320u * 240u * 2u) {
    return fail("test_frame_upload_matches_panel", "payload size mismatch");
  }
  if (b.Pixel(0, 0) != RGB(255, 0, 0) || b.Pixel(1, 0) != RGB(0, 0, 255) || b.Pixel(319, 239) != RGB(0, 0, 255)) {
    return fail("test_frame_upload_matches_panel", "pixel content mismatch");
  }
  for (size_t chunk : s.data_chunks) {
    if (chunk > 64u * 1024u) {
      return fail("test_frame_upload_matches_panel", "data chunk larger than 64 KiB");
    }
  }
  if (s.data_chunks.size() != 3 ||
      std::accumulate(s.data_chunks.begin(), s.data_chunks.end(), size_t(0)) != b.data.size()) {
    return fail("test_frame_upload_matches_panel", "153600 bytes should go out as three chunks");
  }
  if (device->FramesSent() != 1 || device->BytesSent() != b.data.size()) {
    return fail("test_frame_upload_matches_panel", "counters not updated");
  }

  Frame wrong(100, 100);
  try {
    device->Display(wrong);
    return fail("test_frame_upload_matches_panel", "size mismatch should be rejected");
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::InvalidArgument || !device->IsValid()) {
      return fail("test_frame_upload_matches_panel", "size mismatch is InvalidArgument and keeps the session");
    }
  }
  return 0;
}

int test_partial_rect_upload() {
  MockUsbBus bus;
  auto device = AX206Device::Open(bus, DeviceSelector());
  Frame frame(320, 240, 0);
  frame.Set(12, 21, 0xABCD);
  device->UpdateRect(frame, Rect{10, 20, 16, 8});
  const MockUsbState& s = bus.State();
  if (s.blits.size() != 1) {
    return fail("test_partial_rect_upload", "expected one blit");
  }
  const MockBlit& b = s.blits[0];
  if (b.x0 != 10 || b.y0 != 20 || b.x1 != 25 || b.y1 != 27 || b.data.size() != 16u * 8u * 2u) {
    return fail("test_partial_rect_upload", "rectangle or payload mismatch");
  }
  if (b.Pixel(2, 1) != 0xABCD) {
    return fail("test_partial_rect_upload", "pixel offset within rectangle mismatch");
  }
  return 0;
}

int test_backlight_and_orientation() {
  MockUsbBus bus;
  auto device = AX206Device::Open(bus, DeviceSelector());
  device->SetBacklight(5);
  device->SetOrientation(2);
  const MockUsbState& s = bus.State();
  if (s.properties.size() != 2 || s.properties[0] != std::pair<uint16_t, uint16_t>(0x01, 5) ||
      s.properties[1] != std::pair<uint16_t, uint16_t>(0x10, 2)) {
    return fail("test_backlight_and_orientation", "property commands mismatch");
  }

  size_t blocks = s.command_blocks.size();
  try {
    device->SetBacklight(8);
    return fail("test_backlight_and_orientation", "level 8 should be rejected");
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::InvalidArgument) {
      return fail("test_backlight_and_orientation", "expected InvalidArgument");
    }
  }
  if (s.command_blocks.size() != blocks || !device->IsValid()) {
    return fail("test_backlight_and_orientation", "rejected level must not reach the device");
  }
  return 0;
}

int test_mid_transfer_failure_invalidates_session() {
  MockUsbBus bus;
  auto device = AX206Device::Open(bus, DeviceSelector());
  MockUsbState& s = bus.State();
  // command block, first chunk, then the second chunk times out
  s.fail_write_in = 2;
  Frame frame(320, 240, RGB(10, 20, 30));
  try {
    device->Display(frame);
    return fail("test_mid_transfer_failure_invalidates_session", "timeout should propagate");
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::IoError) {
      return fail("test_mid_transfer_failure_invalidates_session", "expected IoError");
    }
  }
  if (device->IsValid()) {
    return fail("test_mid_transfer_failure_invalidates_session", "session should be invalid");
  }
  if (!s.blits.empty()) {
    return fail("test_mid_transfer_failure_invalidates_session", "partial frame must not be recorded");
  }

  int writes = s.writes;
  try {
    device->Display(frame);
    return fail("test_mid_transfer_failure_invalidates_session", "invalid session should refuse uploads");
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::SessionInvalid) {
      return fail("test_mid_transfer_failure_invalidates_session", "expected SessionInvalid");
    }
  }
  try {
    device->SetBacklight(3);
    return fail("test_mid_transfer_failure_invalidates_session", "invalid session should refuse commands");
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::SessionInvalid) {
      return fail("test_mid_transfer_failure_invalidates_session", "expected SessionInvalid for backlight");
    }
  }
  if (s.writes != writes) {
    return fail("test_mid_transfer_failure_invalidates_session", "invalid session must not touch USB");
  }
  return 0;
}

int test_bad_status_and_short_write() {
  MockUsbBus bus;
  auto device = AX206Device::Open(bus, DeviceSelector());
  bus.State().bad_next_csw = true;
  try {
    device->SetBacklight(1);
    return fail("test_bad_status_and_short_write", "bad CSW should fail");
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::ProtocolError || device->IsValid()) {
      return fail("test_bad_status_and_short_write", "bad CSW is a ProtocolError and invalidates");
    }
  }

  MockUsbBus bus2;
  auto device2 = AX206Device::Open(bus2, DeviceSelector());
  bus2.State().short_next_data = true;
  try {
    device2->Clear(0);
    return fail("test_bad_status_and_short_write", "short write should fail");
  } catch (const DeviceError& e) {
    if (e.code() != DeviceErrorCode::IoError || device2->IsValid()) {
      return fail("test_bad_status_and_short_write", "short write is an IoError and invalidates");
    }
  }
  return 0;
}

int test_close_is_idempotent() {
  MockUsbBus bus;
  auto device = AX206Device::Open(bus, DeviceSelector());
  device->Close();
  device->Close();
  device.reset();
  if (bus.State().release_count != 1) {
    return fail("test_close_is_idempotent", "interface should be released exactly once");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_blit_command_block_layout(); rc != 0) {
    return rc;
  }
  if (int rc = test_status_and_params_parsing(); rc != 0) {
    return rc;
  }
  if (int rc = test_wire_pixel_is_big_endian(); rc != 0) {
    return rc;
  }
  if (int rc = test_handshake_reports_panel_size(); rc != 0) {
    return rc;
  }
  if (int rc = test_open_missing_device(); rc != 0) {
    return rc;
  }
  if (int rc = test_frame_upload_matches_panel(); rc != 0) {
    return rc;
  }
  if (int rc = test_partial_rect_upload(); rc != 0) {
    return rc;
  }
  if (int rc = test_backlight_and_orientation(); rc != 0) {
    return rc;
  }
  if (int rc = test_mid_transfer_failure_invalidates_session(); rc != 0) {
    return rc;
  }
  if (int rc = test_bad_status_and_short_write(); rc != 0) {
    return rc;
  }
  if (int rc = test_close_is_idempotent(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] protocol unit tests\n";
  return 0;
}
