#include "TestFixtures.hpp"
#include "bench-io/transport/HidTransport.hpp"
#include "bench-io/transport/TransportFactory.hpp"
#include "bench-io/transport/UsbTransport.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace benchio;
using namespace benchio::test;

namespace fs = std::filesystem;

class TransportTest : public BenchTest {
protected:
  void SetUp() override {
    BenchTest::SetUp();
    temp_dir_ = fs::temp_directory_path() /
                ("bench_io_transport_" + std::to_string(::getpid()));
    fs::create_directories(temp_dir_);
  }

  void TearDown() override {
    fs::remove_all(temp_dir_);
    BenchTest::TearDown();
  }

  void add_usb_device(const std::string &name, const std::string &vid,
                      const std::string &pid, const std::string &bus,
                      const std::string &dev) {
    fs::path dir = temp_dir_ / "devices" / name;
    fs::create_directories(dir);
    std::ofstream(dir / "idVendor") << vid << "\n";
    std::ofstream(dir / "idProduct") << pid << "\n";
    std::ofstream(dir / "busnum") << bus << "\n";
    std::ofstream(dir / "devnum") << dev << "\n";
  }

  // A FIFO opened read-write loops written reports back to read()
  std::string make_fifo() {
    fs::path path = temp_dir_ / "hidraw";
    if (::mkfifo(path.c_str(), 0600) != 0) {
      ADD_FAILURE() << "mkfifo failed";
    }
    return path.string();
  }

  fs::path temp_dir_;
};

TEST_F(TransportTest, FindsUsbNodeByVendorAndProduct) {
  add_usb_device("usb1", "1d6b", "0002", "1", "1");
  add_usb_device("1-2", "2e8a", "000a", "1", "4");
  add_usb_device("1-3", "garbage", "000a", "1", "5");
  std::string root = (temp_dir_ / "devices").string();

  EXPECT_EQ(UsbTransport::find_device_node(0x2E8A, 0x000A, root),
            "/dev/bus/usb/001/004");
  EXPECT_EQ(UsbTransport::find_device_node(0x1234, 0x5678, root), "");
  EXPECT_EQ(UsbTransport::find_device_node(0x2E8A, 0x000A,
                                           (temp_dir_ / "missing").string()),
            "");
}

TEST_F(TransportTest, UsbNotOpenIsIoError) {
  UsbTransport usb(UsbDescriptor{});
  EXPECT_FALSE(usb.is_open());
  try {
    usb.write(Frame::outbound({0x7F}, TransferKind::Control));
    FAIL() << "expected TransportError";
  } catch (const TransportError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::TransportIoError);
  }
}

TEST_F(TransportTest, UsbControlRequestFromChannelOrFirstByte) {
  UsbControlRequest channel_only = UsbTransport::control_request(
      Frame::outbound({}, TransferKind::Control, 0x7F));
  EXPECT_EQ(channel_only.request, 0x7F);
  EXPECT_TRUE(channel_only.data.empty());

  UsbControlRequest reset = UsbTransport::control_request(
      Frame::outbound({0x7F}, TransferKind::Control, 0x7F));
  EXPECT_EQ(reset.request, 0x7F);
  EXPECT_TRUE(reset.data.empty());

  UsbControlRequest inline_code = UsbTransport::control_request(
      Frame::outbound({0x21, 0x01, 0x02}, TransferKind::Control));
  EXPECT_EQ(inline_code.request, 0x21);
  EXPECT_EQ(inline_code.data, (std::vector<uint8_t>{0x01, 0x02}));

  EXPECT_THROW(
      UsbTransport::control_request(Frame::outbound({}, TransferKind::Control)),
      TransportError);
}

TEST_F(TransportTest, HidChunksIntoLengthTaggedReports) {
  HidTransport hid(HidDescriptor{make_fifo(), std::nullopt});
  hid.open();

  std::vector<uint8_t> request = {0xAB, 0xCD, 0x03, 0x5E, 0x01, 0xD9};
  hid.write(Frame::outbound(request, TransferKind::HidReport));
  Frame echoed = hid.read(std::chrono::milliseconds(500));
  EXPECT_EQ(echoed.bytes, request);
  ASSERT_TRUE(echoed.channel.has_value());
  EXPECT_EQ(*echoed.channel, 6);
  EXPECT_EQ(echoed.transfer, TransferKind::HidReport);

  std::vector<uint8_t> long_frame(70, 0x55);
  hid.write(Frame::outbound(long_frame, TransferKind::HidReport));
  EXPECT_EQ(hid.read(std::chrono::milliseconds(500)).size(), 63u);
  EXPECT_EQ(hid.read(std::chrono::milliseconds(500)).size(), 7u);
}

TEST_F(TransportTest, HidFixedReportId) {
  HidTransport hid(HidDescriptor{make_fifo(), uint8_t{0}});
  hid.open();
  hid.write(Frame::outbound({1, 2, 3}, TransferKind::HidReport, 9));
  Frame echoed = hid.read(std::chrono::milliseconds(500));
  EXPECT_EQ(echoed.bytes, (std::vector<uint8_t>{1, 2, 3}));
  EXPECT_EQ(*echoed.channel, 0);
}

TEST_F(TransportTest, HidReadTimesOut) {
  HidTransport hid(HidDescriptor{make_fifo(), std::nullopt});
  hid.open();
  try {
    hid.read(std::chrono::milliseconds(30));
    FAIL() << "expected IoTimeout";
  } catch (const TransportError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IoTimeout);
  }
}

TEST_F(TransportTest, HidMissingDeviceIsOpenError) {
  HidTransport hid(HidDescriptor{(temp_dir_ / "nope").string(), std::nullopt});
  try {
    hid.open();
    FAIL() << "expected TransportOpenError";
  } catch (const TransportError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::TransportOpenError);
  }
  EXPECT_FALSE(hid.is_open());
}

TEST_F(TransportTest, FactoryBuildsMatchingBackend) {
  auto hid = make_transport(HidDescriptor{"/dev/hidraw0", std::nullopt});
  EXPECT_EQ(hid->kind(), TransportKind::Hid);
  EXPECT_EQ(hid->describe(), "hid:/dev/hidraw0");

  UsbDescriptor usb_desc;
  usb_desc.vendor_id = 0x2E8A;
  usb_desc.product_id = 0x000A;
  auto usb = make_transport(usb_desc);
  EXPECT_EQ(usb->kind(), TransportKind::UsbDevice);
  EXPECT_EQ(usb->describe(), "usb:2e8a:000a");

  auto sock = make_transport(ScpiSocketDescriptor{"::1", 5025});
  EXPECT_EQ(sock->kind(), TransportKind::ScpiSocket);
  EXPECT_EQ(sock->describe(), "scpi:[::1]:5025");
  EXPECT_FALSE(sock->is_open());
}
