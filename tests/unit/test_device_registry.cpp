#include "TestFixtures.hpp"
#include "bench-io/device/DeviceRegistry.hpp"
#include "bench-io/transport/UsbTransport.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace benchio;
using namespace benchio::test;

class DeviceRegistryTest : public BenchTest {
protected:
  DeviceRegistry &registry() { return DeviceRegistry::instance(); }
};

TEST_F(DeviceRegistryTest, ListsBuiltinDevicesSorted) {
  std::vector<DeviceInfo> devices = registry().list_devices();
  std::vector<std::string> ids;
  for (const auto &d : devices)
    ids.push_back(d.id);

  for (const char *id :
       {"generic_scpi", "peaktech4055mv", "peaktech4055mv_scpi", "unit161d"}) {
    EXPECT_NE(std::find(ids.begin(), ids.end(), id), ids.end()) << id;
  }
  EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
}

TEST_F(DeviceRegistryTest, ReportsCapabilities) {
  DeviceInfo meter = registry().capabilities("unit161d");
  EXPECT_TRUE(meter.supports(CommandKind::Measure));
  EXPECT_TRUE(meter.supports(CommandKind::MinMax));
  EXPECT_FALSE(meter.supports(CommandKind::Apply));
  EXPECT_TRUE(meter.supports(TransportKind::Hid));
  EXPECT_FALSE(meter.supports(TransportKind::UsbDevice));

  DeviceInfo source = registry().capabilities("peaktech4055mv");
  EXPECT_TRUE(source.supports(CommandKind::Apply));
  EXPECT_TRUE(source.supports(CommandKind::Reset));
  EXPECT_FALSE(source.supports(CommandKind::Measure));
}

TEST_F(DeviceRegistryTest, UnknownDevice) {
  try {
    registry().capabilities("nonexistent");
    FAIL() << "expected ResolutionError";
  } catch (const ResolutionError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnknownDevice);
  }
  EXPECT_FALSE(registry().has_device("nonexistent"));
}

TEST_F(DeviceRegistryTest, UnsupportedTransport) {
  try {
    registry().resolve("unit161d", ScpiSocketDescriptor{"localhost", 5025});
    FAIL() << "expected ResolutionError";
  } catch (const ResolutionError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnsupportedTransport);
  }

  EXPECT_THROW(registry().resolve("peaktech4055mv",
                                  std::make_unique<MockTransport>(
                                      TransportKind::Hid)),
               ResolutionError);
}

TEST_F(DeviceRegistryTest, UnknownDeviceWinsOverTransport) {
  try {
    registry().resolve("nonexistent", HidDescriptor{"/dev/hidraw0", {}});
    FAIL() << "expected ResolutionError";
  } catch (const ResolutionError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnknownDevice);
  }
}

TEST_F(DeviceRegistryTest, ResolveDoesNotOpenTransport) {
  auto transport = std::make_unique<MockTransport>(TransportKind::Hid);
  auto state = transport->state();
  auto device = registry().resolve("unit161d", std::move(transport));
  ASSERT_NE(device, nullptr);
  EXPECT_EQ(device->id(), "unit161d");
  EXPECT_STREQ(device->codec().name(), "unit161d");
  EXPECT_EQ(state->open_count, 0);
  EXPECT_EQ(device->state().mode, DeviceMode::Idle);
}

TEST_F(DeviceRegistryTest, CodecFollowsTransportKind) {
  auto usb = registry().resolve(
      "generic_scpi", std::make_unique<MockTransport>(TransportKind::UsbDevice));
  EXPECT_STREQ(usb->codec().name(), "scpi");
  EXPECT_EQ(usb->prepare(MeasureCmd{}).frame.transfer, TransferKind::Bulk);

  auto socket = registry().resolve(
      "generic_scpi",
      std::make_unique<MockTransport>(TransportKind::ScpiSocket));
  EXPECT_EQ(socket->prepare(MeasureCmd{}).frame.transfer,
            TransferKind::Stream);

  auto peaktech = registry().resolve(
      "peaktech4055mv_scpi",
      std::make_unique<MockTransport>(TransportKind::UsbDevice));
  EXPECT_STREQ(peaktech->codec().name(), "scpi-peaktech");
  const ScpiCodec *scpi = peaktech->codec().get<ScpiCodec>();
  ASSERT_NE(scpi, nullptr);
  EXPECT_EQ(scpi->dialect(), ScpiDialect::PeakTech);
  EXPECT_EQ(peaktech->codec().get<Unit161dCodec>(), nullptr);
}

TEST_F(DeviceRegistryTest, AppliesUsbEndpointLayout) {
  UsbDescriptor descriptor;
  descriptor.vendor_id = 0x2E8A;
  descriptor.product_id = 0x000A;

  auto device = registry().resolve("peaktech4055mv", descriptor);
  auto *usb = dynamic_cast<UsbTransport *>(&device->transport());
  ASSERT_NE(usb, nullptr);
  EXPECT_EQ(usb->descriptor().bulk_in, 0x82);
  EXPECT_EQ(usb->descriptor().bulk_out, 0x02);
  EXPECT_FALSE(usb->is_open());
}

TEST_F(DeviceRegistryTest, RegistersAdditionalModels) {
  registry().register_device(
      DeviceInfo{"test_meter",
                 "Test-only meter",
                 {CommandKind::Measure},
                 {TransportKind::Hid},
                 std::nullopt},
      [](TransportKind) { return ProtocolCodec(Unit161dCodec{}); });

  EXPECT_TRUE(registry().has_device("test_meter"));
  auto device = registry().resolve(
      "test_meter", std::make_unique<MockTransport>(TransportKind::Hid));
  EXPECT_THROW(device->prepare(MinMaxCmd{}), CapabilityError);
  EXPECT_NO_THROW(device->prepare(MeasureCmd{}));
}
