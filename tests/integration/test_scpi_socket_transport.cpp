#include "LoopbackScpiServer.hpp"
#include "TestFixtures.hpp"
#include "bench-io/transport/ScpiSocketTransport.hpp"
#include <gtest/gtest.h>

using namespace benchio;
using namespace benchio::test;

namespace {

Frame line_frame(const std::string &text) {
  return Frame::outbound(std::vector<uint8_t>(text.begin(), text.end()));
}

std::string text_of(const Frame &frame) {
  return std::string(frame.bytes.begin(), frame.bytes.end());
}

std::optional<ScpiReply> instrument(const std::string &line) {
  if (line == "*IDN?")
    return ScpiReply{"ACME,DMM100,0,1.0\n"};
  if (line == "MULTI?")
    return ScpiReply{"1\n2\n"};
  if (line == "SPLIT?")
    return ScpiReply{"3.1"};
  if (line == "BYE")
    return ScpiReply{"", true};
  return std::nullopt;
}

} // namespace

class ScpiSocketTransportTest : public BenchTest {
protected:
  void SetUp() override {
    BenchTest::SetUp();
    server_ = std::make_unique<LoopbackScpiServer>(instrument);
    transport_ = std::make_unique<ScpiSocketTransport>(
        ScpiSocketDescriptor{"127.0.0.1", server_->port()});
  }

  void TearDown() override {
    transport_.reset();
    server_.reset();
    BenchTest::TearDown();
  }

  std::unique_ptr<LoopbackScpiServer> server_;
  std::unique_ptr<ScpiSocketTransport> transport_;
};

TEST_F(ScpiSocketTransportTest, QueryRoundTrip) {
  transport_->open();
  EXPECT_TRUE(transport_->is_open());

  transport_->write(line_frame("*IDN?\n"));
  Frame reply = transport_->read(std::chrono::milliseconds(2000));
  EXPECT_EQ(text_of(reply), "ACME,DMM100,0,1.0\n");
  EXPECT_EQ(reply.direction, Direction::Inbound);
  EXPECT_EQ(reply.transfer, TransferKind::Stream);

  transport_->close();
  EXPECT_FALSE(transport_->is_open());
}

TEST_F(ScpiSocketTransportTest, ReturnsOneLinePerRead) {
  transport_->open();
  transport_->write(line_frame("MULTI?\n"));
  EXPECT_EQ(text_of(transport_->read(std::chrono::milliseconds(2000))), "1\n");
  EXPECT_EQ(text_of(transport_->read(std::chrono::milliseconds(2000))), "2\n");
}

TEST_F(ScpiSocketTransportTest, IncompleteLineTimesOut) {
  transport_->open();
  transport_->write(line_frame("SPLIT?\n"));
  try {
    transport_->read(std::chrono::milliseconds(100));
    FAIL() << "expected IoTimeout";
  } catch (const TransportError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IoTimeout);
  }
}

TEST_F(ScpiSocketTransportTest, PeerCloseIsIoError) {
  transport_->open();
  transport_->write(line_frame("BYE\n"));
  try {
    transport_->read(std::chrono::milliseconds(2000));
    FAIL() << "expected TransportIoError";
  } catch (const TransportError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::TransportIoError);
  }
}

TEST_F(ScpiSocketTransportTest, RefusedConnectionIsOpenError) {
  uint16_t port = server_->port();
  server_.reset();

  ScpiSocketTransport refused(ScpiSocketDescriptor{"127.0.0.1", port});
  try {
    refused.open();
    FAIL() << "expected TransportOpenError";
  } catch (const TransportError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::TransportOpenError);
  }
  EXPECT_FALSE(refused.is_open());
}

TEST_F(ScpiSocketTransportTest, UnresolvableHostIsOpenError) {
  ScpiSocketTransport bad(ScpiSocketDescriptor{"no-such-host.invalid", 5025});
  EXPECT_THROW(bad.open(), TransportError);
}

TEST_F(ScpiSocketTransportTest, DescribesEndpoint) {
  EXPECT_EQ(transport_->describe(),
            "scpi:127.0.0.1:" + std::to_string(server_->port()));
  EXPECT_EQ(transport_->kind(), TransportKind::ScpiSocket);
}
