#include "LoopbackScpiServer.hpp"
#include "TestFixtures.hpp"
#include "bench-io/CommandParser.hpp"
#include "bench-io/cli/CliOptions.hpp"
#include "bench-io/device/DeviceRegistry.hpp"
#include <cmath>
#include <gtest/gtest.h>

using namespace benchio;
using namespace benchio::test;

namespace {

std::optional<ScpiReply> bench_dmm(const std::string &line) {
  if (line == "READ?")
    return ScpiReply{"+1.2345E+00\n"};
  if (line == "*IDN?")
    return ScpiReply{"ACME,DMM100,0,1.0\n"};
  return std::nullopt;
}

} // namespace

class EndToEndTest : public BenchTest {
protected:
  RunSummary run(const std::string &device_id, LoopbackScpiServer &server,
                 const std::string &commands) {
    auto device = DeviceRegistry::instance().resolve(
        device_id, ScpiSocketDescriptor{"127.0.0.1", server.port()});
    MeasurementPipeline pipeline(fast_policy());
    return pipeline.run(*device, CommandParser::parse_list(commands), sink_);
  }

  CollectingSink sink_;
};

TEST_F(EndToEndTest, MixedCommandSequenceOverSocket) {
  LoopbackScpiServer server(bench_dmm);

  RunSummary summary =
      run("generic_scpi", server,
          "Measure, Scpi:*IDN?, Apply:Sin, 1kHz, 2, 0, Reset, Measure");

  EXPECT_TRUE(summary.ok());
  EXPECT_EQ(exit_code_for(summary), exit_code::OK);
  EXPECT_EQ(summary.commands_succeeded, 5u);

  auto measurements = sink_.measurements();
  ASSERT_EQ(measurements.size(), 2u);
  EXPECT_DOUBLE_EQ(measurements[0].value, 1.2345);
  EXPECT_DOUBLE_EQ(measurements[1].value, 1.2345);

  auto acks = sink_.of_kind(EventKind::Acknowledgement);
  ASSERT_EQ(acks.size(), 3u);
  EXPECT_EQ(acks[0].command, "Scpi:*IDN?");
  EXPECT_EQ(acks[0].message, "ACME,DMM100,0,1.0");

  EXPECT_EQ(server.received(),
            (std::vector<std::string>{"READ?", "*IDN?", "APPL:SIN 1000,2,0",
                                      "*RST", "READ?"}));
}

TEST_F(EndToEndTest, OverloadReplyIsInfinite) {
  LoopbackScpiServer server([](const std::string &) {
    return std::optional<ScpiReply>(ScpiReply{"9.9E37\n"});
  });

  RunSummary summary = run("generic_scpi", server, "Measure");

  EXPECT_TRUE(summary.ok());
  ASSERT_EQ(sink_.measurements().size(), 1u);
  const Measurement m = sink_.measurements()[0];
  EXPECT_TRUE(m.overload);
  EXPECT_TRUE(std::isinf(m.value));
}

TEST_F(EndToEndTest, SilentInstrumentEndsRunWithTransportError) {
  LoopbackScpiServer server(
      [](const std::string &) { return std::optional<ScpiReply>(); });

  RunSummary summary = run("generic_scpi", server, "Measure, Measure");

  ASSERT_TRUE(summary.fatal_error.has_value());
  EXPECT_EQ(*summary.fatal_error, ErrorKind::IoTimeout);
  EXPECT_EQ(exit_code_for(summary), exit_code::TRANSPORT);
  EXPECT_EQ(summary.commands_attempted, 1u);
  EXPECT_EQ(sink_.of_kind(EventKind::Fatal).size(), 1u);
}

TEST_F(EndToEndTest, InstrumentHangupIsFatalIoError) {
  LoopbackScpiServer server([](const std::string &line) {
    if (line == "READ?")
      return std::optional<ScpiReply>(ScpiReply{"", true});
    return std::optional<ScpiReply>();
  });

  RunSummary summary = run("generic_scpi", server, "Reset, Measure");

  ASSERT_TRUE(summary.fatal_error.has_value());
  EXPECT_EQ(*summary.fatal_error, ErrorKind::TransportIoError);
  EXPECT_EQ(summary.commands_succeeded, 1u);
}

TEST_F(EndToEndTest, GarbledReplyIsDiagnosticAndRunContinues) {
  int reads = 0;
  LoopbackScpiServer server([&reads](const std::string &line) {
    if (line != "READ?")
      return std::optional<ScpiReply>();
    return std::optional<ScpiReply>(
        ScpiReply{++reads == 1 ? "volts\n" : "0.25\n"});
  });

  RunSummary summary = run("generic_scpi", server, "Measure, Measure");

  EXPECT_FALSE(summary.fatal_error.has_value());
  EXPECT_EQ(summary.decode_errors, 1u);
  EXPECT_EQ(exit_code_for(summary), exit_code::COMMAND_FAILED);
  ASSERT_EQ(sink_.measurements().size(), 1u);
  EXPECT_DOUBLE_EQ(sink_.measurements()[0].value, 0.25);
}

TEST_F(EndToEndTest, UnsupportedTransportIsRejectedBeforeOpening) {
  LoopbackScpiServer server(bench_dmm);
  try {
    DeviceRegistry::instance().resolve(
        "unit161d", ScpiSocketDescriptor{"127.0.0.1", server.port()});
    FAIL() << "expected ResolutionError";
  } catch (const ResolutionError &e) {
    EXPECT_EQ(exit_code_for(e.kind()), exit_code::RESOLUTION);
  }
  EXPECT_TRUE(server.received().empty());
}
