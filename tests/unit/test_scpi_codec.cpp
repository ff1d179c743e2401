#include "bench-io/CommandParser.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/codec/ScpiCodec.hpp"
#include <cmath>
#include <gtest/gtest.h>

using namespace benchio;

namespace {

std::string text_of(const EncodedRequest &req) {
  return std::string(req.frame.bytes.begin(), req.frame.bytes.end());
}

Frame line(const std::string &text,
           TransferKind kind = TransferKind::Stream) {
  return Frame::inbound(std::vector<uint8_t>(text.begin(), text.end()), kind);
}

} // namespace

TEST(ScpiCodec, EncodesStandardMnemonics) {
  ScpiCodec codec;
  EncodedRequest measure = codec.encode(MeasureCmd{});
  EXPECT_EQ(text_of(measure), "READ?\n");
  EXPECT_TRUE(measure.expects_reply);
  EXPECT_EQ(measure.mode, AcquisitionMode::Measure);

  EncodedRequest reset = codec.encode(ResetCmd{});
  EXPECT_EQ(text_of(reset), "*RST\n");
  EXPECT_FALSE(reset.expects_reply);

  EXPECT_EQ(text_of(codec.encode(CommandParser::parse("Apply:Sin, 10kHz, 3, 0.4"))),
            "APPL:SIN 10000,3,0.4\n");
  EXPECT_EQ(text_of(codec.encode(CommandParser::parse("Apply:Squ"))),
            "APPL:SQU\n");
}

TEST(ScpiCodec, EncodesPeakTechDialect) {
  ScpiCodec codec(ScpiDialect::PeakTech, TransferKind::Bulk);
  EncodedRequest req =
      codec.encode(CommandParser::parse("Apply:Sin, 10kHz, 1.2, 0.5"));
  EXPECT_EQ(text_of(req), "Apply:Sin 10kHz, 1.2, 0.5\n");
  EXPECT_EQ(req.frame.transfer, TransferKind::Bulk);
  EXPECT_FALSE(req.expects_reply);

  EXPECT_EQ(text_of(codec.encode(CommandParser::parse("Apply:Ramp, 2.5MHz"))),
            "Apply:Ramp 2.5MHz\n");
}

TEST(ScpiCodec, FreeFormLinesExpectReplyOnlyForQueries) {
  ScpiCodec codec;
  EncodedRequest query = codec.encode(CommandParser::parse("Scpi:*IDN?"));
  EXPECT_EQ(text_of(query), "*IDN?\n");
  EXPECT_TRUE(query.expects_reply);
  EXPECT_EQ(query.mode, AcquisitionMode::Query);

  EncodedRequest beep = codec.encode(CommandParser::parse("Scpi:SYST:BEEP"));
  EXPECT_EQ(text_of(beep), "SYST:BEEP\n");
  EXPECT_FALSE(beep.expects_reply);
}

TEST(ScpiCodec, RawIsByteIdentical) {
  ScpiCodec codec;
  for (const char *text : {"Measure", "Reset", "Apply:Sin, 10kHz, 3, 0.4",
                           "Scpi:MEAS:VOLT:DC?"}) {
    Command cmd = CommandParser::parse(text);
    EXPECT_EQ(codec.encode(make_raw(cmd)).frame.bytes,
              codec.encode(cmd).frame.bytes)
        << text;
  }
}

TEST(ScpiCodec, DecodesNumericLine) {
  ScpiCodec codec;
  codec.encode(MeasureCmd{});
  DecodedUnit unit = codec.decode(line("+1.23400000E+00\r\n"));
  const auto *m = std::get_if<Measurement>(&unit);
  ASSERT_NE(m, nullptr);
  EXPECT_DOUBLE_EQ(m->value, 1.234);
  EXPECT_EQ(m->mode, AcquisitionMode::Measure);
  EXPECT_FALSE(codec.has_queued());
}

TEST(ScpiCodec, EachFieldBecomesAMeasurementInOrder) {
  ScpiCodec codec;
  codec.encode(MeasureCmd{});
  DecodedUnit first = codec.decode(line("1.0,2.0,3.0\n"));
  EXPECT_DOUBLE_EQ(std::get<Measurement>(first).value, 1.0);
  ASSERT_TRUE(codec.has_queued());
  EXPECT_DOUBLE_EQ(std::get<Measurement>(codec.decode(Frame::inbound({}))).value,
                   2.0);
  EXPECT_DOUBLE_EQ(std::get<Measurement>(codec.decode(Frame::inbound({}))).value,
                   3.0);
  EXPECT_FALSE(codec.has_queued());
}

TEST(ScpiCodec, WaitsForLineTerminator) {
  ScpiCodec codec;
  codec.encode(MeasureCmd{});
  EXPECT_TRUE(is_partial(codec.decode(line("4.2"))));
  DecodedUnit unit = codec.decode(line("5\n"));
  EXPECT_DOUBLE_EQ(std::get<Measurement>(unit).value, 4.25);
}

TEST(ScpiCodec, ShortBulkPacketEndsResponse) {
  ScpiCodec codec(ScpiDialect::Standard, TransferKind::Bulk);
  codec.encode(MeasureCmd{});
  DecodedUnit unit = codec.decode(line("0.5", TransferKind::Bulk));
  EXPECT_DOUBLE_EQ(std::get<Measurement>(unit).value, 0.5);
}

TEST(ScpiCodec, UnparseableFieldIsProtocolError) {
  ScpiCodec codec;
  codec.encode(MeasureCmd{});
  EXPECT_THROW(codec.decode(line("1.0,abc\n7.0\n")), ProtocolError);
  // The bad line was consumed; the next one still decodes
  DecodedUnit unit = codec.decode(Frame::inbound({}));
  EXPECT_DOUBLE_EQ(std::get<Measurement>(unit).value, 7.0);
}

TEST(ScpiCodec, TextReplyToQueryIsAcknowledged) {
  ScpiCodec codec;
  codec.encode(CommandParser::parse("Scpi:*IDN?"));
  DecodedUnit unit = codec.decode(line("ACME,DMM-1,1234,1.0\n"));
  const auto *ack = std::get_if<Acknowledgement>(&unit);
  ASSERT_NE(ack, nullptr);
  EXPECT_EQ(ack->detail, "ACME,DMM-1,1234,1.0");
}

TEST(ScpiCodec, OverloadMarkerIsInfinity) {
  ScpiCodec codec;
  codec.encode(MeasureCmd{});
  const auto m = std::get<Measurement>(codec.decode(line("9.9E37\n")));
  EXPECT_TRUE(m.overload);
  EXPECT_TRUE(std::isinf(m.value));
}

TEST(ScpiCodec, EmptyLineIsProtocolError) {
  ScpiCodec codec;
  codec.encode(MeasureCmd{});
  EXPECT_THROW(codec.decode(line("\r\n")), ProtocolError);
}

TEST(ScpiCodec, ParseRequestRoundTrip) {
  ScpiCodec standard;
  ScpiCodec peaktech(ScpiDialect::PeakTech);
  for (const char *text : {"Measure", "Reset", "Apply:Sin, 10kHz, 3, 0.4",
                           "Apply:Squ, 1kHz", "Scpi:*IDN?"}) {
    Command cmd = CommandParser::parse(text);
    for (ScpiCodec *codec : {&standard, &peaktech}) {
      auto back = codec->parse_request(codec->encode(cmd).frame);
      ASSERT_TRUE(back.has_value()) << text;
      EXPECT_TRUE(same_command(*back, cmd))
          << text << " -> " << to_string(*back);
    }
  }
}
