#include "probe/output_parser.hpp"
#include "probe/text_decode.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>

using netdiag::probe::DecodeProcessOutput;
using netdiag::probe::IsValidUtf8;
using netdiag::probe::ParseTextEncoding;
using netdiag::probe::TextEncoding;

TEST_CASE("CP866 Cyrillic decodes to UTF-8", "[probe][decode]") {
  // "мсек" in the OEM code page of a Russian Windows console.
  const std::string oem = "\xAC\xE1\xA5\xAA";
  REQUIRE(DecodeProcessOutput(oem, TextEncoding::kCp866) == "мсек");
  REQUIRE(DecodeProcessOutput("\x80\xA0\xF0\xF1", TextEncoding::kCp866) == "АаЁё");
  REQUIRE(DecodeProcessOutput("ping 10 ms", TextEncoding::kCp866) == "ping 10 ms");
}

TEST_CASE("CP866 tool output feeds the Russian latency dialect", "[probe][decode]") {
  // "(0% потерь)" and "Минимальное = 5 мсек, Максимальное = 9 мсек, Среднее = 7 мсек"
  const std::string oem =
      "(0% \xAF\xAE\xE2\xA5\xE0\xEC)\r\n"
      "\x8C\xA8\xAD\xA8\xAC\xA0\xAB\xEC\xAD\xAE\xA5 = 5 \xAC\xE1\xA5\xAA, "
      "\x8C\xA0\xAA\xE1\xA8\xAC\xA0\xAB\xEC\xAD\xAE\xA5 = 9 \xAC\xE1\xA5\xAA, "
      "\x91\xE0\xA5\xA4\xAD\xA5\xA5 = 7 \xAC\xE1\xA5\xAA\r\n";
  const auto outcome =
      netdiag::probe::ParseLatencyOutput(DecodeProcessOutput(oem, TextEncoding::kCp866));
  REQUIRE(std::holds_alternative<netdiag::probe::LatencyResult>(outcome));
  REQUIRE(netdiag::probe::ToJson(std::get<netdiag::probe::LatencyResult>(outcome)) ==
          R"({"packet_loss":0,"min_rtt":5,"avg_rtt":7,"max_rtt":9})");
}

TEST_CASE("Malformed UTF-8 is replaced rather than rejected", "[probe][decode]") {
  REQUIRE(IsValidUtf8("plain ascii"));
  REQUIRE(IsValidUtf8("\xD0\x9C"));
  REQUIRE_FALSE(IsValidUtf8("\xC0\xAF"));
  REQUIRE_FALSE(IsValidUtf8("\xED\xA0\x80"));

  REQUIRE(DecodeProcessOutput("ok\xFFok", TextEncoding::kUtf8) == "ok\xEF\xBF\xBDok");
  REQUIRE(DecodeProcessOutput("\xD0", TextEncoding::kUtf8) == "\xEF\xBF\xBD");
  REQUIRE(DecodeProcessOutput("", TextEncoding::kUtf8).empty());
}

TEST_CASE("Encoding names parse from config values", "[probe][decode]") {
  REQUIRE(ParseTextEncoding("utf-8") == TextEncoding::kUtf8);
  REQUIRE(ParseTextEncoding("cp866") == TextEncoding::kCp866);
  REQUIRE(ParseTextEncoding("ibm866") == TextEncoding::kCp866);
  REQUIRE_FALSE(ParseTextEncoding("latin1").has_value());
}
