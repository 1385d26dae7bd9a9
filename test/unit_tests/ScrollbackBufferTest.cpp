#include "Compression.hpp"
#include "ScrollbackBuffer.hpp"

#include "TestHeaders.hpp"

using namespace ts;

TEST_CASE("ScrollbackBuffer default capacity", "[ScrollbackBuffer]") {
  ScrollbackBuffer buffer;
  for (int i = 0; i < 5000; i++) {
    buffer.append("line " + to_string(i));
  }
  REQUIRE(buffer.lineCount() == 5000);

  buffer.append("line 5000\nline 5001\nline 5002");
  REQUIRE(buffer.lineCount() == 5000);
  string contents = buffer.contents();
  REQUIRE(contents.substr(0, contents.find('\n')) == "line 3");
  REQUIRE(contents.substr(contents.rfind('\n') + 1) == "line 5002");
  REQUIRE(contents.find("line 2\n") == string::npos);
}

TEST_CASE("ScrollbackBuffer line handling", "[ScrollbackBuffer]") {
  ScrollbackBuffer buffer(5);

  SECTION("Starts empty") {
    REQUIRE(buffer.empty());
    REQUIRE(buffer.lineCount() == 0);
    REQUIRE_FALSE(buffer.snapshot());
  }

  SECTION("Chunks are split on newlines") {
    buffer.append("one\ntwo");
    REQUIRE(buffer.lineCount() == 2);
    REQUIRE(buffer.contents() == "one\ntwo");
  }

  SECTION("Empty pieces are kept") {
    buffer.append("a\n\nb\n");
    REQUIRE(buffer.lineCount() == 4);
    REQUIRE(buffer.contents() == "a\n\nb\n");
  }

  SECTION("Each chunk starts a new line") {
    buffer.append("ab");
    buffer.append("cd");
    REQUIRE(buffer.contents() == "ab\ncd");
  }

  SECTION("Oldest lines are dropped past the limit") {
    buffer.append("1\n2\n3\n4");
    buffer.append("5\n6\n7");
    REQUIRE(buffer.lineCount() == 5);
    REQUIRE(buffer.contents() == "3\n4\n5\n6\n7");
  }

  SECTION("A single oversized chunk keeps its tail") {
    buffer.append("a\nb\nc\nd\ne\nf\ng\nh");
    REQUIRE(buffer.contents() == "d\ne\nf\ng\nh");
  }

  SECTION("Clear") {
    buffer.append("x");
    buffer.clear();
    REQUIRE(buffer.empty());
  }
}

TEST_CASE("ScrollbackBuffer snapshots", "[ScrollbackBuffer]") {
  ScrollbackBuffer buffer;
  buffer.append("$ make\r\n\x1b[32mok\x1b[0m\n");
  optional<string> snapshot = buffer.snapshot();
  REQUIRE(snapshot);
  // gzip magic
  REQUIRE(uint8_t((*snapshot)[0]) == 0x1f);
  REQUIRE(uint8_t((*snapshot)[1]) == 0x8b);
  REQUIRE(gzipDecompress(*snapshot) == buffer.contents());
}

TEST_CASE("Gzip helpers", "[Compression]") {
  SECTION("Large repetitive input shrinks") {
    string input(100000, 'z');
    string compressed = gzipCompress(input);
    REQUIRE(compressed.length() < input.length() / 10);
    REQUIRE(gzipDecompress(compressed) == input);
  }

  SECTION("Corrupt input throws") {
    REQUIRE_THROWS_AS(gzipDecompress("definitely not gzip"),
                      std::runtime_error);
  }

  SECTION("Truncated input throws") {
    string compressed = gzipCompress(string(5000, 'q') + "tail");
    REQUIRE_THROWS_AS(gzipDecompress(compressed.substr(0, 10)),
                      std::runtime_error);
  }
}
