#include "OutputBuffer.hpp"

#include "TestHeaders.hpp"

using namespace tt;

TEST_CASE("OutputBuffer keeps the trailing window", "[OutputBuffer]") {
  SECTION("Default capacity") {
    OutputBuffer buffer;
    REQUIRE(buffer.getCapacity() == 400000);
    REQUIRE(buffer.empty());
  }

  SECTION("Appends below the cap are kept whole") {
    OutputBuffer buffer(10);
    buffer.append("abc");
    buffer.append("def");
    REQUIRE(buffer.contents() == "abcdef");
    REQUIRE(buffer.size() == 6);
  }

  SECTION("Oldest bytes are dropped first") {
    OutputBuffer buffer(10);
    buffer.append("0123456789");
    buffer.append("ABC");
    REQUIRE(buffer.contents() == "3456789ABC");
  }

  SECTION("A single oversized append keeps its tail") {
    OutputBuffer buffer(4);
    buffer.append("abcdefgh");
    REQUIRE(buffer.contents() == "efgh");
  }
}

TEST_CASE("OutputBuffer never exceeds its cap", "[OutputBuffer]") {
  OutputBuffer buffer(1000);
  string produced;
  for (int i = 0; i < 500; i++) {
    string chunk(size_t(1 + rand() % 97), char('a' + i % 26));
    produced += chunk;
    buffer.append(chunk);
    REQUIRE(buffer.size() <= 1000);
  }
  REQUIRE(buffer.contents() ==
          produced.substr(produced.length() - buffer.size()));
  REQUIRE(buffer.size() == 1000);
}
