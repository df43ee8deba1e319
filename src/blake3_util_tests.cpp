#include "blake3_util.h"

#include "doctest.h"

#include <string>

namespace {

// Known BLAKE3 hash of "abc"
constexpr dbuild::blake3_t kExpectedBlake3Abc{ 0x64, 0x37, 0xb3, 0xac, 0x38, 0x46, 0x51,
                                               0x33, 0xff, 0xb6, 0x3b, 0x75, 0x27, 0x3a,
                                               0x8d, 0xb5, 0x48, 0xc5, 0x58, 0x46, 0x5d,
                                               0x79, 0xdb, 0x03, 0xfd, 0x35, 0x9c, 0x6c,
                                               0xd5, 0xbd, 0x9d, 0x85u };

}  // namespace

TEST_CASE("blake3_hash computes known hash") {
  std::string constexpr input{ "abc" };
  auto const digest{ dbuild::blake3_hash(input.data(), input.size()) };
  CHECK(digest == kExpectedBlake3Abc);
}

TEST_CASE("blake3_hex renders lowercase hex of known hash") {
  CHECK(dbuild::blake3_hex("abc") ==
        "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
  CHECK(dbuild::blake3_hex("") ==
        "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST_CASE("blake3_hash different inputs produce different outputs") {
  std::string const input1{ "hello" };
  std::string const input2{ "world" };

  auto const digest1{ dbuild::blake3_hash(input1.data(), input1.size()) };
  auto const digest2{ dbuild::blake3_hash(input2.data(), input2.size()) };
  CHECK(digest1 != digest2);
}
