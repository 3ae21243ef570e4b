#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "base64.hpp"

namespace {

std::string enc(const std::string& s) {
  return base64_encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

std::string dec(const std::string& s) {
  auto v = base64_decode(s);
  return std::string(v.begin(), v.end());
}

}  // namespace

// RFC 4648 section 10 test vectors
TEST(Base64Test, EncodeRfcVectors) {
  EXPECT_EQ(enc(""), "");
  EXPECT_EQ(enc("f"), "Zg==");
  EXPECT_EQ(enc("fo"), "Zm8=");
  EXPECT_EQ(enc("foo"), "Zm9v");
  EXPECT_EQ(enc("foob"), "Zm9vYg==");
  EXPECT_EQ(enc("fooba"), "Zm9vYmE=");
  EXPECT_EQ(enc("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodeRfcVectors) {
  EXPECT_EQ(dec(""), "");
  EXPECT_EQ(dec("Zg=="), "f");
  EXPECT_EQ(dec("Zm8="), "fo");
  EXPECT_EQ(dec("Zm9vYmFy"), "foobar");
}

TEST(Base64Test, BinaryBytes) {
  std::vector<uint8_t> png_sig{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  EXPECT_EQ(base64_encode(png_sig), "iVBORw0KGgo=");
  EXPECT_EQ(base64_decode("iVBORw0KGgo="), png_sig);

  std::vector<uint8_t> jpeg_soi{0xFF, 0xD8, 0xFF};
  EXPECT_EQ(base64_encode(jpeg_soi), "/9j/");
}

TEST(Base64Test, RejectsMalformedInput) {
  EXPECT_THROW(base64_decode("Zg="), std::invalid_argument);
  EXPECT_THROW(base64_decode("Zm9*"), std::invalid_argument);
  EXPECT_THROW(base64_decode("Zg==Zm9v"), std::invalid_argument);
}
