#include <gtest/gtest.h>

#include <algorithm>

#include "capture.hpp"
#include "encoder.hpp"
#include "errors.hpp"

class CaptureEncoderTest : public ::testing::Test {
protected:
  void SetUp() override {
    SyntheticSourceConfig sc;
    sc.width = 320;
    sc.height = 240;
    sc.monitors = 2;
    source = std::make_unique<SyntheticFrameSource>(sc);
  }

  std::unique_ptr<SyntheticFrameSource> source;
  OpenCVEncoder encoder;
};

TEST_F(CaptureEncoderTest, FullMonitorCapture) {
  RawFrame f = source->capture(std::nullopt, 0);
  EXPECT_EQ(f.width, 320);
  EXPECT_EQ(f.height, 240);
  EXPECT_EQ(f.channels, 3);
  EXPECT_EQ(f.pixels.size(), 320u * 240u * 3u);
  EXPECT_EQ(source->frames_rendered(), 1u);
}

TEST_F(CaptureEncoderTest, RegionIsCropped) {
  RawFrame f = source->capture(Region{10, 20, 64, 48}, 1);
  EXPECT_EQ(f.width, 64);
  EXPECT_EQ(f.height, 48);
  EXPECT_EQ(f.pixels.size(), 64u * 48u * 3u);
}

TEST_F(CaptureEncoderTest, FramesChangeOverTime) {
  RawFrame a = source->capture(std::nullopt, 0);
  RawFrame b = source->capture(std::nullopt, 0);
  EXPECT_NE(a.pixels, b.pixels);
}

TEST_F(CaptureEncoderTest, BadMonitorOrRegionFails) {
  try {
    source->capture(std::nullopt, 2);
    FAIL() << "expected CaptureFailure";
  } catch (const StreamError& e) {
    EXPECT_EQ(e.code(), ErrorCode::CaptureFailure);
  }
  EXPECT_THROW(source->capture(Region{300, 0, 64, 64}, 0), StreamError);
}

TEST_F(CaptureEncoderTest, InvalidSourceSize) {
  SyntheticSourceConfig sc;
  sc.width = 0;
  EXPECT_THROW(SyntheticFrameSource{sc}, StreamError);
}

TEST_F(CaptureEncoderTest, JpegOutput) {
  RawFrame f = source->capture(std::nullopt, 0);
  auto bytes = encoder.encode(f, ImageFormat::JPEG, 75);
  ASSERT_GT(bytes.size(), 4u);
  EXPECT_EQ(bytes[0], 0xFF);
  EXPECT_EQ(bytes[1], 0xD8);
}

TEST_F(CaptureEncoderTest, JpegQualityAffectsSize) {
  RawFrame f = source->capture(std::nullopt, 0);
  auto low = encoder.encode(f, ImageFormat::JPEG, 10);
  auto high = encoder.encode(f, ImageFormat::JPEG, 95);
  EXPECT_LT(low.size(), high.size());
}

TEST_F(CaptureEncoderTest, PngOutput) {
  RawFrame f = source->capture(Region{0, 0, 32, 32}, 0);
  auto bytes = encoder.encode(f, ImageFormat::PNG, 95);
  const std::vector<uint8_t> sig{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  ASSERT_GE(bytes.size(), sig.size());
  EXPECT_TRUE(std::equal(sig.begin(), sig.end(), bytes.begin()));
}

TEST_F(CaptureEncoderTest, PngCompressionMapping) {
  EXPECT_EQ(OpenCVEncoder::png_compression_for(100), 0);
  EXPECT_EQ(OpenCVEncoder::png_compression_for(1), 9);
  EXPECT_EQ(OpenCVEncoder::png_compression_for(50), 5);
  EXPECT_EQ(OpenCVEncoder::png_compression_for(-5), 9);
}

TEST_F(CaptureEncoderTest, MismatchedBufferIsEncodeFailure) {
  RawFrame f;
  f.width = 10;
  f.height = 10;
  f.pixels.assign(10, 0);
  try {
    encoder.encode(f, ImageFormat::JPEG, 50);
    FAIL() << "expected EncodeFailure";
  } catch (const StreamError& e) {
    EXPECT_EQ(e.code(), ErrorCode::EncodeFailure);
  }
}
