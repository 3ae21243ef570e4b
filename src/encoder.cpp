#include "encoder.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <opencv2/opencv.hpp>

#include "errors.hpp"

int OpenCVEncoder::png_compression_for(int quality) {
  const int q = std::clamp(quality, 1, 100);
  return std::clamp(9 - (q - 1) / 11, 0, 9);
}

std::vector<uint8_t> OpenCVEncoder::encode(const RawFrame& frame, ImageFormat format, int quality) {
  if (frame.width <= 0 || frame.height <= 0 || (frame.channels != 1 && frame.channels != 3)) {
    throw StreamError(ErrorCode::EncodeFailure,
                      fmt::format("bad frame geometry {}x{}x{}", frame.width, frame.height,
                                  frame.channels));
  }
  const size_t expected = static_cast<size_t>(frame.width) * static_cast<size_t>(frame.height) *
                          static_cast<size_t>(frame.channels);
  if (frame.pixels.size() != expected) {
    throw StreamError(ErrorCode::EncodeFailure,
                      fmt::format("frame has {} bytes, expected {}", frame.pixels.size(), expected));
  }

  // imencode only reads the buffer.
  const cv::Mat img(frame.height, frame.width, frame.channels == 3 ? CV_8UC3 : CV_8UC1,
                    const_cast<uint8_t*>(frame.pixels.data()));

  std::vector<uchar> encoded;
  bool ok = false;
  try {
    if (format == ImageFormat::PNG) {
      ok = cv::imencode(".png", img, encoded,
                        {cv::IMWRITE_PNG_COMPRESSION, png_compression_for(quality)});
    } else {
      ok = cv::imencode(".jpg", img, encoded,
                        {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100)});
    }
  } catch (const cv::Exception& e) {
    throw StreamError(ErrorCode::EncodeFailure, fmt::format("imencode failed: {}", e.what()));
  }
  if (!ok || encoded.empty()) {
    throw StreamError(ErrorCode::EncodeFailure,
                      fmt::format("imencode returned no {} data", to_string(format)));
  }
  return std::vector<uint8_t>(encoded.begin(), encoded.end());
}
