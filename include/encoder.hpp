#pragma once
#include <cstdint>
#include <vector>

#include "types.hpp"

// Encodes a raw frame into the stream's image format. Quality is 1-100; its meaning
// depends on the format. Failures throw StreamError(EncodeFailure).
class Encoder {
public:
  virtual ~Encoder() = default;
  virtual std::vector<uint8_t> encode(const RawFrame& frame, ImageFormat format, int quality) = 0;
};

class OpenCVEncoder : public Encoder {
public:
  std::vector<uint8_t> encode(const RawFrame& frame, ImageFormat format, int quality) override;

  // PNG has no quality knob; higher quality maps to faster, lighter compression.
  static int png_compression_for(int quality);
};
