#include "capture.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <opencv2/opencv.hpp>

#include "errors.hpp"

SyntheticFrameSource::SyntheticFrameSource(SyntheticSourceConfig cfg) : cfg_(cfg) {
  if (cfg_.width <= 0 || cfg_.height <= 0) {
    throw StreamError(ErrorCode::InvalidConfig,
                      fmt::format("invalid monitor size {}x{}", cfg_.width, cfg_.height));
  }
}

RawFrame SyntheticFrameSource::capture(const std::optional<Region>& region, int monitor) {
  if (monitor < 0 || monitor >= cfg_.monitors) {
    throw StreamError(ErrorCode::CaptureFailure, fmt::format("no such monitor: {}", monitor));
  }

  const uint64_t n = counter_.fetch_add(1);
  cv::Mat screen(cfg_.height, cfg_.width, CV_8UC3);

  // Horizontal gradient scrolling one column per frame, plus a bouncing box.
  for (int x = 0; x < cfg_.width; ++x) {
    const auto shade = static_cast<uchar>((x + n) % 256);
    screen.col(x).setTo(cv::Scalar(shade, 64, 255 - shade));
  }
  const int box = std::max(8, std::min(cfg_.width, cfg_.height) / 8);
  const int span_x = std::max(1, cfg_.width - box);
  const int span_y = std::max(1, cfg_.height - box);
  const cv::Rect moving(static_cast<int>((n * 7) % span_x), static_cast<int>((n * 5) % span_y),
                        std::min(box, cfg_.width), std::min(box, cfg_.height));
  cv::rectangle(screen, moving, cv::Scalar(255, 255, 255), cv::FILLED);
  cv::putText(screen, fmt::format("frame {}", n), cv::Point(10, std::min(40, cfg_.height - 1)),
              cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 0), 2);

  cv::Mat out = screen;
  if (region) {
    const cv::Rect r(region->x, region->y, region->width, region->height);
    if ((r & cv::Rect(0, 0, cfg_.width, cfg_.height)) != r || r.area() == 0) {
      throw StreamError(ErrorCode::CaptureFailure,
                        fmt::format("region {}x{}+{}+{} outside monitor {}x{}", r.width, r.height,
                                    r.x, r.y, cfg_.width, cfg_.height));
    }
    out = screen(r).clone();
  }

  RawFrame f;
  f.width = out.cols;
  f.height = out.rows;
  f.channels = out.channels();
  f.pixels.assign(out.datastart, out.dataend);
  f.timestamp = WallClock::now();
  return f;
}
