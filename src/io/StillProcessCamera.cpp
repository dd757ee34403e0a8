/* @file StillProcessCamera.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <opencv2/imgcodecs.hpp>

// Booth headers
#include "io/StillProcessCamera.hpp"

using namespace booth::io;

StillProcessCamera::StillProcessCamera(StillProcessOptions options,
                                       std::shared_ptr<ProcessRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {}

StillProcessCamera::~StillProcessCamera() { close(); }

std::vector<std::string> StillProcessCamera::previewCommand() const {
  std::vector<std::string> argv{ options_.videoCommand,
                                 "-n",
                                 "--codec",
                                 "mjpeg",
                                 "--width",
                                 std::to_string(options_.preview.width),
                                 "--height",
                                 std::to_string(options_.preview.height),
                                 "--framerate",
                                 std::to_string(options_.framerate),
                                 "--quality",
                                 std::to_string(options_.previewQuality),
                                 "-t",
                                 "0",
                                 "-o",
                                 "-" };
  if (options_.mirror)
    argv.push_back("--hflip");
  return argv;
}

std::vector<std::string> StillProcessCamera::stillCommand(const std::filesystem::path& out,
                                                          Resolution res) const {
  std::vector<std::string> argv{ options_.stillCommand,
                                 "-n",
                                 "-o",
                                 out.string(),
                                 "--width",
                                 std::to_string(res.width),
                                 "--height",
                                 std::to_string(res.height),
                                 "-t",
                                 "1",
                                 "-q",
                                 std::to_string(options_.stillQuality) };
  if (options_.mirror)
    argv.push_back("--hflip");
  return argv;
}

bool StillProcessCamera::open() {
  if (preview_.running())
    return true;
  splitter_ = MjpegSplitter{};
  return preview_.start(previewCommand());
}

void StillProcessCamera::close() { preview_.stop(); }

std::optional<Frame> StillProcessCamera::grabFrame() {
  if (!preview_.running() && !open())
    throw std::runtime_error("[StillProcessCamera] cannot start " + options_.videoCommand);

  auto chunk = preview_.readSome(std::chrono::milliseconds{ 0 });
  if (!chunk)
    throw std::runtime_error("[StillProcessCamera] preview stream ended");
  if (chunk->empty())
    return std::nullopt;

  auto frames = splitter_.feed(*chunk);
  if (frames.empty())
    return std::nullopt;

  // only the newest frame matters for a live preview
  Frame decoded = cv::imdecode(frames.back(), cv::IMREAD_COLOR);
  if (decoded.empty())
    throw std::runtime_error("[StillProcessCamera] corrupt MJPEG frame");
  return decoded;
}

bool StillProcessCamera::captureStill(const std::filesystem::path& out, Resolution res) {
  const bool wasPreviewing = preview_.running();
  preview_.stop();

  auto result = runner_->run(stillCommand(out, res), std::chrono::seconds{ 15 });

  if (wasPreviewing)
    open();

  std::error_code ec;
  return result.ok() && std::filesystem::exists(out, ec);
}
