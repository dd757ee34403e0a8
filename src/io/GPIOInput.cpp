/* @file GPIOInput.cpp
 * @brief GPIO character-device line request (v2 uAPI) + debounce, and the push-button classifier.
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>
#include <unistd.h>

// Booth headers
#include "io/ButtonGPIO.hpp"
#include "io/GPIOInput.hpp"

using namespace booth::io;

GPIOInput::~GPIOInput() { close(); }

GPIOInput::GPIOInput(GPIOInput&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), cb_(std::move(other.cb_)), debounce_(other.debounce_),
      rawState_(other.rawState_), stableState_(other.stableState_), rawSince_(other.rawSince_) {}

GPIOInput& GPIOInput::operator=(GPIOInput&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    cb_ = std::move(other.cb_);
    debounce_ = other.debounce_;
    rawState_ = other.rawState_;
    stableState_ = other.stableState_;
    rawSince_ = other.rawSince_;
  }
  return *this;
}

bool GPIOInput::open(const std::string& chip, unsigned int line, bool activeLow) {
  close();

  int chipFd = ::open(chip.c_str(), O_RDONLY | O_CLOEXEC);
  if (chipFd < 0) {
    std::cerr << "[GPIOInput] open " << chip << ": " << strerror(errno) << "\n";
    return false;
  }

  gpio_v2_line_request req{};
  req.offsets[0] = line;
  req.num_lines = 1;
  req.config.flags = GPIO_V2_LINE_FLAG_INPUT;
  if (activeLow)
    req.config.flags |= GPIO_V2_LINE_FLAG_ACTIVE_LOW | GPIO_V2_LINE_FLAG_BIAS_PULL_UP;
  std::snprintf(req.consumer, sizeof(req.consumer), "photobooth");

  const int rc = ::ioctl(chipFd, GPIO_V2_GET_LINE_IOCTL, &req);
  const int err = errno;
  ::close(chipFd); // the line fd stays valid on its own
  if (rc < 0) {
    std::cerr << "[GPIOInput] request line " << line << " on " << chip << ": " << strerror(err)
              << "\n";
    return false;
  }

  fd_ = req.fd;
  rawState_ = stableState_ = false;
  return true;
}

void GPIOInput::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

std::optional<bool> GPIOInput::readLevel() {
  if (fd_ < 0)
    return std::nullopt;
  gpio_v2_line_values values{};
  values.mask = 1;
  if (::ioctl(fd_, GPIO_V2_LINE_GET_VALUES_IOCTL, &values) < 0)
    return std::nullopt;
  return (values.bits & 1) != 0;
}

std::optional<GPIOInput::Edge> GPIOInput::sample(std::chrono::milliseconds now) {
  auto level = readLevel();
  if (!level)
    return std::nullopt;

  if (*level != rawState_) {
    rawState_ = *level;
    rawSince_ = now;
  }
  if (rawState_ == stableState_ || now - rawSince_ < debounce_)
    return std::nullopt;

  stableState_ = rawState_;
  const Edge e = stableState_ ? Edge::Rising : Edge::Falling;
  emit(e);
  return e;
}

// ---------------------------------------------------------------------------
// ButtonGPIO
// ---------------------------------------------------------------------------

void ButtonGPIO::poll(std::chrono::milliseconds now) {
  if (auto edge = sample(now)) {
    if (*edge == Edge::Rising) {
      pressed_ = true;
      longFired_ = false;
      pressStart_ = now;
    } else {
      if (pressed_ && !longFired_)
        emitPress(Event::ShortPress);
      pressed_ = false;
    }
  }

  if (pressed_ && !longFired_ && now - pressStart_ >= longThreshold_) {
    longFired_ = true;
    emitPress(Event::LongPress);
  }
}
