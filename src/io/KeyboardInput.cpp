/* @file KeyboardInput.cpp
 * @brief Terminal key reader - owns the fd, switches it to non-canonical mode, decodes arrows - POSIX compliant
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDONLY
#include <poll.h>
#include <unistd.h> // read(), close()

// Booth headers
#include "io/KeyboardInput.hpp"

using namespace booth::io;

namespace {
  constexpr char kEsc = 0x1b;
  // silence after which a trailing ESC is the Escape key rather than a sequence start
  constexpr std::chrono::milliseconds kEscapeTimeout{ 50 };
}

KeyboardInput::~KeyboardInput() { close(); }

KeyboardInput::KeyboardInput(KeyboardInput&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), restore_(std::exchange(other.restore_, false)),
      saved_(other.saved_), pending_(std::move(other.pending_)), lastData_(other.lastData_) {}

KeyboardInput& KeyboardInput::operator=(KeyboardInput&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    restore_ = std::exchange(other.restore_, false);
    saved_ = other.saved_;
    pending_ = std::move(other.pending_);
    lastData_ = other.lastData_;
  }
  return *this;
}

bool KeyboardInput::open(const std::string& dev) {
  close();
  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "[KeyboardInput] open " << dev << ": " << strerror(errno) << "\n";
    return false;
  }

  if (tcgetattr(fd_, &saved_) != 0) {
    std::cerr << "[KeyboardInput] " << dev << " is not a terminal: " << strerror(errno) << "\n";
    close();
    return false;
  }

  struct termios tty = saved_;
  tty.c_lflag &= ~(ICANON | ECHO);
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "[KeyboardInput] tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  restore_ = true;
  return true;
}

void KeyboardInput::close() {
  if (fd_ >= 0) {
    if (restore_ && tcsetattr(fd_, TCSANOW, &saved_) != 0)
      std::cerr << "[KeyboardInput] could not restore terminal: " << strerror(errno) << "\n";
    ::close(fd_);
  }
  fd_ = -1;
  restore_ = false;
  pending_.clear();
}

// -------------------------------------------------------------------
// KeyboardInput::readKeys
// Waits up to `timeout` for input, then drains everything available.
// -------------------------------------------------------------------
std::vector<KeyPress> KeyboardInput::readKeys(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return {};

  pollfd pfd{ fd_, POLLIN, 0 };
  int rc;
  do {
    rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (rc == -1 && errno == EINTR);

  if (rc == -1) {
    std::cerr << "[KeyboardInput] poll: " << strerror(errno) << '\n';
    return {};
  }

  bool gotData = false;
  if (rc > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
    char temp[64];
    for (;;) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        pending_.append(temp, static_cast<std::size_t>(n));
        gotData = true;
        continue;
      }
      if (n == -1 && errno == EINTR)
        continue; // interrupted → retry
      if (n == 0 && !gotData && (pfd.revents & POLLHUP)) {
        std::cerr << "[KeyboardInput] terminal hung up\n";
        auto keys = decode(pending_, true);
        close();
        return keys;
      }
      if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EIO)
        std::cerr << "[KeyboardInput] read: " << strerror(errno) << '\n';
      break; // drained
    }
  }

  const auto now = std::chrono::steady_clock::now();
  if (gotData)
    lastData_ = now;
  return decode(pending_, !gotData && now - lastData_ >= kEscapeTimeout);
}

std::vector<KeyPress> KeyboardInput::decode(std::string& pending, bool flushEscape) {
  std::vector<KeyPress> keys;
  std::size_t i = 0;

  while (i < pending.size()) {
    const char c = pending[i];

    if (c == kEsc) {
      const std::size_t left = pending.size() - i;
      if (left >= 2 && (pending[i + 1] == '[' || pending[i + 1] == 'O')) {
        // CSI may carry parameter bytes (ESC [ 5 ~); SS3 is always one final byte
        std::size_t j = i + 2;
        if (pending[i + 1] == '[')
          while (j < pending.size() && pending[j] >= 0x30 && pending[j] <= 0x3f)
            ++j;
        if (j >= pending.size())
          break; // introducer seen: wait for the final byte even across idle reads
        if (j == i + 2) {
          switch (pending[j]) {
          case 'A':
            keys.push_back({ Key::Up });
            break;
          case 'B':
            keys.push_back({ Key::Down });
            break;
          case 'C':
            keys.push_back({ Key::Right });
            break;
          case 'D':
            keys.push_back({ Key::Left });
            break;
          default:
            break; // other keys are not mapped
          }
        }
        i = j + 1;
        continue;
      }
      if (left == 1 && !flushEscape)
        break;
      keys.push_back({ Key::Escape });
      ++i;
      continue;
    }

    if (c == '\r' || c == '\n') {
      keys.push_back({ Key::Enter });
      // CR LF is one key
      if (c == '\r' && i + 1 < pending.size() && pending[i + 1] == '\n')
        ++i;
    } else if (c == ' ') {
      keys.push_back({ Key::Space });
    } else if (std::isprint(static_cast<unsigned char>(c))) {
      keys.push_back({ Key::Character, static_cast<char>(std::tolower(static_cast<unsigned char>(c))) });
    }
    ++i;
  }

  pending.erase(0, i);
  return keys;
}
