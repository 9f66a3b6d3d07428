// MIT License
#include "mycobot_driver/transport.hpp"
#include <termios.h>
#include <fcntl.h>
#include <unistd.h>
#include <poll.h>
#include <cstring>
#include <cerrno>

#include <rcutils/logging_macros.h>

namespace mycobot_driver {

  namespace {
    // Gap after which a reply is considered complete.
    constexpr int kInterByteGapMs = 10;
  }  // namespace

  SerialTransport::SerialTransport(const std::string& device, int baud_rate, double read_timeout_sec)
    : device_(device), baud_(baud_rate), read_timeout_sec_(read_timeout_sec) {
    if (!openPort(open_err_)) {
      RCUTILS_LOG_ERROR("[SerialTransport::SerialTransport] unable to open %s: %s",
                        device_.c_str(), open_err_.c_str());
    }
  }

  SerialTransport::~SerialTransport() {
    if (fd_ >= 0) ::close(fd_);
  }

  bool SerialTransport::openPort(std::string& err) {
    if (fd_ >= 0) return true;
    fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
      err = std::string("open failed: ") + strerror(errno);
      return false;
    }
    termios tio{};
    if (tcgetattr(fd_, &tio) != 0) {
      err = "tcgetattr failed";
      ::close(fd_); fd_ = -1;
      return false;
    }
    cfmakeraw(&tio);
    speed_t speed = B115200;
    switch (baud_) {
    case 9600: speed = B9600; break;
    case 19200: speed = B19200; break;
    case 38400: speed = B38400; break;
    case 57600: speed = B57600; break;
    case 115200: speed = B115200; break;
    case 230400: speed = B230400; break;
    case 460800: speed = B460800; break;
    case 921600: speed = B921600; break;
    case 1000000: speed = B1000000; break;
    default:
      RCUTILS_LOG_WARN("[SerialTransport::openPort] unsupported baud rate %d, using 115200", baud_);
      speed = B115200;
      break;
    }
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cflag &= ~PARENB;
    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= CS8;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
      err = "tcsetattr failed";
      ::close(fd_); fd_ = -1;
      return false;
    }
    RCUTILS_LOG_INFO("[SerialTransport::openPort] opened %s at %d baud", device_.c_str(), baud_);
    return true;
  }

  void SerialTransport::discardInput() {
    if (fd_ >= 0 && tcflush(fd_, TCIFLUSH) != 0) {
      RCUTILS_LOG_WARN("[SerialTransport::discardInput] tcflush failed: %s", strerror(errno));
    }
  }

  bool SerialTransport::writeBytes(const uint8_t* data, size_t len, std::string& err) {
    if (fd_ < 0) {
      err = open_err_.empty() ? "port not open" : open_err_;
      return false;
    }
    size_t off = 0;
    while (off < len) {
      ssize_t w = ::write(fd_, data + off, len - off);
      if (w < 0) {
        if (errno == EAGAIN || errno == EINTR) continue;
        err = strerror(errno);
        return false;
      }
      off += size_t(w);
    }
    // Half-duplex: the reply must not be read before the request has left.
    if (tcdrain(fd_) != 0 && errno != EINTR) {
      err = std::string("tcdrain failed: ") + strerror(errno);
      return false;
    }
    return true;
  }

  int SerialTransport::readByte(uint8_t& out, int timeout_ms, std::string& err) {
    struct pollfd p { fd_, POLLIN, 0 };
    int r = poll(&p, 1, timeout_ms);
    if (r == 0) return 0;
    if (r < 0) {
      if (errno == EINTR) return 0;
      err = std::string("poll: ") + strerror(errno);
      return -1;
    }
    if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      err = "error on serial port";
      return -1;
    }
    ssize_t n = ::read(fd_, &out, 1);
    if (n == 1) return 1;
    if (n < 0 && errno != EAGAIN) {
      err = std::string("read: ") + strerror(errno);
      return -1;
    }
    return 0;
  }

  bool SerialTransport::write(const std::vector<uint8_t>& data, std::string& err) {
    return writeBytes(data.data(), data.size(), err);
  }

  bool SerialTransport::writeAndRead(const std::vector<uint8_t>& data, std::vector<uint8_t>& reply,
                                     std::string& err) {
    reply.clear();
    discardInput();
    if (!writeBytes(data.data(), data.size(), err)) return false;
    uint8_t b = 0;
    int r = readByte(b, static_cast<int>(read_timeout_sec_ * 1000.0), err);
    if (r < 0) return false;
    if (r == 0) return true;  // nothing arrived
    reply.push_back(b);
    for (;;) {
      r = readByte(b, kInterByteGapMs, err);
      if (r < 0) return false;
      if (r == 0) break;
      reply.push_back(b);
    }
    return true;
  }

}  // namespace mycobot_driver
