#pragma once
#include "iserial_port.hpp"
#include "../core/errors.hpp"
#include <cerrno>
#include <cstring>
#include <string>

// POSIX serial
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

/**
 * @brief termios-backed serial port
 *
 * Raw mode, 8N1, no hardware or software flow control. Reads block for at
 * most the configured timeout between bytes (VMIN=0, VTIME in deciseconds).
 */
class PosixSerialPort : public ISerialPort {
public:
  static constexpr std::size_t MAX_LINE = 256;  ///< Longest line read_line() collects

  explicit PosixSerialPort(SerialSettings settings) : settings_(std::move(settings)) {}

  ~PosixSerialPort() override { close(); }

  PosixSerialPort(const PosixSerialPort&) = delete;
  PosixSerialPort& operator=(const PosixSerialPort&) = delete;

  void open() override {
    if (fd_ >= 0) return;

    speed_t speed = to_speed(settings_.baud);

    // O_NONBLOCK keeps open() from waiting for carrier while CLOCAL is still unset
    int fd = ::open(settings_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
      throw SerialIOError("could not open " + settings_.port + ": " + std::strerror(errno));
    }

    termios tio{};
    if (tcgetattr(fd, &tio) != 0) {
      int err = errno;
      ::close(fd);
      throw SerialIOError("tcgetattr failed on " + settings_.port + ": " + std::strerror(err));
    }

    cfmakeraw(&tio);
    tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);

    // VTIME is in tenths of a second; a non-zero timeout never rounds down to "block forever"
    long ds = (settings_.timeout.count() + 99) / 100;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = static_cast<cc_t>(ds > 255 ? 255 : ds);

    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
      int err = errno;
      ::close(fd);
      throw SerialIOError("tcsetattr failed on " + settings_.port + ": " + std::strerror(err));
    }

    // Back to blocking reads so VTIME applies
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) != 0) {
      int err = errno;
      ::close(fd);
      throw SerialIOError("fcntl failed on " + settings_.port + ": " + std::strerror(err));
    }
    tcflush(fd, TCIOFLUSH);
    fd_ = fd;
  }

  void close() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool is_open() const override { return fd_ >= 0; }

  void write(const std::string& data) override {
    if (fd_ < 0) throw SerialIOError("write on closed port " + settings_.port);

    std::size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n = ::write(fd_, data.data() + sent, data.size() - sent);
      if (n < 0) {
        if (errno == EINTR) continue;
        throw SerialIOError("write failed on " + settings_.port + ": " + std::strerror(errno));
      }
      sent += static_cast<std::size_t>(n);
    }
  }

  std::string read_line() override {
    if (fd_ < 0) throw SerialIOError("read on closed port " + settings_.port);

    std::string line;
    while (line.size() < MAX_LINE) {
      char c;
      ssize_t n = ::read(fd_, &c, 1);
      if (n < 0) {
        if (errno == EINTR) continue;
        throw SerialIOError("read failed on " + settings_.port + ": " + std::strerror(errno));
      }
      if (n == 0) break;  // timeout
      line.push_back(c);
      if (c == '\n') break;
    }
    return line;
  }

  std::string name() const override { return settings_.port; }

  const SerialSettings& settings() const { return settings_; }

  /**
   * @brief Map a numeric baud rate to a termios speed
   * @throws SerialIOError for rates termios does not support
   */
  static speed_t to_speed(int baud) {
    switch (baud) {
      case 1200: return B1200;
      case 2400: return B2400;
      case 4800: return B4800;
      case 9600: return B9600;
      case 19200: return B19200;
      case 38400: return B38400;
      case 57600: return B57600;
      case 115200: return B115200;
      case 230400: return B230400;
      default:
        throw SerialIOError("unsupported baud rate " + std::to_string(baud));
    }
  }

private:
  SerialSettings settings_;
  int fd_{-1};
};
