#pragma once
#include <chrono>
#include <string>

/**
 * @brief Serial line settings
 *
 * Framing is fixed at 8 data bits, no parity, 1 stop bit, no flow control.
 */
struct SerialSettings {
  std::string port;                              ///< Device path, e.g. /dev/ttyUSB0
  int baud{19200};                               ///< Baud rate
  std::chrono::milliseconds timeout{100};        ///< Read timeout
};

/**
 * @brief Abstract line-oriented serial transport
 *
 * All failures to open, write or read are reported as SerialIOError.
 * read_line() returns whatever arrived before a '\n' or the timeout, so a
 * silent device yields an empty string rather than an error.
 */
class ISerialPort {
public:
  virtual ~ISerialPort() = default;

  /// Open the port; no-op if already open. Throws SerialIOError.
  virtual void open() = 0;

  /// Close the port; no-op if already closed
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  /// Write all bytes. Throws SerialIOError.
  virtual void write(const std::string& data) = 0;

  /// Read up to and including '\n', or until timeout. Throws SerialIOError.
  virtual std::string read_line() = 0;

  /// Port identifier for diagnostics
  virtual std::string name() const = 0;
};
