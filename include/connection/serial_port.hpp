#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace connection {

/**
 * @brief Read-only serial port abstraction for the P1 port.
 *
 * The supervisor only ever pulls bytes from the meter, so the interface has no write side.
 * A fake implementation is injected in tests.
 */
class ISerialPort {
public:
  virtual ~ISerialPort() noexcept = default;

  virtual bool open(std::string_view device, int baud) = 0;
  virtual void close() noexcept = 0;
  virtual bool is_open() const noexcept = 0;

  /**
   * @brief Read whatever is available, waiting at most @p timeout for the first byte.
   *
   * @return false on EOF or a read error (the connection is gone).
   *         true with out_nbytes == 0 when the timeout elapsed without data.
   */
  virtual bool read_some(uint8_t* dst, size_t cap, size_t& out_nbytes,
                         std::chrono::milliseconds timeout) = 0;

  bool read_some(std::span<uint8_t> dst, size_t& out_nbytes, std::chrono::milliseconds timeout) {
    return read_some(dst.data(), dst.size(), out_nbytes, timeout);
  }
};

// Rates SerialPort can configure: 9600, 19200, 38400, 57600, 115200, 230400.
[[nodiscard]] bool is_supported_baud(int baud) noexcept;

/**
 * @brief POSIX serial implementation (Linux), raw 8N1.
 */
class SerialPort final : public ISerialPort {
public:
  SerialPort() = default;
  ~SerialPort() noexcept override;

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  bool open(std::string_view device, int baud) override;
  void close() noexcept override;
  bool is_open() const noexcept override;

  bool read_some(uint8_t* dst, size_t cap, size_t& out_nbytes,
                 std::chrono::milliseconds timeout) override;

private:
  int fd_{-1};
};

} // namespace connection
