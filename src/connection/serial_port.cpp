#include "connection/serial_port.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#ifdef __linux__
  #include <fcntl.h>
  #include <poll.h>
  #include <termios.h>
  #include <unistd.h>
#endif

namespace connection {

namespace {
#ifdef __linux__
bool baud_to_speed(int baud, speed_t& out) {
  switch (baud) {
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default:     return false;
  }
}
#endif
} // namespace

bool is_supported_baud(int baud) noexcept {
#ifdef __linux__
  speed_t sp = B0;
  return baud_to_speed(baud, sp);
#else
  (void)baud;
  return false;
#endif
}

SerialPort::~SerialPort() noexcept {
  close();
}

bool SerialPort::open(std::string_view device, int baud) {
#ifdef __linux__
  close();

  speed_t sp = B0;
  if (!baud_to_speed(baud, sp)) return false;

  fd_ = ::open(std::string(device).c_str(), O_RDONLY | O_NOCTTY | O_CLOEXEC);
  if (fd_ < 0) return false;

  termios tty{};
  if (tcgetattr(fd_, &tty) != 0) {
    close();
    return false;
  }

  cfmakeraw(&tty);

  cfsetispeed(&tty, sp);
  cfsetospeed(&tty, sp);

  // 8N1, receiver on, ignore modem lines
  tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~(PARENB | PARODD);
  tty.c_cflag &= ~CSTOPB;
  tty.c_cflag &= ~CRTSCTS;

  // poll() does the waiting; read() returns what is there.
  tty.c_cc[VMIN]  = 0;
  tty.c_cc[VTIME] = 0;

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    close();
    return false;
  }

  tcflush(fd_, TCIFLUSH);
  return true;
#else
  (void)device; (void)baud;
  return false;
#endif
}

void SerialPort::close() noexcept {
#ifdef __linux__
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#else
  fd_ = -1;
#endif
}

bool SerialPort::is_open() const noexcept {
  return fd_ >= 0;
}

bool SerialPort::read_some(uint8_t* dst, size_t cap, size_t& out_nbytes,
                           std::chrono::milliseconds timeout) {
  out_nbytes = 0;
#ifdef __linux__
  if (fd_ < 0) return false;

  ::pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;

  for (;;) {
    const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc == 0) return true; // timeout, still connected
    if (rc < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    break;
  }

  // USB adapters unplugged while open report POLLHUP/POLLERR.
  if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) return false;

  for (;;) {
    const ssize_t r = ::read(fd_, dst, cap);
    if (r > 0) {
      out_nbytes = static_cast<size_t>(r);
      return true;
    }
    if (r == 0) return false; // readable but nothing to read: the device went away
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    return false;
  }
#else
  (void)dst; (void)cap; (void)timeout;
  return false;
#endif
}

} // namespace connection
