#include "tdu/service/SerialPort.hh"
#include "tdu/service/SysLog.hh"

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include <stdexcept>

using logging = Tdu::SysLog;

using namespace Tdu;

static speed_t _speed(unsigned baud)
{
  switch(baud) {
  case    9600: return B9600;
  case   19200: return B19200;
  case   38400: return B38400;
  case   57600: return B57600;
  case  115200: return B115200;
  case  230400: return B230400;
  case  460800: return B460800;
  case  921600: return B921600;
  case 1000000: return B1000000;
  case 2000000: return B2000000;
  case 3000000: return B3000000;
  default: break;
  }
  throw std::runtime_error("Unsupported baud rate "+std::to_string(baud));
}

static std::string _error(const std::string& what)
{
  return what+": "+strerror(errno);
}

SerialPort::SerialPort(const std::string& device, unsigned baud) :
  m_fd(-1)
{
  speed_t speed = _speed(baud);

  if (device.empty()) {
    m_fd = posix_openpt(O_RDWR | O_NOCTTY);
    if (m_fd < 0)
      throw std::runtime_error(_error("posix_openpt"));
    if (grantpt(m_fd) < 0 || unlockpt(m_fd) < 0) {
      std::string err = _error("Unable to unlock pseudo-terminal");
      ::close(m_fd);
      throw std::runtime_error(err);
    }
    m_name = ptsname(m_fd);
  }
  else {
    m_fd = ::open(device.c_str(), O_RDWR | O_NOCTTY);
    if (m_fd < 0)
      throw std::runtime_error(_error("Unable to open "+device));
    m_name = device;
  }

  struct termios tio;
  if (tcgetattr(m_fd, &tio) < 0) {
    std::string err = _error("tcgetattr "+m_name);
    ::close(m_fd);
    throw std::runtime_error(err);
  }
  cfmakeraw(&tio);
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);
  tio.c_cflag |= CLOCAL | CREAD;
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;
  if (tcsetattr(m_fd, TCSANOW, &tio) < 0) {
    std::string err = _error("tcsetattr "+m_name);
    ::close(m_fd);
    throw std::runtime_error(err);
  }

  int flags = fcntl(m_fd, F_GETFL, 0);
  if (flags < 0 || fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    std::string err = _error("fcntl "+m_name);
    ::close(m_fd);
    throw std::runtime_error(err);
  }

  logging::info("Serial link on %s at %u baud", m_name.c_str(), baud);
}

SerialPort::~SerialPort()
{
  if (m_fd >= 0)
    ::close(m_fd);
}

ssize_t SerialPort::read(uint8_t* buf, size_t len)
{
  ssize_t n = ::read(m_fd, buf, len);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
      return 0;
    //  pty master reports EIO while no requester has the slave open
    if (errno == EIO)
      return 0;
    throw std::runtime_error(_error("read "+m_name));
  }
  return n;
}

void SerialPort::write(const uint8_t* buf, size_t len)
{
  while (len) {
    ssize_t n = ::write(m_fd, buf, len);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        usleep(100);
        continue;
      }
      throw std::runtime_error(_error("write "+m_name));
    }
    buf += n;
    len -= n;
  }
}
