#ifndef Tdu_SerialPort_hh
#define Tdu_SerialPort_hh

#include <stdint.h>
#include <sys/types.h>
#include <string>

namespace Tdu {

  //
  //  Raw, non-blocking byte link.  Opens the named tty at the given baud
  //  rate, or allocates a pseudo-terminal when the name is empty; name()
  //  then returns the slave device a requester should open.
  //
  class SerialPort {
  public:
    SerialPort(const std::string& device, unsigned baud);
    ~SerialPort();
    SerialPort(const SerialPort&) = delete;
    void operator = (const SerialPort&) = delete;
  public:
    int                fd  () const { return m_fd; }
    const std::string& name() const { return m_name; }
    ssize_t            read (uint8_t* buf, size_t len);
    void               write(const uint8_t* buf, size_t len);
  private:
    int         m_fd;
    std::string m_name;
  };
};

#endif
