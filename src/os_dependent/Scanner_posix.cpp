/**
 * POSIX implementation of Scanner
 */
#include "../os_dependent/Scanner.hpp"

#include <termios.h>
#include <unistd.h>
#include <sys/select.h>
#include <sys/time.h>

struct Scanner::Impl {
  termios old{};
  bool ok{false};
  Impl() {
    // raw mode: no line buffering, no echo, read() never blocks
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old) == 0) {
      termios raw = old;
      raw.c_lflag &= ~(ICANON | ECHO | ISIG);
      raw.c_cc[VMIN]  = 0;
      raw.c_cc[VTIME] = 0;
      ok = tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0;
    }
  }
  ~Impl() {
    if (ok) tcsetattr(STDIN_FILENO, TCSAFLUSH, &old);
  }
  int poll(int timeoutMs) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(STDIN_FILENO, &fds);
    timeval tv{};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    int r = select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv);
    if (r > 0 && FD_ISSET(STDIN_FILENO, &fds)) {
      unsigned char c;
      ssize_t n = ::read(STDIN_FILENO, &c, 1);
      if (n == 1) return static_cast<int>(c);
      if (n == 0 && !ok) {
        // end of piped input; don't spin on a readable EOF
        usleep(static_cast<useconds_t>(timeoutMs) * 1000);
      }
    }
    return -1;
  }
};

Scanner::Scanner() : impl(new Impl()) {}
Scanner::~Scanner() { delete impl; }
int Scanner::poll(int timeoutMs) { return impl->poll(timeoutMs < 0 ? 0 : timeoutMs); }
bool Scanner::isInteractive() const { return impl->ok; }
