/**
 * OS-dependent keyboard scanner (single key poll).
 * POSIX: termios raw + select + read
 */
#pragma once

class Scanner {
public:
  Scanner();
  ~Scanner();
  Scanner(const Scanner&) = delete;
  Scanner& operator=(const Scanner&) = delete;

  // waits up to timeoutMs; returns -1 if no key, otherwise the byte (0..255) promoted to int
  int poll(int timeoutMs);

  // false when stdin is not a terminal (piped input); keys then arrive line-buffered
  bool isInteractive() const;
private:
  struct Impl;
  Impl* impl;
};
