#pragma once
#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

inline void die(const std::string& msg) {
  std::cerr << "[FATAL] " << msg << " (errno=" << errno << ": " << std::strerror(errno) << ")\n";
  std::exit(1);
}

// One insertion per line so concurrent workers never interleave mid-line.
inline void log_line(const std::string& line) {
  std::cout << (line + "\n");
}

using Clock = std::chrono::steady_clock;
inline int64_t now_us() {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now().time_since_epoch()).count();
}

inline int64_t ms_since(int64_t start_us) {
  return (now_us() - start_us) / 1000;
}
