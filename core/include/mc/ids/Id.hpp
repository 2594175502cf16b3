#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mc {

// Element and viewport ids are strings of the form "<prefix>-<n>".
using Id = std::string;

class IdAllocator {
public:
  explicit IdAllocator(std::string prefix) : prefix_(std::move(prefix)) {}

  Id next() { return prefix_ + "-" + std::to_string(++counter_); }

  const std::string& prefix() const { return prefix_; }
  std::uint64_t issued() const { return counter_; }

private:
  std::string prefix_;
  std::uint64_t counter_{0};
};

// Accepts "viewport-3" style ids and returns the numeric suffix.
inline std::uint64_t parseIdSuffix(const std::string& s) {
  auto dash = s.rfind('-');
  std::string digits = (dash == std::string::npos) ? s : s.substr(dash + 1);
  if (digits.empty()) throw std::runtime_error("Id has no numeric suffix");
  std::uint64_t v = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') throw std::runtime_error("Id suffix must be decimal digits");
    v = v * 10 + static_cast<std::uint64_t>(c - '0');
  }
  return v;
}

} // namespace mc
