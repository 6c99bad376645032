#include "identity.h"

#include <charconv>

namespace multisplit {

IdGenerator::IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {
}

std::string IdGenerator::next() {
  return prefix_ + std::to_string(next_++);
}

void IdGenerator::observe(const std::string& id) {
  if (id.size() <= prefix_.size() || id.compare(0, prefix_.size(), prefix_) != 0) {
    return;
  }

  uint64_t number = 0;
  const char* first = id.data() + prefix_.size();
  const char* last = id.data() + id.size();
  auto [ptr, ec] = std::from_chars(first, last, number);
  if (ec != std::errc{} || ptr != last) {
    return;
  }

  if (number >= next_) {
    next_ = number + 1;
  }
}

} // namespace multisplit
