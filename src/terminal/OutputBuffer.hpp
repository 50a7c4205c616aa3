#ifndef __TT_OUTPUT_BUFFER_HPP__
#define __TT_OUTPUT_BUFFER_HPP__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Trailing window of process output that is replayed on attach.
 *
 * Holds at most `capacity` bytes; appending past the cap drops the oldest
 * bytes first.
 */
class OutputBuffer {
 public:
  static constexpr size_t MAX_BUFFER_CHARS = 400000;

  explicit OutputBuffer(size_t _capacity = MAX_BUFFER_CHARS)
      : capacity(_capacity) {}

  void append(const string& data) {
    if (data.length() >= capacity) {
      buffer.assign(data, data.length() - capacity, capacity);
      return;
    }
    buffer.append(data);
    if (buffer.length() > capacity) {
      buffer.erase(0, buffer.length() - capacity);
    }
  }

  const string& contents() const { return buffer; }
  size_t size() const { return buffer.length(); }
  bool empty() const { return buffer.empty(); }
  size_t getCapacity() const { return capacity; }

 protected:
  size_t capacity;
  string buffer;
};
}  // namespace tt

#endif
