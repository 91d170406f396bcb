#ifndef __SB_WRITE_BUFFER__
#define __SB_WRITE_BUFFER__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Bounded queue of encoded frames waiting to be written to a socket.
 *
 * Frames are kept whole so that a writer never interleaves two frames. When
 * the buffered byte count would exceed the limit, new frames are refused and
 * the caller decides what to do with them (the hub drops them).
 */
class WriteBuffer {
 public:
  /** @brief Default maximum bytes to buffer per connection. */
  static constexpr size_t DEFAULT_MAX_BUFFER_SIZE = 256 * 1024;  // 256KB

  explicit WriteBuffer(size_t _maxBytes = DEFAULT_MAX_BUFFER_SIZE)
      : maxBytes(_maxBytes), totalBytes(0) {}

  /**
   * @brief Returns true if a frame of `length` bytes would fit.
   */
  bool canAccept(size_t length) const {
    return totalBytes + length <= maxBytes;
  }

  /**
   * @brief Returns true if there is data waiting to be written.
   */
  bool hasPendingData() const { return !pending.empty(); }

  /**
   * @brief Returns the current amount of buffered data in bytes.
   */
  size_t size() const { return totalBytes; }

  size_t getMaxBytes() const { return maxBytes; }

  /**
   * @brief Adds a frame to the end of the buffer.
   * @return false (and buffers nothing) when the frame does not fit.
   */
  bool enqueue(const string &frame) {
    if (frame.empty()) return true;
    if (!canAccept(frame.size())) {
      return false;
    }
    pending.push_back(frame);
    totalBytes += frame.size();
    return true;
  }

  /**
   * @brief Adds a frame regardless of the limit. Used for control frames
   * that must reach the peer (close replies).
   */
  void forceEnqueue(const string &frame) {
    if (frame.empty()) return;
    pending.push_back(frame);
    totalBytes += frame.size();
  }

  /**
   * @brief Pops the oldest frame into `frame`.
   * @return false if the buffer is empty.
   */
  bool dequeue(string *frame) {
    if (pending.empty()) {
      return false;
    }
    *frame = std::move(pending.front());
    pending.pop_front();
    totalBytes -= frame->size();
    return true;
  }

  /**
   * @brief Clears all pending data.
   */
  void clear() {
    pending.clear();
    totalBytes = 0;
  }

 private:
  std::deque<string> pending;
  size_t maxBytes;
  size_t totalBytes;
};
}  // namespace sb

#endif  // __SB_WRITE_BUFFER__
