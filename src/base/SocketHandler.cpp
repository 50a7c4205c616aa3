#include "SocketHandler.hpp"

namespace tt {
namespace {
// A transfer that makes no progress for this long is abandoned
const std::chrono::seconds TRANSFER_STALL_LIMIT(10);

bool isRetryable(int e) { return e == EAGAIN || e == EWOULDBLOCK; }
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  auto lastProgress = std::chrono::steady_clock::now();
  char* out = static_cast<char*>(buf);
  size_t pos = 0;
  while (pos < count) {
    if (!waitOnSocketData(fd)) {
      if (timeout && std::chrono::steady_clock::now() - lastProgress >
                         TRANSFER_STALL_LIMIT) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }

    ssize_t n = read(fd, out + pos, count - pos);
    if (n == 0) {
      // The peer hung up in the middle of a frame.
      throw std::runtime_error("Connection closed during readAll");
    }
    if (n < 0) {
      int e = errno;
      if (!isRetryable(e)) {
        VLOG(1) << "readAll on fd " << fd << " failed: " << strerror(e);
        throw std::runtime_error("Failed a call to readAll");
      }
      VLOG(2) << "readAll on fd " << fd << " would block";
      continue;
    }
    pos += n;
    lastProgress = std::chrono::steady_clock::now();
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  auto lastProgress = std::chrono::steady_clock::now();
  const char* in = static_cast<const char*>(buf);
  size_t pos = 0;
  while (pos < count) {
    if (timeout &&
        std::chrono::steady_clock::now() - lastProgress > TRANSFER_STALL_LIMIT) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t n = write(fd, in + pos, count - pos);
    if (n == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    }
    if (n < 0) {
      int e = errno;
      if (!isRetryable(e)) {
        VLOG(1) << "writeAll on fd " << fd << " failed: " << strerror(e);
        throw std::runtime_error("Failed a call to writeAll");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    pos += n;
    lastProgress = std::chrono::steady_clock::now();
  }
}

bool SocketHandler::readAvailableFrames(int fd, string* pending,
                                        vector<string>* frames) {
  char buf[16 * 1024];
  ssize_t n = read(fd, buf, sizeof(buf));
  if (n == 0) {
    return false;
  }
  if (n < 0) {
    int e = errno;
    if (isRetryable(e) || e == EINTR) {
      return true;
    }
    VLOG(1) << "Read on fd " << fd << " failed: " << strerror(e);
    throw std::runtime_error("Failed a call to readAvailableFrames");
  }
  pending->append(buf, n);

  while (pending->length() >= sizeof(int64_t)) {
    int64_t length;
    memcpy(&length, pending->data(), sizeof(int64_t));
    checkLength(length);
    size_t frameEnd = sizeof(int64_t) + size_t(length);
    if (pending->length() < frameEnd) {
      break;
    }
    if (length > 0) {
      frames->push_back(pending->substr(sizeof(int64_t), length));
    }
    pending->erase(0, frameEnd);
  }
  return true;
}
}  // namespace tt
