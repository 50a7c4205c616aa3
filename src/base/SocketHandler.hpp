#ifndef __TT_SOCKET_HANDLER__
#define __TT_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace tt {
/**
 * @brief Abstract socket API shared by the attach listener, the server-side
 * connections and the client transport.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /** @brief True when the kernel reports data ready to read on fd. */
  virtual bool hasData(int fd) = 0;
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes.
   * @param timeout Throw if no progress is made for
   * ten seconds.
   * @throws std::runtime_error when the peer closes or the read fails.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Writes the whole buffer.
   * @throws std::runtime_error on failure or (if requested) timeout.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads a length-prefixed protobuf from the socket.
   * @throws std::runtime_error on invalid length or parse failure.
   */
  template <typename T>
  inline T readProto(int fd, bool timeout) {
    T t;
    int64_t length;
    readAll(fd, &length, sizeof(int64_t), timeout);
    checkLength(length);
    if (length == 0) {
      return t;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, timeout);
    if (!t.ParseFromString(s)) {
      throw std::runtime_error("Invalid proto");
    }
    return t;
  }

  template <typename T>
  inline void writeProto(int fd, const T& t, bool timeout) {
    string s;
    if (!t.SerializeToString(&s)) {
      STFATAL << "Serialization of " << t.GetTypeName() << " failed!";
    }
    writeFrame(fd, s, timeout);
  }

  /**
   * @brief Reads one length-prefixed packet.
   * @returns false for an empty frame.
   */
  inline bool readPacket(int fd, Packet* packet) {
    int64_t length;
    readAll(fd, &length, sizeof(int64_t), false);
    checkLength(length);
    if (length == 0) {
      return false;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, false);
    *packet = Packet(s);
    return true;
  }

  inline void writePacket(int fd, const Packet& packet, bool timeout = false) {
    writeFrame(fd, packet.serialize(), timeout);
  }

  /**
   * @brief Reads the bytes that are ready on fd and moves every complete
   * frame out of pending. Never waits for the rest of a partial frame.
   * @return false once the peer has closed the stream.
   * @throws std::runtime_error on a read error or an invalid length.
   */
  bool readAvailableFrames(int fd, string* pending, vector<string>* frames);

  /**
   * @brief Opens a connection to the endpoint.
   * @return The socket fd, or -1 on failure.
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Starts listening on the endpoint and returns the listen fds. */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /** @brief Accepts a pending connection; -1 when none is ready. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;
  /**
   * @brief Shuts down both directions of fd without releasing it, so a
   * thread blocked on it wakes up and the number cannot be reused yet.
   */
  virtual void shutdownSocket(int fd) = 0;
  virtual vector<int> getActiveSockets() = 0;

 protected:
  static constexpr int64_t MAX_FRAME_LENGTH = 128 * 1024 * 1024;

  inline void checkLength(int64_t length) {
    if (length < 0 || length > MAX_FRAME_LENGTH) {
      // Assume the stream is corrupt
      throw std::runtime_error(string("Invalid size (<0 or >128 MB): ") +
                               to_string(length));
    }
  }

  inline void writeFrame(int fd, const string& s, bool timeout) {
    int64_t length = s.length();
    if (length > MAX_FRAME_LENGTH) {
      STFATAL << "Invalid frame length: " << length;
    }
    writeAllOrThrow(fd, &length, sizeof(int64_t), timeout);
    if (length > 0) {
      writeAllOrThrow(fd, &s[0], length, timeout);
    }
  }
};
}  // namespace tt

#endif  // __TT_SOCKET_HANDLER__
