#ifndef __TT_TRANSPORT_HPP__
#define __TT_TRANSPORT_HPP__

#include "ControlFrame.hpp"
#include "Headers.hpp"

namespace tt {
/**
 * @brief Callbacks for one transport connection. Each runs on the client's
 * event queue. onClose fires at most once and never after close().
 */
struct TransportHandlers {
  function<void()> onOpen;
  function<void(const string& data)> onData;
  function<void(const ControlFrame& frame)> onControl;
  /** @brief reason is one of the CLOSE_* strings. */
  function<void(const string& reason)> onClose;
};

/**
 * @brief One duplex connection to a server-side session.
 */
class Transport {
 public:
  virtual ~Transport() {}

  /**
   * @brief Attaches to sessionId. Completion is reported through onOpen or
   * onClose.
   * @param agentOnly Ask the server to refuse non-agent sessions.
   */
  virtual void open(const string& sessionId, const string& accessToken,
                    bool agentOnly, const TransportHandlers& handlers) = 0;
  virtual void sendData(const string& data) = 0;
  virtual void sendControl(const ControlFrame& frame) = 0;
  /** @brief Local close. Handlers are not invoked afterwards. */
  virtual void close() = 0;
  virtual bool isOpen() = 0;
  /** @brief Descriptor to wait on for inbound traffic, or -1. */
  virtual int getFd() = 0;
  /** @brief Reads whatever inbound traffic is ready. */
  virtual void poll() = 0;
};

class TransportFactory {
 public:
  virtual ~TransportFactory() {}
  virtual shared_ptr<Transport> create() = 0;
};
}  // namespace tt

#endif  // __TT_TRANSPORT_HPP__
