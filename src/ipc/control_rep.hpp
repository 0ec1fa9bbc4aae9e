#pragma once
#include "../core/log.hpp"
#include <zmq.h>
#include <chrono>
#include <string>

/**
 * @brief ZeroMQ command responder
 *
 * Receives agent commands as JSON and sends JSON replies. Supported
 * commands are listed with handle_command().
 *
 * The REP pattern requires exactly one reply() after each recv().
 */
struct ControlRep {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* rep{nullptr};  ///< ZeroMQ REP socket
  std::string bind_address;
  bool connected{false};

  /**
   * @brief Constructor - creates and binds responder socket
   * @param address ZeroMQ endpoint to bind
   */
  explicit ControlRep(const std::string& address = "tcp://127.0.0.1:5555")
      : bind_address(address) {
    ctx = zmq_ctx_new();
    rep = zmq_socket(ctx, ZMQ_REP);
    int linger = 0;
    zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger));
    int rc = zmq_bind(rep, bind_address.c_str());
    connected = (rc == 0);
    if (!connected) {
      Logger("control").error("could not bind " + bind_address + ": " + zmq_strerror(zmq_errno()));
    }
  }

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~ControlRep() {
    zmq_close(rep);
    zmq_ctx_term(ctx);
  }

  ControlRep(const ControlRep&) = delete;
  ControlRep& operator=(const ControlRep&) = delete;

  bool is_connected() const { return connected; }
  const std::string& get_bind_address() const { return bind_address; }

  /**
   * @brief Wait for a pending request
   * @return true if recv() will not block
   */
  bool poll(std::chrono::milliseconds timeout) {
    if (!connected) return false;
    zmq_pollitem_t items[] = {{rep, 0, ZMQ_POLLIN, 0}};
    int rc = zmq_poll(items, 1, static_cast<long>(timeout.count()));
    return rc > 0 && (items[0].revents & ZMQ_POLLIN);
  }

  /**
   * @brief Receive command (blocking)
   * @return Received JSON string, empty on error. Caller must reply.
   */
  std::string recv() {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    int n = zmq_msg_recv(&msg, rep, 0);
    std::string out;
    if (n > 0) {
      out.assign(static_cast<const char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
    }
    zmq_msg_close(&msg);
    return out;
  }

  /**
   * @brief Send reply to received command
   * @param s Response string (typically JSON)
   * @return false if ZeroMQ refused the reply
   */
  bool reply(const std::string& s) {
    return zmq_send(rep, s.data(), s.size(), 0) >= 0;
  }
};
