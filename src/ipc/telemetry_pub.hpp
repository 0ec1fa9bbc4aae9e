#pragma once
#include "../core/log.hpp"
#include <zmq.h>
#include <string>

/**
 * @brief ZeroMQ feed publisher
 *
 * Sends each feed frame as a two-part message: the feed name as topic, then
 * the JSON body. Subscribers filter on the topic.
 */
struct TelemetryPub {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* pub{nullptr};  ///< ZeroMQ PUB socket
  std::string bind_address;
  bool connected{false};

  /**
   * @brief Constructor - creates and binds publisher socket
   * @param address ZeroMQ endpoint to bind
   */
  explicit TelemetryPub(const std::string& address = "tcp://127.0.0.1:5556")
      : bind_address(address) {
    ctx = zmq_ctx_new();
    pub = zmq_socket(ctx, ZMQ_PUB);
    int linger = 0;
    zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
    int rc = zmq_bind(pub, bind_address.c_str());
    connected = (rc == 0);
    if (!connected) {
      Logger("telemetry").error("could not bind " + bind_address + ": " + zmq_strerror(zmq_errno()));
    }
  }

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~TelemetryPub() {
    zmq_close(pub);
    zmq_ctx_term(ctx);
  }

  TelemetryPub(const TelemetryPub&) = delete;
  TelemetryPub& operator=(const TelemetryPub&) = delete;

  bool is_connected() const { return connected; }
  const std::string& get_bind_address() const { return bind_address; }

  /**
   * @brief Send one message
   * @param topic Feed name
   * @param body JSON frame
   * @return false if the socket is unbound or ZeroMQ refused the message
   */
  bool send(const std::string& topic, const std::string& body) {
    if (!connected) return false;
    if (zmq_send(pub, topic.data(), topic.size(), ZMQ_SNDMORE) < 0) return false;
    return zmq_send(pub, body.data(), body.size(), 0) >= 0;
  }
};
