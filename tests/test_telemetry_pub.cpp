#include "../src/ipc/telemetry_pub.hpp"
#include "../src/ipc/feed.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <chrono>
#include <zmq.h>

/**
 * @brief Test TelemetryPub functionality
 *
 * Binds a publisher, subscribes to its feed topic and checks that frames
 * sent through an AggregatedFeed arrive as topic + JSON body.
 */

static const char* kEndpoint = "tcp://127.0.0.1:15556";

static bool recv_part(void* sock, std::string& out) {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    int n = zmq_msg_recv(&msg, sock, 0);
    if (n >= 0) out.assign(static_cast<const char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
    zmq_msg_close(&msg);
    return n >= 0;
}

int main() {
    std::cout << "Testing TelemetryPub functionality..." << std::endl;

    // Test 1: Bind and unbound behaviour
    {
        std::cout << "Test 1: Bind" << std::endl;

        TelemetryPub pub(kEndpoint);
        assert(pub.is_connected());
        assert(pub.get_bind_address() == kEndpoint);

        // Same endpoint twice cannot bind; sending is refused
        TelemetryPub clash(kEndpoint);
        assert(!clash.is_connected());
        assert(!clash.send("pressure", "{}"));

        std::cout << "  Bind test passed" << std::endl;
    }

    // Test 2: Frames reach a subscriber
    {
        std::cout << "Test 2: Subscriber receives frames" << std::endl;

        TelemetryPub pub(kEndpoint);
        assert(pub.is_connected());
        AggregatedFeed<TelemetryPub> feed("pressure", pub);

        void* ctx = zmq_ctx_new();
        void* sub = zmq_socket(ctx, ZMQ_SUB);
        int linger = 0;
        zmq_setsockopt(sub, ZMQ_LINGER, &linger, sizeof(linger));
        int rc = zmq_connect(sub, kEndpoint);
        assert(rc == 0);
        zmq_setsockopt(sub, ZMQ_SUBSCRIBE, "pressure", 8);

        // PUB drops messages until the subscription has propagated, so keep
        // sending until one arrives
        bool received = false;
        std::string topic, body;
        for (int attempt = 0; attempt < 50 && !received; ++attempt) {
            FeedBlock b;
            b.timestamp = 1000.0 + attempt;
            b.block_name = "pressure";
            b.data = {{"pressure", 980.3}};
            feed.publish(b);
            feed.flush();

            zmq_pollitem_t items[] = {{sub, 0, ZMQ_POLLIN, 0}};
            if (zmq_poll(items, 1, 100) > 0 && (items[0].revents & ZMQ_POLLIN)) {
                assert(recv_part(sub, topic));
                assert(recv_part(sub, body));
                received = true;
            }
        }
        assert(received);
        assert(topic == "pressure");

        json frame = json::parse(body);
        assert(frame["feed"] == "pressure");
        assert(frame["blocks"].size() == 1);
        assert(frame["blocks"][0]["block_name"] == "pressure");
        assert(frame["blocks"][0]["data"]["pressure"] == 980.3);

        zmq_close(sub);
        zmq_ctx_term(ctx);

        std::cout << "  Subscriber test passed" << std::endl;
    }

    // Test 3: Repeated creation and cleanup
    {
        std::cout << "Test 3: Repeated creation" << std::endl;

        for (int i = 0; i < 3; i++) {
            TelemetryPub pub(kEndpoint);
            assert(pub.is_connected());
            assert(pub.send("pressure", R"({"feed":"pressure","blocks":[]})"));
        }

        std::cout << "  Repeated creation test passed" << std::endl;
    }

    std::cout << "✅ All TelemetryPub tests passed!" << std::endl;
    return 0;
}
