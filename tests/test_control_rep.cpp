#include "sim_fixtures.hpp"
#include "../src/ipc/control_rep.hpp"
#include "../src/control/acquisition.hpp"
#include "../src/control/commands.hpp"
#include "../src/control/runner.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <chrono>
#include <string>
#include <zmq.h>

/**
 * @brief Test ControlRep functionality
 *
 * Serves agent commands over a REP socket and drives them from a REQ client,
 * the way an operator tool would.
 */

static const char* kEndpoint = "tcp://127.0.0.1:15555";

using Fixtures::MockFeed;
using Fixtures::make_sim_gauge;

int main() {
    std::cout << "Testing ControlRep functionality..." << std::endl;

    // Test 1: Construction and destruction
    {
        ControlRep rep(kEndpoint);
        assert(rep.is_connected());
        assert(rep.get_bind_address() == kEndpoint);
        assert(!rep.poll(std::chrono::milliseconds(10)));
        std::cout << "  ControlRep created and destroyed successfully" << std::endl;
    }

    // Test 2: Request/response against a live agent
    {
        std::cout << "Testing request/response pattern..." << std::endl;

        auto rig = make_sim_gauge("980.3\r>");
        MockFeed feed;
        PressureAgent agent(std::move(rig.gauge), feed);
        ProcessRunner runner(agent);

        ControlRep rep(kEndpoint);
        assert(rep.is_connected());

        const int requests = 3;
        std::thread server_thread([&]() {
            int served = 0;
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (served < requests && std::chrono::steady_clock::now() < deadline) {
                if (rep.poll(std::chrono::milliseconds(100))) {
                    std::string cmd = rep.recv();
                    bool sent = rep.reply(handle_command(runner, cmd));
                    assert(sent);
                    served++;
                }
            }
        });

        void* ctx = zmq_ctx_new();
        void* req = zmq_socket(ctx, ZMQ_REQ);
        int linger = 0;
        zmq_setsockopt(req, ZMQ_LINGER, &linger, sizeof(linger));
        int timeout_ms = 5000;
        zmq_setsockopt(req, ZMQ_RCVTIMEO, &timeout_ms, sizeof(timeout_ms));
        int rc = zmq_connect(req, kEndpoint);
        assert(rc == 0);

        auto request = [&](const std::string& cmd) {
            int n = zmq_send(req, cmd.data(), cmd.size(), 0);
            assert(n == static_cast<int>(cmd.size()));
            char buf[4096];
            int m = zmq_recv(req, buf, sizeof(buf), 0);
            assert(m > 0 && m <= static_cast<int>(sizeof(buf)));
            return json::parse(std::string(buf, buf + m));
        };

        json started = request(R"({"cmd":"acq","sampling_frequency":10,"test_mode":true})");
        assert(started["ok"] == true);
        std::cout << "  Client started acq" << std::endl;

        assert(runner.wait(std::chrono::milliseconds(3000)));

        json status = request(R"({"cmd":"status"})");
        assert(status["ok"] == true);
        assert(status["acq"]["success"] == true);
        assert(status["acq"]["data"]["fields"]["pressure"] == 980.3);
        std::cout << "  Client received status" << std::endl;

        json bad = request("not json");
        assert(bad["ok"] == false);

        server_thread.join();
        zmq_close(req);
        zmq_ctx_term(ctx);

        assert(feed.count() == 1);
        std::cout << "  Request/response test passed" << std::endl;
    }

    std::cout << "✅ ControlRep tests completed!" << std::endl;
    return 0;
}
