#include "sim_fixtures.hpp"
#include "../src/hw/hvg2020.hpp"
#include "../src/hw/sim_gauge_port.hpp"
#include "../src/core/errors.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

/**
 * @brief Tests for the HVG-2020 controller against a simulated port
 *
 * Tests include:
 * 1. Construction opens the port, open failure raises
 * 2. Pressure reads and the command bytes sent
 * 3. Unparseable replies give the sentinel
 * 4. Transport errors propagate from read_pressure
 * 5. Reads on a closed port are a logic error
 * 6. Signature probing (first try, later try, never)
 * 7. Reopen of a closed port
 * 8. Cool-down reopen after an I/O error
 * 9. verify_after_reopen
 * 10. close() is idempotent
 * 11. State queries answer during a cool-down
 */

using Fixtures::fast_timing;
using Fixtures::make_sim_gauge;
using Step = SimGaugePort::Step;
using Action = SimGaugePort::Action;

int main() {
    std::cout << "Testing HVG2020Gauge functionality..." << std::endl;

    // Test 1: Construction
    {
        std::cout << "Test 1: Construction" << std::endl;

        auto rig = make_sim_gauge();
        assert(rig.gauge->is_open());
        assert(rig.port->open_count() == 1);
        assert(rig.gauge->port_name() == "SIM0");

        auto sim = std::make_unique<SimGaugePort>("BROKEN");
        sim->fail_next_opens(1);
        bool threw = false;
        try {
            HVG2020Gauge g(std::move(sim), fast_timing());
        } catch (const GaugeConnectionError& e) {
            threw = true;
            assert(std::string(e.what()).find("BROKEN") != std::string::npos);
        }
        assert(threw);

        std::cout << "  Construction test passed" << std::endl;
    }

    // Test 2: Pressure reads
    {
        std::cout << "Test 2: Pressure reads" << std::endl;

        auto rig = make_sim_gauge("980.3\r>");
        double before = SampleClock::wall_time();
        PressureSample s = rig.gauge->read_pressure();
        double after = SampleClock::wall_time();

        assert(s.pressure_mbar == 980.3);
        assert(s.is_valid());
        assert(s.raw == "980.3");
        assert(s.timestamp >= before && s.timestamp <= after);

        auto written = rig.port->written();
        assert(written.size() == 1);
        assert(written[0] == "p\r\n");

        rig.port->set_response("p\r\n", "1.23E-05\r>");
        assert(rig.gauge->read_pressure().pressure_mbar == 1.23e-5);

        GaugeStatistics st = rig.gauge->statistics();
        assert(st.total_reads == 2);
        assert(st.invalid_reads == 0);

        std::cout << "  Pressure reads test passed" << std::endl;
    }

    // Test 3: Garbage replies
    {
        std::cout << "Test 3: Garbage replies" << std::endl;

        auto rig = make_sim_gauge("ERR\r>");
        PressureSample s = rig.gauge->read_pressure();
        assert(s.pressure_mbar == -99.0);
        assert(!s.is_valid());
        assert(s.raw == "ERR");

        // A silent gauge is also a data anomaly, not an I/O failure
        rig.port->push_step("p\r\n", Step{Action::SILENT, ""});
        s = rig.gauge->read_pressure();
        assert(s.pressure_mbar == PressureSample::INVALID_PRESSURE);
        assert(rig.gauge->is_open());

        assert(rig.gauge->statistics().invalid_reads == 2);

        std::cout << "  Garbage replies test passed" << std::endl;
    }

    // Test 4: Transport errors propagate
    {
        std::cout << "Test 4: Transport errors" << std::endl;

        auto rig = make_sim_gauge();
        rig.port->push_step("p\r\n", Step{Action::WRITE_ERROR, ""});
        rig.port->push_step("p\r\n", Step{Action::READ_ERROR, ""});

        bool threw = false;
        try { rig.gauge->read_pressure(); } catch (const SerialIOError&) { threw = true; }
        assert(threw);

        threw = false;
        try { rig.gauge->read_pressure(); } catch (const SerialIOError&) { threw = true; }
        assert(threw);

        // Next read is fine again
        assert(rig.gauge->read_pressure().pressure_mbar == 980.3);
        assert(rig.gauge->statistics().io_errors == 2);

        std::cout << "  Transport errors test passed" << std::endl;
    }

    // Test 5: Reads on a closed port
    {
        std::cout << "Test 5: Reads on a closed port" << std::endl;

        auto rig = make_sim_gauge();
        rig.gauge->close();
        bool threw_logic = false;
        try {
            rig.gauge->read_pressure();
        } catch (const SerialIOError&) {
            assert(false && "closed port must not look like an I/O failure");
        } catch (const GaugeNotOpenError&) {
            threw_logic = true;
        }
        assert(threw_logic);
        assert(rig.port->count_writes("p\r\n") == 0);

        std::cout << "  Closed port test passed" << std::endl;
    }

    // Test 6: Signature probing
    {
        std::cout << "Test 6: Signature probing" << std::endl;

        // First attempt
        {
            auto rig = make_sim_gauge();
            assert(rig.gauge->check_connection());
            assert(rig.port->count_writes("s1\r\n") == 1);
        }

        // Third attempt
        {
            auto rig = make_sim_gauge();
            rig.port->push_step("s1\r\n", Step{Action::REPLY, "garbled\r>"});
            rig.port->push_step("s1\r\n", Step{Action::SILENT, ""});
            assert(rig.gauge->check_connection());
            assert(rig.port->count_writes("s1\r\n") == 3);
        }

        // Wrong device, every attempt
        {
            auto rig = make_sim_gauge("980.3\r>", "XGS-600\r>");
            assert(!rig.gauge->check_connection());
            assert(rig.port->count_writes("s1\r\n") == 3);
            assert(rig.port->close_count() == 0);
            GaugeStatistics st = rig.gauge->statistics();
            assert(st.connection_checks == 1);
            assert(st.failed_checks == 1);
        }

        // Only the first 8 characters matter; a short reply never matches
        {
            auto rig = make_sim_gauge("980.3\r>", "HVG-2020 rev C\r>");
            assert(rig.gauge->check_connection());
            auto rig2 = make_sim_gauge("980.3\r>", "HVG-202\r>");
            assert(!rig2.gauge->check_connection());
        }

        std::cout << "  Signature probing test passed" << std::endl;
    }

    // Test 7: Closed port is reopened once
    {
        std::cout << "Test 7: Reopen of a closed port" << std::endl;

        auto rig = make_sim_gauge();
        rig.gauge->close();
        assert(!rig.gauge->is_open());
        assert(rig.gauge->check_connection());
        assert(rig.gauge->is_open());
        assert(rig.port->open_count() == 2);

        rig.gauge->close();
        rig.port->fail_next_opens(1);
        assert(!rig.gauge->check_connection());
        assert(!rig.gauge->is_open());
        assert(rig.port->count_writes("s1\r\n") == 1);

        std::cout << "  Reopen test passed" << std::endl;
    }

    // Test 8: Cool-down reopen after an I/O error
    {
        std::cout << "Test 8: Cool-down reopen" << std::endl;

        // Reopen succeeds -> connected, identity not re-checked
        {
            auto rig = make_sim_gauge("980.3\r>", "XGS-600\r>");
            rig.port->push_step("s1\r\n", Step{Action::READ_ERROR, ""});

            auto start = std::chrono::steady_clock::now();
            assert(rig.gauge->check_connection());
            auto took = std::chrono::steady_clock::now() - start;

            assert(took >= fast_timing().cooldown);
            assert(rig.port->close_count() == 1);
            assert(rig.port->open_count() == 2);
            assert(rig.port->count_writes("s1\r\n") == 1);
            assert(rig.gauge->is_open());
        }

        // Reopen fails -> not connected
        {
            auto rig = make_sim_gauge();
            rig.port->push_step("s1\r\n", Step{Action::WRITE_ERROR, ""});
            rig.port->fail_next_opens(1);
            assert(!rig.gauge->check_connection());
            assert(!rig.gauge->is_open());
            assert(rig.port->failed_open_count() == 1);
        }

        // An I/O error on a later attempt still takes the cool-down path
        {
            auto rig = make_sim_gauge();
            rig.port->push_step("s1\r\n", Step{Action::REPLY, "noise\r>"});
            rig.port->push_step("s1\r\n", Step{Action::READ_ERROR, ""});
            assert(rig.gauge->check_connection());
            assert(rig.port->count_writes("s1\r\n") == 2);
            assert(rig.port->close_count() == 1);
        }

        std::cout << "  Cool-down reopen test passed" << std::endl;
    }

    // Test 9: verify_after_reopen
    {
        std::cout << "Test 9: verify_after_reopen" << std::endl;

        GaugeTiming timing = fast_timing();
        timing.verify_after_reopen = true;

        auto wrong = make_sim_gauge("980.3\r>", "XGS-600\r>", timing);
        wrong.port->push_step("s1\r\n", Step{Action::READ_ERROR, ""});
        assert(!wrong.gauge->check_connection());
        assert(wrong.port->count_writes("s1\r\n") == 1 + 3);

        auto right = make_sim_gauge("980.3\r>", "HVG-2020B\r>", timing);
        right.port->push_step("s1\r\n", Step{Action::READ_ERROR, ""});
        assert(right.gauge->check_connection());
        assert(right.port->count_writes("s1\r\n") == 2);

        // A second I/O error after the reopen does not loop back into recovery
        auto flaky = make_sim_gauge("980.3\r>", "HVG-2020B\r>", timing);
        flaky.port->push_step("s1\r\n", Step{Action::READ_ERROR, ""});
        flaky.port->push_step("s1\r\n", Step{Action::READ_ERROR, ""});
        assert(!flaky.gauge->check_connection());
        assert(flaky.port->close_count() == 1);

        std::cout << "  verify_after_reopen test passed" << std::endl;
    }

    // Test 10: close() is idempotent
    {
        std::cout << "Test 10: Idempotent close" << std::endl;

        auto rig = make_sim_gauge();
        rig.gauge->close();
        rig.gauge->close();
        rig.gauge->close();
        assert(!rig.gauge->is_open());
        assert(rig.port->close_count() == 1);

        std::cout << "  Idempotent close test passed" << std::endl;
    }

    // Test 11: State queries do not wait for a recovery in progress
    {
        std::cout << "Test 11: Queries during cool-down" << std::endl;

        GaugeTiming timing = fast_timing();
        timing.cooldown = std::chrono::milliseconds(1500);
        auto rig = make_sim_gauge("980.3\r>", "HVG-2020B\r>", timing);
        rig.port->push_step("s1\r\n", Step{Action::READ_ERROR, ""});

        bool connected = false;
        std::thread checker([&]() { connected = rig.gauge->check_connection(); });
        assert(Fixtures::eventually([&]() { return rig.port->close_count() == 1; }));

        // The checker holds the port for the whole cool-down
        auto start = std::chrono::steady_clock::now();
        GaugeStatistics st = rig.gauge->statistics();
        bool open = rig.gauge->is_open();
        std::string name = rig.gauge->port_name();
        auto took = std::chrono::steady_clock::now() - start;

        assert(took < std::chrono::milliseconds(500));
        assert(!open);
        assert(name == "SIM0");
        assert(st.connection_checks == 1);
        assert(st.io_errors == 1);
        assert(st.reopens == 0);

        checker.join();
        assert(connected);
        assert(rig.gauge->is_open());
        assert(rig.gauge->statistics().reopens == 1);

        std::cout << "  Queries during cool-down test passed" << std::endl;
    }

    std::cout << "\n✅ All HVG2020Gauge tests passed!" << std::endl;
    return 0;
}
