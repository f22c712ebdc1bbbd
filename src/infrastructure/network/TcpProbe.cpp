#include "infrastructure/network/TcpProbe.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace portsweep::infra {

namespace {

struct ProbeState {
    explicit ProbeState(asio::io_context& io) : resolver(io), socket(io), timer(io) {}

    asio::ip::tcp::resolver resolver;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    bool completed{false};
    core::ProbeOutcome outcome{core::ProbeOutcome::NotOpen};
    asio::error_code error;

    void finish(core::ProbeOutcome result, const asio::error_code& ec) {
        if (completed) {
            return;
        }
        completed = true;
        outcome = result;
        error = ec;

        timer.cancel();
        resolver.cancel();
        asio::error_code ignored;
        socket.close(ignored);
    }
};

} // namespace

core::ProbeOutcome TcpProbe::probe(const core::ProbeTask& task,
                                   std::chrono::milliseconds timeout) {
    asio::io_context io;
    ProbeState state(io);

    // Start timeout timer
    state.timer.expires_after(timeout);
    state.timer.async_wait([&state](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return; // Timer cancelled, probe already finished
        }
        state.finish(core::ProbeOutcome::NotOpen, asio::error::timed_out);
    });

    // Resolve, then connect to the first endpoint that accepts
    state.resolver.async_resolve(
        task.host, std::to_string(task.port), asio::ip::tcp::resolver::numeric_service,
        [&state](const asio::error_code& ec, asio::ip::tcp::resolver::results_type endpoints) {
            if (state.completed) {
                return;
            }
            if (ec) {
                state.finish(core::ProbeOutcome::NotOpen, ec);
                return;
            }

            asio::async_connect(state.socket, endpoints,
                                [&state](const asio::error_code& connectEc,
                                         const asio::ip::tcp::endpoint&) {
                                    state.finish(connectEc ? core::ProbeOutcome::NotOpen
                                                           : core::ProbeOutcome::Open,
                                                 connectEc);
                                });
        });

    io.run();

    if (state.outcome != core::ProbeOutcome::Open) {
        spdlog::trace("{} not open: {}", task.toString(), state.error.message());
    }
    return state.outcome;
}

} // namespace portsweep::infra
