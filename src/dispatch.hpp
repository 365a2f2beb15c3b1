#pragma once

#include "control.hpp"
#include "events.hpp"
#include "process_supervisor.hpp"

#include <deque>
#include <vector>

namespace tabmux {

class Container;

// Everything one loop iteration collected before touching the container.
struct Batch {
    std::vector<WindowEvent> events;
    std::vector<ExitStatus> exits;
    std::deque<ControlServer::Request> requests;
};

// Applies window events, then child exits, then control requests, so a
// request sees every state change that was already pending when it was read.
// Failed requests are answered with an error reply; fatal errors propagate.
void dispatch(Container &container, ControlServer &control, Batch batch);

// Runs one request against the container and answers its client.
void serve(Container &container, ControlServer &control, const ControlServer::Request &req);

}  // namespace tabmux
