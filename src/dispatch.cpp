#include "dispatch.hpp"

#include "container.hpp"
#include "error.hpp"
#include "log.hpp"

namespace tabmux {

void dispatch(Container &container, ControlServer &control, Batch batch) {
    for (const auto &e : batch.events) container.handle(e);
    for (const auto &ex : batch.exits) container.handle_exit(ex);
    for (const auto &req : batch.requests) serve(container, control, req);
}

void serve(Container &container, ControlServer &control, const ControlServer::Request &req) {
    if (req.command.kind == CommandKind::Subscribe) {
        control.subscribe(req.client);
        control.reply(req.client, ok_reply());
        return;
    }
    try {
        json result = container.execute(req.command);
        control.reply(req.client, ok_reply(std::move(result)));
    } catch (const Error &e) {
        if (e.fatal()) throw;
        TABMUX_LOG_WARN("control", "{} failed: {}: {}", command_name(req.command.kind), to_string(e.kind()), e.what());
        control.reply(req.client, error_reply(e.kind(), e.what()));
    }
}

}  // namespace tabmux
