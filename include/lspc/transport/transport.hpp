#pragma once
#include "../framer.hpp"
#include "../json_rpc.hpp"

namespace lspc {

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the receive loop. Blocks until shutdown() or until the peer
    /// closes the connection; returning means the connection is gone.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue a message for the peer. Each message is written as one unit.
    virtual void send(const Message& msg) = 0;

    /// Stop the receive loop and the writer.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace lspc
