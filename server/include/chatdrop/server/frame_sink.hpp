#pragma once

#include "chatdrop/protocol.hpp"

namespace chatdrop::server
{

    // Outbound side of one client connection. send() queues the frame and returns immediately.
    class FrameSink
    {
    public:
        virtual ~FrameSink() = default;

        virtual void send(protocol::ResponseEnvelope envelope) = 0;
    };

} // namespace chatdrop::server
