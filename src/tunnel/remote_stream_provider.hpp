#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include "duplex_stream.hpp"

// Turns a (pod, namespace, port) identity into a connected byte stream.
//
// The handler is called exactly once and never from inside async_open().
// Providers do not retry; a failed open is reported as Err.
class RemoteStreamProvider {
public:
    using OpenHandler = std::function<void(Result<std::shared_ptr<DuplexStream>>)>;

    virtual ~RemoteStreamProvider() = default;

    virtual void async_open(const std::string& pod_name,
                            const std::string& pod_namespace,
                            uint16_t remote_port,
                            OpenHandler handler) = 0;

    virtual std::string name() const = 0;
};
