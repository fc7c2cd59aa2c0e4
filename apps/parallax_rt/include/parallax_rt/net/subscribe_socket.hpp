#pragma once

#include "detail/socket_base.hpp"
#include <chrono>
#include <string>
#include <system_error>

namespace parallax_rt::net {

// Client-side SUB socket. Receives from one publisher address.
class SubscribeSocket {
  public:
    SubscribeSocket();

    std::error_code Init();

    std::error_code Connect(const std::string &address);

    // Empty topic receives every message
    std::error_code Subscribe(const std::string &topic = {});

    // Bounds Receive() so a reader thread can observe stop requests.
    std::error_code SetReceiveTimeout(std::chrono::milliseconds timeout);

    std::error_code Receive(std::string &data);

    void Shutdown();

    bool IsOpen() const;

    ~SubscribeSocket();

  private:
    detail::SocketBase base_;
};

} // namespace parallax_rt::net
