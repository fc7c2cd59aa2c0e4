#include "parallax_rt/net/subscribe_socket.hpp"
#include <nng/protocol/pubsub0/sub.h>

namespace parallax_rt::net {

SubscribeSocket::SubscribeSocket() = default;

std::error_code SubscribeSocket::Init() {
    return base_.Init(detail::SocketType::SUB);
}

std::error_code SubscribeSocket::Connect(const std::string &address) {
    return base_.Connect(address);
}

std::error_code SubscribeSocket::Subscribe(const std::string &topic) {
    return base_.SetPointerOption(NNG_OPT_SUB_SUBSCRIBE,
                                  topic.empty() ? nullptr : topic.data(),
                                  topic.size());
}

std::error_code
SubscribeSocket::SetReceiveTimeout(std::chrono::milliseconds timeout) {
    return base_.SetReceiveTimeout(timeout);
}

std::error_code SubscribeSocket::Receive(std::string &data) {
    return base_.Receive(data);
}

void SubscribeSocket::Shutdown() { base_.Close(); }

bool SubscribeSocket::IsOpen() const { return base_.IsOpen(); }

SubscribeSocket::~SubscribeSocket() = default;

} // namespace parallax_rt::net
