#include "parallax_rt/net/detail/socket_base.hpp"
#include <nng/nng.h>
#include <nng/protocol/pubsub0/sub.h>
#include <spdlog/spdlog.h>

namespace parallax_rt::net::detail {

SocketBase::SocketBase() = default;

SocketBase::~SocketBase() { Close(); }

std::error_code SocketBase::Init(SocketType type) {
    if (is_open_)
        return make_error_code(NNG_EBUSY);

    int ret = 0;
    switch (type) {
    case SocketType::SUB:
        ret = nng_sub0_open(&socket_);
        break;
    }

    if (ret != 0) {
        spdlog::error("Failed to open socket: {}", nng_strerror(ret));
        return make_error_code(ret);
    }

    is_open_ = true;
    return {};
}

std::error_code SocketBase::Connect(const std::string &address) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    int ret = nng_dial(socket_, address.c_str(), &dialer_, NNG_FLAG_NONBLOCK);
    if (ret != 0) {
        return make_error_code(ret);
    }

    return {};
}

std::error_code SocketBase::Receive(std::string &data) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    MessagePtr msg;
    int ret = nng_recvmsg(socket_, msg.out(), 0);
    if (ret != 0) {
        return make_error_code(ret);
    }

    auto len = nng_msg_len(msg.get());
    auto beg = static_cast<const char *>(nng_msg_body(msg.get()));
    data.assign(beg, beg + len);

    return {};
}

void SocketBase::Close() {
    if (dialer_.id != 0) {
        nng_dialer_close(dialer_);
        dialer_ = NNG_DIALER_INITIALIZER;
    }

    if (is_open_) {
        nng_close(socket_);
        socket_ = NNG_SOCKET_INITIALIZER;
        is_open_ = false;
    }
}

bool SocketBase::IsOpen() const { return is_open_; }

std::error_code SocketBase::SetPointerOption(const char *name,
                                             const void *value, size_t len) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    int ret = nng_socket_set(socket_, name, value, len);
    if (ret != 0) {
        return make_error_code(ret);
    }

    return {};
}

std::error_code
SocketBase::SetReceiveTimeout(std::chrono::milliseconds timeout) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    int ret = nng_socket_set_ms(socket_, NNG_OPT_RECVTIMEO,
                                static_cast<nng_duration>(timeout.count()));
    if (ret != 0) {
        return make_error_code(ret);
    }

    return {};
}

} // namespace parallax_rt::net::detail
