#pragma once

#include <chrono>
#include <cstddef>
#include <nng/nng.h>
#include <string>
#include <system_error>

namespace parallax_rt::net::detail {

enum class SocketType {
    SUB, // Subscribe (client-side PUB/SUB)
};

// RAII wrapper for NNG messages
class MessagePtr {
  public:
    explicit MessagePtr(nng_msg *msg = nullptr) : msg_(msg) {}

    ~MessagePtr() { reset(); }

    MessagePtr(const MessagePtr &) = delete;
    MessagePtr &operator=(const MessagePtr &) = delete;

    MessagePtr(MessagePtr &&other) noexcept : msg_(other.release()) {}
    MessagePtr &operator=(MessagePtr &&other) noexcept {
        reset(other.release());
        return *this;
    }

    nng_msg *get() const { return msg_; }
    nng_msg **out() {
        reset();
        return &msg_;
    }

    nng_msg *release() {
        auto ptr = msg_;
        msg_ = nullptr;
        return ptr;
    }

    void reset(nng_msg *msg = nullptr) {
        if (msg_) {
            nng_msg_free(msg_);
        }
        msg_ = msg;
    }

  private:
    nng_msg *msg_ = nullptr;
};

class SocketBase {
  public:
    SocketBase();
    ~SocketBase();

    SocketBase(const SocketBase &) = delete;
    SocketBase &operator=(const SocketBase &) = delete;
    SocketBase(SocketBase &&) = delete;
    SocketBase &operator=(SocketBase &&) = delete;

    std::error_code Init(SocketType type);

    // Client-side. Non-blocking: the dialer keeps retrying in the background.
    std::error_code Connect(const std::string &address);

    // Returns NNG_ETIMEDOUT once the receive timeout elapses.
    std::error_code Receive(std::string &data);

    void Close();

    bool IsOpen() const;

    std::error_code SetPointerOption(const char *name, const void *value,
                                     size_t len);
    std::error_code SetReceiveTimeout(std::chrono::milliseconds timeout);

  private:
    nng_socket socket_ = NNG_SOCKET_INITIALIZER;
    nng_dialer dialer_ = NNG_DIALER_INITIALIZER;
    bool is_open_ = false;
};

class nng_error_category : public std::error_category {
  public:
    const char *name() const noexcept override { return "nng"; }

    std::string message(int ev) const override { return nng_strerror(ev); }
};

inline const std::error_category &nng_category() {
    static nng_error_category instance;
    return instance;
}

inline std::error_code make_error_code(int nng_errno) {
    return std::error_code(nng_errno, nng_category());
}

inline bool is_timeout(const std::error_code &ec) {
    return ec.category() == nng_category() && ec.value() == NNG_ETIMEDOUT;
}

} // namespace parallax_rt::net::detail
