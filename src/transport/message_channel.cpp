#include "transport/message_channel.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <system_error>
#include <unistd.h>

namespace crucible::transport {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::size_t kHeaderBytes = 4;
constexpr std::uint32_t kMaxFrameBytes = 256u * 1024u * 1024u;

CrucibleError system_error(const std::string& what, const std::string& code) {
    return CrucibleError{ErrorCategory::Transport,
                         what + ": " + std::strerror(errno), code};
}

CrucibleError channel_closed() {
    return CrucibleError{ErrorCategory::Transport, "Peer closed the channel.",
                         "channel_closed"};
}

core::errors::Result<sockaddr_un> make_address(const std::string& address) {
    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (address.empty() || address.size() >= sizeof(addr.sun_path)) {
        return CrucibleError{ErrorCategory::Input,
                             "Socket address is empty or too long: " + address,
                             "invalid_address",
                             "Use a shorter socket directory."};
    }
    std::memcpy(addr.sun_path, address.c_str(), address.size() + 1);
    return addr;
}

}  // namespace

MessageChannel::MessageChannel(const int fd) : fd_(fd) {}

MessageChannel::~MessageChannel() {
    close();
}

void MessageChannel::close() {
    if (fd_ >= 0) {
        static_cast<void>(::close(fd_));
        fd_ = -1;
    }
}

core::errors::Status MessageChannel::send(const json& message) {
    if (fd_ < 0) {
        return channel_closed();
    }

    const std::vector<std::uint8_t> payload = json::to_cbor(message);
    if (payload.size() > kMaxFrameBytes) {
        return CrucibleError{ErrorCategory::Transport,
                             "Message exceeds the maximum frame size.",
                             "frame_too_large"};
    }

    std::vector<std::uint8_t> frame(kHeaderBytes + payload.size());
    const auto size = static_cast<std::uint32_t>(payload.size());
    frame[0] = static_cast<std::uint8_t>(size >> 24);
    frame[1] = static_cast<std::uint8_t>(size >> 16);
    frame[2] = static_cast<std::uint8_t>(size >> 8);
    frame[3] = static_cast<std::uint8_t>(size);
    std::memcpy(frame.data() + kHeaderBytes, payload.data(), payload.size());

    std::size_t written = 0;
    while (written < frame.size()) {
        const ssize_t n = ::send(fd_, frame.data() + written, frame.size() - written,
                                 MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd_, POLLOUT, 0};
            static_cast<void>(::poll(&pfd, 1, 100));
            continue;
        }
        if (n < 0 && (errno == EPIPE || errno == ECONNRESET)) {
            return channel_closed();
        }
        return system_error("Failed to write to channel", "channel_send_failed");
    }
    return core::errors::ok();
}

std::optional<json> MessageChannel::pop_buffered() {
    if (buffer_.size() < kHeaderBytes) {
        return std::nullopt;
    }
    const std::uint32_t size = (static_cast<std::uint32_t>(buffer_[0]) << 24) |
                               (static_cast<std::uint32_t>(buffer_[1]) << 16) |
                               (static_cast<std::uint32_t>(buffer_[2]) << 8) |
                               static_cast<std::uint32_t>(buffer_[3]);
    if (size > kMaxFrameBytes) {
        buffer_.clear();
        return json(json::value_t::discarded);
    }
    if (buffer_.size() < kHeaderBytes + size) {
        return std::nullopt;
    }

    const auto begin = buffer_.begin() + kHeaderBytes;
    const auto end = begin + size;
    json message = json::from_cbor(begin, end, true, false);
    buffer_.erase(buffer_.begin(), end);
    return message;
}

core::errors::Status MessageChannel::read_available(bool& peer_closed) {
    std::uint8_t chunk[65536];
    while (true) {
        const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (n > 0) {
            buffer_.insert(buffer_.end(), chunk, chunk + n);
            continue;
        }
        if (n == 0) {
            peer_closed = true;
            return core::errors::ok();
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return core::errors::ok();
        }
        if (errno == ECONNRESET) {
            peer_closed = true;
            return core::errors::ok();
        }
        return system_error("Failed to read from channel", "channel_read_failed");
    }
}

core::errors::Result<json> MessageChannel::receive(
    std::optional<std::chrono::milliseconds> timeout) {
    if (fd_ < 0) {
        return channel_closed();
    }

    const auto deadline = timeout.has_value()
                              ? std::chrono::steady_clock::now() + timeout.value()
                              : std::chrono::steady_clock::time_point::max();
    while (true) {
        if (auto message = pop_buffered()) {
            if (message->is_discarded()) {
                return CrucibleError{ErrorCategory::Transport,
                                     "Received a malformed frame.",
                                     "malformed_message"};
            }
            return std::move(message.value());
        }
        if (peer_closed_) {
            return channel_closed();
        }

        int wait_ms = -1;
        if (timeout.has_value()) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return CrucibleError{ErrorCategory::Transport,
                                     "Timed out waiting for a message.",
                                     "channel_timeout"};
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return system_error("Failed to poll channel", "channel_read_failed");
        }
        if (ready == 0) {
            continue;
        }

        auto status = read_available(peer_closed_);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }
}

core::errors::Result<std::vector<json>> MessageChannel::drain() {
    if (fd_ < 0) {
        return channel_closed();
    }
    if (!peer_closed_) {
        auto status = read_available(peer_closed_);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }

    std::vector<json> messages;
    while (auto message = pop_buffered()) {
        if (message->is_discarded()) {
            return CrucibleError{ErrorCategory::Transport,
                                 "Received a malformed frame.", "malformed_message"};
        }
        messages.push_back(std::move(message.value()));
    }
    if (messages.empty() && peer_closed_) {
        return channel_closed();
    }
    return messages;
}

core::errors::Result<std::unique_ptr<UnixListener>> UnixListener::bind(
    const std::string& address) {
    auto addr_result = make_address(address);
    if (core::errors::is_error(addr_result)) {
        return core::errors::get_error(addr_result);
    }
    const sockaddr_un addr = core::errors::get_value(addr_result);

    std::error_code ec;
    const auto parent = std::filesystem::path(address).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return CrucibleError{ErrorCategory::Internal,
                                 "Unable to create socket directory: " + parent.string(),
                                 "socket_dir_create_failed"};
        }
    }
    // A stale socket file from a crashed process would make bind() fail.
    std::filesystem::remove(address, ec);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return system_error("Failed to create socket", "socket_create_failed");
    }
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        auto err = system_error("Failed to bind " + address, "socket_bind_failed");
        static_cast<void>(::close(fd));
        return err;
    }
    if (::listen(fd, 16) != 0) {
        auto err = system_error("Failed to listen on " + address, "socket_listen_failed");
        static_cast<void>(::close(fd));
        return err;
    }
    return std::make_unique<UnixListener>(fd, address, true);
}

UnixListener::UnixListener(const int fd, std::string address, const bool owns_path)
    : fd_(fd), address_(std::move(address)), owns_path_(owns_path) {}

UnixListener::~UnixListener() {
    if (fd_ >= 0) {
        static_cast<void>(::close(fd_));
    }
    if (owns_path_) {
        std::error_code ec;
        std::filesystem::remove(address_, ec);
    }
}

int UnixListener::release() {
    const int fd = fd_;
    fd_ = -1;
    owns_path_ = false;
    return fd;
}

core::errors::Result<std::unique_ptr<MessageChannel>> UnixListener::accept() {
    while (true) {
        const int fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) {
            return std::make_unique<MessageChannel>(fd);
        }
        if (errno == EINTR) {
            continue;
        }
        return system_error("Failed to accept on " + address_, "socket_accept_failed");
    }
}

core::errors::Result<std::unique_ptr<MessageChannel>> connect_unix(
    const std::string& address) {
    auto addr_result = make_address(address);
    if (core::errors::is_error(addr_result)) {
        return core::errors::get_error(addr_result);
    }
    const sockaddr_un addr = core::errors::get_value(addr_result);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return system_error("Failed to create socket", "socket_create_failed");
    }
    while (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno == EINTR) {
            continue;
        }
        auto err = system_error("Failed to connect to " + address, "connect_failed");
        static_cast<void>(::close(fd));
        return err;
    }
    return std::make_unique<MessageChannel>(fd);
}

core::errors::Result<std::pair<std::unique_ptr<MessageChannel>,
                               std::unique_ptr<MessageChannel>>>
make_channel_pair() {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        return system_error("Failed to create socket pair", "socketpair_failed");
    }
    return std::make_pair(std::make_unique<MessageChannel>(fds[0]),
                          std::make_unique<MessageChannel>(fds[1]));
}

core::errors::Result<json> request_reply(MessageChannel& channel, const json& request,
                                         const std::chrono::milliseconds timeout) {
    auto sent = channel.send(request);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    return channel.receive(timeout);
}

}  // namespace crucible::transport
