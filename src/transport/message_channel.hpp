#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"

namespace crucible::transport {

// A bidirectional message stream over a connected stream socket.
// Frames are a 4-byte big-endian length followed by a CBOR document.
class MessageChannel {
public:
    explicit MessageChannel(int fd);
    ~MessageChannel();

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    int fd() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }
    void close();

    core::errors::Status send(const nlohmann::json& message);

    // Blocks until one message arrives, the peer closes ("channel_closed") or
    // the timeout elapses ("channel_timeout"). No timeout waits forever.
    core::errors::Result<nlohmann::json> receive(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Reads whatever is available without blocking and returns every complete
    // message. End of stream is reported as "channel_closed" once the
    // buffered messages have been handed out.
    core::errors::Result<std::vector<nlohmann::json>> drain();

private:
    std::optional<nlohmann::json> pop_buffered();
    core::errors::Status read_available(bool& peer_closed);

    int fd_;
    std::vector<std::uint8_t> buffer_;
    bool peer_closed_ = false;
};

// A listening Unix-domain socket. The socket file is removed when the
// listener that created it is destroyed.
class UnixListener {
public:
    static core::errors::Result<std::unique_ptr<UnixListener>> bind(
        const std::string& address);

    // Adopts an already listening descriptor, e.g. one inherited across fork().
    UnixListener(int fd, std::string address, bool owns_path);
    ~UnixListener();

    UnixListener(const UnixListener&) = delete;
    UnixListener& operator=(const UnixListener&) = delete;

    int fd() const { return fd_; }
    const std::string& address() const { return address_; }

    // Gives up the descriptor without unlinking the socket file.
    int release();

    core::errors::Result<std::unique_ptr<MessageChannel>> accept();

private:
    int fd_;
    std::string address_;
    bool owns_path_;
};

core::errors::Result<std::unique_ptr<MessageChannel>> connect_unix(
    const std::string& address);

// Connected pair for parent/child process links.
core::errors::Result<std::pair<std::unique_ptr<MessageChannel>,
                               std::unique_ptr<MessageChannel>>>
make_channel_pair();

// Sends `request` and waits for the single reply on the same channel.
core::errors::Result<nlohmann::json> request_reply(
    MessageChannel& channel, const nlohmann::json& request,
    std::chrono::milliseconds timeout);

// Builds a message with its "type" tag.
inline nlohmann::json make_message(const std::string& type,
                                   nlohmann::json body = nlohmann::json::object()) {
    body["type"] = type;
    return body;
}

inline std::string message_type(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("type") ||
        !message["type"].is_string()) {
        return "";
    }
    return message["type"].get<std::string>();
}

}  // namespace crucible::transport
