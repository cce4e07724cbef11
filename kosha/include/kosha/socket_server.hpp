#pragma once
// Socket Server: Unix domain socket front of the daemon
//
// Newline-delimited JSON-RPC 2.0, multiplexed with poll() on one thread.
// Requests carry a connection id rather than the fd, so a response that
// arrives after its client left is dropped instead of reaching whoever
// reused the descriptor.

#include <kosha/version.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kosha {

struct ClientRequest {
    uint64_t client_id = 0;
    std::string data;
};

class SocketServer {
public:
    static constexpr int MAX_CONNECTIONS = 32;
    static constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16MB

    explicit SocketServer(std::string socket_path);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    bool start();
    void stop();
    bool running() const { return listen_fd_ >= 0; }

    // Accept, read and write; returns complete requests.
    // timeout_ms: -1 = block, 0 = non-blocking, >0 = wait up to N ms
    std::vector<ClientRequest> poll(int timeout_ms = 100);

    // Queue a response and try to send it at once; the rest goes out on
    // later polls. False if the client is gone.
    bool respond(uint64_t client_id, const std::string& response);

    size_t connection_count() const { return conns_.size(); }
    size_t pending_writes() const;
    const std::string& socket_path() const { return socket_path_; }

private:
    struct Connection {
        int fd = -1;
        uint64_t id = 0;
        std::string inbox;
        std::string outbox;
        size_t awaiting = 0;  // Requests handed out, not yet answered
        bool closing = false;

        bool take_line(std::string& line);
    };

    bool bind_listener();
    void accept_pending();
    void receive(Connection& conn);
    void flush(Connection& conn);
    void reap();

    std::string socket_path_;
    int listen_fd_ = -1;
    uint64_t next_id_ = 1;
    std::vector<Connection> conns_;
};

} // namespace kosha
