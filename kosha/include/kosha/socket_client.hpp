#pragma once
// Socket Client: talks to a running koshad over its Unix socket
//
// Never starts or restarts the daemon. Version compatibility is checked
// with the initialize handshake.

#include <kosha/version.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace kosha {

struct DaemonVersion {
    std::string software;
    int protocol_major = 0;
    int protocol_minor = 0;
};

class SocketClient {
public:
    static constexpr int RESPONSE_TIMEOUT_MS = 300000;  // Rebuilds of large indexes are slow
    static constexpr size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;

    explicit SocketClient(std::string socket_path);
    ~SocketClient();

    SocketClient(const SocketClient&) = delete;
    SocketClient& operator=(const SocketClient&) = delete;
    SocketClient(SocketClient&&) = delete;
    SocketClient& operator=(SocketClient&&) = delete;

    bool connect();
    void disconnect();
    bool connected() const { return fd_ >= 0; }

    // Connect and verify the daemon speaks a compatible protocol
    bool connect_checked();

    std::optional<DaemonVersion> check_version();

    // Raw line in, raw line out
    std::optional<std::string> request(const std::string& json_rpc);

    // Builds the envelope and parses the response. The returned document
    // holds either "result" or "error".
    std::optional<nlohmann::json> call(const std::string& method,
                                       const nlohmann::json& params = nlohmann::json::object());

    bool request_shutdown();
    bool wait_for_socket_gone(int timeout_ms);

    const std::string& last_error() const { return last_error_; }
    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int fd_ = -1;
    uint64_t next_id_ = 1;
    std::string pending_;   // Bytes read past the last newline
    std::string last_error_;
};

} // namespace kosha
