#include <kosha/socket_client.hpp>
#include <kosha/version.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <thread>

namespace kosha {

using json = nlohmann::json;

SocketClient::SocketClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SocketClient::~SocketClient() {
    disconnect();
}

bool SocketClient::connect() {
    if (fd_ >= 0) return true;

    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        last_error_ = "socket path too long: " + socket_path_;
        return false;
    }

    fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        return false;
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = "cannot connect to " + socket_path_ + ": " + strerror(errno) +
                      " (is koshad running?)";
        close(fd_);
        fd_ = -1;
        return false;
    }

    pending_.clear();
    return true;
}

void SocketClient::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}

bool SocketClient::connect_checked() {
    if (!connect()) return false;

    auto version = check_version();
    if (!version) {
        disconnect();
        return false;
    }
    if (!version::protocol_compatible(version->protocol_major, version->protocol_minor)) {
        last_error_ = "daemon v" + version->software + " speaks protocol " +
                      std::to_string(version->protocol_major) + "." +
                      std::to_string(version->protocol_minor) + ", client v" KOSHA_VERSION
                      " needs " + std::to_string(KOSHA_PROTOCOL_VERSION_MAJOR) + "." +
                      std::to_string(KOSHA_PROTOCOL_VERSION_MINOR);
        disconnect();
        return false;
    }
    return true;
}

std::optional<DaemonVersion> SocketClient::check_version() {
    auto response = call("initialize", {
        {"protocol_major", KOSHA_PROTOCOL_VERSION_MAJOR},
        {"protocol_minor", KOSHA_PROTOCOL_VERSION_MINOR},
        {"client", "kosha " KOSHA_VERSION},
    });
    if (!response) return std::nullopt;

    const json& r = *response;
    if (!r.contains("result") || !r["result"].is_object()) {
        last_error_ = "initialize failed: " +
                      (r.contains("error") ? r["error"].value("message", std::string("unknown"))
                                           : std::string("malformed response"));
        return std::nullopt;
    }

    const json& res = r["result"];
    DaemonVersion ver;
    ver.software = res.value("software_version", std::string());
    ver.protocol_major = res.value("protocol_major", 0);
    ver.protocol_minor = res.value("protocol_minor", 0);
    if (ver.protocol_major == 0) {
        last_error_ = "daemon did not report a protocol version";
        return std::nullopt;
    }
    return ver;
}

std::optional<std::string> SocketClient::request(const std::string& json_rpc) {
    if (fd_ < 0) {
        last_error_ = "Not connected";
        return std::nullopt;
    }

    std::string msg = json_rpc + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = write(fd_, msg.data() + sent, msg.size() - sent);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                pollfd pfd = {fd_, POLLOUT, 0};
                ::poll(&pfd, 1, 1000);
                continue;
            }
            last_error_ = std::string("write() failed: ") + strerror(errno);
            return std::nullopt;
        }
        sent += static_cast<size_t>(n);
    }

    pollfd pfd = {fd_, POLLIN, 0};
    while (true) {
        size_t pos = pending_.find('\n');
        if (pos != std::string::npos) {
            std::string line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            return line;
        }
        if (pending_.size() > MAX_RESPONSE_SIZE) {
            last_error_ = "Response too large";
            disconnect();
            return std::nullopt;
        }

        int ret = ::poll(&pfd, 1, RESPONSE_TIMEOUT_MS);
        if (ret < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("poll() failed: ") + strerror(errno);
            return std::nullopt;
        }
        if (ret == 0) {
            last_error_ = "Response timeout";
            return std::nullopt;
        }

        char buf[8192];
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            last_error_ = n == 0 ? "Connection closed" :
                          std::string("read() failed: ") + strerror(errno);
            return std::nullopt;
        }
        pending_.append(buf, static_cast<size_t>(n));
    }
}

std::optional<json> SocketClient::call(const std::string& method, const json& params) {
    json envelope = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params},
    };

    auto line = request(envelope.dump());
    if (!line) return std::nullopt;

    json response = json::parse(*line, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        last_error_ = "daemon sent invalid JSON";
        return std::nullopt;
    }
    return response;
}

bool SocketClient::request_shutdown() {
    if (!connected() && !connect()) {
        return false;
    }

    auto response = call("shutdown");
    disconnect();
    return response.has_value() && response->contains("result");
}

bool SocketClient::wait_for_socket_gone(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();

    while (access(socket_path_.c_str(), F_OK) == 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed >= timeout_ms) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

} // namespace kosha
