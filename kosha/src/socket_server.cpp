#include <kosha/socket_server.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace kosha {

namespace {

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool would_block(int err) {
    return err == EAGAIN || err == EWOULDBLOCK;
}

} // namespace

// Empty lines are dropped; a trailing \r is tolerated
bool SocketServer::Connection::take_line(std::string& line) {
    while (true) {
        size_t nl = inbox.find('\n');
        if (nl == std::string::npos) return false;
        line.assign(inbox, 0, nl);
        inbox.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) return true;
    }
}

SocketServer::SocketServer(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::start() {
    if (listen_fd_ >= 0) return true;
    if (!bind_listener()) return false;
    std::cerr << "[socket_server] Listening on " << socket_path_ << "\n";
    return true;
}

void SocketServer::stop() {
    for (auto& conn : conns_) ::close(conn.fd);
    conns_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        ::unlink(socket_path_.c_str());
    }
}

bool SocketServer::bind_listener() {
    sockaddr_un addr{};
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        std::cerr << "[socket_server] Socket path too long: " << socket_path_ << "\n";
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size() + 1);

    // The daemon's pid lock is held, so any file here is left from a dead run
    ::unlink(socket_path_.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        std::cerr << "[socket_server] socket() failed: " << std::strerror(errno) << "\n";
        return false;
    }

    const char* step = nullptr;
    if (!set_nonblocking(fd)) {
        step = "fcntl";
    } else if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        step = "bind";
    } else if (::chmod(socket_path_.c_str(), 0600) < 0) {
        step = "chmod";
    } else if (::listen(fd, MAX_CONNECTIONS) < 0) {
        step = "listen";
    }

    if (step) {
        std::cerr << "[socket_server] " << step << "() failed: " << std::strerror(errno) << "\n";
        ::close(fd);
        ::unlink(socket_path_.c_str());
        return false;
    }

    listen_fd_ = fd;
    return true;
}

std::vector<ClientRequest> SocketServer::poll(int timeout_ms) {
    std::vector<ClientRequest> requests;
    if (listen_fd_ < 0) return requests;

    std::vector<pollfd> fds;
    fds.reserve(conns_.size() + 1);
    for (const auto& conn : conns_) {
        short events = conn.closing ? 0 : POLLIN;
        if (!conn.outbox.empty()) events |= POLLOUT;
        fds.push_back({conn.fd, events, 0});
    }
    fds.push_back({listen_fd_, POLLIN, 0});

    int ready = ::poll(fds.data(), fds.size(), timeout_ms);
    if (ready < 0 && errno != EINTR) {
        std::cerr << "[socket_server] poll() failed: " << std::strerror(errno) << "\n";
    }

    if (ready > 0) {
        // fds[i] belongs to conns_[i]; accepting last keeps the pairing intact
        for (size_t i = 0; i < conns_.size(); ++i) {
            Connection& conn = conns_[i];
            short revents = fds[i].revents;

            if (revents & POLLIN) receive(conn);
            if (revents & POLLOUT) flush(conn);

            // A hangup can arrive together with the client's last request
            if (revents & (POLLERR | POLLNVAL)) conn.closing = true;
            if ((revents & POLLHUP) && !(revents & POLLIN)) conn.closing = true;

            std::string line;
            while (conn.take_line(line)) {
                conn.awaiting++;
                requests.push_back({conn.id, std::move(line)});
            }
        }

        if (fds.back().revents & POLLIN) accept_pending();
    }

    reap();
    return requests;
}

bool SocketServer::respond(uint64_t client_id, const std::string& response) {
    auto it = std::find_if(conns_.begin(), conns_.end(),
                           [&](const Connection& c) { return c.id == client_id; });
    if (it == conns_.end()) return false;

    if (it->awaiting > 0) it->awaiting--;
    it->outbox += response;
    it->outbox += '\n';
    flush(*it);
    return true;
}

size_t SocketServer::pending_writes() const {
    size_t bytes = 0;
    for (const auto& conn : conns_) bytes += conn.outbox.size();
    return bytes;
}

// Drain the socket until it would block
void SocketServer::receive(Connection& conn) {
    char buf[8192];
    while (!conn.closing) {
        ssize_t n = ::read(conn.fd, buf, sizeof(buf));
        if (n > 0) {
            conn.inbox.append(buf, static_cast<size_t>(n));
            if (conn.inbox.size() > MAX_MESSAGE_SIZE) {
                std::cerr << "[socket_server] Client " << conn.id << " sent more than "
                          << MAX_MESSAGE_SIZE << " bytes without a newline, closing\n";
                conn.closing = true;
            }
        } else if (n == 0) {
            conn.closing = true;
        } else if (errno != EINTR) {
            if (!would_block(errno)) conn.closing = true;
            return;
        }
    }
}

void SocketServer::flush(Connection& conn) {
    while (!conn.outbox.empty()) {
        ssize_t n = ::send(conn.fd, conn.outbox.data(), conn.outbox.size(), MSG_NOSIGNAL);
        if (n > 0) {
            conn.outbox.erase(0, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            if (n < 0 && !would_block(errno)) {
                conn.closing = true;
                conn.outbox.clear();
            }
            return;
        }
    }
}

void SocketServer::accept_pending() {
    while (true) {
        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (!would_block(errno)) {
                std::cerr << "[socket_server] accept() failed: " << std::strerror(errno) << "\n";
            }
            return;
        }

        if (conns_.size() >= static_cast<size_t>(MAX_CONNECTIONS) || !set_nonblocking(fd)) {
            std::cerr << "[socket_server] Refusing client (connections=" << conns_.size() << ")\n";
            ::close(fd);
            continue;
        }

        Connection conn;
        conn.fd = fd;
        conn.id = next_id_++;
        conns_.push_back(std::move(conn));
        std::cerr << "[socket_server] Client " << conns_.back().id << " connected ("
                  << conns_.size() << " open)\n";
    }
}

// A closing client keeps its slot until every request it sent is answered
// and the answers are written
void SocketServer::reap() {
    auto gone = std::remove_if(conns_.begin(), conns_.end(), [](const Connection& c) {
        if (!c.closing || c.awaiting > 0 || !c.outbox.empty()) return false;
        std::cerr << "[socket_server] Client " << c.id << " disconnected\n";
        ::close(c.fd);
        return true;
    });
    conns_.erase(gone, conns_.end());
}

} // namespace kosha
