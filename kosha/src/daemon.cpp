// koshad: embedding index daemon
//
// Usage: koshad [options]
//
// Serves the engine over a Unix socket as newline-delimited JSON-RPC 2.0.
// The main thread owns socket I/O; a fixed worker pool executes requests;
// a maintenance thread checkpoints and compacts.

#include <kosha/config.hpp>
#include <kosha/engine.hpp>
#include <kosha/job_queue.hpp>
#include <kosha/log.hpp>
#include <kosha/maintenance.hpp>
#include <kosha/rpc/handler.hpp>
#include <kosha/socket_server.hpp>
#include <kosha/version.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace kosha;

namespace {

std::atomic<bool> daemon_running{true};

void daemon_signal_handler(int sig) {
    (void)sig;
    daemon_running = false;
}

// Double fork; stdout/stderr go to log_path (or /dev/null)
bool daemonize(const std::string& log_path) {
    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[daemon] First fork failed: " << strerror(errno) << "\n";
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }

    if (setsid() < 0) {
        std::cerr << "[daemon] setsid failed: " << strerror(errno) << "\n";
        return false;
    }

    pid = fork();
    if (pid < 0) {
        std::cerr << "[daemon] Second fork failed: " << strerror(errno) << "\n";
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }

    umask(022);

    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        close(null_fd);
    }

    const char* out_path = log_path.empty() ? "/dev/null" : log_path.c_str();
    int log_fd = open(out_path, O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (log_fd >= 0) {
        dup2(log_fd, STDOUT_FILENO);
        dup2(log_fd, STDERR_FILENO);
        close(log_fd);
    }

    return true;
}

struct DaemonLock {
    int fd = -1;
    std::string path;
};

// One daemon per data directory; the lock file holds our pid
bool acquire_daemon_lock(const std::string& path, DaemonLock& lock, std::string& error) {
    lock.path = path;
    lock.fd = open(lock.path.c_str(), O_CREAT | O_RDWR, 0600);
    if (lock.fd < 0) {
        error = std::string("Failed to open daemon lock: ") + strerror(errno);
        return false;
    }

    struct flock fl;
    std::memset(&fl, 0, sizeof(fl));
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;

    if (fcntl(lock.fd, F_SETLK, &fl) != 0) {
        if (errno == EACCES || errno == EAGAIN) {
            error = "Daemon already running (lock held: " + lock.path + ")";
        } else {
            error = std::string("Failed to acquire daemon lock: ") + strerror(errno);
        }
        close(lock.fd);
        lock.fd = -1;
        return false;
    }

    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(lock.fd, 0) != 0 || write(lock.fd, pid.data(), pid.size()) < 0) {
        std::cerr << "[daemon] Could not record pid in " << lock.path << "\n";
    }
    return true;
}

void release_daemon_lock(DaemonLock& lock) {
    if (lock.fd >= 0) {
        close(lock.fd);
        lock.fd = -1;
        unlink(lock.path.c_str());
    }
}

void print_usage(const char* prog) {
    std::cerr << "koshad v" << KOSHA_VERSION << " - embedding index daemon\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config PATH      JSON config file\n"
              << "  --data-dir PATH    Snapshot, graph and WAL directory\n"
              << "  --model-dir PATH   ONNX model cache (model.onnx, vocab.txt)\n"
              << "  --socket PATH      Unix socket (default: derived from data dir)\n"
              << "  --dim N            Vector dimension\n"
              << "  --metric NAME      cosine | euclidean\n"
              << "  --embedder NAME    hash | onnx\n"
              << "  --workers N        Request worker threads\n"
              << "  -f, --foreground   Run in foreground (don't daemonize)\n"
              << "  --log PATH         Log file when daemonized\n"
              << "  -v, --verbose      Debug logging\n"
              << "  --version          Print version\n"
              << "  -h, --help         Show this help\n\n"
              << "Environment:\n"
              << "  KOSHA_DATA_DIR, KOSHA_MODEL_DIR, KOSHA_DIM, KOSHA_METRIC,\n"
              << "  KOSHA_SOCKET, KOSHA_EMBEDDER, KOSHA_VERBOSE\n";
}

bool parse_size(const char* text, size_t& out) {
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') return false;
    out = static_cast<size_t>(v);
    return true;
}

struct Outbox {
    std::mutex mutex;
    std::vector<std::pair<uint64_t, std::string>> responses;

    void push(uint64_t client_id, std::string response) {
        std::lock_guard<std::mutex> lock(mutex);
        responses.emplace_back(client_id, std::move(response));
    }

    std::vector<std::pair<uint64_t, std::string>> take() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::pair<uint64_t, std::string>> out;
        out.swap(responses);
        return out;
    }
};

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_path;
    bool foreground = false;

    // Flags apply last, so collect them first
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " needs a value\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "koshad " << KOSHA_VERSION << " (protocol "
                      << KOSHA_PROTOCOL_VERSION_MAJOR << "." << KOSHA_PROTOCOL_VERSION_MINOR << ")\n";
            return 0;
        } else if (arg == "--config") {
            config_path = next("--config");
        } else if (arg == "-f" || arg == "--foreground") {
            foreground = true;
        } else if (arg == "--log") {
            log_path = next("--log");
        } else if (arg == "-v" || arg == "--verbose") {
            set_verbose(true);
        } else if (arg == "--data-dir" || arg == "--model-dir" || arg == "--socket" ||
                   arg == "--dim" || arg == "--metric" || arg == "--embedder" ||
                   arg == "--workers") {
            overrides.emplace_back(arg, next(arg.c_str()));
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    init_verbose_from_env();

    // defaults → file → environment → flags
    EngineConfig config;
    if (!config_path.empty()) {
        Status st = config.merge_file(config_path);
        if (!st) {
            std::cerr << "Error: " << st.error().describe() << "\n";
            return 2;
        }
    }
    Status env = config.merge_env();
    if (!env) {
        std::cerr << "Error: " << env.error().describe() << "\n";
        return 2;
    }
    for (const auto& [flag, value] : overrides) {
        if (flag == "--data-dir") {
            config.data_dir = value;
        } else if (flag == "--model-dir") {
            config.model_dir = value;
        } else if (flag == "--socket") {
            config.daemon.socket_path = value;
        } else if (flag == "--embedder") {
            config.embedder = value;
        } else if (flag == "--metric") {
            auto m = parse_metric(value);
            if (!m) {
                std::cerr << "Error: unknown metric '" << value << "'\n";
                return 2;
            }
            config.metric = *m;
        } else if (flag == "--dim") {
            if (!parse_size(value.c_str(), config.dimension)) {
                std::cerr << "Error: --dim expects a number, got '" << value << "'\n";
                return 2;
            }
        } else if (flag == "--workers") {
            if (!parse_size(value.c_str(), config.daemon.workers)) {
                std::cerr << "Error: --workers expects a number, got '" << value << "'\n";
                return 2;
            }
        }
    }

    // One data dir, one socket and lock, whatever the working directory
    std::error_code ec;
    fs::path absolute = fs::absolute(config.data_dir, ec);
    if (!ec) config.data_dir = absolute.lexically_normal().string();

    Status valid = config.validate();
    if (!valid) {
        std::cerr << "Error: " << valid.error().describe() << "\n";
        return 2;
    }

    if (!foreground && !daemonize(log_path)) {
        return 1;
    }

    DaemonLock lock;
    std::string lock_error;
    if (!acquire_daemon_lock(config.lock_path(), lock, lock_error)) {
        std::cerr << "[daemon] " << lock_error << "\n";
        return 1;
    }

    auto embedder = create_embedder(config);
    if (!embedder) {
        std::cerr << "[daemon] " << embedder.error().describe() << "\n";
        release_daemon_lock(lock);
        return 1;
    }

    Engine engine(config, embedder.take());
    Status opened = engine.open();
    if (!opened) {
        std::cerr << "[daemon] Cannot open engine: " << opened.error().describe() << "\n";
        release_daemon_lock(lock);
        return 1;
    }

    std::string socket_path = config.socket_path();
    SocketServer server(socket_path);
    if (!server.start()) {
        std::cerr << "[daemon] Failed to start socket server on " << socket_path << "\n";
        Status closed = engine.close(true);
        if (!closed) std::cerr << "[daemon] " << closed.error().describe() << "\n";
        release_daemon_lock(lock);
        return 1;
    }

    std::signal(SIGTERM, daemon_signal_handler);
    std::signal(SIGINT, daemon_signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    rpc::Handler handler(engine, rpc::HandlerContext{socket_path, [] {
        std::cerr << "[daemon] Shutdown requested\n";
        daemon_running = false;
    }});

    Outbox outbox;
    WorkerPool<ClientRequest> workers(config.daemon.workers, [&](ClientRequest& req) {
        auto start = std::chrono::steady_clock::now();
        std::string response = handler.handle(req.data);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        log_debug("rpc", "client=%llu len=%zu handled in %ldms (resp_len=%zu)",
                  static_cast<unsigned long long>(req.client_id), req.data.size(),
                  static_cast<long>(elapsed), response.size());
        outbox.push(req.client_id, std::move(response));
    });

    Maintenance maintenance(engine, std::chrono::seconds(config.daemon.maintenance_interval_s));
    maintenance.on_event([](MaintenanceEvent event, const std::string& msg) {
        if (event == MaintenanceEvent::Failed) {
            std::cerr << "[maintenance] " << msg << "\n";
        } else {
            log_debug("maint", "%s", msg.c_str());
        }
    });
    maintenance.start();

    std::cerr << "[daemon] Started v" << KOSHA_VERSION << " (socket=" << socket_path
              << ", data=" << config.data_dir << ", dim=" << config.dimension
              << ", metric=" << metric_name(config.metric) << ", embedder=" << config.embedder
              << ", workers=" << workers.workers() << ", pid=" << getpid()
              << (verbose() ? ", verbose=on" : "") << ")\n";

    auto deliver = [&] {
        for (auto& [client_id, response] : outbox.take()) {
            if (!server.respond(client_id, response)) {
                log_debug("rpc", "client=%llu gone, response dropped",
                          static_cast<unsigned long long>(client_id));
            }
        }
    };

    size_t total_requests = 0;
    auto last_status_log = std::chrono::steady_clock::now();

    while (daemon_running) {
        // Short timeout while workers hold results so replies go out promptly
        auto requests = server.poll(workers.pending() > 0 ? 5 : 100);
        for (auto& req : requests) {
            total_requests++;
            workers.submit(std::move(req));
        }
        deliver();

        auto now_tp = std::chrono::steady_clock::now();
        if (verbose() && now_tp - last_status_log >= std::chrono::seconds(10)) {
            last_status_log = now_tp;
            log_debug("status", "total_requests=%zu conns=%zu pending=%zu pending_writes=%zu",
                      total_requests, server.connection_count(), workers.pending(),
                      server.pending_writes());
        }
    }

    std::cerr << "[daemon] Stopping...\n";

    // Finish accepted work and flush replies (the shutdown reply included)
    workers.shutdown();
    deliver();
    auto flush_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (server.pending_writes() > 0 && std::chrono::steady_clock::now() < flush_deadline) {
        server.poll(20);
    }

    maintenance.stop();
    server.stop();

    Status closed = engine.close(true);
    if (!closed) {
        std::cerr << "[daemon] Final checkpoint failed: " << closed.error().describe() << "\n";
    }

    release_daemon_lock(lock);
    std::cerr << "[daemon] Stopped (requests=" << total_requests << ")\n";
    return closed ? 0 : 1;
}
