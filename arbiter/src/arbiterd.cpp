// arbiterd: existence-arbitration daemon
//
// Usage: arbiterd [options]
//
// Serves JSON-RPC 2.0 over a Unix socket, reconciles active scopes in the
// background, and pushes binding notifications to subscribed clients.

#include <arbiter/arbiter.hpp>
#include <arbiter/socket_server.hpp>
#include <arbiter/rpc/handler.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <memory>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

using namespace arbiter;

static std::atomic<bool> daemon_running{true};

void daemon_signal_handler(int sig) {
    (void)sig;
    daemon_running = false;
}

// Double-fork into the background. stdout/stderr go to log_path
// (or /dev/null when empty).
bool daemonize(const std::string& log_path) {
    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[arbiterd] First fork failed: " << strerror(errno) << "\n";
        return false;
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        std::cerr << "[arbiterd] setsid failed: " << strerror(errno) << "\n";
        return false;
    }

    pid = fork();
    if (pid < 0) {
        std::cerr << "[arbiterd] Second fork failed: " << strerror(errno) << "\n";
        return false;
    }
    if (pid > 0) _exit(0);

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

static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config PATH       JSON configuration file\n"
              << "  --db PATH           SQLite database (default: arbiter.db)\n"
              << "  --socket-path PATH  Unix socket (default: derived from --db)\n"
              << "  --scope ID          Activate a scope at startup (repeatable)\n"
              << "  --interval SEC      Seconds between reconcile passes\n"
              << "  --no-auto-fix       Scheduled passes only demote to review\n"
              << "  --strict            Enforce the strict transition table\n"
              << "  --outbox PATH       Persist undelivered notifications here\n"
              << "  --log PATH          Log file\n"
              << "  --foreground, -f    Do not daemonize\n"
              << "  --verbose           Log every transition\n"
              << "  -h, --help          Show this help\n"
              << "  -v, --version       Show version\n";
}

int run_daemon(const ArbiterConfig& config) {
    SqliteStatusStore store(config.db_path);
    if (!store.open()) {
        std::cerr << "[arbiterd] Cannot open database " << config.db_path << "\n";
        return 1;
    }

    SignalTable signals;
    EventBus bus;

    auto outbox = std::make_shared<NotificationOutbox>(config.outbox);
    if (!config.outbox_path.empty()) {
        size_t restored = outbox->load(config.outbox_path);
        if (restored > 0) {
            std::cerr << "[arbiterd] Restored " << restored << " queued notifications\n";
        }
    }
    bus.attach(outbox);

    ScopeRegistry registry(store, signals, bus, config);
    for (const auto& scope_id : config.scopes) {
        try {
            registry.activate(scope_id);
        } catch (const std::exception& e) {
            std::cerr << "[arbiterd] Cannot activate " << scope_id << ": " << e.what() << "\n";
        }
    }

    SocketServer server(config.socket_path);
    if (!server.start()) {
        std::cerr << "[arbiterd] Failed to start socket server on " << config.socket_path << "\n";
        return 1;
    }

    rpc::Handler handler(&registry, &signals, rpc::HandlerContext{config.socket_path, config.db_path});
    handler.on_subscribe([&server](int fd, bool on) {
        return on ? server.subscribe(fd) : server.unsubscribe(fd);
    });

    // Runs on the main thread inside flush(), same thread as poll()
    outbox->set_transport([&server](const StatusEvent& event) {
        if (server.subscriber_count() == 0) return false;
        auto note = rpc::make_notification(std::string("binding:") + to_string(event.type),
                                           event.to_json());
        server.broadcast(note.dump());
        return true;
    });

    ReconcileDaemon daemon(config.daemon);
    daemon.attach(&registry);
    daemon.on_save([&]() {
        if (!config.outbox_path.empty() && !outbox->save(config.outbox_path)) {
            std::cerr << "[arbiterd] Cannot write " << config.outbox_path << "\n";
        }
    });
    daemon.on_event([&config](DaemonEvent event, const std::string& msg) {
        if (event == DaemonEvent::Alert || event == DaemonEvent::Tick || config.verbose) {
            std::cerr << "[daemon] " << msg << "\n";
        }
    });

    std::signal(SIGTERM, daemon_signal_handler);
    std::signal(SIGINT, daemon_signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    std::cerr << "[arbiterd] Started (socket=" << config.socket_path
              << ", db=" << config.db_path
              << ", scopes=" << registry.size()
              << ", interval=" << config.daemon.reconcile_interval_ms / 1000 << "s"
              << ", pid=" << getpid() << ")\n";

    daemon.start();

    while (daemon_running && !handler.shutdown_requested()) {
        for (const auto& req : server.poll(100)) {
            server.respond(req.client_fd, handler.handle(req.data, req.client_fd));
        }
        outbox->flush(now());
    }

    // Let queued responses (the shutdown reply included) drain
    for (int i = 0; i < 10 && server.pending_writes() > 0; ++i) {
        server.poll(20);
    }

    daemon.stop();
    if (!config.outbox_path.empty()) {
        outbox->save(config.outbox_path);
    }
    server.stop();
    store.close();

    auto stats = daemon.stats();
    std::cerr << "[arbiterd] Stopped (passes=" << stats.reconcile_passes
              << " auto_fixed=" << stats.auto_fixed
              << " review=" << stats.requires_human_review
              << " undelivered=" << outbox->size() << ")\n";
    return 0;
}

int main(int argc, char* argv[]) {
    const char* prog = prog_name(argv[0]);

    // The config file is the base; flags override it
    ArbiterConfig config;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            auto loaded = ArbiterConfig::load(argv[++i]);
            if (!loaded) return 1;
            config = *loaded;
        }
    }

    bool foreground = false;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            ++i;
        } else if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            config.db_path = argv[++i];
        } else if (strcmp(argv[i], "--socket-path") == 0 && i + 1 < argc) {
            config.socket_path = argv[++i];
        } else if (strcmp(argv[i], "--scope") == 0 && i + 1 < argc) {
            config.scopes.push_back(argv[++i]);
        } else if (strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            config.daemon.reconcile_interval_ms = std::atoll(argv[++i]) * 1000;
        } else if (strcmp(argv[i], "--no-auto-fix") == 0) {
            config.daemon.auto_fix = false;
        } else if (strcmp(argv[i], "--strict") == 0) {
            config.strict_transitions = true;
        } else if (strcmp(argv[i], "--outbox") == 0 && i + 1 < argc) {
            config.outbox_path = argv[++i];
        } else if (strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            config.log_path = argv[++i];
        } else if (strcmp(argv[i], "--foreground") == 0 || strcmp(argv[i], "-f") == 0) {
            foreground = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(prog);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << prog << " " << ARBITER_VERSION << "\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(prog);
            return 1;
        }
    }

    if (config.daemon.reconcile_interval_ms <= 0) {
        std::cerr << "--interval must be positive\n";
        return 1;
    }
    if (config.socket_path.empty()) {
        config.socket_path = socket_path_for_db(config.db_path);
    }

    if (!foreground) {
        if (!daemonize(config.log_path)) return 1;
    } else if (!config.log_path.empty()) {
        int log_fd = open(config.log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (log_fd < 0) {
            std::cerr << "Cannot open log " << config.log_path << ": " << strerror(errno) << "\n";
            return 1;
        }
        dup2(log_fd, STDERR_FILENO);
        close(log_fd);
    }

    return run_daemon(config);
}
