#include <arbiter/socket_server.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <algorithm>

namespace arbiter {

namespace {

constexpr size_t READ_CHUNK = 4096;

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool would_block() {
    return errno == EAGAIN || errno == EWOULDBLOCK;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// ClientConnection
// ═══════════════════════════════════════════════════════════════════════════

bool ClientConnection::has_complete_message() const {
    return read_buffer.find('\n') != std::string::npos;
}

// Next line without its terminator; CRLF clients are tolerated
std::string ClientConnection::extract_message() {
    auto end = read_buffer.find('\n');
    if (end == std::string::npos) return {};

    std::string line(read_buffer, 0, end);
    read_buffer.erase(0, end + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

SocketServer::SocketServer(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::start() {
    if (running()) return true;
    if (!create_socket()) return false;

    std::cerr << "[SocketServer] Listening on " << socket_path_
              << " (protocol " << ARBITER_PROTOCOL_VERSION_MAJOR << "."
              << ARBITER_PROTOCOL_VERSION_MINOR << ")\n";
    return true;
}

void SocketServer::stop() {
    for (auto& conn : connections_) {
        if (conn.fd >= 0) close(conn.fd);
    }
    connections_.clear();

    if (running()) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
    }
}

bool SocketServer::create_socket() {
    sockaddr_un addr{};
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        std::cerr << "[SocketServer] Socket path too long: " << socket_path_ << "\n";
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::copy(socket_path_.begin(), socket_path_.end(), addr.sun_path);

    // A previous daemon may have left its socket file behind
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail_socket("socket");
    if (!set_nonblocking(server_fd_)) return fail_socket("fcntl");

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail_socket("bind");
    }
    chmod(socket_path_.c_str(), 0600);

    if (listen(server_fd_, MAX_CONNECTIONS) < 0) return fail_socket("listen");
    return true;
}

// Log errno for the failed step and release whatever create_socket() built
bool SocketServer::fail_socket(const char* step) {
    std::cerr << "[SocketServer] " << step << " failed on " << socket_path_
              << ": " << strerror(errno) << "\n";
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
    unlink(socket_path_.c_str());
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Event loop
// ═══════════════════════════════════════════════════════════════════════════

std::vector<ClientRequest> SocketServer::poll(int timeout_ms) {
    std::vector<ClientRequest> requests;
    if (!running()) return requests;

    // Slot 0 is the listener, slot i+1 is connections_[i]
    std::vector<pollfd> fds;
    fds.reserve(connections_.size() + 1);
    fds.push_back(pollfd{server_fd_, POLLIN, 0});
    for (const auto& conn : connections_) {
        short wanted = conn.write_buffer.empty() ? POLLIN : (POLLIN | POLLOUT);
        fds.push_back(pollfd{conn.fd, wanted, 0});
    }

    int ready = ::poll(fds.data(), fds.size(), timeout_ms);
    if (ready <= 0) {
        if (ready < 0 && errno != EINTR) {
            std::cerr << "[SocketServer] poll: " << strerror(errno) << "\n";
        }
        return requests;
    }

    size_t polled = fds.size() - 1;
    for (size_t i = 0; i < polled; ++i) {
        short revents = fds[i + 1].revents;
        auto& conn = connections_[i];
        if (revents & POLLIN) read_from(conn);
        if (revents & POLLOUT) write_to(conn);
        if (revents & (POLLERR | POLLHUP | POLLNVAL)) conn.wants_close = true;
    }

    // After the loop above: accepting grows connections_
    if (fds[0].revents & POLLIN) accept_new_connections();

    for (auto& conn : connections_) {
        while (!conn.wants_close && conn.has_complete_message()) {
            auto line = conn.extract_message();
            if (!line.empty()) requests.push_back(ClientRequest{conn.fd, std::move(line)});
        }
    }

    drop_closed();
    return requests;
}

void SocketServer::read_from(ClientConnection& conn) {
    char chunk[READ_CHUNK];
    ssize_t got = read(conn.fd, chunk, sizeof(chunk));
    if (got == 0 || (got < 0 && !would_block())) {
        conn.wants_close = true;
        return;
    }
    if (got < 0) return;

    conn.read_buffer.append(chunk, static_cast<size_t>(got));
    if (conn.read_buffer.size() > MAX_MESSAGE_SIZE) {
        std::cerr << "[SocketServer] fd=" << conn.fd << " sent more than "
                  << MAX_MESSAGE_SIZE << " bytes without a newline\n";
        conn.wants_close = true;
    }
}

void SocketServer::write_to(ClientConnection& conn) {
    if (conn.write_buffer.empty()) return;

    ssize_t sent = write(conn.fd, conn.write_buffer.data(), conn.write_buffer.size());
    if (sent > 0) {
        conn.write_buffer.erase(0, static_cast<size_t>(sent));
    } else if (sent < 0 && !would_block()) {
        conn.wants_close = true;
    }
}

void SocketServer::accept_new_connections() {
    for (;;) {
        int fd = accept(server_fd_, nullptr, nullptr);
        if (fd < 0) {
            if (!would_block() && errno != EINTR) {
                std::cerr << "[SocketServer] accept: " << strerror(errno) << "\n";
            }
            return;
        }

        if (connections_.size() >= static_cast<size_t>(MAX_CONNECTIONS) || !set_nonblocking(fd)) {
            std::cerr << "[SocketServer] Refusing fd=" << fd << " ("
                      << connections_.size() << " open)\n";
            close(fd);
            continue;
        }

        ClientConnection conn;
        conn.fd = fd;
        connections_.push_back(std::move(conn));
    }
}

void SocketServer::drop_closed() {
    auto closed = std::stable_partition(connections_.begin(), connections_.end(),
        [](const ClientConnection& conn) { return !conn.wants_close; });
    for (auto it = closed; it != connections_.end(); ++it) {
        close(it->fd);
    }
    connections_.erase(closed, connections_.end());
}

// ═══════════════════════════════════════════════════════════════════════════
// Responses and notifications
// ═══════════════════════════════════════════════════════════════════════════

void SocketServer::respond(int client_fd, const std::string& response) {
    if (auto* conn = find(client_fd)) {
        queue(*conn, response);
    }
}

bool SocketServer::subscribe(int client_fd) {
    auto* conn = find(client_fd);
    if (!conn) return false;
    conn->subscribed = true;
    return true;
}

bool SocketServer::unsubscribe(int client_fd) {
    auto* conn = find(client_fd);
    if (!conn || !conn->subscribed) return false;
    conn->subscribed = false;
    return true;
}

size_t SocketServer::broadcast(const std::string& message) {
    size_t sent = 0;
    for (auto& conn : connections_) {
        if (!conn.subscribed || conn.wants_close) continue;
        queue(conn, message);
        sent++;
    }
    return sent;
}

size_t SocketServer::subscriber_count() const {
    return static_cast<size_t>(std::count_if(connections_.begin(), connections_.end(),
        [](const ClientConnection& conn) { return conn.subscribed && !conn.wants_close; }));
}

size_t SocketServer::pending_writes() const {
    size_t total = 0;
    for (const auto& conn : connections_) total += conn.write_buffer.size();
    return total;
}

// A subscriber that stops reading is cut off rather than buffered forever
void SocketServer::queue(ClientConnection& conn, const std::string& line) {
    if (conn.write_buffer.size() + line.size() + 1 > MAX_PENDING_WRITE) {
        std::cerr << "[SocketServer] fd=" << conn.fd << " is not reading, closing\n";
        conn.wants_close = true;
        return;
    }
    conn.write_buffer.append(line).push_back('\n');
}

ClientConnection* SocketServer::find(int client_fd) {
    auto it = std::find_if(connections_.begin(), connections_.end(),
        [client_fd](const ClientConnection& conn) { return conn.fd == client_fd; });
    return it != connections_.end() ? &*it : nullptr;
}

} // namespace arbiter
