#pragma once
// Socket Server: Unix domain socket transport for arbiterd
//
// Newline-delimited JSON-RPC 2.0, multiplexed with poll(). Besides
// request/response, a client can subscribe to binding notifications;
// broadcast() queues a message on every subscribed connection.

#include <arbiter/version.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <unistd.h>

namespace arbiter {

// djb2, stable across platforms and runs
inline uint32_t path_hash(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
    }
    return hash;
}

// One daemon per database file
inline std::string socket_path_for_db(const std::string& db_path) {
    return "/tmp/arbiter-" + std::to_string(path_hash(db_path)) + ".sock";
}

struct ClientRequest {
    int client_fd;
    std::string data;
};

struct ClientConnection {
    int fd = -1;
    std::string read_buffer;
    std::string write_buffer;
    bool subscribed = false;
    bool wants_close = false;

    bool has_complete_message() const;
    std::string extract_message();
};

class SocketServer {
public:
    static constexpr int MAX_CONNECTIONS = 32;
    static constexpr size_t MAX_MESSAGE_SIZE = 4 * 1024 * 1024;       // 4MB per request
    static constexpr size_t MAX_PENDING_WRITE = 8 * 1024 * 1024;      // Slow subscriber cutoff

    explicit SocketServer(std::string socket_path);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    bool start();
    void stop();
    bool running() const { return server_fd_ >= 0; }

    // Accept, read and write once. Returns complete requests.
    // timeout_ms: -1 = block, 0 = non-blocking, >0 = wait up to N ms
    std::vector<ClientRequest> poll(int timeout_ms = 100);

    // Queue a response line for one client
    void respond(int client_fd, const std::string& response);

    // Notifications
    bool subscribe(int client_fd);
    bool unsubscribe(int client_fd);
    size_t broadcast(const std::string& message);
    size_t subscriber_count() const;

    size_t connection_count() const { return connections_.size(); }
    size_t pending_writes() const;
    const std::string& socket_path() const { return socket_path_; }

private:
    bool create_socket();
    bool fail_socket(const char* step);
    void accept_new_connections();
    void read_from(ClientConnection& conn);
    void write_to(ClientConnection& conn);
    void queue(ClientConnection& conn, const std::string& line);
    void drop_closed();
    ClientConnection* find(int client_fd);

    std::string socket_path_;
    int server_fd_ = -1;
    std::vector<ClientConnection> connections_;
};

} // namespace arbiter
