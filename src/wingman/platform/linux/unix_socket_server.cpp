#include "unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind({}) failed: {}", endpoint, std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    ::chmod(endpoint.c_str(), 0600);

    if (::listen(server_fd_, 4) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        ::unlink(endpoint.c_str());
        return false;
    }

    socket_path_ = endpoint;
    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : connections_) {
        ::close(c.fd);
    }
    connections_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    connections_.push_back({fd, {}});
    return fd;
}

IpcServer::ReadResult UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* conn = find_connection(client_fd);
    if (!conn) return ReadResult::Closed;

    // A line left over from an earlier read is served before reading more.
    auto pos = conn->pending.find('\n');
    if (pos == std::string::npos) {
        char buf[4096];
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return ReadResult::Incomplete;
        }
        if (n <= 0) return ReadResult::Closed;

        size_t old_size = conn->pending.size();
        conn->pending.append(buf, static_cast<size_t>(n));
        pos = conn->pending.find('\n', old_size);
        if (pos == std::string::npos) {
            if (conn->pending.size() > MAX_LINE_BYTES) {
                conn->pending.clear();
                return ReadResult::Invalid;
            }
            return ReadResult::Incomplete;
        }
    }

    std::string line = conn->pending.substr(0, pos);
    conn->pending.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return ReadResult::Invalid;
    }
    return cmd.is_object() ? ReadResult::Command : ReadResult::Invalid;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    // Man pages, --help output and X11 titles are not always UTF-8.
    std::string msg = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Documentation responses can exceed the socket buffer.
                pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
                if (::poll(&pfd, 1, SEND_TIMEOUT_MS) > 0) continue;
            }
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(connections_, [client_fd](const Connection& c) { return c.fd == client_fd; });
}

UnixSocketServer::Connection* UnixSocketServer::find_connection(int fd) {
    auto it = std::ranges::find_if(connections_, [fd](const Connection& c) { return c.fd == fd; });
    return it != connections_.end() ? &*it : nullptr;
}
