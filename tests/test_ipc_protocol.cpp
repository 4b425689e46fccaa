#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/wingman_test_ipc_" + std::to_string(getpid()) + ".sock";
}

using ReadResult = IpcServer::ReadResult;

// The server socket is non-blocking, so poll briefly for data to arrive.
ReadResult read_with_retry(UnixSocketServer& server, int client_fd, json& out) {
    auto result = ReadResult::Incomplete;
    for (int i = 0; i < 50 && result == ReadResult::Incomplete; ++i) {
        result = server.read_command(client_fd, out);
        if (result == ReadResult::Incomplete) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    return result;
}

bool send_raw(int fd, const std::string& data) {
    return ::send(fd, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(server.server_fd() >= 0);
        REQUIRE(std::filesystem::exists(sock_path));

        auto perms = std::filesystem::status(sock_path).permissions();
        REQUIRE((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);

        server.stop();
        REQUIRE(server.server_fd() < 0);
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RejectsOverlongPath") {
        UnixSocketServer server;
        REQUIRE_FALSE(server.start("/tmp/" + std::string(200, 'w') + ".sock"));
    }

    SECTION("ClientConnects") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "position"}, {"edge", "left"}}));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Command);
        REQUIRE(received["cmd"] == "position");
        REQUIRE(received["edge"] == "left");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"edge", "left"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["status"] == "ok");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MultipleMessages") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "status"}, {"seq", i}}));

            json received;
            REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Command);
            REQUIRE(received["seq"] == i);

            REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", i}}));

            json resp;
            REQUIRE(client.recv(resp, 1000));
            REQUIRE(resp["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        // Peer hangup is reported rather than treated as no data
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("RejectsMalformedLines") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json cmd;
        REQUIRE(client.send("just a string"));
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Invalid);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("RejectsInvalidJson") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(raw >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        sock_path.copy(addr.sun_path, sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(send_raw(raw, "{not json\n"));
        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Invalid);

        // The connection stays usable for the next line
        REQUIRE(send_raw(raw, "{\"cmd\":\"show\"}\n"));
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Command);
        REQUIRE(cmd["cmd"] == "show");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("PipelinedCommands") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "hide"}}));
        REQUIRE(client.send({{"cmd", "show"}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json first, second;
        REQUIRE(read_with_retry(server, client_fd, first) == ReadResult::Command);
        REQUIRE(read_with_retry(server, client_fd, second) == ReadResult::Command);
        REQUIRE(first["cmd"] == "hide");
        REQUIRE(second["cmd"] == "show");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("NonUtf8TextIsReplaced") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Latin-1 --help output
        json reply = {{"status", "ok"}, {"text", "--- Help for foo ---\n\ncaf\xe9"}};
        REQUIRE(server.send_response(client_fd, reply));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["text"] == "--- Help for foo ---\n\ncaf\xef\xbf\xbd");

        // The request direction tolerates it too
        REQUIRE(client.send({{"cmd", "doc"}, {"command", "caf\xe9"}}));
        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Command);
        REQUIRE(received["command"] == "caf\xef\xbf\xbd");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("LargeResponse") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // A long man page exceeds the socket buffer; the reader drains concurrently.
        std::string text(1024 * 1024, 'm');
        json resp;
        bool received = false;
        std::thread reader([&] { received = client.recv(resp, 5000); });

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"text", text}}));
        reader.join();

        REQUIRE(received);
        REQUIRE(resp["text"].get<std::string>().size() == text.size());

        server.close_client(client_fd);
        client.close();
        server.stop();
    }
}
