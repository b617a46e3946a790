#include "deploy/readiness_probe.hpp"

#include <cerrno>
#include <fcntl.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace agentrt::deploy {

namespace {

// Wildcard listen addresses are reached through loopback.
std::string connect_host(const std::string& host) {
    if (host == "0.0.0.0" || host.empty()) {
        return "127.0.0.1";
    }
    if (host == "::") {
        return "::1";
    }
    return host;
}

bool connect_with_timeout(const addrinfo& address, const int timeout_ms) {
    const int fd = socket(address.ai_family, address.ai_socktype, address.ai_protocol);
    if (fd < 0) {
        return false;
    }

    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
    }

    bool connected = false;
    const int rc = connect(fd, address.ai_addr, address.ai_addrlen);
    if (rc == 0) {
        connected = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        if (poll(&pfd, 1, timeout_ms) == 1) {
            int error = 0;
            socklen_t length = sizeof(error);
            connected = getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) == 0 && error == 0;
        }
    }

    static_cast<void>(close(fd));
    return connected;
}

}  // namespace

bool port_accepts_connections(const std::string& host, const int port,
                              const std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    const std::string service = std::to_string(port);
    if (getaddrinfo(connect_host(host).c_str(), service.c_str(), &hints, &addresses) != 0) {
        return false;
    }

    bool connected = false;
    for (const addrinfo* it = addresses; it != nullptr && !connected; it = it->ai_next) {
        connected = connect_with_timeout(*it, static_cast<int>(timeout.count()));
    }
    freeaddrinfo(addresses);
    return connected;
}

bool health_endpoint_ok(const ProbeTarget& target) {
    httplib::Client client(connect_host(target.host), target.port);
    client.set_connection_timeout(std::chrono::duration_cast<std::chrono::microseconds>(
                                      target.connect_timeout));
    client.set_read_timeout(std::chrono::duration_cast<std::chrono::microseconds>(
                                target.health_timeout));
    const auto response = client.Get("/health");
    if (!response || response->status != 200) {
        return false;
    }
    if (target.expected_pid == 0) {
        return true;
    }
    const auto payload = nlohmann::json::parse(response->body, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded() || !payload.is_object()) {
        return false;
    }
    const auto pid = payload.find("pid");
    return pid != payload.end() && pid->is_number_integer() &&
           pid->get<long>() == target.expected_pid;
}

bool probe_once(const ProbeTarget& target) {
    if (!port_accepts_connections(target.host, target.port, target.connect_timeout)) {
        return false;
    }
    if (!target.health_check && target.expected_pid == 0) {
        return true;
    }
    return health_endpoint_ok(target);
}

}  // namespace agentrt::deploy
