#include "DnsResolver.hpp"
#include <ares.h>
#include <algorithm>
#include <memory>
#include <utility>
#include <cerrno>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include "../utils/Logger.hpp"

namespace {

// Closes the socket on scope exit
struct SocketGuard {
    int fd = -1;
    ~SocketGuard() {
        if (fd >= 0) close(fd);
    }
};

bool split_host_port(const std::string& address, std::string& host, std::string& port) {
    if (!address.empty() && address[0] == '[') {
        auto close_pos = address.find(']');
        if (close_pos == std::string::npos) return false;
        host = address.substr(1, close_pos - 1);
        std::string rest = address.substr(close_pos + 1);
        port = (rest.size() > 1 && rest[0] == ':') ? rest.substr(1) : "53";
        return true;
    }
    auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        host = address;
        port = "53";
    } else {
        host = address.substr(0, colon);
        port = address.substr(colon + 1);
    }
    return !host.empty() && !port.empty();
}

bool dial_one(const addrinfo* ai, long timeout_ms) {
    SocketGuard sock;
    sock.fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock.fd < 0) return false;

    int flags = fcntl(sock.fd, F_GETFL, 0);
    if (flags < 0 || fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;

    if (connect(sock.fd, ai->ai_addr, ai->ai_addrlen) == 0) return true;
    if (errno != EINPROGRESS) return false;

    pollfd pfd{};
    pfd.fd = sock.fd;
    pfd.events = POLLOUT;
    if (poll(&pfd, 1, static_cast<int>(timeout_ms)) <= 0) return false;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) return false;
    return so_error == 0;
}

// c-ares keeps a reference count for library init/cleanup pairs
struct AresLibrary {
    int status;
    AresLibrary() : status(ares_library_init(ARES_LIB_INIT_ALL)) {}
    ~AresLibrary() {
        if (status == ARES_SUCCESS) ares_library_cleanup();
    }
};

struct ChannelGuard {
    ares_channel channel = nullptr;
    ~ChannelGuard() {
        if (channel) ares_destroy(channel);
    }
};

struct LookupState {
    bool done = false;
    int status = ARES_ENOTFOUND;
    std::vector<std::string> addresses;
};

void on_addrinfo(void* arg, int status, int /*timeouts*/, ares_addrinfo* result) {
    auto* state = static_cast<LookupState*>(arg);
    state->done = true;
    state->status = status;
    if (!result) return;
    std::unique_ptr<ares_addrinfo, decltype(&ares_freeaddrinfo)> guard(result, &ares_freeaddrinfo);
    if (status != ARES_SUCCESS) return;

    for (const ares_addrinfo_node* node = result->nodes; node != nullptr; node = node->ai_next) {
        char text[INET6_ADDRSTRLEN] = {0};
        const void* raw = nullptr;
        if (node->ai_family == AF_INET) {
            raw = &reinterpret_cast<const sockaddr_in*>(node->ai_addr)->sin_addr;
        } else if (node->ai_family == AF_INET6) {
            raw = &reinterpret_cast<const sockaddr_in6*>(node->ai_addr)->sin6_addr;
        }
        if (!raw || !inet_ntop(node->ai_family, raw, text, sizeof(text))) continue;
        std::string address(text);
        if (std::find(state->addresses.begin(), state->addresses.end(), address) == state->addresses.end()) {
            state->addresses.push_back(address);
        }
    }
}

} // anonymous namespace

namespace LinkScope {

DnsResolver::DnsResolver(Options options) : options_(std::move(options)) {}

bool DnsResolver::Dial(const std::string& address, long timeout_ms) {
    std::string host;
    std::string port;
    if (!split_host_port(address, host, port)) return false;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo* raw = nullptr;
    if (getaddrinfo(host.c_str(), port.c_str(), &hints, &raw) != 0 || raw == nullptr) {
        return false;
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> result(raw, &freeaddrinfo);

    for (const addrinfo* ai = result.get(); ai != nullptr; ai = ai->ai_next) {
        if (dial_one(ai, timeout_ms)) return true;
    }
    return false;
}

std::optional<std::string> DnsResolver::SelectServer() const {
    if (Dial(options_.primary, options_.timeout_ms)) {
        return options_.primary;
    }
    Logger::Log(LogLevel::Debug, "Primary DNS " + options_.primary + " unreachable, trying " + options_.fallback);
    if (Dial(options_.fallback, options_.timeout_ms)) {
        return options_.fallback;
    }
    return std::nullopt;
}

bool DnsResolver::IsIpLiteral(const std::string& host) {
    unsigned char buf[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

Resolution DnsResolver::Lookup(const std::string& host, const std::string& server) const {
    Resolution resolution;
    if (host.empty()) {
        resolution.error = "empty hostname";
        return resolution;
    }
    if (IsIpLiteral(host)) {
        resolution.addresses.push_back(host);
        return resolution;
    }

    AresLibrary library;
    if (library.status != ARES_SUCCESS) {
        resolution.error = std::string("c-ares init failed: ") + ares_strerror(library.status);
        return resolution;
    }

    // Declared before the channel: ares_destroy may still invoke the callback
    LookupState state;
    ChannelGuard guard;

    ares_options opts{};
    opts.timeout = static_cast<int>(options_.timeout_ms);
    opts.tries = 1;
    int status = ares_init_options(&guard.channel, &opts, ARES_OPT_TIMEOUTMS | ARES_OPT_TRIES);
    if (status != ARES_SUCCESS) {
        guard.channel = nullptr;
        resolution.error = std::string("c-ares channel init failed: ") + ares_strerror(status);
        return resolution;
    }
    status = ares_set_servers_ports_csv(guard.channel, server.c_str());
    if (status != ARES_SUCCESS) {
        resolution.error = "invalid DNS server " + server + ": " + ares_strerror(status);
        return resolution;
    }

    ares_addrinfo_hints hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = ARES_AI_NOSORT;
    ares_getaddrinfo(guard.channel, host.c_str(), nullptr, &hints, on_addrinfo, &state);

    while (!state.done) {
        fd_set read_fds;
        fd_set write_fds;
        FD_ZERO(&read_fds);
        FD_ZERO(&write_fds);
        int nfds = ares_fds(guard.channel, &read_fds, &write_fds);
        if (nfds == 0) break;
        timeval tv{};
        timeval* tvp = ares_timeout(guard.channel, nullptr, &tv);
        if (select(nfds, &read_fds, &write_fds, nullptr, tvp) < 0 && errno != EINTR) {
            resolution.error = "lookup " + host + " on " + server + ": select failed";
            return resolution;
        }
        ares_process(guard.channel, &read_fds, &write_fds);
    }

    if (!state.done) {
        resolution.error = "lookup " + host + " on " + server + ": no answer";
    } else if (state.status != ARES_SUCCESS) {
        resolution.error = "lookup " + host + " on " + server + ": " + ares_strerror(state.status);
    } else if (state.addresses.empty()) {
        resolution.error = "lookup " + host + " on " + server + ": no addresses";
    } else {
        resolution.addresses = std::move(state.addresses);
    }
    return resolution;
}

}
