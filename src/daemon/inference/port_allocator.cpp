#include "inference/port_allocator.hpp"

#include <arpa/inet.h>
#include <format>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ports {

bool is_available(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool ok = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
              ::listen(fd, 1) == 0;
    ::close(fd);
    return ok;
}

Result<uint16_t> find_available(PortRange range) {
    for (uint32_t port = range.first; port <= range.last; ++port) {
        if (is_available(static_cast<uint16_t>(port))) return static_cast<uint16_t>(port);
    }
    return make_error(ErrorCode::Io,
                      std::format("no available ports in range {}-{}", range.first, range.last));
}

} // namespace ports
