#pragma once
#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace test_support {

    /**
     * Listening TCP socket on the loopback interface that never accepts. Connections complete
     * in the kernel backlog, so a client sends its request and then waits forever for an answer.
     */
    class SilentServer {
        int _fd{-1};
        int _port{0};

    public:
        SilentServer() {
            _fd = ::socket(AF_INET, SOCK_STREAM, 0);
            if(_fd < 0) {
                throw std::runtime_error("socket() failed");
            }
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            socklen_t len = sizeof(addr);
            if(::bind(_fd, reinterpret_cast<sockaddr *>(&addr), len) != 0
               || ::listen(_fd, 8) != 0
               || ::getsockname(_fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
                ::close(_fd);
                throw std::runtime_error("Unable to listen on loopback");
            }
            _port = ntohs(addr.sin_port);
        }
        SilentServer(const SilentServer &) = delete;
        SilentServer(SilentServer &&) = delete;
        SilentServer &operator=(const SilentServer &) = delete;
        SilentServer &operator=(SilentServer &&) = delete;
        ~SilentServer() {
            ::close(_fd);
        }

        [[nodiscard]] std::string url() const {
            return "http://127.0.0.1:" + std::to_string(_port);
        }
    };

} // namespace test_support
