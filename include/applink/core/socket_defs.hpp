#pragma once

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#endif

namespace applink {
namespace core {

#ifdef _WIN32
using socket_t = SOCKET;
constexpr socket_t INVALID_SOCKET_VALUE = INVALID_SOCKET;

inline int closeSocket(socket_t fd) { return ::closesocket(fd); }
inline int pollSockets(WSAPOLLFD* fds, ULONG count, int timeoutMs) { return ::WSAPoll(fds, count, timeoutMs); }
using pollfd_t = WSAPOLLFD;
#else
using socket_t = int;
constexpr socket_t INVALID_SOCKET_VALUE = -1;

inline int closeSocket(socket_t fd) { return ::close(fd); }
inline int pollSockets(pollfd* fds, nfds_t count, int timeoutMs) { return ::poll(fds, count, timeoutMs); }
using pollfd_t = pollfd;
#endif

} // namespace core
} // namespace applink
