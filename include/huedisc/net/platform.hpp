/**
 * @file platform.hpp
 * @brief POSIX socket includes and handle helpers.
 *
 * The discovery engine relies on getifaddrs and the kernel routing table,
 * so only POSIX targets are supported.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace huedisc {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }

}  // namespace net
}  // namespace huedisc
