#include "core/device/probe/icmp_probe.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

#include "core/common/utils/network_utils.hpp"

namespace devinv::core::device::probe {

using common::log::Level;

namespace {

constexpr const char* kLogTag = "probe";

constexpr std::size_t kPayloadSize = 16;

struct SocketHandle {
  int fd = -1;
  bool raw = false;

  ~SocketHandle() {
    if (fd >= 0) ::close(fd);
  }
};

std::uint16_t Checksum(const std::uint8_t* data, std::size_t len) {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i + 1 < len; i += 2) {
    sum += static_cast<std::uint32_t>(data[i] << 8 | data[i + 1]);
  }
  if (len % 2 != 0) sum += static_cast<std::uint32_t>(data[len - 1] << 8);
  while (sum >> 16) sum = (sum & 0xffff) + (sum >> 16);
  return static_cast<std::uint16_t>(~sum);
}

bool IsPermissionError(int err) {
  return err == EPERM || err == EACCES;
}

bool OpenSocket(SocketHandle& h, int& err) {
  h.fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
  if (h.fd >= 0) return true;

  h.fd = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
  if (h.fd >= 0) {
    h.raw = true;
    return true;
  }
  err = errno;
  return false;
}

// True when `buf` holds the echo reply for (id, seq).
bool IsMatchingReply(const std::uint8_t* buf, std::size_t len, bool raw, std::uint16_t id,
                     std::uint16_t seq) {
  if (raw) {
    if (len < sizeof(struct ip)) return false;
    const std::size_t ihl = static_cast<std::size_t>(buf[0] & 0x0f) * 4;
    if (ihl < sizeof(struct ip) || len < ihl) return false;
    buf += ihl;
    len -= ihl;
  }
  if (len < sizeof(struct icmphdr)) return false;

  struct icmphdr hdr;
  std::memcpy(&hdr, buf, sizeof(hdr));
  if (hdr.type != ICMP_ECHOREPLY) return false;
  if (ntohs(hdr.un.echo.sequence) != seq) return false;
  // The kernel rewrites the identifier of datagram ICMP sockets.
  if (raw && ntohs(hdr.un.echo.id) != id) return false;
  return true;
}

}  // namespace

const char* ToString(ProbeOutcome outcome) {
  switch (outcome) {
    case ProbeOutcome::Reply: return "reply";
    case ProbeOutcome::Timeout: return "timeout";
    case ProbeOutcome::Unreachable: return "unreachable";
    case ProbeOutcome::PermissionDenied: return "permission_denied";
    case ProbeOutcome::SocketError: return "socket_error";
    case ProbeOutcome::SendFailed: return "send_failed";
    case ProbeOutcome::ReceiveFailed: return "receive_failed";
  }
  return "unknown";
}

IcmpProbe::IcmpProbe(std::shared_ptr<common::log::Logger> logger) : logger_(std::move(logger)) {}

bool IcmpProbe::Probe(const std::string& host, std::chrono::milliseconds timeout) {
  const ProbeOutcome outcome = Ping(host, timeout);
  if (logger_) {
    const std::string msg = "probe " + host + ": " + ToString(outcome);
    if (outcome == ProbeOutcome::Reply || outcome == ProbeOutcome::Timeout ||
        outcome == ProbeOutcome::Unreachable) {
      logger_->Log(Level::Debug, kLogTag, msg);
    } else {
      logger_->Log(Level::Warn, kLogTag, msg);
    }
  }
  return outcome == ProbeOutcome::Reply;
}

ProbeOutcome IcmpProbe::Ping(const std::string& host, std::chrono::milliseconds timeout) {
  const auto octets = common::net::ParseIpv4(host);
  if (!octets.has_value()) {
    throw std::invalid_argument("probe host is not an IPv4 address: " + host);
  }

  struct sockaddr_in dst {};
  dst.sin_family = AF_INET;
  std::memcpy(&dst.sin_addr.s_addr, octets->data(), octets->size());

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  SocketHandle sock;
  int err = 0;
  if (!OpenSocket(sock, err)) {
    if (logger_) logger_->Log(Level::Debug, kLogTag, std::string("icmp socket: ") + std::strerror(err));
    return IsPermissionError(err) ? ProbeOutcome::PermissionDenied : ProbeOutcome::SocketError;
  }

  const std::uint16_t id = static_cast<std::uint16_t>(::getpid() & 0xffff);
  const std::uint16_t seq = next_seq_.fetch_add(1);

  std::uint8_t packet[sizeof(struct icmphdr) + kPayloadSize] = {};
  struct icmphdr hdr {};
  hdr.type = ICMP_ECHO;
  hdr.code = 0;
  hdr.un.echo.id = htons(id);
  hdr.un.echo.sequence = htons(seq);
  std::memcpy(packet, &hdr, sizeof(hdr));
  for (std::size_t i = 0; i < kPayloadSize; ++i) {
    packet[sizeof(hdr) + i] = static_cast<std::uint8_t>('a' + i);
  }
  const std::uint16_t sum = Checksum(packet, sizeof(packet));
  hdr.checksum = htons(sum);
  std::memcpy(packet, &hdr, sizeof(hdr));

  const ssize_t sent = ::sendto(sock.fd, packet, sizeof(packet), 0,
                                reinterpret_cast<const struct sockaddr*>(&dst), sizeof(dst));
  if (sent < 0) {
    err = errno;
    if (err == ENETUNREACH || err == EHOSTUNREACH) return ProbeOutcome::Unreachable;
    if (IsPermissionError(err)) return ProbeOutcome::PermissionDenied;
    return ProbeOutcome::SendFailed;
  }

  std::uint8_t buf[1500];
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return ProbeOutcome::Timeout;
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

    struct pollfd pfd {};
    pfd.fd = sock.fd;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, static_cast<int>(remaining > 0 ? remaining : 1));
    if (rc == 0) return ProbeOutcome::Timeout;
    if (rc < 0) {
      if (errno == EINTR) continue;
      return ProbeOutcome::ReceiveFailed;
    }

    struct sockaddr_in from {};
    socklen_t from_len = sizeof(from);
    const ssize_t n = ::recvfrom(sock.fd, buf, sizeof(buf), 0,
                                 reinterpret_cast<struct sockaddr*>(&from), &from_len);
    if (n < 0) {
      err = errno;
      if (err == EINTR || err == EAGAIN) continue;
      if (err == ENETUNREACH || err == EHOSTUNREACH) return ProbeOutcome::Unreachable;
      return ProbeOutcome::ReceiveFailed;
    }
    if (from.sin_addr.s_addr != dst.sin_addr.s_addr) continue;
    if (IsMatchingReply(buf, static_cast<std::size_t>(n), sock.raw, id, seq)) {
      return ProbeOutcome::Reply;
    }
  }
}

}  // namespace devinv::core::device::probe
