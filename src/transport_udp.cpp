// ============================================================================
// transport_udp.cpp : implementation for transport_udp.hpp
// ============================================================================

#include "orbcomm/transport/transport_udp.hpp"
#include "orbcomm/log.hpp"
#include "orbcomm/topic.hpp"

#include "nlohmann/json.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>
#include <vector>

namespace orbcomm::transport {

using nlohmann::json;

static constexpr const char* COMP = "udp";
static constexpr int POLL_MS = 100;   // how often rx_loop rechecks running_

static std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

static const char* kind_token(Frame::Kind k) {
  switch (k) {
    case Frame::Kind::PUT:   return "put";
    case Frame::Kind::QUERY: return "query";
    case Frame::Kind::REPLY: return "reply";
  }
  return "put";
}

std::string encode_frame(const Frame& f) {
  json j;
  j["v"] = FRAME_VERSION;
  j["k"] = kind_token(f.kind);
  j["t"] = f.topic;
  j["p"] = f.payload;
  if (!f.query_id.empty()) j["q"] = f.query_id;

  std::string out = j.dump(-1, ' ', false, json::error_handler_t::replace);   // bad UTF-8 becomes U+FFFD
  if (out.size() > MAX_FRAME) return {};
  return out;
}

std::optional<Frame> decode_frame(const std::string& text) {
  if (text.empty() || text.size() > MAX_FRAME) return std::nullopt;
  json j = json::parse(text, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  auto v = j.find("v");
  auto k = j.find("k");
  auto t = j.find("t");
  if (v == j.end() || !v->is_number_integer() || v->get<int>() != FRAME_VERSION) return std::nullopt;
  if (k == j.end() || !k->is_string()) return std::nullopt;
  if (t == j.end() || !t->is_string()) return std::nullopt;

  Frame f;
  const std::string kind = k->get<std::string>();
  if      (kind == "put")   f.kind = Frame::Kind::PUT;
  else if (kind == "query") f.kind = Frame::Kind::QUERY;
  else if (kind == "reply") f.kind = Frame::Kind::REPLY;
  else return std::nullopt;

  f.topic = t->get<std::string>();
  if (f.topic.empty()) return std::nullopt;

  if (auto p = j.find("p"); p != j.end()) {
    if (!p->is_string()) return std::nullopt;
    f.payload = p->get<std::string>();
  }
  if (auto q = j.find("q"); q != j.end()) {
    if (!q->is_string()) return std::nullopt;
    f.query_id = q->get<std::string>();
  }
  // queries and replies are useless without an id to pair them
  if (f.kind != Frame::Kind::PUT && f.query_id.empty()) return std::nullopt;
  return f;
}

// ---------------------------------------------------------------------------
// UdpReplyChannel
// ---------------------------------------------------------------------------
namespace {

class UdpReplyChannel : public ReplyChannel {
public:
  UdpReplyChannel(std::shared_ptr<UdpTransport::Socket> sock, sockaddr_in dest, std::string qid)
    : sock_(std::move(sock)), dest_(dest), qid_(std::move(qid)) {}

  bool reply(const std::string& topic, const std::string& payload) override {
    Frame f;
    f.kind     = Frame::Kind::REPLY;
    f.topic    = topic;
    f.payload  = payload;
    f.query_id = qid_;
    const std::string wire = encode_frame(f);
    if (wire.empty()) {
      log::warn(COMP, "reply for " + topic + " exceeds frame limit");
      return false;
    }

    std::lock_guard<std::mutex> lk(sock_->mu);
    if (sock_->fd < 0) return false;
    ssize_t n = ::sendto(sock_->fd, wire.data(), wire.size(), 0,
                         reinterpret_cast<const sockaddr*>(&dest_), sizeof(dest_));
    if (n != static_cast<ssize_t>(wire.size())) {
      log::warn(COMP, errno_text("reply sendto"));
      return false;
    }
    return true;
  }

private:
  std::shared_ptr<UdpTransport::Socket> sock_;
  sockaddr_in                           dest_;
  std::string                           qid_;
};

} // namespace

// ---------------------------------------------------------------------------
// UdpTransport
// ---------------------------------------------------------------------------
UdpTransport::UdpTransport(UdpConfig cfg)
  : cfg_(std::move(cfg)), ucast_(std::make_shared<Socket>()) {
  std::random_device rd;
  std::ostringstream os;
  os << std::hex << rd() << rd();
  qid_prefix_ = os.str();
}

UdpTransport::~UdpTransport() { close(); }

bool UdpTransport::open(std::string& err) {
  if (running_) return true;               // already open

  in_addr group{};
  in_addr iface{};
  if (::inet_pton(AF_INET, cfg_.group.c_str(), &group) != 1 ||
      !IN_MULTICAST(ntohl(group.s_addr))) {
    err = "invalid multicast group '" + cfg_.group + "'";
    return false;
  }
  if (::inet_pton(AF_INET, cfg_.iface.c_str(), &iface) != 1) {
    err = "invalid interface address '" + cfg_.iface + "'";
    return false;
  }

  // --- group socket: receives puts and queries ---
  int mfd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (mfd < 0) { err = errno_text("socket"); return false; }

  // several orbcommd/orbcomm processes on one host share the group port
  int one = 1;
  if (::setsockopt(mfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0)
    log::warn(COMP, errno_text("SO_REUSEADDR"));
#ifdef SO_REUSEPORT
  if (::setsockopt(mfd, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one)) != 0)
    log::warn(COMP, errno_text("SO_REUSEPORT"));
#endif

  sockaddr_in bind_addr{};
  bind_addr.sin_family      = AF_INET;
  bind_addr.sin_port        = htons(cfg_.port);
  bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);   // group traffic arrives on any address
  if (::bind(mfd, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) != 0) {
    err = errno_text("bind group port");
    ::close(mfd);
    return false;
  }

  ip_mreq mreq{};
  mreq.imr_multiaddr = group;              // e.g. 239.255.0.47
  mreq.imr_interface = iface;              // 0.0.0.0 lets the kernel pick
  if (::setsockopt(mfd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) != 0) {
    err = errno_text("IP_ADD_MEMBERSHIP");
    ::close(mfd);
    return false;
  }

  // --- unicast socket: sends everything, receives replies ---
  int ufd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (ufd < 0) { err = errno_text("socket"); ::close(mfd); return false; }

  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_port   = 0;   // ephemeral
  local.sin_addr   = iface;
  if (::bind(ufd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) {
    err = errno_text("bind unicast");
    ::close(mfd);
    ::close(ufd);
    return false;
  }

  unsigned char loop = 1;   // local servers must see local queries
  unsigned char ttl  = static_cast<unsigned char>(cfg_.ttl);
  if (::setsockopt(ufd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) != 0)
    log::warn(COMP, errno_text("IP_MULTICAST_LOOP"));
  if (::setsockopt(ufd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) != 0)
    log::warn(COMP, errno_text("IP_MULTICAST_TTL"));
  if (iface.s_addr != htonl(INADDR_ANY) &&
      ::setsockopt(ufd, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) != 0) {
    err = errno_text("IP_MULTICAST_IF");
    ::close(mfd);
    ::close(ufd);
    return false;
  }

  group_dest_ = sockaddr_in{};
  group_dest_.sin_family = AF_INET;
  group_dest_.sin_port   = htons(cfg_.port);
  group_dest_.sin_addr   = group;         // every put and query goes here

  mcast_fd_ = mfd;
  {
    std::lock_guard<std::mutex> lk(ucast_->mu);
    ucast_->fd = ufd;
  }
  rx_failed_ = false;
  running_   = true;
  rx_ = std::thread([this] { rx_loop(); });

  log::info(COMP, "joined " + cfg_.group + ":" + std::to_string(cfg_.port) + " on " + cfg_.iface);
  return true;
}

void UdpTransport::close() {
  if (!running_.exchange(false)) return;
  if (rx_.joinable()) rx_.join();

  ::close(mcast_fd_);
  mcast_fd_ = -1;
  {
    std::lock_guard<std::mutex> lk(ucast_->mu);
    ::close(ucast_->fd);
    ucast_->fd = -1;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
  }
  std::lock_guard<std::mutex> lk(pending_mu_);
  for (auto& kv : pending_) kv.second->close();
  pending_.clear();
}

bool UdpTransport::send_to_group(const std::string& wire) {
  std::lock_guard<std::mutex> lk(ucast_->mu);
  if (ucast_->fd < 0) return false;
  ssize_t n = ::sendto(ucast_->fd, wire.data(), wire.size(), 0,
                       reinterpret_cast<const sockaddr*>(&group_dest_), sizeof(group_dest_));
  if (n != static_cast<ssize_t>(wire.size())) {
    log::warn(COMP, errno_text("sendto"));
    return false;
  }
  return true;
}

TxResult UdpTransport::publish(const std::string& topic, const std::string& payload) {
  if (!running_ || rx_failed_) return TxResult::Error;
  Frame f;
  f.kind    = Frame::Kind::PUT;
  f.topic   = topic;
  f.payload = payload;
  const std::string wire = encode_frame(f);
  if (wire.empty()) return TxResult::Error;
  return send_to_group(wire) ? TxResult::Ok : TxResult::Error;
}

HandleId UdpTransport::subscribe(const std::string& key_expr, SampleHandler handler) {
  if (key_expr.empty() || !handler) return 0;
  std::lock_guard<std::mutex> lk(mu_);
  HandleId id = next_id_++;
  entries_[id] = Entry{key_expr, std::move(handler), nullptr};
  return id;
}

HandleId UdpTransport::declare_queryable(const std::string& key_expr, RequestHandler handler) {
  if (key_expr.empty() || !handler) return 0;
  std::lock_guard<std::mutex> lk(mu_);
  HandleId id = next_id_++;
  entries_[id] = Entry{key_expr, nullptr, std::move(handler)};
  return id;
}

void UdpTransport::undeclare(HandleId id) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.erase(id);
}

QueryResult UdpTransport::query(const std::string& topic, const std::string& payload,
                                std::chrono::milliseconds timeout, std::size_t max_replies) {
  QueryResult res;
  if (!running_) {
    res.status = TxResult::Error;
    res.error  = "transport_closed";
    return res;
  }
  if (rx_failed_) {
    res.status = TxResult::Error;
    res.error  = "receive_loop_failed";   // replies could never arrive
    return res;
  }

  Frame f;
  f.kind     = Frame::Kind::QUERY;
  f.topic    = topic;
  f.payload  = payload;
  f.query_id = qid_prefix_ + "-" + std::to_string(++qid_seq_);

  const std::string wire = encode_frame(f);
  if (wire.empty()) {
    res.status = TxResult::Error;
    res.error  = "frame_too_large";
    return res;
  }

  auto collector = std::make_shared<ReplyCollector>(max_replies);
  {
    std::lock_guard<std::mutex> lk(pending_mu_);
    pending_[f.query_id] = collector;
  }

  if (!send_to_group(wire)) {
    std::lock_guard<std::mutex> lk(pending_mu_);
    pending_.erase(f.query_id);
    res.status = TxResult::Error;
    res.error  = "send_failed";
    return res;
  }

  res.replies = collector->wait(timeout);
  {
    std::lock_guard<std::mutex> lk(pending_mu_);
    pending_.erase(f.query_id);
  }
  if (rx_failed_) {
    res.status = TxResult::Error;
    res.error  = "receive_loop_failed";
    res.replies.clear();
  }
  return res;
}

int UdpTransport::wait_readable(pollfd* fds, nfds_t count, int timeout_ms) {
  return ::poll(fds, count, timeout_ms);
}

void UdpTransport::fail_rx(const std::string& why) {
  log::error(COMP, why + ", receive loop stopped");
  rx_failed_ = true;
  std::lock_guard<std::mutex> lk(pending_mu_);
  for (auto& kv : pending_) kv.second->close();   // wake waiting queries now
}

void UdpTransport::rx_loop() {
  std::vector<char> buf(MAX_FRAME + 1);
  int ufd = -1;
  {
    std::lock_guard<std::mutex> lk(ucast_->mu);
    ufd = ucast_->fd;
  }
  pollfd fds[2] = {{mcast_fd_, POLLIN, 0}, {ufd, POLLIN, 0}};

  while (running_) {
    int pr = wait_readable(fds, 2, POLL_MS);
    if (pr == 0) continue;                 // timeout, recheck running_
    if (pr < 0) {
      if (errno == EINTR) continue;        // signal, not a failure
      fail_rx(errno_text("poll"));
      return;
    }

    for (int i = 0; i < 2; ++i) {
      if (!(fds[i].revents & POLLIN)) continue;

      sockaddr_in src{};
      socklen_t   src_len = sizeof(src);
      ssize_t n = ::recvfrom(fds[i].fd, buf.data(), buf.size(), 0,
                             reinterpret_cast<sockaddr*>(&src), &src_len);
      if (n <= 0) continue;
      if (static_cast<std::size_t>(n) > MAX_FRAME) {
        log::debug(COMP, "dropping oversized datagram");
        continue;
      }

      auto frame = decode_frame(std::string(buf.data(), static_cast<std::size_t>(n)));
      if (!frame) {
        log::debug(COMP, "dropping malformed datagram");
        continue;
      }
      if (i == 0) on_group_frame(*frame, &src, src_len);
      else        on_unicast_frame(*frame);
    }
  }
}

void UdpTransport::on_group_frame(const Frame& f, const void* src, unsigned src_len) {
  if (f.kind == Frame::Kind::REPLY) return;   // replies only travel unicast

  std::vector<Entry> matched;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : entries_) {
      const Entry& e = kv.second;
      bool wanted = (f.kind == Frame::Kind::PUT) ? static_cast<bool>(e.on_sample)
                                                 : static_cast<bool>(e.on_request);
      if (wanted && key_expr_matches(e.key_expr, f.topic)) matched.push_back(e);
    }
  }
  if (matched.empty()) return;

  if (f.kind == Frame::Kind::PUT) {
    Sample s{f.topic, f.payload};
    for (const auto& e : matched) e.on_sample(s);
    return;
  }

  if (src_len < sizeof(sockaddr_in)) return;
  sockaddr_in dest{};
  std::memcpy(&dest, src, sizeof(dest));
  for (const auto& e : matched) {
    Request req{f.topic, f.payload, std::make_shared<UdpReplyChannel>(ucast_, dest, f.query_id)};
    e.on_request(req);
  }
}

void UdpTransport::on_unicast_frame(const Frame& f) {
  if (f.kind != Frame::Kind::REPLY) return;

  std::shared_ptr<ReplyCollector> collector;
  {
    std::lock_guard<std::mutex> lk(pending_mu_);
    auto it = pending_.find(f.query_id);
    if (it == pending_.end()) {
      log::trace(COMP, "late reply for " + f.topic);
      return;
    }
    collector = it->second;
  }
  collector->add(Sample{f.topic, f.payload});
}

} // namespace orbcomm::transport
