// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TRANSPORT_TRANSPORT_DIALER_H_
#define GUISE_TRANSPORT_TRANSPORT_DIALER_H_

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "guise/config.h"
#include "guise/core/connection.h"
#include "guise/core/reactor.h"
#include "guise/pool/dialer.h"
#include "guise/profile/profile_registry.h"
#include "guise/tls/tls_context.h"
#include "guise/util/dns_resolver.h"

namespace guise {
namespace transport {

// Production Dialer: resolve, bind, connect, proxy handshake, TLS with the
// profile's ClientHello, ALPN check, HTTP/2 preface. Runs on one reactor
// and must only be called from its thread. Never retries.
class TransportDialer : public pool::Dialer {
 public:
  // All pointers must outlive the dialer
  TransportDialer(core::Reactor* reactor, util::DnsResolver* resolver,
                  tls::TlsContextStore* contexts,
                  const profile::ProfileRegistry* registry,
                  HttpVersionPref http_version);
  ~TransportDialer() override;

  TransportDialer(const TransportDialer&) = delete;
  TransportDialer& operator=(const TransportDialer&) = delete;
  TransportDialer(TransportDialer&&) = delete;
  TransportDialer& operator=(TransportDialer&&) = delete;

  // Configuration errors (unknown profile, TLS versions the engine cannot
  // negotiate) are reported before any I/O, from inside this call.
  void Dial(const pool::DialRequest& request,
            pool::DialCallback callback) override;

  size_t pending() const { return pending_.size(); }

 private:
  struct PendingDial {
    uint64_t id = 0;
    pool::IdentityKey key;
    const profile::ImpersonationProfile* profile = nullptr;
    std::shared_ptr<tls::TlsContext> context;
    pool::DialCallback callback;

    std::vector<util::ResolvedAddress> addresses;
    std::string target_ip;
    std::unique_ptr<core::Connection> connection;
    core::TimerId timer = 0;
    uint64_t timeout_ms = 0;
  };

  void OnResolved(uint64_t id, const std::vector<util::ResolvedAddress>& addrs,
                  const std::string& error);
  void OnTargetResolved(uint64_t id,
                        const std::vector<util::ResolvedAddress>& addrs,
                        const std::string& error);
  void Connect(uint64_t id);
  void OnEstablished(uint64_t id, const Error& error);
  void OnTimeout(uint64_t id);

  // Removes the dial and reports `result` to its owner
  void Complete(uint64_t id, Result<std::unique_ptr<pool::Transport>> result);

  PendingDial* Find(uint64_t id);

  core::Reactor* reactor_;
  util::DnsResolver* resolver_;
  tls::TlsContextStore* contexts_;
  const profile::ProfileRegistry* registry_;
  HttpVersionPref http_version_;

  uint64_t next_id_ = 1;
  std::unordered_map<uint64_t, std::unique_ptr<PendingDial>> pending_;

  // Cleared in the destructor so resolver and timer callbacks do not touch
  // a dead dialer
  std::shared_ptr<bool> alive_;
};

}  // namespace transport
}  // namespace guise

#endif  // GUISE_TRANSPORT_TRANSPORT_DIALER_H_
