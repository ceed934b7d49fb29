// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/transport/transport_dialer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "guise/tls/client_hello_builder.h"
#include "guise/tls/grease.h"

namespace guise {
namespace transport {

TransportDialer::TransportDialer(core::Reactor* reactor,
                                 util::DnsResolver* resolver,
                                 tls::TlsContextStore* contexts,
                                 const profile::ProfileRegistry* registry,
                                 HttpVersionPref http_version)
    : reactor_(reactor),
      resolver_(resolver),
      contexts_(contexts),
      registry_(registry),
      http_version_(http_version),
      alive_(std::make_shared<bool>(true)) {}

TransportDialer::~TransportDialer() {
  *alive_ = false;
  for (auto& [id, dial] : pending_) {
    if (dial->timer != 0) {
      reactor_->CancelTimer(dial->timer);
    }
  }
  if (!pending_.empty()) {
    SPDLOG_DEBUG("dialer: dropping {} pending dial(s)", pending_.size());
  }
  pending_.clear();
}

TransportDialer::PendingDial* TransportDialer::Find(uint64_t id) {
  auto it = pending_.find(id);
  return it == pending_.end() ? nullptr : it->second.get();
}

void TransportDialer::Dial(const pool::DialRequest& request,
                           pool::DialCallback callback) {
  auto profile = registry_->Lookup(request.key.profile);
  if (!profile) {
    callback(profile.error());
    return;
  }

  // Fingerprint problems surface before any I/O
  tls::ClientHelloBuilder builder(tls::TlsEngineCapabilities::BoringSsl(),
                                  http_version_);
  auto plan = builder.Build(*profile.value(), request.key.host, false,
                            tls::GreaseSeed());
  if (!plan) {
    callback(plan.error());
    return;
  }

  auto context = contexts_->Get(*profile.value());
  if (!context) {
    callback(context.error());
    return;
  }

  auto dial = std::make_unique<PendingDial>();
  dial->id = next_id_++;
  dial->key = request.key;
  dial->profile = profile.value();
  dial->context = std::move(context).value();
  dial->callback = std::move(callback);
  dial->timeout_ms = static_cast<uint64_t>(std::max<int64_t>(
      1, static_cast<int64_t>(request.timeout.count())));

  const uint64_t id = dial->id;
  dial->timer = reactor_->AddTimer(dial->timeout_ms, 0,
                                   [this, id, alive = alive_] {
                                     if (*alive) OnTimeout(id);
                                   });

  // Name to connect to: the proxy's, or the destination's
  const std::string host =
      dial->key.proxy ? dial->key.proxy->host : dial->key.host;
  pending_.emplace(id, std::move(dial));

  SPDLOG_DEBUG("dialer: resolving {}", host);
  resolver_->ResolveAsync(
      host, [this, id, alive = alive_](
                const std::vector<util::ResolvedAddress>& addrs,
                const std::string& error) {
        if (*alive) OnResolved(id, addrs, error);
      });
}

void TransportDialer::OnResolved(
    uint64_t id, const std::vector<util::ResolvedAddress>& addrs,
    const std::string& error) {
  PendingDial* dial = Find(id);
  if (dial == nullptr) {
    return;
  }

  if (!error.empty() || addrs.empty()) {
    Complete(id, Error::Dial(DialStage::kResolve,
                             error.empty() ? "no addresses" : error));
    return;
  }
  dial->addresses = addrs;

  // SOCKS4 and SOCKS5 carry an address, not a name
  const auto& proxy = dial->key.proxy;
  if (proxy && !proxy->ResolvesRemotely()) {
    resolver_->ResolveAsync(
        dial->key.host, [this, id, alive = alive_](
                            const std::vector<util::ResolvedAddress>& target,
                            const std::string& target_error) {
          if (*alive) OnTargetResolved(id, target, target_error);
        });
    return;
  }

  Connect(id);
}

void TransportDialer::OnTargetResolved(
    uint64_t id, const std::vector<util::ResolvedAddress>& addrs,
    const std::string& error) {
  PendingDial* dial = Find(id);
  if (dial == nullptr) {
    return;
  }
  if (!error.empty() || addrs.empty()) {
    Complete(id, Error::Dial(DialStage::kResolve,
                             error.empty() ? "no addresses" : error));
    return;
  }

  const bool ipv4_only = dial->key.proxy->scheme == pool::ProxyScheme::kSocks4;
  auto it = std::find_if(addrs.begin(), addrs.end(),
                         [ipv4_only](const util::ResolvedAddress& a) {
                           return !ipv4_only || !a.is_ipv6;
                         });
  if (it == addrs.end()) {
    Complete(id, Error::Dial(DialStage::kResolve,
                             "no IPv4 address for " + dial->key.host));
    return;
  }
  dial->target_ip = it->ip;
  Connect(id);
}

void TransportDialer::Connect(uint64_t id) {
  PendingDial* dial = Find(id);
  if (dial == nullptr) {
    return;
  }

  core::ConnectionParams params;
  params.key = dial->key;
  params.profile = dial->profile;
  params.tls_context = dial->context;
  params.http_version = http_version_;
  params.addresses = dial->addresses;
  params.target_ip = dial->target_ip;

  dial->connection =
      std::make_unique<core::Connection>(reactor_, std::move(params));
  dial->connection->Establish([this, id, alive = alive_](const Error& error) {
    if (*alive) OnEstablished(id, error);
  });
}

void TransportDialer::OnEstablished(uint64_t id, const Error& error) {
  PendingDial* dial = Find(id);
  if (dial == nullptr) {
    return;
  }
  if (error) {
    Complete(id, error);
    return;
  }
  std::unique_ptr<pool::Transport> transport = std::move(dial->connection);
  Complete(id, std::move(transport));
}

void TransportDialer::OnTimeout(uint64_t id) {
  PendingDial* dial = Find(id);
  if (dial == nullptr) {
    return;
  }
  // The timer already fired; nothing to cancel
  dial->timer = 0;

  DialStage stage =
      dial->connection ? dial->connection->stage() : DialStage::kResolve;
  Complete(id, Error::Dial(stage, "timed out after " +
                                      std::to_string(dial->timeout_ms) +
                                      " ms"));
}

void TransportDialer::Complete(
    uint64_t id, Result<std::unique_ptr<pool::Transport>> result) {
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return;
  }
  std::unique_ptr<PendingDial> dial = std::move(it->second);
  pending_.erase(it);

  if (dial->timer != 0) {
    reactor_->CancelTimer(dial->timer);
  }
  if (!result) {
    SPDLOG_DEBUG("dialer: {} failed: {}", dial->key.ToString(),
                 result.error().ToString());
  }

  // A failed connection closes here, outside its own call stack
  dial->connection.reset();
  dial->callback(std::move(result));
}

}  // namespace transport
}  // namespace guise
