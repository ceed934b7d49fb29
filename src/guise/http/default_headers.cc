// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/http/default_headers.h"

#include <algorithm>

namespace guise {
namespace http {
namespace headers {

namespace {

// Position of `name` in `order`, or order.size() if unlisted
size_t OrderIndex(const std::vector<std::string>& order,
                  std::string_view name) {
  for (size_t i = 0; i < order.size(); ++i) {
    if (EqualsIgnoreCase(order[i], name)) {
      return i;
    }
  }
  return order.size();
}

}  // namespace

bool Has(const Headers& headers, std::string_view name) {
  return std::any_of(headers.begin(), headers.end(), [name](const Header& h) {
    return EqualsIgnoreCase(h.name, name);
  });
}

void Set(Headers& headers, std::string_view name, std::string_view value) {
  for (auto& h : headers) {
    if (EqualsIgnoreCase(h.name, name)) {
      h.value = std::string(value);
      return;
    }
  }
  headers.push_back({std::string(name), std::string(value)});
}

void ApplyOrder(Headers& headers, const std::vector<std::string>& order) {
  if (order.empty()) {
    return;
  }
  std::stable_sort(headers.begin(), headers.end(),
                   [&order](const Header& a, const Header& b) {
                     return OrderIndex(order, a.name) <
                            OrderIndex(order, b.name);
                   });
}

Headers Merge(const profile::HeaderProfile& profile, const Headers& user,
              const MergeOptions& options) {
  Headers out;
  if (options.apply_profile_headers) {
    out = profile.headers;
  }

  for (const auto& h : user) {
    Set(out, h.name, h.value);
  }

  if (options.body_size > 0) {
    Set(out, "content-length", std::to_string(options.body_size));
  }

  ApplyOrder(out, options.header_order);
  return out;
}

}  // namespace headers
}  // namespace http
}  // namespace guise
