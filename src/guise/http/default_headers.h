// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// Request header assembly: profile defaults, caller overrides, caller order.
// Free functions over plain data.

#ifndef GUISE_HTTP_DEFAULT_HEADERS_H_
#define GUISE_HTTP_DEFAULT_HEADERS_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "guise/profile/impersonation_profile.h"
#include "guise/types.h"

namespace guise {
namespace http {
namespace headers {

struct MergeOptions {
  // Start from the profile's default headers
  bool apply_profile_headers = true;

  // Names to move to the front, in this order (case-insensitive). Headers
  // not listed keep their relative order behind them.
  std::vector<std::string> header_order;

  // Request body size; a content-length is added for non-empty bodies
  size_t body_size = 0;
};

// Profile defaults in browser order; a caller header with the same name
// replaces the default value in place, new names are appended.
Headers Merge(const profile::HeaderProfile& profile, const Headers& user,
              const MergeOptions& options);

// Stable reorder: names in `order` first, in that order
void ApplyOrder(Headers& headers, const std::vector<std::string>& order);

// Replaces the first header named `name`, or appends it
void Set(Headers& headers, std::string_view name, std::string_view value);

bool Has(const Headers& headers, std::string_view name);

}  // namespace headers
}  // namespace http
}  // namespace guise

#endif  // GUISE_HTTP_DEFAULT_HEADERS_H_
