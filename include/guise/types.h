// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TYPES_H_
#define GUISE_TYPES_H_

#include <string>
#include <string_view>
#include <vector>

namespace guise {

// HTTP header pair
struct Header {
  std::string name;
  std::string value;
};

// Collection of HTTP headers, order preserved
using Headers = std::vector<Header>;

// ASCII case-insensitive comparison for header names
bool EqualsIgnoreCase(std::string_view a, std::string_view b);

// Returns the value of the first header named `name`, or "" if absent
std::string_view FindHeader(const Headers& headers, std::string_view name);

}  // namespace guise

#endif  // GUISE_TYPES_H_
