/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include <boost/multiprecision/cpp_int.hpp>

template <typename Backend, boost::multiprecision::expression_template_option ET>
struct fmt::formatter<boost::multiprecision::number<Backend, ET>>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const boost::multiprecision::number<Backend, ET> &value,
              FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(value.str(), ctx);
  }
};
