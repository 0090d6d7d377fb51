/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include <optional>

template <typename T>
  requires fmt::is_formattable<T>::value
struct fmt::formatter<std::optional<T>> : fmt::formatter<T> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    return fmt::formatter<T>::parse(ctx);
  }

  template <typename FormatContext>
  auto format(const std::optional<T> &opt, FormatContext &ctx) const {
    if (opt.has_value()) {
      return fmt::formatter<T>::format(opt.value(), ctx);
    }
    return fmt::format_to(ctx.out(), "<none>");
  }
};
