#pragma once

#include "sqlrpc/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace sqlrpc {

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  // RFC 4122 version 4, variant 1
  a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

// 2024-01-02T03:04:05.123456Z
inline auto format_timestamp_precise(std::chrono::system_clock::time_point tp)
    -> std::string {
  auto us = std::chrono::floor<std::chrono::microseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", us);
}

inline auto format_timestamp_precise() -> std::string {
  return format_timestamp_precise(std::chrono::system_clock::now());
}

[[nodiscard]] auto decode_base64(std::string_view input)
    -> std::optional<std::string>;

[[nodiscard]] auto encode_base64(std::string_view input) -> std::string;

[[nodiscard]] auto trim(std::string_view s) noexcept -> std::string_view;

[[nodiscard]] auto read_file(const std::filesystem::path& path)
    -> Result<std::string>;

}  // namespace sqlrpc
