#include "sqlrpc/util/util.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <sstream>

namespace sqlrpc {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr auto make_decode_table() -> std::array<std::int8_t, 256> {
  std::array<std::int8_t, 256> table{};
  table.fill(-1);
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] =
        static_cast<std::int8_t>(i);
  }
  // URL-safe variants
  table[static_cast<unsigned char>('-')] = 62;
  table[static_cast<unsigned char>('_')] = 63;
  return table;
}

constexpr auto kDecodeTable = make_decode_table();

}  // namespace

auto decode_base64(std::string_view input) -> std::optional<std::string> {
  std::string out;
  out.reserve(input.size() / 4 * 3);

  std::uint32_t acc = 0;
  int bits = 0;
  std::size_t padding = 0;

  for (char c : input) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    if (c == '=') {
      ++padding;
      continue;
    }
    if (padding > 0) {
      return std::nullopt;
    }
    auto v = kDecodeTable[static_cast<unsigned char>(c)];
    if (v < 0) {
      return std::nullopt;
    }
    acc = (acc << 6) | static_cast<std::uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((acc >> bits) & 0xFF));
    }
  }

  if (padding > 2 || bits >= 6) {
    return std::nullopt;
  }
  return out;
}

auto encode_base64(std::string_view input) -> std::string {
  std::string out;
  out.reserve((input.size() + 2) / 3 * 4);

  std::size_t i = 0;
  for (; i + 2 < input.size(); i += 3) {
    auto n = (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i]))
              << 16) |
             (static_cast<std::uint32_t>(
                  static_cast<unsigned char>(input[i + 1]))
              << 8) |
             static_cast<unsigned char>(input[i + 2]);
    out.push_back(kAlphabet[(n >> 18) & 63]);
    out.push_back(kAlphabet[(n >> 12) & 63]);
    out.push_back(kAlphabet[(n >> 6) & 63]);
    out.push_back(kAlphabet[n & 63]);
  }

  auto rest = input.size() - i;
  if (rest == 1) {
    auto n = static_cast<std::uint32_t>(static_cast<unsigned char>(input[i]))
             << 16;
    out.push_back(kAlphabet[(n >> 18) & 63]);
    out.push_back(kAlphabet[(n >> 12) & 63]);
    out.append("==");
  } else if (rest == 2) {
    auto n = (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i]))
              << 16) |
             (static_cast<std::uint32_t>(
                  static_cast<unsigned char>(input[i + 1]))
              << 8);
    out.push_back(kAlphabet[(n >> 18) & 63]);
    out.push_back(kAlphabet[(n >> 12) & 63]);
    out.push_back(kAlphabet[(n >> 6) & 63]);
    out.push_back('=');
  }
  return out;
}

auto trim(std::string_view s) noexcept -> std::string_view {
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return fail(Error::FileOpenFailed);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace sqlrpc
