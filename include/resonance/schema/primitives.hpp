#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace resonance::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using key32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

/// Opaque key/value payload attached to intents and records. Never
/// interpreted by the ledger beyond marker correlation.
using payload_t = std::map<std::string, std::string>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// Parse a non-negative decimal amount. Rejects signs, blanks and overflow.
std::optional<amount_t> try_parse_amount(const std::string_view decimal);
std::string to_string(const amount_t& amount);

timestamp_milliseconds_t now_milliseconds();

}  // namespace resonance::schema
