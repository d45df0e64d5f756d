#pragma once
#include <resonance/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace resonance::storage {

using key_value_entry_t =
    std::pair<resonance::schema::bytes_t, resonance::schema::bytes_t>;

/// Durable key/value state shared by the marker table, watcher cursor,
/// anchor publisher and supply controller.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const resonance::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const resonance::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const resonance::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace resonance::storage
