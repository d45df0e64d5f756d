#pragma once

#include <resonance/crypto/key_material.hpp>
#include <resonance/schema/primitives.hpp>
#include <resonance/storage/record_store.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <memory>
#include <string_view>
#include <system_error>

namespace resonance::testing {

inline resonance::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = resonance::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline resonance::schema::key32_t make_key(const uint8_t seed) {
  return make_hash(seed);
}

inline resonance::crypto::key_material make_keys(const uint8_t seed = 1) {
  return resonance::crypto::key_material{make_key(seed),
                                         make_key(static_cast<uint8_t>(seed + 100))};
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes the directory when the test scope ends.
struct scoped_path final {
  explicit scoped_path(const std::string_view prefix)
      : path{make_db_path(prefix)} {}
  ~scoped_path() { remove_path(path); }

  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;

  std::string path;
};

/// Occupy the blob path of `external_ref` with a directory so the next put
/// for it fails at the final rename. Returns the blocking path.
inline std::filesystem::path block_record(
    const std::string& directory,
    const resonance::storage::record_store& store,
    const std::string_view external_ref) {
  auto blocked = std::filesystem::path{directory} /
                 (resonance::schema::to_hex(store.derive_id(external_ref)) +
                  ".blob");
  std::filesystem::create_directory(blocked);
  return blocked;
}

/// Routes the default logger into memory for the lifetime of the object.
class captured_log final {
 public:
  captured_log()
      : sink_{std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(128)},
        previous_{spdlog::default_logger()} {
    auto logger = std::make_shared<spdlog::logger>("captured", sink_);
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(std::move(logger));
  }
  ~captured_log() { spdlog::set_default_logger(previous_); }

  captured_log(const captured_log&) = delete;
  captured_log& operator=(const captured_log&) = delete;

  bool contains(const std::string_view text) const {
    auto lines = sink_->last_formatted();
    return std::any_of(std::begin(lines), std::end(lines),
                       [&](const std::string& line) {
                         return line.find(text) != std::string::npos;
                       });
  }

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
  std::shared_ptr<spdlog::logger> previous_;
};

}  // namespace resonance::testing
