#include <resonance/common/critical.hpp>
#include <resonance/crypto/cipher.hpp>
#include <resonance/crypto/digest.hpp>
#include <resonance/schema/encoding/scale/encoder.hpp>
#include <resonance/storage/record_store.hpp>

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

using namespace resonance::schema;

namespace {

constexpr auto kBlobExtension = std::string_view{".blob"};
constexpr auto kTempExtension = std::string_view{".tmp"};

std::string errno_message(const std::string_view what) {
  return std::string{what} + ": " + std::strerror(errno);
}

bool write_all(const int fd, const bytes_view_t& bytes, std::string& error) {
  auto offset = std::size_t{0};
  while (offset < bytes.size()) {
    auto written = ::write(fd, bytes.data() + offset, bytes.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = errno_message("write failed");
      return false;
    }
    offset += static_cast<std::size_t>(written);
  }
  return true;
}

bool sync_directory(const std::filesystem::path& directory,
                    std::string& error) {
  auto fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    error = errno_message("failed to open record directory for sync");
    return false;
  }
  auto ok = ::fsync(fd) == 0;
  if (!ok) {
    error = errno_message("failed to sync record directory");
  }
  ::close(fd);
  return ok;
}

// Temp file + fsync + rename. The destination either keeps its previous
// content or holds the complete new blob.
bool write_atomically(const std::filesystem::path& destination,
                      const bytes_view_t& bytes,
                      std::string& error) {
  auto suffix = std::array<uint8_t, 8>{};
  if (!resonance::crypto::random_bytes(suffix)) {
    error = "failed to generate temporary file name";
    return false;
  }
  auto temp_path = destination;
  temp_path += "." + to_hex(bytes_view_t{suffix.data(), suffix.size()}) +
               std::string{kTempExtension};

  auto fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                   S_IRUSR | S_IWUSR);
  if (fd < 0) {
    error = errno_message("failed to create temporary blob");
    return false;
  }
  auto ok = write_all(fd, bytes, error);
  if (ok && ::fsync(fd) != 0) {
    error = errno_message("failed to sync temporary blob");
    ok = false;
  }
  if (::close(fd) != 0 && ok) {
    error = errno_message("failed to close temporary blob");
    ok = false;
  }

  auto ec = std::error_code{};
  if (ok) {
    std::filesystem::rename(temp_path, destination, ec);
    if (ec) {
      error = "failed to move blob into place: " + ec.message();
      ok = false;
    }
  }
  if (!ok) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  return sync_directory(destination.parent_path(), error);
}

std::optional<bytes_t> read_file(const std::filesystem::path& path,
                                 std::string& error) {
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    error = "failed to open '" + path.string() + "'";
    return std::nullopt;
  }
  auto bytes = bytes_t{std::istreambuf_iterator<char>{stream},
                       std::istreambuf_iterator<char>{}};
  if (stream.bad()) {
    error = "failed to read '" + path.string() + "'";
    return std::nullopt;
  }
  return bytes;
}

}  // namespace

namespace resonance::storage {

record_store::record_store(std::filesystem::path directory,
                           const resonance::crypto::key_material& keys)
    : directory_{std::move(directory)}, keys_{keys} {
  auto ec = std::error_code{};
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    resonance::common::critical("Failed to create record directory {}: {}",
                                directory_.string(), ec.message());
  }

  auto stray = std::vector<std::filesystem::path>{};
  for (const auto& entry :
       std::filesystem::directory_iterator{directory_, ec}) {
    if (entry.path().extension().string() == kTempExtension) {
      stray.push_back(entry.path());
    }
  }
  if (ec) {
    resonance::common::critical("Failed to scan record directory {}: {}",
                                directory_.string(), ec.message());
  }
  auto removed = 0u;
  for (const auto& path : stray) {
    auto remove_ec = std::error_code{};
    if (std::filesystem::remove(path, remove_ec)) {
      ++removed;
    }
  }
  if (removed > 0) {
    spdlog::warn("Removed {} interrupted blob write(s) from {}", removed,
                 directory_.string());
  }
  spdlog::info("Record store ready at {} with {} record(s)",
               directory_.string(), size());
}

hash32_t record_store::derive_id(const std::string_view& external_ref) const {
  return resonance::crypto::hmac_sha256(keys_.identity_key(),
                                        make_bytes_view(external_ref));
}

std::optional<put_receipt_t> record_store::put(
    const std::string_view& external_ref,
    const record_payload_t& payload,
    const payload_t& metadata,
    std::string& error) const {
  auto resonance_id = derive_id(external_ref);
  auto record = confirmed_record_t{.resonance_id = resonance_id,
                                   .external_ref = std::string{external_ref},
                                   .from_party = payload.from_party,
                                   .to_party = payload.to_party,
                                   .value = payload.value,
                                   .cursor_position = payload.cursor_position,
                                   .created_at = now_milliseconds(),
                                   .metadata = metadata};

  auto encoder = scale_encoder_t{};
  auto plaintext = encoder.encode(record);
  auto sealed = resonance::crypto::seal(
      keys_.encryption_key(), bytes_view_t{plaintext.data(), plaintext.size()},
      bytes_view_t{resonance_id.data(), resonance_id.size()}, error);
  if (!sealed) {
    return std::nullopt;
  }

  if (!write_atomically(blob_path(resonance_id),
                        bytes_view_t{sealed->data(), sealed->size()}, error)) {
    spdlog::error("Failed to store record for {}: {}", external_ref, error);
    return std::nullopt;
  }

  auto receipt = put_receipt_t{
      .resonance_id = resonance_id,
      .blob_digest = resonance::crypto::sha256(
          bytes_view_t{sealed->data(), sealed->size()})};
  spdlog::debug("Stored record {} for {}", to_hex(resonance_id), external_ref);
  return receipt;
}

std::optional<confirmed_record_t> record_store::get(
    const hash32_t& resonance_id,
    std::string& error) const {
  auto path = blob_path(resonance_id);
  auto ec = std::error_code{};
  if (!std::filesystem::exists(path, ec)) {
    error = "record " + to_hex(resonance_id) + " not found";
    return std::nullopt;
  }
  auto sealed = read_file(path, error);
  if (!sealed) {
    return std::nullopt;
  }
  auto plaintext = resonance::crypto::open(
      keys_.encryption_key(), bytes_view_t{sealed->data(), sealed->size()},
      bytes_view_t{resonance_id.data(), resonance_id.size()}, error);
  if (!plaintext) {
    error = "record " + to_hex(resonance_id) + ": " + error;
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  auto record = encoder.try_decode<confirmed_record_t>(
      bytes_view_t{plaintext->data(), plaintext->size()});
  if (!record) {
    error = "record " + to_hex(resonance_id) + " failed to decode";
    return std::nullopt;
  }
  return record;
}

bool record_store::contains(const hash32_t& resonance_id) const {
  auto ec = std::error_code{};
  return std::filesystem::is_regular_file(blob_path(resonance_id), ec);
}

std::optional<std::vector<record_leaf_t>> record_store::enumerate(
    std::string& error) const {
  auto ids = std::vector<hash32_t>{};
  auto ec = std::error_code{};
  for (const auto& entry :
       std::filesystem::directory_iterator{directory_, ec}) {
    const auto& path = entry.path();
    if (path.extension().string() != kBlobExtension) {
      continue;
    }
    auto type_ec = std::error_code{};
    if (!entry.is_regular_file(type_ec)) {
      spdlog::warn("Ignoring non-file entry {} in record store",
                   path.string());
      continue;
    }
    auto id = try_make_hash32(path.stem().string());
    if (!id) {
      spdlog::warn("Ignoring unexpected file {} in record store",
                   path.string());
      continue;
    }
    ids.push_back(*id);
  }
  if (ec) {
    error = "failed to list record directory: " + ec.message();
    return std::nullopt;
  }

  // Directory listing order is unspecified; leaves must not depend on it.
  std::sort(std::begin(ids), std::end(ids));

  auto leaves = std::vector<record_leaf_t>{};
  leaves.reserve(ids.size());
  for (const auto& id : ids) {
    auto blob = read_file(blob_path(id), error);
    if (!blob) {
      return std::nullopt;
    }
    leaves.push_back(record_leaf_t{
        .resonance_id = id,
        .blob_digest = resonance::crypto::sha256(
            bytes_view_t{blob->data(), blob->size()})});
  }
  return leaves;
}

std::optional<std::vector<hash32_t>> record_store::enumerate_hashes(
    std::string& error) const {
  auto leaves = enumerate(error);
  if (!leaves) {
    return std::nullopt;
  }
  auto hashes = std::vector<hash32_t>{};
  hashes.reserve(leaves->size());
  std::transform(std::begin(*leaves), std::end(*leaves),
                 std::back_inserter(hashes),
                 [](const record_leaf_t& leaf) { return leaf.blob_digest; });
  return hashes;
}

std::size_t record_store::size() const {
  auto count = std::size_t{0};
  auto ec = std::error_code{};
  for (const auto& entry :
       std::filesystem::directory_iterator{directory_, ec}) {
    auto type_ec = std::error_code{};
    if (entry.path().extension().string() == kBlobExtension &&
        entry.is_regular_file(type_ec)) {
      ++count;
    }
  }
  if (ec) {
    spdlog::warn("Record count for {} is partial: {}", directory_.string(),
                 ec.message());
  }
  return count;
}

std::filesystem::path record_store::blob_path(
    const hash32_t& resonance_id) const {
  return directory_ / (to_hex(resonance_id) + std::string{kBlobExtension});
}

}  // namespace resonance::storage
