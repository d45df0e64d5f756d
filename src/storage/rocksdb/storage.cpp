#include <resonance/common/critical.hpp>
#include <resonance/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace resonance::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  // RocksDB creates the database directory but not its parents.
  auto parent = std::filesystem::path{path}.parent_path();
  if (!parent.empty()) {
    auto ec = std::error_code{};
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      resonance::common::critical("Cannot create state directory {}: {}",
                                  parent.string(), ec.message());
    }
  }

  // Reconciler state is a few small keys written on every batch; keep the
  // footprint modest and the info log bounded.
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.max_open_files = 256;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    resonance::common::critical("Failed to open RocksDB at {}: {}", path,
                                status.ToString());
  }
  spdlog::info("Opened reconciler state at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace resonance::storage
