#pragma once
#include <guild/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace guild::storage {

using key_value_entry_t =
    std::pair<guild::schema::bytes_t, guild::schema::bytes_t>;

/// Last committed ledger checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  guild::schema::hash32_t state_root{};
};

/// Set of row writes that must land together or not at all.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<guild::schema::bytes_t> deletes;
  std::optional<committed_state> committed;

  bool empty() const {
    return puts.empty() && deletes.empty() && !committed.has_value();
  }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const guild::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const guild::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent committed checkpoint (sequence + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (sequence + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const guild::schema::bytes_view_t& prefix) const;

  /// Atomically apply every put/delete in the batch.
  void commit(const write_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace guild::storage
