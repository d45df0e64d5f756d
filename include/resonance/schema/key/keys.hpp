#pragma once
#include <resonance/schema/primitives.hpp>
#include <string_view>

namespace resonance::schema::key {

inline constexpr auto kMarkerPrefix = std::string_view{"MARKER|"};
inline constexpr auto kWatcherCursorKey = std::string_view{"SYS|WATCHER|CURSOR"};
inline constexpr auto kAnchorStateKey = std::string_view{"SYS|ANCHOR|LAST"};
inline constexpr auto kLatestCommitmentKey =
    std::string_view{"SYS|COMMIT|LATEST"};
inline constexpr auto kSupplyStateKey = std::string_view{"SYS|SUPPLY|STATE"};

bytes_t make_marker_key(const hash32_t& marker_id);
bytes_t make_system_key(const std::string_view& name);

/// Id of a marker synthesized for a confirmation with no local intent.
/// Stable per external reference so replayed batches reuse it.
hash32_t make_synthesized_marker_id(const std::string_view& external_ref);

}  // namespace resonance::schema::key
