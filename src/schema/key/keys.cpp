#include <resonance/blake3/hash.hpp>
#include <resonance/schema/key/builder.hpp>
#include <resonance/schema/key/keys.hpp>

namespace resonance::schema::key {

bytes_t make_marker_key(const hash32_t& marker_id) {
  return builder{kMarkerPrefix}.write(marker_id).data;
}

bytes_t make_system_key(const std::string_view& name) {
  return builder{name}.data;
}

hash32_t make_synthesized_marker_id(const std::string_view& external_ref) {
  return resonance::blake3::hasher{}
      .update(std::string_view{"SYNTHESIZED|"})
      .update(external_ref)
      .finalize();
}

}  // namespace resonance::schema::key
