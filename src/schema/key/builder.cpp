#include <resonance/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>

using namespace resonance::schema::key;

builder::builder(const std::string_view& prefix) {
  write(prefix);
}

builder& builder::write(const std::string_view& str) {
  std::ranges::copy(str, std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy(bytes, std::back_inserter(data));
  return *this;
}

resonance::schema::bytes_view_t builder::view() const {
  return resonance::schema::bytes_view_t{data.data(), data.size()};
}
