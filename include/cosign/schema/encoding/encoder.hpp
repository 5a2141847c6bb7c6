#pragma once
#include <cosign/schema/primitives.hpp>
#include <optional>
#include <span>

namespace cosign::schema::encoding {

// Encoding is a build-time choice: callers hold an encoder<Library> and the
// specialization for the chosen library supplies the implementation.
template <typename Library>
struct encoder {
  template <typename T>
  cosign::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cosign::schema::bytes_t& out);

  template <typename T>
  T decode(const cosign::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cosign::schema::bytes_view_t& bytes);
};

}  // namespace cosign::schema::encoding
