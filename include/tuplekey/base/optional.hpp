#pragma once

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>

namespace tuplekey {

#ifdef DEBUG
#define TK_DCHECK_HAS_VALUE assert(has_value() && "No value present in Optional");
#else
#define TK_DCHECK_HAS_VALUE
#endif

/// A move-only optional value, returned by lookups and parsers that have no
/// error detail to report. A moved-from Optional is empty.
template <typename T>
  requires(!std::is_void_v<T>)
class [[nodiscard]] Optional {
public:
  Optional() = default;

  Optional(std::nullopt_t) { // NOLINT (google-explicit-constructor)
  }

  Optional(T&& v) : opt_(std::move(v)) { // NOLINT (google-explicit-constructor)
  }

  Optional(const T& v) : opt_(v) { // NOLINT (google-explicit-constructor)
  }

  Optional(const Optional&) = delete;
  Optional& operator=(const Optional&) = delete;

  Optional(Optional&& other) noexcept : opt_(std::exchange(other.opt_, std::nullopt)) {
  }

  Optional& operator=(Optional&& other) noexcept {
    if (this != &other) {
      opt_ = std::exchange(other.opt_, std::nullopt);
    }
    return *this;
  }

  constexpr bool has_value() const noexcept { // NOLINT: mimicking std::optional
    return opt_.has_value();
  }

  explicit operator bool() const noexcept {
    return has_value();
  }

  constexpr const T& value() const& { // NOLINT: mimicking std::optional
    TK_DCHECK_HAS_VALUE;
    return *opt_;
  }

  constexpr T value_or(T fallback) const& { // NOLINT: mimicking std::optional
    return has_value() ? *opt_ : std::move(fallback);
  }

  constexpr const T& operator*() const& {
    return value();
  }

  constexpr const T* operator->() const {
    return &value();
  }

private:
  std::optional<T> opt_;
};

#undef TK_DCHECK_HAS_VALUE

} // namespace tuplekey
