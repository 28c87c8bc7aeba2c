#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace ferry {

struct TaskTag {};

// Phantom-typed id so a task id can't be mixed up with a path or any other
// string.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }
  [[nodiscard]] auto size() const -> std::size_t { return value_.size(); }

  [[nodiscard]] auto starts_with(std::string_view prefix) const -> bool {
    return value_.starts_with(prefix);
  }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs,
                                       const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;

// Random (version 4) UUID string.
inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

inline auto generate_task_id() -> TaskId {
  return TaskId{generate_uuid()};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace ferry

template <typename Tag>
struct std::hash<ferry::TypedId<Tag>> {
  auto operator()(const ferry::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<ferry::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const ferry::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
