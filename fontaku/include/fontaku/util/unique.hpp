#pragma once
#include <utility>

namespace fontaku {
///
/// \brief Sole owner of a handle (raw pointer or small struct), released through Deleter.
///
/// Deleter must accept a default constructed Type (an empty handle).
///
template <typename Type, typename Deleter>
class Unique {
  public:
	constexpr Unique(Type t = {}, Deleter deleter = {}) : m_t{std::move(t)}, m_deleter{std::move(deleter)} {}

	constexpr Unique(Unique&& rhs) noexcept : Unique() { swap(rhs); }
	constexpr Unique& operator=(Unique rhs) noexcept { return (swap(rhs), *this); }
	constexpr ~Unique() noexcept { m_deleter(std::move(m_t)); }

	constexpr void swap(Unique& rhs) noexcept {
		using std::swap;
		swap(m_t, rhs.m_t);
		swap(m_deleter, rhs.m_deleter);
	}

	constexpr Type& get() { return m_t; }
	constexpr Type const& get() const { return m_t; }

	constexpr operator Type const&() const { return get(); }

  private:
	Type m_t{};
	[[no_unique_address]] Deleter m_deleter{};
};
} // namespace fontaku
