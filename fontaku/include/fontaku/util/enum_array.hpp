#pragma once
#include <cstddef>
#include <type_traits>

namespace fontaku {
template <typename Type>
concept EnumT = std::is_enum_v<Type>;

///
/// \brief Fixed array with one Type per enumerator of E, indexed by E.
///
/// E must end with eCOUNT_.
///
template <EnumT E, typename Type, std::size_t Size = static_cast<std::size_t>(E::eCOUNT_)>
struct EnumArray {
	Type t[Size]{};

	constexpr Type& operator[](E const e) { return t[static_cast<std::size_t>(e)]; }
	constexpr Type const& operator[](E const e) const { return t[static_cast<std::size_t>(e)]; }

	static constexpr std::size_t size() { return Size; }
};
} // namespace fontaku
