#pragma once
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace fontaku::sfnt {
///
/// \brief Big-endian byte sink for sfnt tables.
///
class ByteWriter {
  public:
	void append8(std::uint8_t value) { m_bytes.push_back(static_cast<std::byte>(value)); }

	void append16(std::uint16_t value) {
		append8(static_cast<std::uint8_t>(value >> 8));
		append8(static_cast<std::uint8_t>(value));
	}

	void append32(std::uint32_t value) {
		append16(static_cast<std::uint16_t>(value >> 16));
		append16(static_cast<std::uint16_t>(value));
	}

	void append64(std::uint64_t value) {
		append32(static_cast<std::uint32_t>(value >> 32));
		append32(static_cast<std::uint32_t>(value));
	}

	void append_i16(std::int16_t value) { append16(static_cast<std::uint16_t>(value)); }
	void append_i64(std::int64_t value) { append64(static_cast<std::uint64_t>(value)); }

	void append_tag(std::span<char const, 4> tag) {
		for (char const c : tag) { append8(static_cast<std::uint8_t>(c)); }
	}

	void append_tag(std::string_view tag) {
		assert(tag.size() == 4);
		append_tag(std::span<char const, 4>{tag.data(), 4});
	}

	void append_bytes(std::span<std::byte const> bytes) { m_bytes.insert(m_bytes.end(), bytes.begin(), bytes.end()); }

	void append_zeros(std::size_t count) { m_bytes.resize(m_bytes.size() + count); }

	void overwrite16(std::size_t location, std::uint16_t value) {
		assert(m_bytes.size() >= location + 2);
		m_bytes[location] = static_cast<std::byte>(value >> 8);
		m_bytes[location + 1] = static_cast<std::byte>(value);
	}

	void overwrite32(std::size_t location, std::uint32_t value) {
		overwrite16(location, static_cast<std::uint16_t>(value >> 16));
		overwrite16(location + 2, static_cast<std::uint16_t>(value));
	}

	///
	/// \brief Zero-pad to a multiple of 4 bytes.
	///
	void pad_to_4() {
		while (m_bytes.size() % 4 != 0) { append8(0); }
	}

	std::size_t size() const { return m_bytes.size(); }
	std::span<std::byte const> bytes() const { return m_bytes; }
	std::vector<std::byte> release() { return std::move(m_bytes); }

  private:
	std::vector<std::byte> m_bytes{};
};
} // namespace fontaku::sfnt
