#pragma once
#include <memory>
#include <span>

namespace fontaku {
///
/// \brief Heap array whose size is fixed at construction (pixel storage).
///
/// Elements are value initialized.
///
template <typename T>
class DynArray {
  public:
	DynArray() = default;

	explicit DynArray(std::size_t size) : m_data(std::make_unique<T[]>(size)), m_size(size) {}

	T* data() const { return m_data.get(); }
	std::size_t size() const { return m_data ? m_size : 0u; }
	std::span<T> span() const { return {m_data.get(), size()}; }

	bool empty() const { return size() == 0u; }

  private:
	std::unique_ptr<T[]> m_data{};
	std::size_t m_size{};
};
} // namespace fontaku
