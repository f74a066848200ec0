#pragma once
#include <cassert>
#include <concepts>
#include <memory>
#include <type_traits>

namespace fontaku {
template <typename T>
class UniqueTask;

///
/// \brief Move-only type erased callable, for queueing tasks that own promises.
///
template <typename Ret, typename... Args>
class UniqueTask<Ret(Args...)> {
  public:
	UniqueTask() = default;

	template <typename T>
		requires(!std::same_as<UniqueTask, T> && std::is_invocable_r_v<Ret, T&, Args...>)
	UniqueTask(T t) : m_func(std::make_unique<Model<T>>(std::move(t))) {}

	Ret operator()(Args... args) const {
		assert(m_func);
		return m_func->call(std::forward<Args>(args)...);
	}

	explicit operator bool() const { return m_func != nullptr; }

  private:
	struct Concept {
		virtual ~Concept() = default;
		virtual Ret call(Args... args) = 0;
	};

	template <typename F>
	struct Model : Concept {
		F f;
		explicit Model(F&& f) : f(std::move(f)) {}
		Ret call(Args... args) final { return f(std::forward<Args>(args)...); }
	};

	std::unique_ptr<Concept> m_func{};
};
} // namespace fontaku
