#pragma once

namespace fontaku {
///
/// \brief Base for types whose address must stay stable (registered sinks, worker pools).
///
class Pinned {
  public:
	Pinned() = default;
	Pinned(Pinned&&) = delete;
	Pinned& operator=(Pinned&&) = delete;
	Pinned(Pinned const&) = delete;
	Pinned& operator=(Pinned const&) = delete;
};
} // namespace fontaku
