#pragma once

namespace fontaku {
///
/// \brief Non-owning, nullable pointer to a single T.
///
/// Marks observers and optional collaborators (eg CreateInfo members); never used for arrays or ownership.
///
template <typename T>
using Ptr = T*;
} // namespace fontaku
