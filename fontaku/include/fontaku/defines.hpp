#pragma once

namespace fontaku {
constexpr bool debug_v =
#if defined(FONTAKU_DEBUG)
	true;
#else
	false;
#endif
} // namespace fontaku
