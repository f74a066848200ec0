#include <fontaku/font_metrics.hpp>
#include <algorithm>

namespace fontaku {
std::string FontNames::postscript_name() const {
	auto ret = family + "-" + style;
	std::erase_if(ret, [](char const c) { return c == ' '; });
	return ret;
}
} // namespace fontaku
