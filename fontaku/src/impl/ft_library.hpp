#pragma once
#include <fontaku/util/unique.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace fontaku {
struct FreetypeLibraryDeleter {
	void operator()(FT_Library lib) const {
		if (lib != FT_Library{}) { FT_Done_FreeType(lib); }
	}
};

struct FreetypeFaceDeleter {
	void operator()(FT_Face face) const {
		if (face != FT_Face{}) { FT_Done_Face(face); }
	}
};

using FtLibrary = Unique<FT_Library, FreetypeLibraryDeleter>;
using FtFace = Unique<FT_Face, FreetypeFaceDeleter>;
} // namespace fontaku
