#pragma once
#include <stdexcept>

namespace fontaku {
///
/// \brief Base fontaku exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

///
/// \brief No source images were found.
///
struct EmptyInputError : Error {
	using Error::Error;
};

///
/// \brief A codepoint could not be parsed from a filename, or is not a usable Unicode scalar.
///
struct InvalidCodepointError : Error {
	using Error::Error;
};

///
/// \brief A source raster could not be read or decoded.
///
struct UnreadableImageError : Error {
	using Error::Error;
};

///
/// \brief A target resolution is non-positive, duplicated, or out of range.
///
struct InvalidSizeError : Error {
	using Error::Error;
};

///
/// \brief The font container rejected the document, or the output could not be written.
///
struct SerializationError : Error {
	using Error::Error;
};

///
/// \brief Malformed command line or config file value.
///
struct ConfigError : Error {
	using Error::Error;
};
} // namespace fontaku
