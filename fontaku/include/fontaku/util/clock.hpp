#pragma once
#include <chrono>
#include <cstdint>

namespace fontaku {
using WallClock = std::chrono::system_clock;

///
/// \brief Source of wall-clock time for font timestamps.
///
/// Injected wherever a timestamp is written so that builds can be made reproducible.
///
struct Clock {
	struct System;
	struct Fixed;

	virtual ~Clock() = default;

	virtual WallClock::time_point now() const = 0;
};

///
/// \brief Reads the system clock.
///
struct Clock::System : Clock {
	WallClock::time_point now() const final { return WallClock::now(); }
};

///
/// \brief Always returns the same instant.
///
struct Clock::Fixed : Clock {
	WallClock::time_point instant{};

	explicit Fixed(WallClock::time_point instant = {}) : instant(instant) {}

	///
	/// \brief Construct an instance from seconds since the Unix epoch.
	///
	static Fixed from_unix(std::int64_t seconds) { return Fixed{WallClock::time_point{std::chrono::seconds{seconds}}}; }

	WallClock::time_point now() const final { return instant; }
};

///
/// \brief Seconds since the Unix epoch.
///
constexpr std::int64_t to_unix_seconds(WallClock::time_point const tp) {
	return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}
} // namespace fontaku
