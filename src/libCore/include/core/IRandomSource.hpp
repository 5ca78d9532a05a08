#pragma once

#include <cstddef>

namespace hexsnake {

//! Source of every random choice of a session. Allows deterministic sources in tests.
class IRandomSource {
public:
	virtual ~IRandomSource() = default;

	//! Uniformly distributed index in [0, count). count must be larger than 0.
	virtual std::size_t index(std::size_t count) = 0;
};

} // namespace hexsnake
