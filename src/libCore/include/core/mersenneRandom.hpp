#pragma once

#include "core/IRandomSource.hpp"

#include <cstdint>
#include <random>

namespace hexsnake {

//! Random source backed by a 64bit mersenne twister.
class MersenneRandom : public IRandomSource {
public:
	MersenneRandom();                       //!< Seeded from std::random_device.
	explicit MersenneRandom(uint64_t seed); //!< Fixed seed for reproducible sessions.

	std::size_t index(std::size_t count) override;

private:
	std::mt19937_64 m_engine;
};

} // namespace hexsnake
