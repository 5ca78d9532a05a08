#include "core/mersenneRandom.hpp"

#include <cassert>

namespace hexsnake {

MersenneRandom::MersenneRandom() : m_engine(std::random_device{}()) {
}

MersenneRandom::MersenneRandom(const uint64_t seed) : m_engine(seed) {
}

std::size_t MersenneRandom::index(const std::size_t count) {
	assert(count > 0u);

	std::uniform_int_distribution<std::size_t> dist(0u, count - 1u);
	return dist(m_engine);
}

} // namespace hexsnake
