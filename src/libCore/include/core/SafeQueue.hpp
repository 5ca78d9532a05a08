#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace hexsnake {

//! Thread safe queue with a blocking and a non blocking pop.
template <class Entry>
class SafeQueue {
public:
	SafeQueue();

	//! Push element onto the queue.
	void Push(const Entry& value);

	//! Thread blocks here until there is an element to receive.
	//! \note Throws std::runtime_error when the queue is empty and blocking for threads is disabled.
	Entry Pop();

	//! Returns the front element if there is one; never blocks.
	std::optional<Entry> TryPop();

	//! Stop blocking the threads trying to pop an element from the queue.
	void Release();

protected:
	std::deque<Entry> m_queue;           //!< Stores the entries.
	mutable std::mutex m_mutex;          //!< Manage access to the queue.
	std::condition_variable m_condition; //!< Notify that element can be popped.
	std::atomic<bool> m_blockThreads;    //!< Should the Pop function block the threads or not.
};


template <class Entry>
SafeQueue<Entry>::SafeQueue() : m_blockThreads(true) {
}

template <class Entry>
void SafeQueue<Entry>::Push(const Entry& value) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(value);
	}
	m_condition.notify_one();
}

template <class Entry>
Entry SafeQueue<Entry>::Pop() {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_condition.wait(lock, [this] { return !(m_queue.empty() && m_blockThreads); });

	if (m_queue.empty()) {
		throw std::runtime_error("SafeQueue released while empty.");
	}
	Entry element = std::move(m_queue.front());
	m_queue.pop_front();
	return element;
}

template <class Entry>
std::optional<Entry> SafeQueue<Entry>::TryPop() {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_queue.empty()) {
		return std::nullopt;
	}

	Entry element = std::move(m_queue.front());
	m_queue.pop_front();
	return element;
}

template <class Entry>
void SafeQueue<Entry>::Release() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_blockThreads.store(false);
	}
	m_condition.notify_all();
}

} // namespace hexsnake
