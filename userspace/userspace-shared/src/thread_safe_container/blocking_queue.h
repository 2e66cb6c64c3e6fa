/**
 * @file
 *
 * Interface to blocking_queue -- a bounded, multi-priority FIFO that
 * consumers can wait on.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <Poco/Mutex.h>
#include <Poco/Semaphore.h>

#include <cstdint>
#include <queue>
#include <stdexcept>

namespace thread_safe_container
{

/**
 * A bounded queue with a fixed number of priority lanes. Producers never
 * block; a put into a full lane fails. Consumers block (up to a timeout)
 * until an item is available and always drain higher priority lanes first.
 */
template<class T>
class blocking_queue
{
public:
	enum item_priority
	{
		BQ_PRIORITY_HIGH = 0,
		BQ_PRIORITY_MEDIUM = 1,
		BQ_PRIORITY_LOW = 2,
		BQ_PRIORITY_SIZE = 3
	};

	explicit blocking_queue(uint32_t max_size);

	/**
	 * Add the given item to the lane with the given priority.
	 *
	 * @returns true if the item was queued, false if the lane is full.
	 */
	bool put(const T& item, item_priority priority = BQ_PRIORITY_MEDIUM);

	/**
	 * Remove the next item, waiting up to timeout_ms for one to arrive.
	 *
	 * @param[out] item receives the item if non-null.
	 *
	 * @returns true if an item was removed, false on timeout.
	 */
	bool get(T* item, uint64_t timeout_ms);

	bool is_full(item_priority priority) const;
	size_t size(item_priority priority) const;
	size_t size() const;
	void clear();

private:
	static void check_priority(item_priority priority);

	const uint32_t m_max_size;
	std::queue<T> m_queues[BQ_PRIORITY_SIZE];
	mutable Poco::FastMutex m_mutex;
	Poco::Semaphore m_semaphore;
};

template<class T>
blocking_queue<T>::blocking_queue(const uint32_t max_size) :
	m_max_size(max_size),
	m_semaphore(0, max_size * BQ_PRIORITY_SIZE)
{
}

template<class T>
void blocking_queue<T>::check_priority(const item_priority priority)
{
	if(priority >= BQ_PRIORITY_SIZE)
	{
		throw std::out_of_range("blocking_queue: invalid priority");
	}
}

template<class T>
bool blocking_queue<T>::put(const T& item, const item_priority priority)
{
	check_priority(priority);

	{
		Poco::FastMutex::ScopedLock lock(m_mutex);

		if(m_queues[priority].size() >= m_max_size)
		{
			return false;
		}

		m_queues[priority].push(item);
	}

	m_semaphore.set();
	return true;
}

template<class T>
bool blocking_queue<T>::get(T* const item, const uint64_t timeout_ms)
{
	if(!m_semaphore.tryWait(static_cast<long>(timeout_ms)))
	{
		return false;
	}

	Poco::FastMutex::ScopedLock lock(m_mutex);

	for(uint32_t j = 0; j < BQ_PRIORITY_SIZE; ++j)
	{
		if(!m_queues[j].empty())
		{
			if(item != nullptr)
			{
				*item = m_queues[j].front();
			}
			m_queues[j].pop();
			break;
		}
	}

	return true;
}

template<class T>
bool blocking_queue<T>::is_full(const item_priority priority) const
{
	check_priority(priority);
	Poco::FastMutex::ScopedLock lock(m_mutex);

	return m_queues[priority].size() >= m_max_size;
}

template<class T>
size_t blocking_queue<T>::size(const item_priority priority) const
{
	check_priority(priority);
	Poco::FastMutex::ScopedLock lock(m_mutex);

	return m_queues[priority].size();
}

template<class T>
size_t blocking_queue<T>::size() const
{
	size_t s = 0;

	for(uint32_t j = 0; j < BQ_PRIORITY_SIZE; ++j)
	{
		s += size(static_cast<item_priority>(j));
	}

	return s;
}

template<class T>
void blocking_queue<T>::clear()
{
	while(get(nullptr, 0));
}

} // namespace thread_safe_container
