/**
 * @file
 *
 * Implementation of work_queue.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "work_queue.h"
#include "common_logger.h"

#include <algorithm>

COMMON_LOGGER();

namespace
{

// Workers wake up at least this often to notice delayed keys and stop().
const std::chrono::milliseconds MAX_IDLE_WAIT(1000);

// 2^20 times any sane base delay already exceeds any sane cap.
const uint32_t MAX_BACKOFF_EXPONENT = 20;

} // end namespace

namespace meshbridge
{

work_queue::work_queue(reconciler& target,
                       const uint16_t threads,
                       const uint64_t base_delay_ms,
                       const uint64_t max_delay_ms):
	m_reconciler(target),
	m_thread_count(std::max<uint16_t>(threads, 1)),
	m_base_delay_ms(base_delay_ms),
	m_max_delay_ms(max_delay_ms),
	m_run(false)
{
}

work_queue::~work_queue()
{
	stop();
}

void work_queue::start()
{
	std::unique_lock<std::mutex> l(m_lock);

	if(m_run)
	{
		return;
	}

	m_run = true;
	LOG_INFO("Starting %u workers for %s",
	         static_cast<unsigned>(m_thread_count),
	         m_reconciler.name().c_str());
	for(uint16_t i = 0; i < m_thread_count; ++i)
	{
		m_threads.emplace_back(&work_queue::run_loop, this);
	}
}

void work_queue::stop()
{
	{
		std::unique_lock<std::mutex> l(m_lock);

		if(!m_run)
		{
			return;
		}
		m_run = false;
	}
	m_cv.notify_all();

	for(auto& t : m_threads)
	{
		t.join();
	}
	m_threads.clear();
	LOG_INFO("Stopped workers for %s", m_reconciler.name().c_str());
}

void work_queue::add(const object_key& key)
{
	std::unique_lock<std::mutex> l(m_lock);

	enqueue_locked(key);
}

void work_queue::add_after(const object_key& key, const uint64_t delay_ms)
{
	if(delay_ms == 0)
	{
		add(key);
		return;
	}

	std::unique_lock<std::mutex> l(m_lock);

	m_delayed.emplace(clock::now() + std::chrono::milliseconds(delay_ms), key);
	m_cv.notify_all();
}

uint64_t work_queue::backoff_ms(const uint32_t failures) const
{
	const uint32_t exponent = std::min(failures, MAX_BACKOFF_EXPONENT);

	return std::min(m_base_delay_ms << exponent, m_max_delay_ms);
}

size_t work_queue::size() const
{
	std::unique_lock<std::mutex> l(m_lock);

	return m_queued.size() + m_in_flight.size() + m_delayed.size();
}

bool work_queue::wait_until_idle(const uint64_t timeout_ms) const
{
	std::unique_lock<std::mutex> l(m_lock);

	return m_cv.wait_for(l, std::chrono::milliseconds(timeout_ms), [this]() {
		return idle_locked();
	});
}

uint32_t work_queue::failures(const object_key& key) const
{
	std::unique_lock<std::mutex> l(m_lock);
	const auto it = m_failures.find(key);

	return it == m_failures.end() ? 0 : it->second;
}

bool work_queue::idle_locked() const
{
	return m_queue.empty() && m_in_flight.empty();
}

void work_queue::enqueue_locked(const object_key& key)
{
	if(m_in_flight.count(key) > 0)
	{
		m_dirty.insert(key);
	}
	else if(m_queued.insert(key).second)
	{
		m_queue.push_back(key);
	}
	m_cv.notify_all();
}

void work_queue::promote_due_locked(const clock::time_point now)
{
	while(!m_delayed.empty() && m_delayed.begin()->first <= now)
	{
		enqueue_locked(m_delayed.begin()->second);
		m_delayed.erase(m_delayed.begin());
	}
}

void work_queue::run_loop()
{
	std::unique_lock<std::mutex> l(m_lock);

	while(m_run)
	{
		promote_due_locked(clock::now());

		if(m_queue.empty())
		{
			clock::time_point wake = clock::now() + MAX_IDLE_WAIT;

			if(!m_delayed.empty())
			{
				wake = std::min(wake, m_delayed.begin()->first);
			}
			m_cv.wait_until(l, wake);
			continue;
		}

		const object_key key = m_queue.front();
		m_queue.pop_front();
		m_queued.erase(key);
		m_in_flight.insert(key);

		l.unlock();
		process(key);
		l.lock();

		m_in_flight.erase(key);
		if(m_dirty.erase(key) > 0)
		{
			enqueue_locked(key);
		}
		m_cv.notify_all();
	}
}

void work_queue::process(const object_key& key)
{
	LOG_DEBUG("%s: reconciling %s", m_reconciler.name().c_str(), key.to_string().c_str());

	try
	{
		const reconcile_result result = m_reconciler.reconcile(key);

		std::unique_lock<std::mutex> l(m_lock);
		if(result.requeue_after_ms > 0)
		{
			m_failures.erase(key);
			m_delayed.emplace(clock::now() +
			                      std::chrono::milliseconds(result.requeue_after_ms),
			                  key);
		}
		else if(result.requeue)
		{
			const uint32_t failures = m_failures[key]++;
			m_delayed.emplace(clock::now() + std::chrono::milliseconds(backoff_ms(failures)),
			                  key);
		}
		else
		{
			m_failures.erase(key);
		}
	}
	catch(const std::exception& ex)
	{
		std::unique_lock<std::mutex> l(m_lock);
		const uint32_t failures = m_failures[key]++;
		const uint64_t delay = backoff_ms(failures);

		LOG_ERROR("%s: reconciling %s failed, retrying in %llu ms: %s",
		          m_reconciler.name().c_str(),
		          key.to_string().c_str(),
		          static_cast<unsigned long long>(delay),
		          ex.what());
		m_delayed.emplace(clock::now() + std::chrono::milliseconds(delay), key);
	}
}

} // namespace meshbridge
