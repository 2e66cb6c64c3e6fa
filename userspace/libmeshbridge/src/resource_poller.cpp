/**
 * @file
 *
 * Implementation of resource_poller.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "resource_poller.h"
#include "common_logger.h"

COMMON_LOGGER();

namespace meshbridge
{

resource_poller::resource_poller(const std::string& name,
                                 const lister& list,
                                 const sink& on_change,
                                 const uint64_t poll_interval_ms,
                                 const uint64_t resync_interval_s):
	m_name(name),
	m_list(list),
	m_on_change(on_change),
	m_poll_interval(poll_interval_ms),
	m_resync_interval(resync_interval_s),
	m_last_resync(std::chrono::steady_clock::now()),
	m_run(false)
{
}

resource_poller::~resource_poller()
{
	stop();
}

void resource_poller::start()
{
	std::unique_lock<std::mutex> l(m_lock);

	if(m_run)
	{
		return;
	}

	m_run = true;
	m_thread = std::thread(&resource_poller::run_loop, this);
}

void resource_poller::stop()
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

	if(m_thread.joinable())
	{
		m_thread.join();
	}
}

size_t resource_poller::poll_once()
{
	std::map<object_key, std::string> current;

	try
	{
		current = m_list();
	}
	catch(const std::exception& ex)
	{
		LOG_WARNING("Unable to list %s, will retry: %s", m_name.c_str(), ex.what());
		return 0;
	}

	size_t reported = 0;

	for(const auto& entry : current)
	{
		const auto known = m_known.find(entry.first);

		if(known == m_known.end() || known->second != entry.second)
		{
			m_on_change(entry.first);
			++reported;
		}
	}

	// Vanished keys are reported so the reconciler observes the deletion.
	for(const auto& entry : m_known)
	{
		if(current.count(entry.first) == 0)
		{
			m_on_change(entry.first);
			++reported;
		}
	}

	if(reported > 0)
	{
		LOG_DEBUG("%s: %zu changed keys", m_name.c_str(), reported);
	}

	m_known.swap(current);
	return reported;
}

size_t resource_poller::resync()
{
	for(const auto& entry : m_known)
	{
		m_on_change(entry.first);
	}

	m_last_resync = std::chrono::steady_clock::now();
	LOG_DEBUG("%s: resynced %zu keys", m_name.c_str(), m_known.size());
	return m_known.size();
}

void resource_poller::run_loop()
{
	LOG_INFO("Polling %s every %lld ms",
	         m_name.c_str(),
	         static_cast<long long>(m_poll_interval.count()));

	std::unique_lock<std::mutex> l(m_lock);

	while(m_run)
	{
		l.unlock();
		poll_once();
		if(m_resync_interval.count() > 0 &&
		   std::chrono::steady_clock::now() - m_last_resync >= m_resync_interval)
		{
			resync();
		}
		l.lock();

		m_cv.wait_for(l, m_poll_interval, [this]() { return !m_run; });
	}
}

} // namespace meshbridge
