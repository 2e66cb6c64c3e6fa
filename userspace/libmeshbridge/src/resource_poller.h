/**
 * @file
 *
 * Interface to resource_poller, the event source of the controllers. It
 * periodically lists one kind of object and reports the keys that
 * changed since the previous listing.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "k8s_types.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace meshbridge
{

class resource_poller
{
public:
	/** Maps every listed key to its resourceVersion. */
	using lister = std::function<std::map<object_key, std::string>()>;

	/** Receives changed keys. */
	using sink = std::function<void(const object_key&)>;

	/**
	 * @param[in] name             kind of object, for logs.
	 * @param[in] list             lists the objects.
	 * @param[in] on_change        called for keys that appeared, changed
	 *                             or disappeared.
	 * @param[in] poll_interval_ms time between listings.
	 * @param[in] resync_interval_s time between passes that report every
	 *                              known key, changed or not.
	 */
	resource_poller(const std::string& name,
	                const lister& list,
	                const sink& on_change,
	                uint64_t poll_interval_ms,
	                uint64_t resync_interval_s);
	~resource_poller();

	resource_poller(const resource_poller&) = delete;
	resource_poller& operator=(const resource_poller&) = delete;

	void start();
	void stop();

	/**
	 * List once and report differences. A failed listing is logged and
	 * leaves the known state untouched.
	 *
	 * @returns the number of keys reported.
	 */
	size_t poll_once();

	/**
	 * Report every known key.
	 */
	size_t resync();

private:
	void run_loop();

	const std::string m_name;
	const lister m_list;
	const sink m_on_change;
	const std::chrono::milliseconds m_poll_interval;
	const std::chrono::seconds m_resync_interval;

	std::map<object_key, std::string> m_known;
	std::chrono::steady_clock::time_point m_last_resync;

	std::thread m_thread;
	bool m_run;
	std::mutex m_lock;
	std::condition_variable m_cv;
};

} // namespace meshbridge
