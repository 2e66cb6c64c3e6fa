/**
 * @file
 *
 * Interface to work_queue, which feeds object keys to a reconciler from a
 * set of worker threads.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "k8s_types.h"
#include "reconciler.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace meshbridge
{

/**
 * Keys waiting for processing are deduplicated. A key is never handed to
 * two workers at once; adding a key that is being processed marks it to
 * be processed again once the current pass ends.
 *
 * Failed keys are retried after min(base * 2^failures, max)
 * milliseconds. A successful pass resets the failure count.
 */
class work_queue
{
public:
	using clock = std::chrono::steady_clock;

	/**
	 * @param[in] target        the reconciler keys are handed to.
	 * @param[in] threads       the number of workers.
	 * @param[in] base_delay_ms first retry delay.
	 * @param[in] max_delay_ms  retry delay cap.
	 */
	work_queue(reconciler& target,
	           uint16_t threads,
	           uint64_t base_delay_ms,
	           uint64_t max_delay_ms);
	~work_queue();

	work_queue(const work_queue&) = delete;
	work_queue& operator=(const work_queue&) = delete;

	/**
	 * Spin up the worker threads.
	 */
	void start();

	/**
	 * Stop handing out keys and wait for in-flight passes to finish.
	 * Pending keys are dropped.
	 */
	void stop();

	void add(const object_key& key);
	void add_after(const object_key& key, uint64_t delay_ms);

	/**
	 * @returns the delay before the next retry of a key that has failed
	 *          the given number of times.
	 */
	uint64_t backoff_ms(uint32_t failures) const;

	/** Keys waiting, delayed, or in flight. */
	size_t size() const;

	/**
	 * Block until no key is waiting or in flight. Delayed keys do not
	 * count.
	 *
	 * @returns false on timeout.
	 */
	bool wait_until_idle(uint64_t timeout_ms) const;

	uint32_t failures(const object_key& key) const;

private:
	void run_loop();
	void process(const object_key& key);
	void enqueue_locked(const object_key& key);
	void promote_due_locked(clock::time_point now);
	bool idle_locked() const;

	reconciler& m_reconciler;
	const uint16_t m_thread_count;
	const uint64_t m_base_delay_ms;
	const uint64_t m_max_delay_ms;

	std::vector<std::thread> m_threads;
	std::atomic<bool> m_run;

	/** Guards everything below. */
	mutable std::mutex m_lock;
	mutable std::condition_variable m_cv;

	std::list<object_key> m_queue;
	std::set<object_key> m_queued;
	std::set<object_key> m_in_flight;
	std::set<object_key> m_dirty;
	std::multimap<clock::time_point, object_key> m_delayed;
	std::map<object_key, uint32_t> m_failures;
};

} // namespace meshbridge
