/**
 * @file
 *
 * Unit tests for work_queue.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "meshbridge_exception.h"
#include "work_queue.h"

#include <gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>

using namespace meshbridge;

namespace
{

const object_key KEY("ns1", "web");

/**
 * Counts passes per key, optionally failing or asking for a requeue the
 * first few times.
 */
class recording_reconciler : public reconciler
{
public:
	recording_reconciler():
		m_failures_left(0),
		m_requeues_left(0),
		m_pass_duration_ms(0),
		m_running(0),
		m_max_running(0)
	{
	}

	reconcile_result reconcile(const object_key& key) override
	{
		reconcile_result result;
		{
			std::lock_guard<std::mutex> l(m_lock);
			++m_passes[key];
			++m_running;
			m_max_running = std::max(m_max_running, m_running);
		}

		if(m_pass_duration_ms > 0)
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(m_pass_duration_ms));
		}

		std::lock_guard<std::mutex> l(m_lock);
		--m_running;
		if(m_failures_left > 0)
		{
			--m_failures_left;
			throw meshbridge_exception("injected failure");
		}
		if(m_requeues_left > 0)
		{
			--m_requeues_left;
			result.requeue_after_ms = 20;
		}
		return result;
	}

	std::string name() const override { return "recording"; }

	uint32_t passes(const object_key& key) const
	{
		std::lock_guard<std::mutex> l(m_lock);
		const auto it = m_passes.find(key);
		return it == m_passes.end() ? 0 : it->second;
	}

	int max_running() const
	{
		std::lock_guard<std::mutex> l(m_lock);
		return m_max_running;
	}

	/**
	 * Poll until the key has seen the given number of passes.
	 */
	bool wait_for_passes(const object_key& key, const uint32_t expected) const
	{
		for(int i = 0; i < 200; ++i)
		{
			if(passes(key) >= expected)
			{
				return true;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
		return false;
	}

	int m_failures_left;
	int m_requeues_left;
	int m_pass_duration_ms;

private:
	mutable std::mutex m_lock;
	std::map<object_key, uint32_t> m_passes;
	int m_running;
	int m_max_running;
};

} // end namespace

TEST(work_queue_test, backoff)
{
	recording_reconciler target;
	work_queue queue(target, 1, 10, 1000);

	ASSERT_EQ(10u, queue.backoff_ms(0));
	ASSERT_EQ(20u, queue.backoff_ms(1));
	ASSERT_EQ(80u, queue.backoff_ms(3));
	ASSERT_EQ(1000u, queue.backoff_ms(10));
	ASSERT_EQ(1000u, queue.backoff_ms(1000));
}

TEST(work_queue_test, duplicate_keys_collapse)
{
	recording_reconciler target;
	work_queue queue(target, 2, 10, 100);

	queue.add(KEY);
	queue.add(KEY);
	queue.add(object_key("ns1", "api"));
	ASSERT_EQ(2u, queue.size());

	queue.start();
	ASSERT_TRUE(queue.wait_until_idle(2000));
	queue.stop();

	ASSERT_EQ(1u, target.passes(KEY));
	ASSERT_EQ(1u, target.passes(object_key("ns1", "api")));
}

TEST(work_queue_test, failures_are_retried)
{
	recording_reconciler target;
	target.m_failures_left = 2;
	work_queue queue(target, 1, 10, 100);

	queue.start();
	queue.add(KEY);

	ASSERT_TRUE(target.wait_for_passes(KEY, 3));
	ASSERT_TRUE(queue.wait_until_idle(2000));
	queue.stop();

	ASSERT_EQ(3u, target.passes(KEY));
	ASSERT_EQ(0u, queue.failures(KEY));
}

TEST(work_queue_test, requeue_after)
{
	recording_reconciler target;
	target.m_requeues_left = 1;
	work_queue queue(target, 1, 10, 100);

	queue.start();
	queue.add(KEY);

	ASSERT_TRUE(target.wait_for_passes(KEY, 2));
	queue.stop();
}

TEST(work_queue_test, key_is_never_processed_concurrently)
{
	recording_reconciler target;
	target.m_pass_duration_ms = 30;
	work_queue queue(target, 4, 10, 100);

	queue.start();
	queue.add(KEY);
	ASSERT_TRUE(target.wait_for_passes(KEY, 1));

	// Arrives while the first pass runs, so it must wait for it.
	queue.add(KEY);
	queue.add(KEY);

	ASSERT_TRUE(target.wait_for_passes(KEY, 2));
	ASSERT_TRUE(queue.wait_until_idle(2000));
	queue.stop();

	ASSERT_EQ(1, target.max_running());
	ASSERT_EQ(2u, target.passes(KEY));
}

TEST(work_queue_test, stop_is_idempotent)
{
	recording_reconciler target;
	work_queue queue(target, 2, 10, 100);

	queue.start();
	queue.stop();
	queue.stop();
}
