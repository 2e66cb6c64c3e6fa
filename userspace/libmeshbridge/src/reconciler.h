/**
 * @file
 *
 * Interface implemented by every controller.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "k8s_types.h"

#include <cstdint>
#include <string>

namespace meshbridge
{

struct reconcile_result
{
	/** Reprocess the key with backoff. */
	bool requeue = false;

	/** Reprocess the key after this many milliseconds, if non-zero. */
	uint64_t requeue_after_ms = 0;
};

/**
 * A reconciler drives the world towards the state an object describes.
 * reconcile() must be safe to repeat: the same key can be delivered
 * again after any failure. It is never called concurrently for the same
 * key, but may be for different keys.
 */
class reconciler
{
public:
	virtual ~reconciler() = default;

	/**
	 * @throws std::exception on any failure; the key is retried.
	 */
	virtual reconcile_result reconcile(const object_key& key) = 0;

	/** Name used in logs. */
	virtual std::string name() const = 0;
};

} // namespace meshbridge
