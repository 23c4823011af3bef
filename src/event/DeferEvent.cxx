// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DeferEvent.hxx"
#include "Loop.hxx"

#include <cassert>

void
DeferEvent::Schedule() noexcept
{
	if (!IsPending())
		loop.Defer(*this);

	assert(IsPending());
}

void
DeferEvent::Cancel() noexcept
{
	if (IsPending())
		loop.CancelDefer(*this);

	assert(!IsPending());
}
