// sc_util.hpp — ready-made steppables
//
// Provides:
//   FnSteppable      — step/remove from callables
//   TimedSteppable   — steps until a run time has elapsed, then removes itself
//   CountedSteppable — steps N times, then removes itself
//
// The timed and counted forms pair with add_and_wait_steppable():
//   sc::TimedSteppable turn(std::chrono::seconds(2), [&](sc::Instant, sc::Duration dt) { ... });
//   sched->add_and_wait_steppable(turn);   // returns ~2s later

#pragma once

#include "sc_core.hpp"
#include <functional>

namespace sc {

using StepFn = std::function<void(Instant, Duration)>;
using RemoveFn = std::function<bool(Instant, Duration)>;

// =============================================================================
// FnSteppable — no remove predicate means it stays forever
// =============================================================================
struct FnSteppable : Steppable
{
	StepFn step_fn;
	RemoveFn remove_fn;
	const char *name = "fn";

	explicit FnSteppable(StepFn s, RemoveFn r = {}, const char *n = "fn")
		: step_fn(std::move(s)), remove_fn(std::move(r)), name(n) {}

	bool remove(Instant now, Duration elapsed) override { return remove_fn && remove_fn(now, elapsed); }

	void step(Instant now, Duration elapsed) override
	{
		if (step_fn) step_fn(now, elapsed);
	}

	const char *label() const override { return name; }
};

// =============================================================================
// TimedSteppable — accumulates the elapsed time it was stepped with
// =============================================================================
//
// Removed on the first firing after `ran` reaches `run_for`. With divisor 1
// the first step sees elapsed == 0, so a run of k ticks takes k + 1 steps.

struct TimedSteppable : Steppable
{
	Duration run_for{};
	Duration ran{};
	StepFn step_fn;

	TimedSteppable(Duration d, StepFn s = {}) : run_for(d), step_fn(std::move(s)) {}

	bool remove(Instant, Duration) override { return ran >= run_for; }

	void step(Instant now, Duration elapsed) override
	{
		if (step_fn) step_fn(now, elapsed);
		ran += elapsed;
	}

	Duration remaining() const { return ran >= run_for ? Duration::zero() : run_for - ran; }
	const char *label() const override { return "timed"; }
};

// =============================================================================
// CountedSteppable
// =============================================================================
struct CountedSteppable : Steppable
{
	uint64_t limit = 0;
	uint64_t count = 0;
	StepFn step_fn;

	CountedSteppable(uint64_t n, StepFn s = {}) : limit(n), step_fn(std::move(s)) {}

	bool remove(Instant, Duration) override { return count >= limit; }

	void step(Instant now, Duration elapsed) override
	{
		if (step_fn) step_fn(now, elapsed);
		count++;
	}

	const char *label() const override { return "counted"; }
};

} // namespace sc
