// sc_core.hpp — stepcore: fixed-cadence step scheduler
//
// ONE THREAD STEPS EVERYTHING:
// 1. Register: sched.add_steppable(s, divisor) from any thread
// 2. Tick:     drain registrations, then fire rate groups in ascending divisor order
// 3. Freeze:   sched.pause() / sched.unpause() hold the step gate between ticks
//
// A steppable registered with divisor N fires once every N ticks. Steps never
// overlap, so steppables may read and write shared simulation state without
// locking.
//
// WAITING:
// add_and_wait_steppable() registers a steppable and blocks the caller until
// the driver sees remove() return true for it. Every steppable has its own
// wait channel; removals are signalled after the tick that removed them.

#pragma once

#include <vector>
#include <deque>
#include <string>
#include <unordered_map>
#include <algorithm>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdarg>
#include <cmath>
#include <typeinfo>
#include <stdexcept>
#include <memory>

namespace sc
{

// =============================================================================
// Time
// =============================================================================
using Clock = std::chrono::steady_clock;
using Instant = Clock::time_point;
using Duration = Clock::duration;

constexpr double DEFAULT_RATE = 60.0;
constexpr size_t MAX_FAULTS = 256;
constexpr int MAX_BEHIND_TICKS = 5;

// =============================================================================
// Logging — "[sched] ..." lines on stdout/stderr unless a hook is installed
// =============================================================================
enum class LogLevel { Info, Warn, Error };

using LogHook = void (*)(void *, LogLevel, const char *);

struct LogSink
{
	std::mutex mtx;
	LogHook fn = nullptr;
	void *ctx = nullptr;
};

inline LogSink &log_sink()
{
	static LogSink sink;
	return sink;
}

// Redirect all scheduler diagnostics. Pass nullptr to restore stdio output.
// The hook runs under the sink lock and must not call set_log_hook().
inline void set_log_hook(LogHook fn, void *ctx)
{
	LogSink &sink = log_sink();
	std::lock_guard<std::mutex> lk(sink.mtx);
	sink.fn = fn;
	sink.ctx = ctx;
}

inline void log(LogLevel level, const char *fmt, ...)
{
	char buf[512];
	va_list args;
	va_start(args, fmt);
	vsnprintf(buf, sizeof(buf), fmt, args);
	va_end(args);

	LogSink &sink = log_sink();
	std::lock_guard<std::mutex> lk(sink.mtx);
	if (sink.fn)
	{
		sink.fn(sink.ctx, level, buf);
		return;
	}
	fprintf(level == LogLevel::Info ? stdout : stderr, "[sched] %s\n", buf);
}

struct StepFault : std::exception
{
	std::string msg;
	explicit StepFault(std::string m) : msg(std::move(m)) {}
	const char *what() const noexcept override { return msg.c_str(); }
};

// =============================================================================
// Steppable — the only thing the scheduler knows about an entity
// =============================================================================
class Steppable
{
public:
	virtual ~Steppable() = default;

	// Checked before every step. true detaches the steppable for good.
	virtual bool remove(Instant now, Duration elapsed) = 0;

	// Must not block. elapsed is the time since this steppable's group last fired.
	virtual void step(Instant now, Duration elapsed) = 0;

	virtual const char *label() const { return typeid(*this).name(); }
};

// =============================================================================
// StepGate — binary gate that may be released by a thread other than the
// one that acquired it. The driver holds it for drain+step; pause() holds it
// until unpause().
// =============================================================================
class StepGate
{
	std::mutex mtx;
	std::condition_variable cv;
	bool held = false;

public:
	void acquire()
	{
		std::unique_lock<std::mutex> lk(mtx);
		cv.wait(lk, [this] { return !held; });
		held = true;
	}

	void release()
	{
		{
			std::lock_guard<std::mutex> lk(mtx);
			held = false;
		}
		cv.notify_one();
	}

	bool is_held()
	{
		std::lock_guard<std::mutex> lk(mtx);
		return held;
	}
};

// =============================================================================
// PendingQueue — registrations from any thread, drained only by the driver
// =============================================================================
struct Pending
{
	Steppable *steppable = nullptr;
	int divisor = 1;
	std::unique_ptr<Steppable> owned;
	uint64_t seq = 0;   // registration number, 0 for owned steppables
};

class PendingQueue
{
	mutable std::mutex mtx;
	std::vector<Pending> items;

public:
	void push(Pending p)
	{
		std::lock_guard<std::mutex> lk(mtx);
		items.push_back(std::move(p));
	}

	// Moves every queued entry into out, in arrival order.
	void drain(std::vector<Pending> &out)
	{
		out.clear();
		std::lock_guard<std::mutex> lk(mtx);
		out.swap(items);
	}

	size_t size() const
	{
		std::lock_guard<std::mutex> lk(mtx);
		return items.size();
	}
};

// =============================================================================
// RateGroup / RateTable
//
// One group per distinct divisor, kept strictly ascending. Only the driver
// touches the table, and only while it holds the step gate.
// =============================================================================
struct Member
{
	Steppable *steppable = nullptr;
	std::unique_ptr<Steppable> owned;
	uint64_t seq = 0;
};

struct RateGroup
{
	int divisor = 1;
	int countdown = 1;
	bool has_last_fire = false;
	Instant last_fire{};
	std::vector<Member> members;

	uint64_t fires = 0, last_us = 0, max_us = 0;

	explicit RateGroup(int d) : divisor(d), countdown(d) {}

	void record(uint64_t us)
	{
		last_us = us;
		if (us > max_us)
			max_us = us;
		fires++;
	}
};

class RateTable
{
	std::vector<RateGroup> group_list;

public:
	static int coerce_divisor(int divisor)
	{
		if (divisor < 1)
		{
			log(LogLevel::Warn, "invalid step divisor %d, using 1", divisor);
			return 1;
		}
		return divisor;
	}

	// Append to the group with an equal divisor, or insert a new group before
	// the first larger one. Existing groups are never reordered.
	RateGroup &merge(Pending &&p)
	{
		int divisor = coerce_divisor(p.divisor);
		Member m{p.steppable, std::move(p.owned), p.seq};

		size_t at = 0;
		for (; at < group_list.size(); ++at)
		{
			if (group_list[at].divisor == divisor)
			{
				group_list[at].members.push_back(std::move(m));
				return group_list[at];
			}
			if (group_list[at].divisor > divisor)
				break;
		}

		auto it = group_list.emplace(group_list.begin() + static_cast<std::ptrdiff_t>(at), divisor);
		it->members.push_back(std::move(m));
		return *it;
	}

	std::vector<RateGroup> &groups() { return group_list; }
	const std::vector<RateGroup> &groups() const { return group_list; }

	size_t steppable_count() const
	{
		size_t n = 0;
		for (const RateGroup &g : group_list)
			n += g.members.size();
		return n;
	}
};

// =============================================================================
// RemovalRegistry — one wait channel per steppable identity
//
// Every reference registration gets a sequence number. A removal is handed to
// exactly one thread already waiting on that steppable; with nobody waiting it
// is dropped, and an idle channel is erased. add_and_wait_steppable() enrols
// its caller before the registration is queued, so it cannot miss the removal,
// and it only accepts the removal of its own registration.
// =============================================================================
enum class WaitResult
{
	Removed,       // the steppable was detached by the driver
	Interrupted,   // interrupt_wait() or scheduler teardown; registration left as is
	NotRegistered  // nothing registered under this steppable, nothing to wait for
};

class RemovalRegistry
{
	struct Channel
	{
		std::condition_variable cv;
		uint32_t live = 0;
		uint32_t waiters = 0;
		uint64_t last_seq = 0;
		uint64_t interrupt_gen = 0;
		std::vector<uint64_t> signalled;   // removed registrations not yet taken
		std::vector<uint64_t> enrolled;    // registrations with their own waiter
	};

	std::mutex mtx;
	std::condition_variable idle_cv;
	std::unordered_map<const Steppable *, std::shared_ptr<Channel>> channels;
	uint32_t total_waiters = 0;
	bool closing = false;

	void prune(const Steppable *s, const std::shared_ptr<Channel> &ch)
	{
		if (ch->live != 0 || ch->waiters != 0)
			return;
		auto it = channels.find(s);
		if (it != channels.end() && it->second == ch)
			channels.erase(it);
	}

	std::shared_ptr<Channel> &open(const Steppable *s)
	{
		auto &ch = channels[s];
		if (!ch)
			ch = std::make_shared<Channel>();
		return ch;
	}

	// Caller is counted in ch->waiters; this removes it again. own_seq 0
	// accepts any removal not claimed by an enrolled waiter.
	WaitResult park(std::unique_lock<std::mutex> &lk, const Steppable *s,
	                std::shared_ptr<Channel> ch, uint64_t own_seq, uint64_t gen)
	{
		auto accepts = [&](uint64_t seq) {
			if (own_seq != 0)
				return seq == own_seq;
			return std::find(ch->enrolled.begin(), ch->enrolled.end(), seq) == ch->enrolled.end();
		};

		WaitResult r = WaitResult::Interrupted;
		if (!closing)
		{
			auto hit = ch->signalled.end();
			ch->cv.wait(lk, [&] {
				hit = std::find_if(ch->signalled.begin(), ch->signalled.end(), accepts);
				return hit != ch->signalled.end() || ch->interrupt_gen != gen;
			});
			if (hit != ch->signalled.end())
			{
				ch->signalled.erase(hit);
				r = WaitResult::Removed;
			}
		}

		if (own_seq != 0)
			ch->enrolled.erase(std::remove(ch->enrolled.begin(), ch->enrolled.end(), own_seq),
			                   ch->enrolled.end());
		ch->waiters--;
		total_waiters--;
		if (ch->waiters == 0)
			ch->signalled.clear();
		prune(s, ch);
		if (closing)
			idle_cv.notify_all();
		return r;
	}

public:
	// A registration whose caller is already counted as a waiter.
	struct Ticket
	{
		uint64_t seq = 0;
		uint64_t gen = 0;
	};

	uint64_t registered(const Steppable *s)
	{
		std::lock_guard<std::mutex> lk(mtx);
		Channel &ch = *open(s);
		ch.live++;
		return ++ch.last_seq;
	}

	Ticket enrol(const Steppable *s)
	{
		std::lock_guard<std::mutex> lk(mtx);
		Channel &ch = *open(s);
		ch.live++;
		ch.waiters++;
		total_waiters++;
		ch.enrolled.push_back(++ch.last_seq);
		return Ticket{ch.last_seq, ch.interrupt_gen};
	}

	void removed(const Steppable *s, uint64_t seq)
	{
		std::lock_guard<std::mutex> lk(mtx);
		auto it = channels.find(s);
		if (it == channels.end())
			return;
		std::shared_ptr<Channel> ch = it->second;
		if (ch->live > 0)
			ch->live--;
		bool claimed = std::find(ch->enrolled.begin(), ch->enrolled.end(), seq) != ch->enrolled.end();
		if (claimed || ch->waiters > ch->enrolled.size())
		{
			ch->signalled.push_back(seq);
			ch->cv.notify_all();
			return;
		}
		prune(s, ch);
	}

	// Waits for the next removal of any registration of s.
	WaitResult wait(const Steppable *s)
	{
		std::unique_lock<std::mutex> lk(mtx);
		if (closing)
			return WaitResult::Interrupted;
		auto it = channels.find(s);
		if (it == channels.end() || it->second->live == 0)
			return WaitResult::NotRegistered;

		std::shared_ptr<Channel> ch = it->second;
		ch->waiters++;
		total_waiters++;
		return park(lk, s, ch, 0, ch->interrupt_gen);
	}

	// Waits for the removal of the ticket's own registration.
	WaitResult wait(const Steppable *s, const Ticket &t)
	{
		std::unique_lock<std::mutex> lk(mtx);
		std::shared_ptr<Channel> ch = channels.at(s);
		return park(lk, s, ch, t.seq, t.gen);
	}

	// Wakes every thread currently waiting on s. Returns false if none were.
	bool interrupt(const Steppable *s)
	{
		std::lock_guard<std::mutex> lk(mtx);
		auto it = channels.find(s);
		if (it == channels.end())
			return false;
		Channel &ch = *it->second;
		ch.interrupt_gen++;
		ch.cv.notify_all();
		return ch.waiters > 0;
	}

	uint32_t waiting(const Steppable *s)
	{
		std::lock_guard<std::mutex> lk(mtx);
		auto it = channels.find(s);
		return it != channels.end() ? it->second->waiters : 0;
	}

	size_t channel_count()
	{
		std::lock_guard<std::mutex> lk(mtx);
		return channels.size();
	}

	// Interrupts every waiter and returns once all of them have left.
	void shutdown()
	{
		std::unique_lock<std::mutex> lk(mtx);
		closing = true;
		for (auto &kv : channels)
		{
			kv.second->interrupt_gen++;
			kv.second->cv.notify_all();
		}
		idle_cv.wait(lk, [this] { return total_waiters == 0; });
	}
};

// =============================================================================
// GroupStats — per-group snapshot published at the end of every tick
// =============================================================================
struct GroupStats
{
	int divisor = 1;
	int countdown = 1;
	size_t members = 0;
	uint64_t fires = 0, last_us = 0, max_us = 0;
};

// =============================================================================
// Scheduler — the driver loop
// =============================================================================
class Scheduler
{
	const double rate_hz;
	const Duration tick_len;

	StepGate gate;
	std::mutex pause_mtx;          // serializes pause()/unpause()
	std::atomic<bool> paused{false};

	// In-step flag, separate from the gate, used only to wake wait_for_end_of_step().
	mutable std::mutex step_mtx;
	std::condition_variable step_cv;
	bool stepping_active = false;
	std::thread::id stepping_thread;

	PendingQueue pending;
	RateTable table;
	RemovalRegistry removals;
	Instant logical_now;

	std::atomic<uint64_t> tick{0};
	std::atomic<size_t> member_count{0};

	mutable std::mutex stats_mtx;
	std::vector<GroupStats> stats;
	std::deque<std::string> fault_list;
	uint64_t fault_total = 0;

	std::thread driver;
	std::atomic<bool> running{false};
	std::mutex stop_mtx;
	std::condition_variable stop_cv;
	bool stop_requested = false;

	static double checked_rate(double hz)
	{
		if (!std::isfinite(hz) || hz <= 0.0 || hz > 1e9)
			throw std::invalid_argument("scheduler rate must be finite and in (0, 1e9] Hz");
		return hz;
	}

	static Duration tick_for(double hz)
	{
		return std::chrono::round<Duration>(std::chrono::duration<double>(1.0 / hz));
	}

public:
	explicit Scheduler(double hz = DEFAULT_RATE)
		: rate_hz(checked_rate(hz)), tick_len(tick_for(rate_hz)), logical_now(Clock::now())
	{
	}

	Scheduler(const Scheduler &) = delete;
	Scheduler &operator=(const Scheduler &) = delete;
	Scheduler(Scheduler &&) = delete;
	Scheduler &operator=(Scheduler &&) = delete;

	~Scheduler()
	{
		{
			std::lock_guard<std::mutex> lk(stop_mtx);
			stop_requested = true;
		}
		stop_cv.notify_all();
		unpause();
		if (driver.joinable())
			driver.join();
		removals.shutdown();
	}

	static std::unique_ptr<Scheduler> create(bool autostart = true, double hz = DEFAULT_RATE)
	{
		auto sched = std::make_unique<Scheduler>(hz);
		if (autostart)
			sched->start();
		return sched;
	}

	// ====== DRIVER THREAD ======
	void start()
	{
		if (running.exchange(true))
		{
			log(LogLevel::Warn, "start() ignored, driver already running");
			return;
		}
		if (tick.load() == 0)
			logical_now = Clock::now();
		driver = std::thread([this] { loop(); });
		log(LogLevel::Info, "driver started at %.1f Hz", rate_hz);
	}

	// Runs one drain+step phase on the calling thread, without sleeping.
	// Only for schedulers whose driver thread has not been started, and not
	// while paused: the gate is already held.
	void tick_once()
	{
		if (running.load())
			throw std::logic_error("tick_once: driver thread is running");
		if (paused.load())
			throw std::logic_error("tick_once: scheduler is paused");
		gate.acquire();
		run_tick();
	}

	// ====== REGISTRATION ======
	// s must outlive its registration.
	void add_steppable(Steppable &s, int divisor = 1)
	{
		uint64_t seq = removals.registered(&s);
		pending.push(Pending{&s, divisor, nullptr, seq});
	}

	// The scheduler owns s and destroys it after removal. Owned steppables
	// have no wait channel.
	void add_steppable(std::unique_ptr<Steppable> s, int divisor = 1)
	{
		if (!s)
			throw std::invalid_argument("add_steppable: null steppable");
		Steppable *raw = s.get();
		pending.push(Pending{raw, divisor, std::move(s)});
	}

	WaitResult add_and_wait_steppable(Steppable &s, int divisor = 1)
	{
		check_off_driver("add_and_wait_steppable");
		RemovalRegistry::Ticket t = removals.enrol(&s);
		pending.push(Pending{&s, divisor, nullptr, t.seq});
		return removals.wait(&s, t);
	}

	WaitResult wait_steppable(Steppable &s)
	{
		check_off_driver("wait_steppable");
		return removals.wait(&s);
	}

	bool interrupt_wait(Steppable &s) { return removals.interrupt(&s); }
	uint32_t waiting(Steppable &s) { return removals.waiting(&s); }
	size_t wait_channels() { return removals.channel_count(); }

	// ====== PAUSE GATE ======
	// Returns once no tick is in progress; no further tick starts until unpause().
	void pause()
	{
		check_off_driver("pause");
		std::lock_guard<std::mutex> lk(pause_mtx);
		if (paused.load())
			return;
		gate.acquire();
		paused.store(true);
	}

	void unpause()
	{
		std::lock_guard<std::mutex> lk(pause_mtx);
		if (!paused.load())
			return;
		paused.store(false);
		gate.release();
	}

	void wait_for_end_of_step()
	{
		check_off_driver("wait_for_end_of_step");
		std::unique_lock<std::mutex> lk(step_mtx);
		step_cv.wait(lk, [this] { return !stepping_active; });
	}

	// ====== STATE ======
	double target_rate() const { return rate_hz; }
	Duration tick_duration() const { return tick_len; }
	bool is_paused() const { return paused.load(); }
	bool is_running() const { return running.load(); }
	uint64_t tick_count() const { return tick.load(); }
	size_t steppable_count() const { return member_count.load(); }
	size_t pending_count() const { return pending.size(); }

	bool in_step() const
	{
		std::lock_guard<std::mutex> lk(step_mtx);
		return stepping_active;
	}

	std::vector<GroupStats> group_stats() const
	{
		std::lock_guard<std::mutex> lk(stats_mtx);
		return stats;
	}

	std::vector<std::string> faults() const
	{
		std::lock_guard<std::mutex> lk(stats_mtx);
		return {fault_list.begin(), fault_list.end()};
	}

	uint64_t fault_count() const
	{
		std::lock_guard<std::mutex> lk(stats_mtx);
		return fault_total;
	}

private:
	void check_off_driver(const char *what) const
	{
		std::lock_guard<std::mutex> lk(step_mtx);
		if (stepping_active && stepping_thread == std::this_thread::get_id())
			throw std::logic_error(std::string(what) + ": called from inside a step");
	}

	bool stop_pending()
	{
		std::lock_guard<std::mutex> lk(stop_mtx);
		return stop_requested;
	}

	void loop()
	{
		Instant next_wake = Clock::now();
		while (true)
		{
			gate.acquire();
			if (stop_pending())
			{
				gate.release();
				break;
			}
			run_tick();

			// Absolute deadlines keep the cadence from drifting; if we fall too
			// far behind, re-base instead of bursting ticks.
			next_wake += tick_len;
			Instant wall = Clock::now();
			if (wall - next_wake > tick_len * MAX_BEHIND_TICKS)
				next_wake = wall;

			std::unique_lock<std::mutex> lk(stop_mtx);
			if (stop_cv.wait_until(lk, next_wake, [this] { return stop_requested; }))
				break;
		}
		running.store(false);
	}

	// Caller holds the gate; released here.
	void run_tick()
	{
		std::vector<Member> removed;
		{
			std::lock_guard<std::mutex> lk(step_mtx);
			stepping_active = true;
			stepping_thread = std::this_thread::get_id();
		}

		try
		{
			logical_now += tick_len;
			merge_pending();
			for (RateGroup &g : table.groups())
				fire_group(g, logical_now, removed);
		}
		catch (const std::exception &e)
		{
			log(LogLevel::Error, "tick %llu aborted: %s", (unsigned long long)(tick.load() + 1), e.what());
		}

		tick.fetch_add(1);
		member_count.store(table.steppable_count());
		publish_stats();

		{
			std::lock_guard<std::mutex> lk(step_mtx);
			stepping_active = false;
			stepping_thread = std::thread::id();
		}
		gate.release();
		step_cv.notify_all();

		for (Member &m : removed)
		{
			if (!m.owned)
				removals.removed(m.steppable, m.seq);
		}
	}

	void merge_pending()
	{
		std::vector<Pending> batch;
		pending.drain(batch);
		for (Pending &p : batch)
			table.merge(std::move(p));
	}

	void fire_group(RateGroup &g, Instant now, std::vector<Member> &removed)
	{
		// The first visit only sets the baseline, so the first firing's elapsed
		// is measured from the tick the group first appeared.
		if (!g.has_last_fire)
		{
			g.last_fire = now;
			g.has_last_fire = true;
		}
		if (--g.countdown > 0)
			return;

		auto t0 = Clock::now();
		Duration elapsed = now - g.last_fire;

		size_t keep = 0;
		for (size_t i = 0; i < g.members.size(); ++i)
		{
			if (remove_or_step(g.members[i], now, elapsed))
			{
				removed.push_back(std::move(g.members[i]));
				continue;
			}
			if (keep != i)
				g.members[keep] = std::move(g.members[i]);
			keep++;
		}
		g.members.erase(g.members.begin() + static_cast<std::ptrdiff_t>(keep), g.members.end());

		g.last_fire = now;
		g.countdown = g.divisor;
		g.record(std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - t0).count());
	}

	// true when the member should leave its group.
	bool remove_or_step(Member &m, Instant now, Duration elapsed)
	{
		try
		{
			if (m.steppable->remove(now, elapsed))
				return true;
			m.steppable->step(now, elapsed);
		}
		catch (const std::exception &e)
		{
			record_fault(*m.steppable, e.what());
		}
		catch (...)
		{
			record_fault(*m.steppable, "unknown exception");
		}
		return false;
	}

	void record_fault(const Steppable &s, const char *what)
	{
		std::string line = std::string(s.label()) + ": " + what;
		log(LogLevel::Error, "fault in tick %llu: %s", (unsigned long long)(tick.load() + 1), line.c_str());

		std::lock_guard<std::mutex> lk(stats_mtx);
		fault_list.push_back(std::move(line));
		if (fault_list.size() > MAX_FAULTS)
			fault_list.pop_front();
		fault_total++;
	}

	void publish_stats()
	{
		std::vector<GroupStats> snap;
		snap.reserve(table.groups().size());
		for (const RateGroup &g : table.groups())
		{
			GroupStats gs;
			gs.divisor = g.divisor;
			gs.countdown = g.countdown;
			gs.members = g.members.size();
			gs.fires = g.fires;
			gs.last_us = g.last_us;
			gs.max_us = g.max_us;
			snap.push_back(gs);
		}
		std::lock_guard<std::mutex> lk(stats_mtx);
		stats.swap(snap);
	}
};

} // namespace sc
