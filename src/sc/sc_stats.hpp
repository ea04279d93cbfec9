// sc_stats.hpp — plain-text scheduler report
//
// Shows:
//   - rate / tick / steppable count / pause state
//   - Group table: divisor | members | countdown | fires | last | max
//   - The most recent entity faults
//
// Usage:
//   sc::print_stats(*sched);            // stdout
//   sc::print_stats(*sched, stderr, 10);

#pragma once
#include "sc_core.hpp"
#include <cstdio>

namespace sc {

namespace detail {

inline void fmt_us(char* buf, int n, uint64_t us) {
	if (us >= 1000)
		snprintf(buf, n, "%llu.%01llu ms",
			(unsigned long long)(us / 1000),
			(unsigned long long)((us % 1000) / 100));
	else
		snprintf(buf, n, "%llu us", (unsigned long long)us);
}

} // namespace detail

inline void print_stats(const Scheduler& sched, FILE* out = stdout, size_t max_faults = 5) {
	const char* state = sched.is_paused() ? "  |paused|" : "";
	fprintf(out, "rate:%.1f Hz  tick:%llu  steppables:%zu  pending:%zu%s\n",
		sched.target_rate(), (unsigned long long)sched.tick_count(),
		sched.steppable_count(), sched.pending_count(), state);

	fprintf(out, "%8s %8s %6s %10s %10s %10s\n", "divisor", "members", "cd", "fires", "last", "max");
	for (const GroupStats& g : sched.group_stats()) {
		char last[16], max[16];
		detail::fmt_us(last, sizeof(last), g.last_us);
		detail::fmt_us(max, sizeof(max), g.max_us);
		fprintf(out, "%8d %8zu %6d %10llu %10s %10s\n",
			g.divisor, g.members, g.countdown, (unsigned long long)g.fires, last, max);
	}

	uint64_t total = sched.fault_count();
	if (total == 0 || max_faults == 0) return;

	std::vector<std::string> faults = sched.faults();
	size_t first = faults.size() > max_faults ? faults.size() - max_faults : 0;
	fprintf(out, "faults: %llu\n", (unsigned long long)total);
	for (size_t i = first; i < faults.size(); i++)
		fprintf(out, "  %s\n", faults[i].c_str());
}

} // namespace sc
