// rover.cpp — stepcore demo: a toy rover driven by three steppables
// Run: ./rover [rate_hz]
//
// drive  (divisor 1) integrates position every tick
// sonar  (divisor 3) samples range every third tick
// turn   (timed)     main thread blocks in add_and_wait_steppable until done

#include "sc_core.hpp"
#include "sc_util.hpp"
#include "sc_stats.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>

using namespace sc;

constexpr double PI = 3.14159265358979323846;

// =============================================================================
// World — shared by every steppable; main only touches it while paused
// =============================================================================
struct World {
    double x = 0, y = 0, heading = 0;
    double speed = 0.5;      // m/s
    double turn_rate = 0;    // rad/s
    double range = 0;
    uint64_t pings = 0;
};

static double seconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

struct Drive : Steppable {
    World* w;
    explicit Drive(World* world) : w(world) {}

    bool remove(Instant, Duration) override { return false; }
    void step(Instant, Duration elapsed) override {
        double dt = seconds(elapsed);
        w->heading += w->turn_rate * dt;
        w->x += std::cos(w->heading) * w->speed * dt;
        w->y += std::sin(w->heading) * w->speed * dt;
    }
    const char* label() const override { return "drive"; }
};

struct Sonar : Steppable {
    World* w;
    explicit Sonar(World* world) : w(world) {}

    bool remove(Instant, Duration) override { return false; }
    void step(Instant, Duration) override {
        // Wall along x = 3
        double dx = 3.0 - w->x;
        double c = std::cos(w->heading);
        w->range = c > 1e-6 ? dx / c : 1e9;
        w->pings++;
    }
    const char* label() const override { return "sonar"; }
};

int main(int argc, char** argv) {
    double rate = DEFAULT_RATE;
    if (argc > 1) {
        char* end = nullptr;
        rate = strtod(argv[1], &end);
        if (end == argv[1] || *end != '\0') {
            fprintf(stderr, "[rover] bad rate '%s', usage: rover [hz]\n", argv[1]);
            return 1;
        }
    }

    World world;
    Drive drive(&world);
    Sonar sonar(&world);

    std::unique_ptr<Scheduler> sched;
    try {
        sched = Scheduler::create(true, rate);
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "[rover] %s\n", e.what());
        return 1;
    }
    sched->add_steppable(drive, 1);
    sched->add_steppable(sonar, 3);

    // Straight for one second
    TimedSteppable straight(std::chrono::seconds(1));
    sched->add_and_wait_steppable(straight);

    // Quarter turn over two seconds
    TimedSteppable turn(std::chrono::seconds(2), [&world](Instant, Duration) {
        world.turn_rate = (PI / 2) / 2.0;
    });
    sched->add_and_wait_steppable(turn);

    sched->pause();
    world.turn_rate = 0;
    printf("[rover] paused at (%.2f, %.2f) heading %.1f deg, range %.2f m, %llu pings\n",
           world.x, world.y, world.heading * 180.0 / PI, world.range,
           (unsigned long long)world.pings);
    sched->unpause();

    CountedSteppable settle(30);
    sched->add_and_wait_steppable(settle);

    sched->wait_for_end_of_step();
    print_stats(*sched);
    return 0;
}
