// src/core/resource.cc
#include "modules/resource.hh"
#include "modules/seize.hh"
#include "sim_context.hh"

#include <algorithm>

Resource::Resource(const std::string& n, SimContext* ctx)
    : Entity(n, ctx) {
    addOutput("Capacity", [this](double) -> json { return capacity; });
    addOutput("UnitsInUse", [this](double) -> json { return units_in_use; });
    addOutput("AvailableUnits", [this](double) -> json { return getAvailableUnits(); });
    addOutput("UnitsSeized", [this](double) -> json { return units_seized; });
    addOutput("UnitsReleased", [this](double) -> json { return units_released; });
    addOutput("Utilisation", [this](double t) -> json { return getUtilisation(t); });
}

void Resource::configure(const json& cfg) {
    Entity::configure(cfg);
    capacity = cfg.value("capacity", 1);
}

void Resource::validate() {
    Entity::validate();
    if (capacity < 0) {
        throw InputErrorException("Capacity can not be less than 0.");
    }
}

void Resource::earlyInit() {
    Entity::earlyInit();
    units_in_use = 0;
    units_seized = 0;
    units_released = 0;
    unit_ticks = 0.0;
    stats_start_tick = getSimTicks();
    last_update_tick = getSimTicks();

    seize_list.clear();
    for (Seize* s : context->getEntitiesOfType<Seize>()) {
        if (s->requiresResource(this)) seize_list.push_back(s);
    }
}

void Resource::clearStatistics() {
    Entity::clearStatistics();
    units_seized = 0;
    units_released = 0;
    unit_ticks = 0.0;
    stats_start_tick = getSimTicks();
    last_update_tick = getSimTicks();
}

void Resource::updateStatistics() {
    Tick now = getSimTicks();
    unit_ticks += static_cast<double>(units_in_use) * (now - last_update_tick);
    last_update_tick = now;
}

void Resource::seize(int n) {
    if (n < 0 || n > getAvailableUnits()) {
        error("Capacity of resource exceeded. Capacity: %d, units in use: %d, units requested: %d",
              capacity, units_in_use, n);
    }
    updateStatistics();
    units_in_use += n;
    units_seized += n;
    DPRINTF(RESOURCE, "[%s] t=%" PRId64 " seize %d (in use %d/%d)\n",
            name.c_str(), getSimTicks(), n, units_in_use, capacity);
}

void Resource::release(int n) {
    if (n < 0 || n > units_in_use) {
        error("Cannot release %d units, only %d in use", n, units_in_use);
    }
    updateStatistics();
    units_in_use -= n;
    units_released += n;
    DPRINTF(RESOURCE, "[%s] t=%" PRId64 " release %d (in use %d/%d)\n",
            name.c_str(), getSimTicks(), n, units_in_use, capacity);
    notifySeizeUsers();
}

void Resource::removeSeizeUser(Seize* s) {
    seize_list.erase(std::remove(seize_list.begin(), seize_list.end(), s), seize_list.end());
}

void Resource::notifySeizeUsers() {
    // 每个 Seize 至多尝试一次，优先队头等待最久的
    std::vector<Seize*> tried;
    while (true) {
        Seize* best = nullptr;
        Tick best_tick = MAX_TICK;
        for (Seize* s : seize_list) {
            if (std::find(tried.begin(), tried.end(), s) != tried.end()) continue;
            if (!s->isIdle() || s->getWaitQueue()->isEmpty()) continue;
            Tick t = s->getWaitQueue()->getFirstEntryTick();
            if (!best || t < best_tick) {
                best = s;
                best_tick = t;
            }
        }
        if (!best) break;

        tried.push_back(best);
        if (best->isReadyToStart()) best->resourcesReleased();
    }
}

double Resource::getUtilisation(double simTime) const {
    Tick now = event_manager->secondsToNearestTick(simTime);
    Tick dur = now - stats_start_tick;
    if (dur <= 0 || capacity == 0) return 0.0;
    double total = unit_ticks + static_cast<double>(units_in_use) * (now - last_update_tick);
    return total / (static_cast<double>(capacity) * dur);
}
