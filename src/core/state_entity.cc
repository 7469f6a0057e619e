// src/core/state_entity.cc
#include "state_entity.hh"
#include "sim_context.hh"

#include <algorithm>

StateEntity::StateEntity(const std::string& n, SimContext* ctx)
    : Entity(n, ctx) {
    addOutput("State", [this](double) -> json {
        return present_state ? json(present_state->name) : json(nullptr);
    });
    addOutput("WorkingTime", [this](double) -> json { return getWorkingTime(); });
}

void StateEntity::configure(const json& cfg) {
    Entity::configure(cfg);
    working_state_list.clear();
    if (cfg.contains("working_state_list")) {
        for (const auto& s : cfg["working_state_list"]) {
            working_state_list.push_back(s.get<std::string>());
        }
    }
}

void StateEntity::validate() {
    Entity::validate();
    std::string init = getInitialState();
    if (!isValidState(init)) {
        throw InputErrorException("Invalid initial state: " + init);
    }
    for (const auto& s : working_state_list) {
        if (!isValidState(s)) {
            throw InputErrorException("Invalid working state: " + s);
        }
    }
}

void StateEntity::earlyInit() {
    Entity::earlyInit();
    Tick now = getSimTicks();
    states.clear();
    working_ticks = 0;
    last_state_update = now;
    present_state = getRecord(getInitialState());
    present_state->start_tick = now;
}

void StateEntity::lateInit() {
    Entity::lateInit();
    // 保留此前通过 addListener 注册的监听者
    for (StateEntityListener* l : context->getEntitiesOfType<StateEntityListener>()) {
        if (l->isWatching(this)) addListener(l);
    }
}

StateRecord* StateEntity::getRecord(const std::string& state) {
    auto it = states.find(state);
    if (it != states.end()) return &it->second;

    StateRecord& rec = states[state];
    rec.name = state;
    if (working_state_list.empty()) {
        rec.working = isValidWorkingState(state);
    } else {
        rec.working = std::find(working_state_list.begin(), working_state_list.end(), state)
                      != working_state_list.end();
    }
    return &rec;
}

void StateEntity::updateStateTicks(Tick now) {
    Tick dur = now - last_state_update;
    if (dur <= 0) return;
    present_state->total_ticks += dur;
    present_state->current_cycle_ticks += dur;
    if (present_state->working) working_ticks += dur;
    last_state_update = now;
}

void StateEntity::setPresentState(const std::string& state) {
    if (present_state && present_state->name == state) return;

    if (!isValidState(state)) {
        error("Invalid state: %s", state.c_str());
    }

    Tick now = getSimTicks();
    if (present_state) updateStateTicks(now);

    StateRecord* prev = present_state;
    StateRecord* next = getRecord(state);
    next->start_tick = now;
    present_state = next;

    DPRINTF(STATE, "[%s] t=%" PRId64 " %s -> %s\n", name.c_str(), now,
            prev ? prev->name.c_str() : "-", state.c_str());

    for (size_t i = 0; i < listeners.size(); ++i) {
        listeners[i]->updateForStateChange(this, prev, next);
    }
}

const std::string& StateEntity::getPresentState() const {
    static const std::string none;
    return present_state ? present_state->name : none;
}

void StateEntity::addListener(StateEntityListener* l) {
    if (std::find(listeners.begin(), listeners.end(), l) == listeners.end()) {
        listeners.push_back(l);
    }
}

void StateEntity::removeListener(StateEntityListener* l) {
    listeners.erase(std::remove(listeners.begin(), listeners.end(), l), listeners.end());
}

std::vector<std::string> StateEntity::getStateNames() const {
    std::vector<std::string> ret;
    for (const auto& kv : states) ret.push_back(kv.first);
    return ret;
}

Tick StateEntity::getTicksInState(Tick simTicks, const std::string& state) const {
    auto it = states.find(state);
    if (it == states.end()) return 0;
    Tick ticks = it->second.total_ticks;
    if (&it->second == present_state) ticks += simTicks - last_state_update;
    return ticks;
}

double StateEntity::getTimeInState(double simTime, const std::string& state) const {
    Tick simTicks = event_manager->secondsToNearestTick(simTime);
    return event_manager->ticksToSeconds(getTicksInState(simTicks, state));
}

Tick StateEntity::getCurrentCycleTicks(Tick simTicks, const std::string& state) const {
    auto it = states.find(state);
    if (it == states.end()) return 0;
    Tick ticks = it->second.current_cycle_ticks;
    if (&it->second == present_state) ticks += simTicks - last_state_update;
    return ticks;
}

Tick StateEntity::getCompletedCycleTicks(const std::string& state) const {
    auto it = states.find(state);
    return it == states.end() ? 0 : it->second.completed_cycle_ticks;
}

Tick StateEntity::getTotalTicks(Tick simTicks) const {
    Tick total = 0;
    for (const auto& kv : states) {
        total += getTicksInState(simTicks, kv.first);
    }
    return total;
}

void StateEntity::collectCycleStats() {
    if (!present_state) return;
    updateStateTicks(getSimTicks());
    for (auto& kv : states) {
        kv.second.completed_cycle_ticks = kv.second.current_cycle_ticks;
        kv.second.current_cycle_ticks = 0;
    }
}

void StateEntity::clearStatistics() {
    Entity::clearStatistics();
    if (!present_state) return;
    updateStateTicks(getSimTicks());
    last_state_update = getSimTicks();
    for (auto& kv : states) {
        kv.second.total_ticks = 0;
        kv.second.current_cycle_ticks = 0;
        kv.second.completed_cycle_ticks = 0;
    }
}

Tick StateEntity::getWorkingTicks() const {
    Tick ticks = working_ticks;
    if (isWorking()) ticks += getSimTicks() - last_state_update;
    return ticks;
}

double StateEntity::getWorkingTime() const {
    return event_manager->ticksToSeconds(getWorkingTicks());
}
