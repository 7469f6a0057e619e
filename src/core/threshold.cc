// src/core/threshold.cc
#include "threshold.hh"
#include "sim_context.hh"

#include <algorithm>

void ThresholdChangedTarget::addUser(ThresholdUser* u) {
    if (std::find(users.begin(), users.end(), u) == users.end()) {
        users.push_back(u);
    }
}

void ThresholdChangedTarget::removeUser(ThresholdUser* u) {
    users.erase(std::remove(users.begin(), users.end(), u), users.end());
    std::replace(running.begin(), running.end(), u, static_cast<ThresholdUser*>(nullptr));
}

void ThresholdChangedTarget::process() {
    // 通知过程中可能再次改变阈值，先取出本批用户
    running.clear();
    running.swap(users);
    for (size_t i = 0; i < running.size(); ++i) {
        if (running[i]) running[i]->thresholdChanged();
    }
    running.clear();
}

Threshold::Threshold(const std::string& n, SimContext* ctx)
    : StateEntity(n, ctx) {
    addOutput("Open", [this](double) -> json { return open; });
    addOutput("OpenFraction", [this](double t) -> json { return getOpenFraction(t); });
    addOutput("ClosedFraction", [this](double t) -> json { return getClosedFraction(t); });
}

void Threshold::earlyInit() {
    StateEntity::earlyInit();
    context->getThresholdChangedTarget().clear();
    open = (getInitialState() == "Open");

    user_list.clear();
    for (ThresholdUser* u : context->getEntitiesOfType<ThresholdUser>()) {
        std::vector<Threshold*> list = u->getThresholds();
        if (std::find(list.begin(), list.end(), this) != list.end()) {
            user_list.push_back(u);
        }
    }
}

void Threshold::setOpen(bool bool_val) {
    if (open == bool_val) return;

    open = bool_val;
    setPresentState(open ? "Open" : "Closed");
    DPRINTF(THRESHOLD, "[%s] t=%" PRId64 " %s\n", name.c_str(), getSimTicks(), open ? "open" : "close");

    ThresholdChangedTarget& target = context->getThresholdChangedTarget();
    for (ThresholdUser* u : user_list) {
        target.addUser(u);
    }
    if (target.hasUsers() && !target.getHandle()->isScheduled()) {
        scheduleProcessTicks(0, PRIORITY_NOTIFY, false, &target, target.getHandle());
    }
}

void Threshold::removeUser(ThresholdUser* u) {
    user_list.erase(std::remove(user_list.begin(), user_list.end(), u), user_list.end());
}

double Threshold::getOpenFraction(double simTime) const {
    Tick simTicks = event_manager->secondsToNearestTick(simTime);
    Tick open_ticks = getTicksInState(simTicks, "Open");
    Tick closed_ticks = getTicksInState(simTicks, "Closed");
    Tick total = open_ticks + closed_ticks;
    return total > 0 ? static_cast<double>(open_ticks) / total : 0.0;
}

double Threshold::getClosedFraction(double simTime) const {
    Tick simTicks = event_manager->secondsToNearestTick(simTime);
    Tick open_ticks = getTicksInState(simTicks, "Open");
    Tick closed_ticks = getTicksInState(simTicks, "Closed");
    Tick total = open_ticks + closed_ticks;
    return total > 0 ? static_cast<double>(closed_ticks) / total : 0.0;
}

void SignalThreshold::configure(const json& cfg) {
    Threshold::configure(cfg);
    initial_open = cfg.value("initial_open", true);
}
