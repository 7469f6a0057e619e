// src/core/downtime_entity.cc
#include "downtime_entity.hh"
#include "utils/config_utils.hh"

#include <algorithm>
#include <cmath>
#include <limits>

const char* downtimeTypeName(DowntimeType t) {
    switch (t) {
        case DowntimeType::IMMEDIATE: return "IMMEDIATE";
        case DowntimeType::FORCED: return "FORCED";
        case DowntimeType::OPPORTUNISTIC: return "OPPORTUNISTIC";
    }
    return "UNKNOWN";
}

DowntimeEntity::DowntimeEntity(const std::string& n, SimContext* ctx)
    : StateEntity(n, ctx),
      schedule_downtime_target(this, &DowntimeEntity::scheduleDowntime, "scheduleDowntime"),
      end_downtime_target(this, &DowntimeEntity::endDowntime, "endDowntime") {
    addOutput("StartTime", [this](double) -> json { return start_time; });
    addOutput("EndTime", [this](double) -> json { return end_time; });
    addOutput("CalculatedDowntimeRatio", [this](double t) -> json { return getCalculatedDowntimeRatio(t); });
    addOutput("Availability", [this](double t) -> json { return getAvailability(t); });
}

void DowntimeEntity::configure(const json& cfg) {
    StateEntity::configure(cfg);
    first_downtime = getSampleInput(context, cfg, "first_downtime");
    interval = getSampleInput(context, cfg, "interval", true);
    duration = getSampleInput(context, cfg, "duration", true);
    interval_working_entity = getEntityInput<StateEntity>(context, cfg, "interval_working_entity");
    duration_working_entity = getEntityInput<StateEntity>(context, cfg, "duration_working_entity");
    concurrent = cfg.value("concurrent", false);

    std::string type_name = cfg.value("downtime_type", std::string("IMMEDIATE"));
    if (type_name == "IMMEDIATE") {
        type = DowntimeType::IMMEDIATE;
    } else if (type_name == "FORCED") {
        type = DowntimeType::FORCED;
    } else if (type_name == "OPPORTUNISTIC") {
        type = DowntimeType::OPPORTUNISTIC;
    } else {
        throw InputErrorException("Unknown downtime type: " + type_name);
    }
}

void DowntimeEntity::validate() {
    StateEntity::validate();
    if (!interval) throw InputErrorException("Missing required input: interval");
    if (!duration) throw InputErrorException("Missing required input: duration");
    if (interval->getMinValue() < 0) {
        throw InputErrorException("Interval values can not be less than 0.");
    }
    if (duration->getMinValue() < 0) {
        throw InputErrorException("Duration values can not be less than 0.");
    }
    if (first_downtime && first_downtime->getMinValue() < 0) {
        throw InputErrorException("First downtime values can not be less than 0.");
    }
}

void DowntimeEntity::earlyInit() {
    StateEntity::earlyInit();
    down = false;
    pending_count = 0;
    pending_start_time = 0.0;
    start_time = 0.0;
    end_time = 0.0;

    user_list.clear();
    for (DowntimeUser* du : context->getEntitiesOfType<DowntimeUser>()) {
        std::vector<DowntimeEntity*> maint = du->getMaintenanceEntities();
        std::vector<DowntimeEntity*> brk = du->getBreakdownEntities();
        if (std::find(maint.begin(), maint.end(), this) != maint.end() ||
            std::find(brk.begin(), brk.end(), this) != brk.end()) {
            user_list.push_back(du);
        }
    }
}

void DowntimeEntity::lateInit() {
    StateEntity::lateInit();
    if (first_downtime) {
        seconds_for_next_failure = first_downtime->getNextSample(getSimTime());
    } else {
        seconds_for_next_failure = interval->getNextSample(getSimTime());
    }
}

void DowntimeEntity::startUp() {
    StateEntity::startUp();
    checkProcessNetwork();
}

void DowntimeEntity::kill() {
    killEvent(&schedule_downtime_handle);
    killEvent(&end_downtime_handle);
    if (interval_working_entity) interval_working_entity->removeListener(this);
    if (duration_working_entity) duration_working_entity->removeListener(this);
    for (DowntimeUser* du : user_list) {
        if (StateEntity* ent = dynamic_cast<StateEntity*>(du)) ent->removeListener(this);
    }
    user_list.clear();
    StateEntity::kill();
}

void DowntimeEntity::removeUser(DowntimeUser* du) {
    auto it = std::find(user_list.begin(), user_list.end(), du);
    if (it == user_list.end()) return;
    user_list.erase(it);
    if (pending_count > 0 && !down) checkProcessNetwork();
}

void DowntimeEntity::checkProcessNetwork() {
    // 安排下一次停机
    if (!schedule_downtime_handle.isScheduled()) {
        if (!interval_working_entity) {
            double wait_secs = seconds_for_next_failure - getSimTime();
            scheduleProcess(std::max(wait_secs, 0.0), PRIORITY_WORK,
                            &schedule_downtime_target, &schedule_downtime_handle);
        } else if (interval_working_entity->isWorking()) {
            double wait_secs = seconds_for_next_failure - interval_working_entity->getWorkingTime();
            scheduleProcess(std::max(wait_secs, 0.0), PRIORITY_WORK,
                            &schedule_downtime_target, &schedule_downtime_handle);
        }
    } else if (interval_working_entity && !interval_working_entity->isWorking()) {
        // 工作时间停止累计，取消已安排的事件
        killEvent(&schedule_downtime_handle);
    }

    // 正在停机：安排修复完成
    if (down) {
        if (!duration_working_entity) {
            if (end_downtime_handle.isScheduled()) return;
            double wait_secs = seconds_for_next_repair - getSimTime();
            scheduleProcess(std::max(wait_secs, 0.0), PRIORITY_WORK,
                            &end_downtime_target, &end_downtime_handle);
            return;
        }
        if (duration_working_entity->isWorking()) {
            if (end_downtime_handle.isScheduled()) return;
            double wait_secs = seconds_for_next_repair - duration_working_entity->getWorkingTime();
            scheduleProcess(std::max(wait_secs, 0.0), PRIORITY_WORK,
                            &end_downtime_target, &end_downtime_handle);
        } else {
            killEvent(&end_downtime_handle);
        }
        return;
    }

    // 有待执行的停机，且所有用户都已就绪
    if (pending_count > 0) {
        for (DowntimeUser* du : user_list) {
            if (!du->canStartDowntime(this)) return;
        }
        startDowntime();
    }
}

void DowntimeEntity::scheduleDowntime() {
    pending_count++;
    if (pending_count == 1) pending_start_time = getSimTime();

    if (!interval_working_entity) {
        seconds_for_next_failure += interval->getNextSample(getSimTime());
    } else {
        seconds_for_next_failure = interval_working_entity->getWorkingTime()
                                   + interval->getNextSample(getSimTime());
    }

    DPRINTF(DOWNTIME, "[%s] t=%" PRId64 " downtime due (pending=%d)\n",
            name.c_str(), getSimTicks(), pending_count);

    for (size_t i = 0; i < user_list.size(); ++i) {
        DowntimeUser* du = user_list[i];
        LambdaTarget prepare([this, du]() { du->prepareForDowntime(this); }, "prepareForDowntime");
        startProcess(&prepare);
    }
    checkProcessNetwork();
}

void DowntimeEntity::startDowntime() {
    setDown(true);
    start_time = getSimTime();
    pending_count--;

    double dur = duration->getNextSample(getSimTime());
    if (!duration_working_entity) {
        seconds_for_next_repair = getSimTime() + dur;
    } else {
        seconds_for_next_repair = duration_working_entity->getWorkingTime() + dur;
    }
    end_time = start_time + dur;

    DPRINTF(DOWNTIME, "[%s] t=%" PRId64 " start downtime (%g s)\n", name.c_str(), getSimTicks(), dur);

    for (size_t i = 0; i < user_list.size(); ++i) {
        user_list[i]->startDowntime(this);
    }
    checkProcessNetwork();
}

void DowntimeEntity::endDowntime() {
    setDown(false);
    DPRINTF(DOWNTIME, "[%s] t=%" PRId64 " end downtime\n", name.c_str(), getSimTicks());

    for (size_t i = 0; i < user_list.size(); ++i) {
        user_list[i]->endDowntime(this);
    }
    checkProcessNetwork();
}

void DowntimeEntity::setDown(bool bool_val) {
    down = bool_val;
    setPresentState(down ? "Downtime" : "Working");
}

bool DowntimeEntity::isWatching(StateEntity* ent) const {
    if (ent == interval_working_entity || ent == duration_working_entity) return true;
    DowntimeUser* du = dynamic_cast<DowntimeUser*>(ent);
    if (!du) return false;
    return std::find(user_list.begin(), user_list.end(), du) != user_list.end();
}

void DowntimeEntity::updateForStateChange(StateEntity* ent, StateRecord* prev, StateRecord* next) {
    checkProcessNetwork();
}

double DowntimeEntity::getTimeUntilNextEvent() const {
    if (!interval_working_entity) {
        return seconds_for_next_failure - getSimTime();
    }
    if (interval_working_entity->isWorking()) {
        return seconds_for_next_failure - interval_working_entity->getWorkingTime();
    }
    return std::numeric_limits<double>::infinity();
}

double DowntimeEntity::getCalculatedDowntimeRatio(double simTime) const {
    double dur = duration->getMeanValue(simTime);
    double iat = interval->getMeanValue(simTime);
    return dur / iat;
}

double DowntimeEntity::getAvailability(double simTime) const {
    double total = simTime;
    double init = context->getInitializationTime();
    if (simTime > init) total -= init;
    if (total <= 0.0) return 1.0;
    return 1.0 - getTimeInState(simTime, "Downtime") / total;
}
