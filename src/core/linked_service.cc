// src/core/linked_service.cc
#include "linked_service.hh"
#include "utils/config_utils.hh"

#include <algorithm>

static bool containsDowntime(const std::vector<DowntimeEntity*>& list, DowntimeEntity* down) {
    return std::find(list.begin(), list.end(), down) != list.end();
}

static bool anyDown(const std::vector<DowntimeEntity*>& list) {
    for (DowntimeEntity* de : list) {
        if (de->isDown()) return true;
    }
    return false;
}

LinkedService::LinkedService(const std::string& n, SimContext* ctx)
    : LinkedComponent(n, ctx), end_action_target(this, &LinkedService::endAction, "endAction") {
    addOutput("MatchValue", [this](double) -> json {
        return match_value ? json(*match_value) : json(nullptr);
    });
    addOutput("Open", [this](double) -> json { return isOpen(); });
    addOutput("Working", [this](double) -> json { return isBusy(); });
    addOutput("Maintenance", [this](double) -> json { return isMaintenance(); });
    addOutput("Breakdown", [this](double) -> json { return isBreakdown(); });
    addOutput("Utilisation", [this](double t) -> json { return getUtilisation(t); });
    addOutput("Commitment", [this](double t) -> json { return getCommitment(t); });
    addOutput("Availability", [this](double t) -> json { return getAvailability(t); });
    addOutput("Reliability", [this](double t) -> json { return getReliability(t); });
}

void LinkedService::configure(const json& cfg) {
    LinkedComponent::configure(cfg);
    wait_queue = getEntityInput<Queue>(context, cfg, "wait_queue");
    match = getSampleInput(context, cfg, "match");

    immediate_threshold_list = getEntityListInput<Threshold>(context, cfg, "immediate_thresholds");
    operating_threshold_list = getEntityListInput<Threshold>(context, cfg, "operating_thresholds");

    immediate_maintenance_list = getEntityListInput<DowntimeEntity>(context, cfg, "immediate_maintenance");
    forced_maintenance_list = getEntityListInput<DowntimeEntity>(context, cfg, "forced_maintenance");
    opportunistic_maintenance_list = getEntityListInput<DowntimeEntity>(context, cfg, "opportunistic_maintenance");
    immediate_breakdown_list = getEntityListInput<DowntimeEntity>(context, cfg, "immediate_breakdown");
    forced_breakdown_list = getEntityListInput<DowntimeEntity>(context, cfg, "forced_breakdown");
    opportunistic_breakdown_list = getEntityListInput<DowntimeEntity>(context, cfg, "opportunistic_breakdown");
    maintenance_list = getEntityListInput<DowntimeEntity>(context, cfg, "maintenance");
    breakdown_list = getEntityListInput<DowntimeEntity>(context, cfg, "breakdowns");
}

void LinkedService::validate() {
    LinkedComponent::validate();
    if (!wait_queue) {
        throw InputErrorException("Missing required input: wait_queue");
    }
}

void LinkedService::earlyInit() {
    LinkedComponent::earlyInit();
    busy = false;
    match_value.reset();
    start_time = 0.0;
    duration = 0.0;
    forced_downtime_pending = false;
    process_killed = false;
    stop_work_time = 0.0;
}

void LinkedService::startUp() {
    LinkedComponent::startUp();
    // 初始关闭的阈值
    updatePresentState();
}

void LinkedService::kill() {
    if (isDead()) return;
    killEvent(&end_action_handle);

    // 不再响应队列、阈值和停机
    for (Queue* q : getQueues()) q->removeUser(this);
    for (Threshold* thr : getThresholds()) thr->removeUser(this);
    context->getThresholdChangedTarget().removeUser(this);
    for (DowntimeEntity* down : getMaintenanceEntities()) down->removeUser(this);
    for (DowntimeEntity* down : getBreakdownEntities()) down->removeUser(this);

    LinkedComponent::kill();
}

bool LinkedService::isValidState(const std::string& state) const {
    return state == "Working" || state == "Clearing_while_Stopped" || state == "Stopped"
        || state == "Maintenance" || state == "Breakdown" || state == "Idle";
}

void LinkedService::addEntity(SimEntity* ent) {
    wait_queue->addEntity(ent);
}

SimEntity* LinkedService::getNextEntityForMatch(std::optional<int> m) {
    SimEntity* ent = wait_queue->removeFirstForMatch(m);
    if (ent) registerEntity(ent);
    return ent;
}

std::optional<int> LinkedService::getNextMatchValue(double simTime) {
    match_value.reset();
    if (match) match_value = static_cast<int>(match->getNextSample(simTime));
    return match_value;
}

std::vector<Queue*> LinkedService::getQueues() const {
    std::vector<Queue*> ret;
    if (wait_queue) ret.push_back(wait_queue);
    return ret;
}

void LinkedService::queueChanged() {
    restartAction();
}

// ----------------------------------------------------------------------------
// 服务循环
// ----------------------------------------------------------------------------

void LinkedService::setBusy(bool bool_val) {
    if (bool_val == busy) return;
    if (!bool_val) stop_work_time = getSimTime();
    busy = bool_val;
}

void LinkedService::startAction() {
    // 强制停机等待中：本工件完成后停下
    if (forced_downtime_pending) {
        forced_downtime_pending = false;
        stopAction();
        return;
    }

    if (!isOpen()) {
        stopAction();
        return;
    }

    double simTime = getSimTime();
    if (!startProcessing(simTime)) {
        stopAction();
        return;
    }

    if (!isBusy()) {
        setBusy(true);
        updatePresentState();
    }

    start_time = simTime;
    duration = getProcessingTime(simTime);
    scheduleProcess(duration, PRIORITY_WORK, &end_action_target, &end_action_handle);
}

void LinkedService::endAction() {
    endProcessing(getSimTime());
    startAction();
}

void LinkedService::stopAction() {
    if (end_action_handle.isScheduled()) {
        killEvent(&end_action_handle);
        process_killed = true;
    }
    setBusy(false);
    updatePresentState();
}

void LinkedService::restartAction() {
    if (isIdle()) {
        if (process_killed) {
            process_killed = false;
            if (updateForStoppage(start_time, stop_work_time, getSimTime())) {
                // 续做：扣除已完成的部分
                setBusy(true);
                updatePresentState();
                duration -= stop_work_time - start_time;
                start_time = getSimTime();
                scheduleProcess(duration, PRIORITY_WORK, &end_action_target, &end_action_handle);
                return;
            }
        }
        startAction();
        return;
    }
    updatePresentState();
}

// ----------------------------------------------------------------------------
// 阈值
// ----------------------------------------------------------------------------

std::vector<Threshold*> LinkedService::getThresholds() const {
    std::vector<Threshold*> ret(operating_threshold_list);
    ret.insert(ret.end(), immediate_threshold_list.begin(), immediate_threshold_list.end());
    return ret;
}

void LinkedService::thresholdChanged() {
    if (isImmediateThresholdClosure()) {
        stopAction();
        return;
    }
    restartAction();
}

bool LinkedService::isImmediateThresholdClosure() const {
    for (Threshold* thr : immediate_threshold_list) {
        if (!thr->isOpen()) return true;
    }
    return false;
}

// ----------------------------------------------------------------------------
// 状态
// ----------------------------------------------------------------------------

bool LinkedService::isOpen() const {
    for (Threshold* thr : immediate_threshold_list) {
        if (!thr->isOpen()) return false;
    }
    for (Threshold* thr : operating_threshold_list) {
        if (!thr->isOpen()) return false;
    }
    return true;
}

bool LinkedService::isMaintenance() const {
    return anyDown(immediate_maintenance_list) || anyDown(forced_maintenance_list)
        || anyDown(opportunistic_maintenance_list) || anyDown(maintenance_list);
}

bool LinkedService::isBreakdown() const {
    return anyDown(immediate_breakdown_list) || anyDown(forced_breakdown_list)
        || anyDown(opportunistic_breakdown_list) || anyDown(breakdown_list);
}

bool LinkedService::isIdle() const {
    return !isBusy() && isOpen() && !isMaintenance() && !isBreakdown();
}

bool LinkedService::isUnableToWork() const {
    return !isBusy() && (!isOpen() || isMaintenance() || isBreakdown());
}

void LinkedService::updatePresentState() {
    if (isBusy()) {
        setPresentState(isOpen() ? "Working" : "Clearing_while_Stopped");
        return;
    }
    if (!isOpen()) {
        setPresentState("Stopped");
        return;
    }
    if (isMaintenance()) {
        setPresentState("Maintenance");
        return;
    }
    if (isBreakdown()) {
        setPresentState("Breakdown");
        return;
    }
    setPresentState("Idle");
}

// ----------------------------------------------------------------------------
// 维护与故障
// ----------------------------------------------------------------------------

std::vector<DowntimeEntity*> LinkedService::getMaintenanceEntities() const {
    std::vector<DowntimeEntity*> ret(immediate_maintenance_list);
    ret.insert(ret.end(), forced_maintenance_list.begin(), forced_maintenance_list.end());
    ret.insert(ret.end(), opportunistic_maintenance_list.begin(), opportunistic_maintenance_list.end());
    ret.insert(ret.end(), maintenance_list.begin(), maintenance_list.end());
    return ret;
}

std::vector<DowntimeEntity*> LinkedService::getBreakdownEntities() const {
    std::vector<DowntimeEntity*> ret(immediate_breakdown_list);
    ret.insert(ret.end(), forced_breakdown_list.begin(), forced_breakdown_list.end());
    ret.insert(ret.end(), opportunistic_breakdown_list.begin(), opportunistic_breakdown_list.end());
    ret.insert(ret.end(), breakdown_list.begin(), breakdown_list.end());
    return ret;
}

bool LinkedService::hasDowntimeOfType(DowntimeEntity* down, DowntimeType t) const {
    if (down->getType() != t) return false;
    return containsDowntime(maintenance_list, down) || containsDowntime(breakdown_list, down);
}

bool LinkedService::isImmediateDowntime(DowntimeEntity* down) const {
    return containsDowntime(immediate_maintenance_list, down) || containsDowntime(immediate_breakdown_list, down)
        || hasDowntimeOfType(down, DowntimeType::IMMEDIATE);
}

bool LinkedService::isForcedDowntime(DowntimeEntity* down) const {
    return containsDowntime(forced_maintenance_list, down) || containsDowntime(forced_breakdown_list, down)
        || hasDowntimeOfType(down, DowntimeType::FORCED);
}

bool LinkedService::isOpportunisticDowntime(DowntimeEntity* down) const {
    return containsDowntime(opportunistic_maintenance_list, down)
        || containsDowntime(opportunistic_breakdown_list, down)
        || hasDowntimeOfType(down, DowntimeType::OPPORTUNISTIC);
}

bool LinkedService::canStartDowntime(DowntimeEntity* down) const {
    // 只能从 Idle 开始；concurrent 停机可与其他停机并行
    if (isBusy() || !isOpen()) return false;
    if (!isMaintenance() && !isBreakdown()) return true;
    return down->isConcurrent();
}

void LinkedService::prepareForDowntime(DowntimeEntity* down) {
    if (isImmediateDowntime(down)) {
        stopAction();
        return;
    }
    if (isForcedDowntime(down) && isBusy()) {
        forced_downtime_pending = true;
    }
}

void LinkedService::startDowntime(DowntimeEntity* down) {
    updatePresentState();
}

void LinkedService::endDowntime(DowntimeEntity* down) {
    restartAction();
}

// ----------------------------------------------------------------------------
// 输出
// ----------------------------------------------------------------------------

static double reportingTime(SimContext* ctx, double simTime) {
    double total = simTime;
    double init = ctx->getInitializationTime();
    if (simTime > init) total -= init;
    return total;
}

double LinkedService::getUtilisation(double simTime) const {
    double total = reportingTime(context, simTime);
    if (total <= 0.0) return 0.0;
    return getTimeInState(simTime, "Working") / total;
}

double LinkedService::getCommitment(double simTime) const {
    double total = reportingTime(context, simTime);
    if (total <= 0.0) return 0.0;
    return 1.0 - getTimeInState(simTime, "Idle") / total;
}

double LinkedService::getAvailability(double simTime) const {
    double total = reportingTime(context, simTime);
    if (total <= 0.0) return 1.0;
    double down = getTimeInState(simTime, "Maintenance") + getTimeInState(simTime, "Breakdown");
    return 1.0 - down / total;
}

double LinkedService::getReliability(double simTime) const {
    double total = reportingTime(context, simTime);
    if (total <= 0.0) return 1.0;
    return 1.0 - getTimeInState(simTime, "Breakdown") / total;
}
