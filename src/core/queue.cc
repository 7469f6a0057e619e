// src/core/queue.cc
#include "queue.hh"
#include "sim_context.hh"

#include <algorithm>

Queue::Queue(const std::string& n, SimContext* ctx)
    : LinkedComponent(n, ctx), notify_target(this, &Queue::notifyUsers, "notifyUsers") {
    addOutput("QueueLength", [this](double) -> json { return items.size(); });
    addOutput("NumberRemoved", [this](double) -> json { return num_removed; });
    addOutput("QueueLengthMinimum", [this](double) -> json { return min_length; });
    addOutput("QueueLengthMaximum", [this](double) -> json { return max_length; });
    addOutput("AverageQueueLength", [this](double t) -> json { return getAverageQueueLength(t); });
    addOutput("AverageQueueTime", [this](double) -> json { return getAverageQueueTime(); });
}

void Queue::configure(const json& cfg) {
    LinkedComponent::configure(cfg);
    match_attribute = cfg.value("match_attribute", std::string());
}

void Queue::earlyInit() {
    LinkedComponent::earlyInit();
    items.clear();
    num_removed = 0;
    min_length = 0;
    max_length = 0;
    length_ticks = 0.0;
    stats_start_tick = getSimTicks();
    last_length_update = getSimTicks();
    total_queue_ticks = 0;

    user_list.clear();
    for (QueueUser* u : context->getEntitiesOfType<QueueUser>()) {
        std::vector<Queue*> queues = u->getQueues();
        if (std::find(queues.begin(), queues.end(), this) != queues.end()) {
            user_list.push_back(u);
        }
    }
}

void Queue::clearStatistics() {
    LinkedComponent::clearStatistics();
    num_removed = 0;
    min_length = items.size();
    max_length = items.size();
    length_ticks = 0.0;
    stats_start_tick = getSimTicks();
    last_length_update = getSimTicks();
    total_queue_ticks = 0;
}

void Queue::kill() {
    killEvent(&notify_handle);
    for (auto& entry : items) entry.entity->setQueue(nullptr);
    items.clear();
    LinkedComponent::kill();
}

void Queue::removeUser(QueueUser* u) {
    user_list.erase(std::remove(user_list.begin(), user_list.end(), u), user_list.end());
}

void Queue::updateLengthStats() {
    Tick now = getSimTicks();
    length_ticks += static_cast<double>(items.size()) * (now - last_length_update);
    last_length_update = now;
}

void Queue::addEntity(SimEntity* ent) {
    std::optional<int> match;
    if (!match_attribute.empty() && ent->hasAttribute(match_attribute)) {
        match = static_cast<int>(ent->getAttribute(match_attribute));
    }
    addEntity(ent, match);
}

void Queue::addEntity(SimEntity* ent, std::optional<int> match) {
    registerEntity(ent);
    updateLengthStats();
    items.push_back(QueueEntry{ent, match, getSimTicks()});
    ent->setQueue(this);
    max_length = std::max(max_length, items.size());

    DPRINTF(QUEUE, "[%s] t=%" PRId64 " add %s (len=%zu)\n", name.c_str(), getSimTicks(),
            ent->getName().c_str(), items.size());
    scheduleNotify();
}

void Queue::scheduleNotify() {
    // 同一时刻多次变化只通知一次
    if (user_list.empty() || notify_handle.isScheduled()) return;
    scheduleProcessTicks(0, PRIORITY_NOTIFY, false, &notify_target, &notify_handle);
}

void Queue::notifyUsers() {
    // 用户可能在通知过程中被注销
    std::vector<QueueUser*> batch = user_list;
    for (QueueUser* u : batch) {
        if (std::find(user_list.begin(), user_list.end(), u) == user_list.end()) continue;
        u->queueChanged();
    }
}

SimEntity* Queue::removeEntry(std::list<QueueEntry>::iterator it) {
    updateLengthStats();
    SimEntity* ent = it->entity;
    total_queue_ticks += getSimTicks() - it->entry_tick;
    ent->setQueue(nullptr);
    items.erase(it);
    num_removed++;
    num_processed++;
    min_length = std::min(min_length, items.size());
    DPRINTF(QUEUE, "[%s] t=%" PRId64 " remove %s (len=%zu)\n", name.c_str(), getSimTicks(),
            ent->getName().c_str(), items.size());
    return ent;
}

SimEntity* Queue::removeFirst() {
    if (items.empty()) return nullptr;
    return removeEntry(items.begin());
}

SimEntity* Queue::getFirst() const {
    return items.empty() ? nullptr : items.front().entity;
}

bool Queue::remove(SimEntity* ent) {
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (it->entity == ent) {
            removeEntry(it);
            return true;
        }
    }
    return false;
}

SimEntity* Queue::removeFirstForMatch(std::optional<int> match) {
    if (!match) return removeFirst();
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (it->match == match) return removeEntry(it);
    }
    return nullptr;
}

size_t Queue::getMatchCount(std::optional<int> match) const {
    if (!match) return items.size();
    size_t count = 0;
    for (const auto& entry : items) {
        if (entry.match == match) count++;
    }
    return count;
}

Tick Queue::getFirstEntryTick() const {
    return items.empty() ? MAX_TICK : items.front().entry_tick;
}

double Queue::getAverageQueueLength(double simTime) const {
    Tick now = event_manager->secondsToNearestTick(simTime);
    Tick dur = now - stats_start_tick;
    if (dur <= 0) return 0.0;
    double total = length_ticks + static_cast<double>(items.size()) * (now - last_length_update);
    return total / dur;
}

double Queue::getAverageQueueTime() const {
    if (num_removed == 0) return 0.0;
    return event_manager->ticksToSeconds(total_queue_ticks) / num_removed;
}
