// src/core/sim_context.cc
#include "sim_context.hh"
#include "threshold.hh"
#include "state_entity.hh"

#include <iterator>

SimContext::SimContext(const std::string& n)
    : threshold_changed(std::make_unique<ThresholdChangedTarget>()),
      event_manager(n) {
    event_manager.setDispatchHook([this]() { reapDeadEntities(); });
}

SimContext::~SimContext() {
    // 先释放待执行事件，它们可能引用实体内的 EventHandle
    event_manager.clear();
}

Entity* SimContext::addEntity(std::unique_ptr<Entity> ent) {
    const std::string& n = ent->getName();
    if (n.empty()) {
        throw InputErrorException("Entity name must not be empty");
    }
    if (name_map.find(n) != name_map.end()) {
        throw InputErrorException("Duplicate entity name: " + n);
    }
    Entity* ret = ent.get();
    name_map[n] = ret;
    entities.push_back(std::move(ent));
    entity_index[ret] = std::prev(entities.end());
    return ret;
}

void SimContext::removeEntity(Entity* ent) {
    auto idx = entity_index.find(ent);
    if (idx == entity_index.end()) return;

    auto name_it = name_map.find(ent->getName());
    if (name_it != name_map.end() && name_it->second == ent) name_map.erase(name_it);

    // 当前进程可能仍持有该实体的指针，事件处理完后再释放
    dead_entities.push_back(std::move(*idx->second));
    entities.erase(idx->second);
    entity_index.erase(idx);
}

void SimContext::reapDeadEntities() {
    if (dead_entities.empty()) return;
    size_t freed = 0;
    for (auto& ent : dead_entities) {
        if (ent->isGenerated()) {
            freed++;
        } else {
            retired_entities.push_back(std::move(ent));
        }
    }
    dead_entities.clear();
    DPRINTF(ENTITY, "t=%" PRId64 " freed %zu entities\n", event_manager.simTicks(), freed);
}

void SimContext::setInitializationTime(double secs) {
    if (secs < 0.0) {
        throw InputErrorException("Initialization duration must not be negative");
    }
    initialization_time = secs;
}

void SimContext::validate() {
    for (const auto& ptr : entities) {
        Entity* ent = ptr.get();
        try {
            ent->validate();
        } catch (const InputErrorException& e) {
            throw ErrorException(ent->getName(), e.what());
        }
    }
}

void SimContext::initialize() {
    // 初始化过程中可能生成新实体，只处理开始时已存在的实体
    std::vector<Entity*> init_list;
    for (const auto& ptr : entities) {
        init_list.push_back(ptr.get());
    }

    for (Entity* ent : init_list) ent->earlyInit();
    for (Entity* ent : init_list) ent->lateInit();
    for (Entity* ent : init_list) ent->startUp();

    if (initialization_time > 0.0) {
        event_manager.scheduleSeconds(initialization_time, 0, true,
            [this]() { clearAllStatistics(); });
    }
    initialized = true;
}

void SimContext::startRun() {
    validate();
    initialize();
}

void SimContext::clearAllStatistics() {
    DPRINTF(SIM, "Initialization period finished at t=%" PRId64 "\n", event_manager.simTicks());
    for (const auto& ent : entities) {
        ent->clearStatistics();
    }
}

void SimContext::run(double end_time) {
    if (!initialized) startRun();
    event_manager.run(event_manager.secondsToNearestTick(end_time));
}

void SimContext::resume(double end_time) {
    event_manager.resume(event_manager.secondsToNearestTick(end_time));
}

void SimContext::updateGraphics(double simTime) const {
    for (const auto& ent : entities) {
        ent->updateGraphics(simTime);
    }
}

json SimContext::getOutputReport(double simTime) const {
    json report = json::object();
    for (const auto& ent : entities) {
        if (ent->isGenerated()) continue;
        json values = json::object();
        for (const std::string& output_name : ent->getOutputNames()) {
            values[output_name] = ent->getOutput(output_name, simTime);
        }
        report[ent->getName()] = values;
    }
    return report;
}
