// include/sim_context.hh
#ifndef SIM_CONTEXT_HH
#define SIM_CONTEXT_HH

#include "entity.hh"
#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

class ThresholdChangedTarget;

/**
 * 一次仿真运行的上下文：事件调度器、实体注册表、随机种子
 * 同一进程内可以同时存在多个互不相关的 SimContext
 */
class SimContext {
private:
    using EntityList = std::list<std::unique_ptr<Entity>>;

    EntityList entities;
    std::unordered_map<Entity*, EntityList::iterator> entity_index;
    std::vector<std::unique_ptr<Entity>> dead_entities;     // 等待回收
    std::vector<std::unique_ptr<Entity>> retired_entities;  // 被删除的模型实体
    std::unordered_map<std::string, Entity*> name_map;
    uint64_t next_entity_id = 1;

    double initialization_time = 0.0;
    uint32_t random_seed = 0;
    int next_stream = 1;
    bool initialized = false;

    std::unique_ptr<ThresholdChangedTarget> threshold_changed;
    EventManager event_manager;

    void clearAllStatistics();

    // 释放已删除的运行期实体；模型实体可能仍被其他实体引用，保留到上下文销毁
    void reapDeadEntities();

public:
    explicit SimContext(const std::string& n = "Simulation");
    ~SimContext();

    SimContext(const SimContext&) = delete;
    SimContext& operator=(const SimContext&) = delete;

    EventManager& getEventManager() { return event_manager; }

    Entity* addEntity(std::unique_ptr<Entity> ent);

    template<typename T>
    T* createEntity(const std::string& n) {
        auto ent = std::make_unique<T>(n, this);
        T* ret = ent.get();
        addEntity(std::move(ent));
        return ret;
    }

    // 由 Entity::kill 调用
    void removeEntity(Entity* ent);

    Entity* getEntity(const std::string& n) const {
        auto it = name_map.find(n);
        return it != name_map.end() ? it->second : nullptr;
    }

    template<typename T>
    T* getEntity(const std::string& n) const {
        return dynamic_cast<T*>(getEntity(n));
    }

    template<typename T>
    std::vector<T*> getEntitiesOfType() const {
        std::vector<T*> ret;
        for (const auto& ent : entities) {
            if (T* t = dynamic_cast<T*>(ent.get())) ret.push_back(t);
        }
        return ret;
    }

    const EntityList& getAllEntities() const { return entities; }
    size_t getEntityCount() const { return entities.size(); }
    size_t getDeadEntityCount() const { return dead_entities.size(); }
    uint64_t getNextEntityID() { return next_entity_id++; }

    double getInitializationTime() const { return initialization_time; }
    void setInitializationTime(double secs);

    uint32_t getRandomSeed() const { return random_seed; }
    void setRandomSeed(uint32_t seed) { random_seed = seed; }
    int getNextStreamNumber() { return next_stream++; }

    ThresholdChangedTarget& getThresholdChangedTarget() { return *threshold_changed; }

    // validate + earlyInit + lateInit + startUp
    void validate();
    void initialize();
    void startRun();

    bool isInitialized() const { return initialized; }

    // 运行到指定的仿真时刻（秒）
    void run(double end_time);
    void pause() { event_manager.pause(); }
    void resume(double end_time);
    void terminate() { event_manager.terminate(); }

    void updateGraphics(double simTime) const;

    // 所有实体的命名输出
    json getOutputReport(double simTime) const;
};

#endif // SIM_CONTEXT_HH
