// include/entity.hh
#ifndef ENTITY_HH
#define ENTITY_HH

#include "event_manager.hh"
#include "error_exception.hh"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

class SimContext;  // 前向声明

using OutputFunc = std::function<json(double)>;

/**
 * 所有模型对象的基类
 *
 * 生命周期：configure -> validate -> earlyInit -> lateInit -> startUp
 * 每个阶段对所有实体完成后才进入下一阶段
 */
class Entity {
protected:
    std::string name;
    SimContext* context;
    EventManager* event_manager;
    uint64_t entity_number = 0;
    bool generated = false;
    bool dead = false;

private:
    std::vector<std::pair<std::string, OutputFunc>> outputs;

public:
    Entity(const std::string& n, SimContext* ctx);
    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    // 读取静态配置（在运行开始前由 EntityFactory 调用）
    virtual void configure(const json& cfg) {}

    virtual void validate() {}

    // 不得依赖其他实体
    virtual void earlyInit() {}

    // 其他实体都已完成 earlyInit
    virtual void lateInit() {}

    virtual void startUp() {}

    // 初始化阶段结束时清空统计
    virtual void clearStatistics() {}

    // 从所有集合中移除，并取消自己持有的事件
    virtual void kill();

    // 渲染端读取状态用，不得修改仿真状态
    virtual void updateGraphics(double simTime) const {}

    const std::string& getName() const { return name; }
    uint64_t getEntityNumber() const { return entity_number; }
    SimContext* getContext() const { return context; }
    EventManager* getEventManager() const { return event_manager; }

    bool isGenerated() const { return generated; }
    void setGenerated(bool bool_val) { generated = bool_val; }
    bool isDead() const { return dead; }

    Tick getSimTicks() const { return event_manager->simTicks(); }
    double getSimTime() const { return event_manager->simSeconds(); }

    void startProcess(ProcessTarget* t) { event_manager->startProcess(t); }

    void scheduleProcess(double secs, int priority, ProcessTarget* t, EventHandle* handle = nullptr) {
        event_manager->scheduleSeconds(secs, priority, false, t, handle);
    }

    void scheduleProcess(double secs, int priority, bool fifo, ProcessTarget* t, EventHandle* handle) {
        event_manager->scheduleSeconds(secs, priority, fifo, t, handle);
    }

    void scheduleProcess(double secs, int priority, std::function<void()> f) {
        event_manager->scheduleSeconds(secs, priority, false, std::move(f));
    }

    void scheduleProcessTicks(Tick ticks, int priority, bool fifo, ProcessTarget* t, EventHandle* handle) {
        event_manager->scheduleTicks(ticks, priority, fifo, t, handle);
    }

    void simWait(double secs, int priority, EventHandle* handle, std::function<void()> cont) {
        event_manager->waitSeconds(secs, priority, false, handle, std::move(cont));
    }

    void waitUntil(std::function<bool()> cond, EventHandle* handle, std::function<void()> cont) {
        event_manager->waitUntil(std::move(cond), handle, std::move(cont));
    }

    void killEvent(EventHandle* handle) { event_manager->killEvent(handle); }
    void interruptEvent(EventHandle* handle) { event_manager->interruptEvent(handle); }

    /**
     * 抛出带实体名称的 ErrorException
     */
    [[noreturn]] void error(const char* fmt, ...) const;

    // 命名输出
    std::vector<std::string> getOutputNames() const;
    bool hasOutput(const std::string& output_name) const;
    json getOutput(const std::string& output_name, double simTime) const;

protected:
    void addOutput(const std::string& output_name, OutputFunc func);
};

#endif // ENTITY_HH
