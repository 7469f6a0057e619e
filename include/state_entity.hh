// include/state_entity.hh
#ifndef STATE_ENTITY_HH
#define STATE_ENTITY_HH

#include "entity.hh"
#include <map>
#include <string>
#include <vector>

/**
 * 某一状态的累计时间
 * current_cycle_ticks 在 collectCycleStats() 时转入 completed_cycle_ticks
 */
struct StateRecord {
    std::string name;
    bool working = false;
    Tick total_ticks = 0;
    Tick current_cycle_ticks = 0;
    Tick completed_cycle_ticks = 0;
    Tick start_tick = 0;       // 最近一次进入该状态的时刻
};

class StateEntity;

// 关注其他实体状态变化的对象（例如 DowntimeEntity）
class StateEntityListener {
public:
    virtual ~StateEntityListener() = default;
    virtual bool isWatching(StateEntity* ent) const = 0;
    virtual void updateForStateChange(StateEntity* ent, StateRecord* prev, StateRecord* next) = 0;
};

/**
 * 具有“当前状态”的实体，任一时刻恰好处于一个状态
 */
class StateEntity : public Entity {
private:
    std::map<std::string, StateRecord> states;
    StateRecord* present_state = nullptr;
    Tick last_state_update = 0;
    Tick working_ticks = 0;
    std::vector<std::string> working_state_list;
    std::vector<StateEntityListener*> listeners;

    StateRecord* getRecord(const std::string& state);
    void updateStateTicks(Tick now);

public:
    StateEntity(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void validate() override;
    void earlyInit() override;
    void lateInit() override;
    void clearStatistics() override;

    virtual std::string getInitialState() const { return "None"; }
    virtual bool isValidState(const std::string& state) const { return true; }
    virtual bool isValidWorkingState(const std::string& state) const { return false; }

    void setPresentState(const std::string& state);
    const std::string& getPresentState() const;
    bool isWorking() const { return present_state != nullptr && present_state->working; }

    void addListener(StateEntityListener* l);
    void removeListener(StateEntityListener* l);
    const std::vector<StateEntityListener*>& getListeners() const { return listeners; }

    std::vector<std::string> getStateNames() const;

    Tick getTicksInState(Tick simTicks, const std::string& state) const;
    double getTimeInState(double simTime, const std::string& state) const;
    Tick getCurrentCycleTicks(Tick simTicks, const std::string& state) const;
    Tick getCompletedCycleTicks(const std::string& state) const;
    Tick getTotalTicks(Tick simTicks) const;

    // 当前周期的统计结束，开始新的周期
    void collectCycleStats();

    // 累计工作时间，不受 clearStatistics 影响
    Tick getWorkingTicks() const;
    double getWorkingTime() const;
};

#endif // STATE_ENTITY_HH
