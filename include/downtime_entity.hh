// include/downtime_entity.hh
#ifndef DOWNTIME_ENTITY_HH
#define DOWNTIME_ENTITY_HH

#include "state_entity.hh"
#include "sample_provider.hh"
#include <memory>
#include <vector>

class DowntimeEntity;

enum class DowntimeType { IMMEDIATE, FORCED, OPPORTUNISTIC };

const char* downtimeTypeName(DowntimeType t);

// 受停机影响的对象
class DowntimeUser {
public:
    virtual ~DowntimeUser() = default;
    virtual std::vector<DowntimeEntity*> getMaintenanceEntities() const = 0;
    virtual std::vector<DowntimeEntity*> getBreakdownEntities() const = 0;

    virtual bool canStartDowntime(DowntimeEntity* down) const = 0;
    virtual void prepareForDowntime(DowntimeEntity* down) = 0;
    virtual void startDowntime(DowntimeEntity* down) = 0;
    virtual void endDowntime(DowntimeEntity* down) = 0;
};

/**
 * 计划维护或故障的发生器
 *
 * 间隔和持续时间可以按日历时间计算，也可以按某个实体的工作时间计算
 * 所有用户都能开始停机时才进入停机状态
 */
class DowntimeEntity : public StateEntity, public StateEntityListener {
private:
    std::unique_ptr<SampleProvider> first_downtime;
    std::unique_ptr<SampleProvider> interval;
    std::unique_ptr<SampleProvider> duration;
    StateEntity* interval_working_entity = nullptr;
    StateEntity* duration_working_entity = nullptr;
    DowntimeType type = DowntimeType::IMMEDIATE;
    bool concurrent = false;

    std::vector<DowntimeUser*> user_list;
    bool down = false;
    int pending_count = 0;
    double pending_start_time = 0.0;
    double seconds_for_next_failure = 0.0;   // 日历秒或工作秒
    double seconds_for_next_repair = 0.0;
    double start_time = 0.0;
    double end_time = 0.0;

    EntityTarget<DowntimeEntity> schedule_downtime_target;
    EventHandle schedule_downtime_handle;
    EntityTarget<DowntimeEntity> end_downtime_target;
    EventHandle end_downtime_handle;

    void setDown(bool bool_val);
    void startDowntime();

public:
    DowntimeEntity(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void validate() override;
    void earlyInit() override;
    void lateInit() override;
    void startUp() override;
    void kill() override;

    std::string getInitialState() const override { return "Working"; }
    bool isValidState(const std::string& state) const override {
        return state == "Working" || state == "Downtime";
    }
    bool isValidWorkingState(const std::string& state) const override { return state == "Working"; }

    // 可重入的协调过程：安排下一次停机 / 修复，条件满足时开始停机
    void checkProcessNetwork();

    void scheduleDowntime();
    void endDowntime();

    bool isWatching(StateEntity* ent) const override;
    void updateForStateChange(StateEntity* ent, StateRecord* prev, StateRecord* next) override;

    bool isDown() const { return down; }
    bool isDowntimePending() const { return pending_count > 0; }
    int getPendingCount() const { return pending_count; }
    bool isConcurrent() const { return concurrent; }
    DowntimeType getType() const { return type; }

    double getStartTime() const { return start_time; }
    double getEndTime() const { return end_time; }
    double getDowntimePendingStartTime() const { return pending_start_time; }
    double getTimeUntilNextEvent() const;

    double getCalculatedDowntimeRatio(double simTime) const;
    double getAvailability(double simTime) const;

    const std::vector<DowntimeUser*>& getDowntimeUserList() const { return user_list; }

    // 用户不再参与停机协调；等待中的停机随即重新检查
    void removeUser(DowntimeUser* du);
};

#endif // DOWNTIME_ENTITY_HH
