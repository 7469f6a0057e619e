// include/linked_service.hh
#ifndef LINKED_SERVICE_HH
#define LINKED_SERVICE_HH

#include "linked_component.hh"
#include "queue.hh"
#include "threshold.hh"
#include "downtime_entity.hh"
#include "sample_provider.hh"
#include <memory>
#include <optional>
#include <vector>

/**
 * 通用的服务者状态机：从等待队列取工件，占用一段时间后释放
 *
 * 状态由 busy / open / downtime 三者决定：
 *   Busy & Open               -> Working
 *   Busy & !Open              -> Clearing_while_Stopped
 *   !Busy & !Open             -> Stopped
 *   !Busy & 维护              -> Maintenance
 *   !Busy & 故障              -> Breakdown
 *   其他                      -> Idle
 *
 * 子类通过 startProcessing / getProcessingTime / endProcessing / updateForStoppage 定制行为
 */
class LinkedService : public LinkedComponent, public QueueUser, public ThresholdUser, public DowntimeUser {
protected:
    Queue* wait_queue = nullptr;
    std::unique_ptr<SampleProvider> match;

    std::vector<Threshold*> immediate_threshold_list;
    std::vector<Threshold*> operating_threshold_list;

    std::vector<DowntimeEntity*> immediate_maintenance_list;
    std::vector<DowntimeEntity*> forced_maintenance_list;
    std::vector<DowntimeEntity*> opportunistic_maintenance_list;
    std::vector<DowntimeEntity*> immediate_breakdown_list;
    std::vector<DowntimeEntity*> forced_breakdown_list;
    std::vector<DowntimeEntity*> opportunistic_breakdown_list;

    // 严重程度取自停机实体自身的 downtime_type
    std::vector<DowntimeEntity*> maintenance_list;
    std::vector<DowntimeEntity*> breakdown_list;

private:
    bool busy = false;
    std::optional<int> match_value;
    double start_time = 0.0;        // 当前工件开始服务的时刻
    double duration = 0.0;          // 当前工件的服务时间
    bool forced_downtime_pending = false;
    bool process_killed = false;    // 服务被中断，可续做
    double stop_work_time = 0.0;    // 最近一次 busy 变为 false 的时刻

    EntityTarget<LinkedService> end_action_target;
    EventHandle end_action_handle;

    void setBusy(bool bool_val);
    bool hasDowntimeOfType(DowntimeEntity* down, DowntimeType t) const;
    void stopAction();
    bool isImmediateThresholdClosure() const;

protected:
    // 服务循环
    void startAction();
    void endAction();
    void restartAction();

    // 从等待队列取出下一个匹配的工件
    SimEntity* getNextEntityForMatch(std::optional<int> m);
    std::optional<int> getNextMatchValue(double simTime);
    void setMatchValue(std::optional<int> m) { match_value = m; }

    double getStopWorkTime() const { return stop_work_time; }

    // 返回 false 表示没有可做的工作
    virtual bool startProcessing(double simTime) { return true; }
    virtual double getProcessingTime(double simTime) { return 0.0; }
    virtual void endProcessing(double simTime) {}

    // 返回 true 续做被中断的工件，false 丢弃并重新开始
    virtual bool updateForStoppage(double startWork, double stopWork, double resumeWork) { return true; }

    void updatePresentState();

public:
    LinkedService(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void validate() override;
    void earlyInit() override;
    void startUp() override;
    void kill() override;

    std::string getInitialState() const override { return "Idle"; }
    bool isValidState(const std::string& state) const override;
    bool isValidWorkingState(const std::string& state) const override { return state == "Working"; }

    void addEntity(SimEntity* ent) override;

    Queue* getWaitQueue() const { return wait_queue; }
    std::optional<int> getMatchValue() const { return match_value; }

    // QueueUser
    std::vector<Queue*> getQueues() const override;
    void queueChanged() override;

    // ThresholdUser
    std::vector<Threshold*> getThresholds() const override;
    void thresholdChanged() override;

    // Busy / Idle / UnableToWork 三者互斥
    bool isBusy() const { return busy; }
    bool isOpen() const;
    bool isMaintenance() const;
    bool isBreakdown() const;
    bool isIdle() const;
    bool isUnableToWork() const;
    bool isForcedDowntimePending() const { return forced_downtime_pending; }

    // DowntimeUser
    std::vector<DowntimeEntity*> getMaintenanceEntities() const override;
    std::vector<DowntimeEntity*> getBreakdownEntities() const override;
    bool isImmediateDowntime(DowntimeEntity* down) const;
    bool isForcedDowntime(DowntimeEntity* down) const;
    bool isOpportunisticDowntime(DowntimeEntity* down) const;

    bool canStartDowntime(DowntimeEntity* down) const override;
    void prepareForDowntime(DowntimeEntity* down) override;
    void startDowntime(DowntimeEntity* down) override;
    void endDowntime(DowntimeEntity* down) override;

    double getUtilisation(double simTime) const;
    double getCommitment(double simTime) const;
    double getAvailability(double simTime) const;
    double getReliability(double simTime) const;
};

#endif // LINKED_SERVICE_HH
