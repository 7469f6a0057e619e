// include/threshold.hh
#ifndef THRESHOLD_HH
#define THRESHOLD_HH

#include "state_entity.hh"
#include <vector>

class Threshold;

class ThresholdUser {
public:
    virtual ~ThresholdUser() = default;
    virtual std::vector<Threshold*> getThresholds() const = 0;
    virtual void thresholdChanged() = 0;
};

/**
 * 汇总同一时刻所有阈值变化，对每个用户只通知一次
 * 每个 SimContext 一个实例
 */
class ThresholdChangedTarget : public ProcessTarget {
private:
    std::vector<ThresholdUser*> users;
    std::vector<ThresholdUser*> running;    // 正在通知的一批，注销的用户置空
    EventHandle handle;

public:
    void addUser(ThresholdUser* u);
    void removeUser(ThresholdUser* u);
    bool hasUsers() const { return !users.empty(); }
    size_t getUserCount() const { return users.size(); }
    EventHandle* getHandle() { return &handle; }
    void clear() { users.clear(); }

    void process() override;
    std::string getDescription() const override { return "UpdateAllThresholdUsers"; }
};

/**
 * 开/关两态的门控
 */
class Threshold : public StateEntity {
private:
    std::vector<ThresholdUser*> user_list;

protected:
    bool open = true;

public:
    Threshold(const std::string& n, SimContext* ctx);

    void earlyInit() override;

    std::string getInitialState() const override { return "Open"; }
    bool isValidState(const std::string& state) const override {
        return state == "Open" || state == "Closed";
    }
    bool isValidWorkingState(const std::string& state) const override { return state == "Open"; }

    bool isOpen() const { return open; }

    // 状态变化时在当前时刻（优先级 2）批量通知用户
    void setOpen(bool bool_val);

    void doOpen() { setOpen(true); }
    void doClose() { setOpen(false); }

    const std::vector<ThresholdUser*>& getUserList() const { return user_list; }
    void removeUser(ThresholdUser* u);

    double getOpenFraction(double simTime) const;
    double getClosedFraction(double simTime) const;
};

/**
 * 由外部调用 setOpen 控制的阈值
 */
class SignalThreshold : public Threshold {
private:
    bool initial_open = true;

public:
    SignalThreshold(const std::string& n, SimContext* ctx) : Threshold(n, ctx) {}

    void configure(const json& cfg) override;
    std::string getInitialState() const override { return initial_open ? "Open" : "Closed"; }
};

#endif // THRESHOLD_HH
