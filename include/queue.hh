// include/queue.hh
#ifndef QUEUE_HH
#define QUEUE_HH

#include "linked_component.hh"
#include <list>
#include <optional>
#include <vector>

class Queue;

// 使用队列的对象，队列内容变化时收到通知
class QueueUser {
public:
    virtual ~QueueUser() = default;
    virtual std::vector<Queue*> getQueues() const = 0;
    virtual void queueChanged() = 0;
};

struct QueueEntry {
    SimEntity* entity;
    std::optional<int> match;
    Tick entry_tick;
};

/**
 * 等待队列：FIFO，可按匹配值选择性取出
 *
 * removeFirstForMatch 从队头扫描，跳过（但不重排）不匹配的条目
 */
class Queue : public LinkedComponent {
private:
    std::list<QueueEntry> items;
    std::vector<QueueUser*> user_list;
    std::string match_attribute;

    EntityTarget<Queue> notify_target;
    EventHandle notify_handle;

    // 统计
    uint64_t num_removed = 0;
    size_t min_length = 0;
    size_t max_length = 0;
    double length_ticks = 0.0;     // 队长对时间的积分
    Tick stats_start_tick = 0;
    Tick last_length_update = 0;
    Tick total_queue_ticks = 0;    // 已离队实体的等待时间之和

    void updateLengthStats();
    void scheduleNotify();
    void notifyUsers();
    SimEntity* removeEntry(std::list<QueueEntry>::iterator it);

public:
    Queue(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void earlyInit() override;
    void clearStatistics() override;
    void kill() override;

    // 匹配值取自实体的 match_attribute 属性（如有配置）
    void addEntity(SimEntity* ent) override;
    void addEntity(SimEntity* ent, std::optional<int> match);

    SimEntity* removeFirst();
    SimEntity* getFirst() const;
    bool remove(SimEntity* ent);

    // match 为空时匹配任何条目
    SimEntity* removeFirstForMatch(std::optional<int> match);
    size_t getMatchCount(std::optional<int> match) const;

    size_t getCount() const { return items.size(); }
    bool isEmpty() const { return items.empty(); }

    // 队头的入队时刻，队列为空时为 MAX_TICK
    Tick getFirstEntryTick() const;

    const std::vector<QueueUser*>& getUserList() const { return user_list; }
    void removeUser(QueueUser* u);

    uint64_t getNumberRemoved() const { return num_removed; }
    size_t getMinQueueLength() const { return min_length; }
    size_t getMaxQueueLength() const { return max_length; }
    double getAverageQueueLength(double simTime) const;
    double getAverageQueueTime() const;
};

#endif // QUEUE_HH
