// include/modules/resource.hh
#ifndef RESOURCE_HH
#define RESOURCE_HH

#include "../entity.hh"
#include <vector>

class Seize;

/**
 * 容量有限的共享资源，0 <= units_in_use <= capacity
 */
class Resource : public Entity {
private:
    int capacity = 1;
    int units_in_use = 0;
    std::vector<Seize*> seize_list;

    // 统计
    uint64_t units_seized = 0;
    uint64_t units_released = 0;
    double unit_ticks = 0.0;       // 占用量对时间的积分
    Tick stats_start_tick = 0;
    Tick last_update_tick = 0;

    void updateStatistics();
    void notifySeizeUsers();

public:
    Resource(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void validate() override;
    void earlyInit() override;
    void clearStatistics() override;

    int getCapacity() const { return capacity; }
    int getUnitsInUse() const { return units_in_use; }
    int getAvailableUnits() const { return capacity - units_in_use; }

    void seize(int n);

    // 释放后按队头等待时间最长的顺序通知 Seize
    void release(int n);

    const std::vector<Seize*>& getSeizeList() const { return seize_list; }
    void removeSeizeUser(Seize* s);

    double getUtilisation(double simTime) const;
};

#endif // RESOURCE_HH
