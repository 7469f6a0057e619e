// include/linked_component.hh
#ifndef LINKED_COMPONENT_HH
#define LINKED_COMPONENT_HH

#include "state_entity.hh"
#include "sim_entity.hh"

/**
 * 流程链中的一环：接收 SimEntity，处理后交给 next_component
 */
class LinkedComponent : public StateEntity {
protected:
    LinkedComponent* next_component = nullptr;
    uint64_t num_added = 0;
    uint64_t num_processed = 0;
    uint64_t initial_in_progress = 0;

    // 收到实体时计数
    void registerEntity(SimEntity* ent);

    void sendToNextComponent(SimEntity* ent);

    // 需要下游时在 validate 中调用
    void requireNextComponent() const;

public:
    LinkedComponent(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void earlyInit() override;
    void clearStatistics() override;

    virtual void addEntity(SimEntity* ent);

    LinkedComponent* getNextComponent() const { return next_component; }

    uint64_t getNumberAdded() const { return num_added; }
    uint64_t getNumberProcessed() const { return num_processed; }
    uint64_t getNumberInProgress() const { return initial_in_progress + num_added - num_processed; }
};

#endif // LINKED_COMPONENT_HH
