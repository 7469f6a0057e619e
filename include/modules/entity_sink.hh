// include/modules/entity_sink.hh
#ifndef ENTITY_SINK_HH
#define ENTITY_SINK_HH

#include "../linked_component.hh"

// 流程终点：计数后销毁工件
class EntitySink : public LinkedComponent {
public:
    EntitySink(const std::string& n, SimContext* ctx) : LinkedComponent(n, ctx) {}

    void addEntity(SimEntity* ent) override {
        registerEntity(ent);
        num_processed++;
        DPRINTF(FLOW, "[%s] t=%" PRId64 " dispose %s\n", name.c_str(), getSimTicks(), ent->getName().c_str());
        ent->kill();
    }
};

#endif // ENTITY_SINK_HH
