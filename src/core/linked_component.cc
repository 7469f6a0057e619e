// src/core/linked_component.cc
#include "linked_component.hh"
#include "utils/config_utils.hh"

LinkedComponent::LinkedComponent(const std::string& n, SimContext* ctx)
    : StateEntity(n, ctx) {
    addOutput("NumberAdded", [this](double) -> json { return num_added; });
    addOutput("NumberProcessed", [this](double) -> json { return num_processed; });
    addOutput("NumberInProgress", [this](double) -> json { return getNumberInProgress(); });
}

void LinkedComponent::configure(const json& cfg) {
    StateEntity::configure(cfg);
    next_component = getEntityInput<LinkedComponent>(context, cfg, "next_component");
}

void LinkedComponent::requireNextComponent() const {
    if (!next_component) {
        throw InputErrorException("Missing required input: next_component");
    }
}

void LinkedComponent::earlyInit() {
    StateEntity::earlyInit();
    num_added = 0;
    num_processed = 0;
    initial_in_progress = 0;
}

void LinkedComponent::clearStatistics() {
    StateEntity::clearStatistics();
    // 保留正在处理中的数量
    initial_in_progress = getNumberInProgress();
    num_added = 0;
    num_processed = 0;
}

void LinkedComponent::registerEntity(SimEntity* ent) {
    num_added++;
}

void LinkedComponent::addEntity(SimEntity* ent) {
    registerEntity(ent);
}

void LinkedComponent::sendToNextComponent(SimEntity* ent) {
    num_processed++;
    DPRINTF(FLOW, "[%s] t=%" PRId64 " send %s -> %s\n", name.c_str(), getSimTicks(),
            ent->getName().c_str(), next_component ? next_component->getName().c_str() : "-");
    if (next_component) {
        next_component->addEntity(ent);
    }
}
