// src/core/sim_entity.cc
#include "sim_entity.hh"
#include "queue.hh"

void SimEntity::kill() {
    if (isDead()) return;
    if (queue) queue->remove(this);
    Entity::kill();
}
