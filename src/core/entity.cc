// src/core/entity.cc
#include "entity.hh"
#include "sim_context.hh"

#include <cstdarg>

Entity::Entity(const std::string& n, SimContext* ctx)
    : name(n), context(ctx), event_manager(&ctx->getEventManager()),
      entity_number(ctx->getNextEntityID()) {}

void Entity::kill() {
    if (dead) return;
    dead = true;
    DPRINTF(ENTITY, "[%s] killed at t=%" PRId64 "\n", name.c_str(), getSimTicks());
    context->removeEntity(this);
}

void Entity::error(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    std::string msg = vformatMessage(fmt, args);
    va_end(args);
    throw ErrorException(name, msg);
}

void Entity::addOutput(const std::string& output_name, OutputFunc func) {
    for (auto& kv : outputs) {
        if (kv.first == output_name) {
            kv.second = std::move(func);
            return;
        }
    }
    outputs.emplace_back(output_name, std::move(func));
}

std::vector<std::string> Entity::getOutputNames() const {
    std::vector<std::string> names;
    for (const auto& kv : outputs) {
        names.push_back(kv.first);
    }
    return names;
}

bool Entity::hasOutput(const std::string& output_name) const {
    for (const auto& kv : outputs) {
        if (kv.first == output_name) return true;
    }
    return false;
}

json Entity::getOutput(const std::string& output_name, double simTime) const {
    for (const auto& kv : outputs) {
        if (kv.first == output_name) return kv.second(simTime);
    }
    error("Output not found: %s", output_name.c_str());
}
