// src/core/entity_factory.cc
#include "entity_factory.hh"
#include "modules.hh"

void EntityFactory::registerBuiltinTypes() {
    REGISTER_ENTITY
}

void EntityFactory::applySimulationConfig(const json& sim) {
    try {
        if (sim.contains("ticks_per_second")) {
            context->getEventManager().setTicksPerSecond(sim["ticks_per_second"].get<double>());
        }
        if (sim.contains("initialization_duration")) {
            context->setInitializationTime(sim["initialization_duration"].get<double>());
        }
        if (sim.contains("random_seed")) {
            context->setRandomSeed(sim["random_seed"].get<uint32_t>());
        }
    } catch (const InputErrorException& e) {
        throw ErrorException("simulation", e.what());
    } catch (const json::exception& e) {
        throw ErrorException("simulation", e.what());
    }
}

void EntityFactory::instantiateAll(const json& config) {
    if (config.contains("simulation")) {
        applySimulationConfig(config["simulation"]);
    }
    if (!config.contains("entities")) return;

    // ========================
    // 1. 创建所有实体
    // ========================
    std::vector<std::pair<Entity*, const json*>> created;
    for (const auto& ent_cfg : config["entities"]) {
        if (!ent_cfg.contains("name") || !ent_cfg.contains("type")) {
            throw ErrorException("Entity definition requires 'name' and 'type': " + ent_cfg.dump());
        }
        std::string name = ent_cfg["name"].get<std::string>();
        std::string type = ent_cfg["type"].get<std::string>();

        auto& registry = getRegistry();
        auto it = registry.find(type);
        if (it == registry.end()) {
            throw ErrorException(name, "Unknown or unregistered type: " + type);
        }

        Entity* ent = nullptr;
        try {
            ent = context->addEntity(it->second(name, context));
        } catch (const InputErrorException& e) {
            throw ErrorException(name, e.what());
        }
        instances.push_back(ent);
        created.emplace_back(ent, &ent_cfg);
        DPRINTF(FACTORY, "[EntityFactory] Created %s (%s)\n", name.c_str(), type.c_str());
    }

    // ========================
    // 2. 读取配置，解析引用
    // ========================
    for (auto& [ent, cfg] : created) {
        try {
            ent->configure(*cfg);
        } catch (const InputErrorException& e) {
            throw ErrorException(ent->getName(), e.what());
        } catch (const json::exception& e) {
            throw ErrorException(ent->getName(), e.what());
        }
    }
}
