// include/entity_factory.hh
#ifndef ENTITY_FACTORY_HH
#define ENTITY_FACTORY_HH

#include "sim_context.hh"

#include <unordered_map>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

using json = nlohmann::json;

using CreateEntityFunc = std::function<std::unique_ptr<Entity>(const std::string&, SimContext*)>;

/**
 * 按类型名创建实体并读取配置
 *
 * 配置格式：
 * {
 *   "simulation": { "ticks_per_second": 1e6, "initialization_duration": 0, "random_seed": 1, "run_duration": 100 },
 *   "entities": [ { "name": "Queue1", "type": "Queue", ... }, ... ]
 * }
 */
class EntityFactory {
private:
    SimContext* context;
    std::vector<Entity*> instances;   // 按配置顺序

    static std::unordered_map<std::string, CreateEntityFunc>& getRegistry() {
        static std::unordered_map<std::string, CreateEntityFunc> registry;
        return registry;
    }

    void applySimulationConfig(const json& sim);

public:
    explicit EntityFactory(SimContext* ctx) : context(ctx) {}

    template<typename T>
    static void registerType(const std::string& name) {
        static_assert(std::is_base_of_v<Entity, T>, "T must derive from Entity");
        auto& registry = getRegistry();
        if (registry.find(name) != registry.end()) {
            DPRINTF(FACTORY, "[EntityFactory] Warning: Type '%s' already registered.\n", name.c_str());
        }
        registry[name] = [](const std::string& n, SimContext* ctx) -> std::unique_ptr<Entity> {
            return std::make_unique<T>(n, ctx);
        };
    }

    static bool unregisterType(const std::string& name) {
        auto& registry = getRegistry();
        auto it = registry.find(name);
        if (it != registry.end()) {
            registry.erase(it);
            DPRINTF(FACTORY, "[EntityFactory] Unregistered type: %s\n", name.c_str());
            return true;
        }
        DPRINTF(FACTORY, "[EntityFactory] Attempted to unregister unknown type: %s\n", name.c_str());
        return false;
    }

    static void clearAllTypes() {
        getRegistry().clear();
        DPRINTF(FACTORY, "[EntityFactory] Cleared all registered types.\n");
    }

    static bool isRegistered(const std::string& name) {
        return getRegistry().count(name) != 0;
    }

    static std::vector<std::string> getRegisteredTypes() {
        std::vector<std::string> names;
        for (const auto& kv : getRegistry()) {
            names.push_back(kv.first);
        }
        return names;
    }

    // Queue, Server, Seize ... 等内置类型
    static void registerBuiltinTypes();

    static void listRegisteredTypes() {
        printf("[EntityFactory] Registered types:\n");
        for (const auto& name : getRegisteredTypes()) {
            printf("  - %s\n", name.c_str());
        }
    }

    /**
     * 两遍处理：先创建全部实体，再逐个 configure，引用与顺序无关
     * 任何配置错误都以 ErrorException 抛出，并带有出错实体的名称
     */
    void instantiateAll(const json& config);

    Entity* getInstance(const std::string& name) const {
        return context->getEntity(name);
    }

    const std::vector<Entity*>& getAllInstances() const { return instances; }
};

#endif // ENTITY_FACTORY_HH
