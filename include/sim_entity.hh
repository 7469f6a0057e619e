// include/sim_entity.hh
#ifndef SIM_ENTITY_HH
#define SIM_ENTITY_HH

#include "entity.hh"
#include <algorithm>
#include <map>
#include <string>
#include <vector>

class Queue;

/**
 * 在流程中流动的工件，由 EntityGenerator 在运行期创建
 */
class SimEntity : public Entity {
private:
    std::map<std::string, double> attributes;
    Queue* queue = nullptr;     // 正在其中等待的队列

public:
    SimEntity(const std::string& n, SimContext* ctx) : Entity(n, ctx) {
        addOutput("Attributes", [this](double) -> json { return json(attributes); });
    }

    // 在队列中等待时先离队
    void kill() override;

    Queue* getQueue() const { return queue; }
    void setQueue(Queue* q) { queue = q; }

    void setAttribute(const std::string& key, double value) { attributes[key] = value; }
    bool hasAttribute(const std::string& key) const { return attributes.count(key) != 0; }

    double getAttribute(const std::string& key) const {
        auto it = attributes.find(key);
        if (it == attributes.end()) error("Attribute not found: %s", key.c_str());
        return it->second;
    }
};

// 可装载其他 SimEntity 的容器，用于 Pack / Unpack
class EntityContainer : public SimEntity {
private:
    std::vector<SimEntity*> contents;

public:
    EntityContainer(const std::string& n, SimContext* ctx) : SimEntity(n, ctx) {
        addOutput("NumberInContainer", [this](double) -> json { return contents.size(); });
    }

    void addEntity(SimEntity* ent) { contents.push_back(ent); }

    SimEntity* removeEntity() {
        if (contents.empty()) return nullptr;
        SimEntity* ent = contents.front();
        contents.erase(contents.begin());
        return ent;
    }

    size_t getCount() const { return contents.size(); }
    bool isEmpty() const { return contents.empty(); }
    const std::vector<SimEntity*>& getContents() const { return contents; }
};

#endif // SIM_ENTITY_HH
