// src/core/seize.cc
#include "modules/seize.hh"
#include "utils/config_utils.hh"

#include <algorithm>

static void checkUnitsList(const std::vector<Resource*>& resources,
                           const std::vector<std::unique_ptr<SampleProvider>>& units) {
    if (resources.empty()) {
        throw InputErrorException("Missing required input: resource");
    }
    if (!units.empty() && units.size() != resources.size()) {
        throw InputErrorException("number_of_units must have one entry per resource");
    }
    for (const auto& u : units) {
        if (u->getMinValue() < 0) {
            throw InputErrorException("number_of_units values can not be less than 0.");
        }
    }
}

static int sampleUnits(const std::vector<std::unique_ptr<SampleProvider>>& units, size_t i, double simTime) {
    if (units.empty()) return 1;
    return static_cast<int>(units[i]->getNextSample(simTime));
}

Seize::Seize(const std::string& n, SimContext* ctx)
    : LinkedService(n, ctx) {}

void Seize::configure(const json& cfg) {
    LinkedService::configure(cfg);
    resource_list = getEntityListInput<Resource>(context, cfg, "resource", true);
    number_of_units_list = getSampleListInput(context, cfg, "number_of_units");
}

void Seize::validate() {
    LinkedService::validate();
    requireNextComponent();
    checkUnitsList(resource_list, number_of_units_list);
}

void Seize::earlyInit() {
    LinkedService::earlyInit();
    required_units.assign(resource_list.size(), 0);
    seized_entity = nullptr;
}

void Seize::kill() {
    if (isDead()) return;
    for (Resource* res : resource_list) res->removeSeizeUser(this);
    LinkedService::kill();
}

bool Seize::requiresResource(Resource* res) const {
    return std::find(resource_list.begin(), resource_list.end(), res) != resource_list.end();
}

bool Seize::isReadyToStart() {
    std::optional<int> m = getNextMatchValue(getSimTime());
    return wait_queue->getMatchCount(m) != 0 && checkResources() && isOpen();
}

bool Seize::checkResources() {
    // 每个资源只取样一次，seizeResources 使用同一组数值
    double simTime = getSimTime();
    required_units.assign(resource_list.size(), 0);
    for (size_t i = 0; i < resource_list.size(); ++i) {
        required_units[i] = sampleUnits(number_of_units_list, i, simTime);
        if (resource_list[i]->getAvailableUnits() < required_units[i]) return false;
    }
    return true;
}

void Seize::seizeResources() {
    for (size_t i = 0; i < resource_list.size(); ++i) {
        resource_list[i]->seize(required_units[i]);
    }
}

bool Seize::startProcessing(double simTime) {
    if (!isReadyToStart()) return false;
    seizeResources();
    seized_entity = getNextEntityForMatch(getMatchValue());
    return true;
}

void Seize::endProcessing(double simTime) {
    SimEntity* ent = seized_entity;
    seized_entity = nullptr;
    sendToNextComponent(ent);
}

void Release::configure(const json& cfg) {
    LinkedComponent::configure(cfg);
    resource_list = getEntityListInput<Resource>(context, cfg, "resource", true);
    number_of_units_list = getSampleListInput(context, cfg, "number_of_units");
}

void Release::validate() {
    LinkedComponent::validate();
    requireNextComponent();
    checkUnitsList(resource_list, number_of_units_list);
}

void Release::addEntity(SimEntity* ent) {
    registerEntity(ent);
    double simTime = getSimTime();
    for (size_t i = 0; i < resource_list.size(); ++i) {
        resource_list[i]->release(sampleUnits(number_of_units_list, i, simTime));
    }
    sendToNextComponent(ent);
}
