// include/modules/seize.hh
#ifndef SEIZE_HH
#define SEIZE_HH

#include "../linked_service.hh"
#include "resource.hh"

/**
 * 为队头工件占用所需的全部资源，然后把工件交给下游
 * 任一资源不足则整体不占用，工件留在队列中
 */
class Seize : public LinkedService {
private:
    std::vector<Resource*> resource_list;
    std::vector<std::unique_ptr<SampleProvider>> number_of_units_list;
    std::vector<int> required_units;    // checkResources 时的取样
    SimEntity* seized_entity = nullptr;

public:
    Seize(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void validate() override;
    void earlyInit() override;
    void kill() override;

    bool isReadyToStart();
    bool checkResources();
    void seizeResources();

    bool requiresResource(Resource* res) const;
    const std::vector<Resource*>& getResourceList() const { return resource_list; }

    // 由 Resource 在释放单位后调用
    void resourcesReleased() { restartAction(); }

protected:
    bool startProcessing(double simTime) override;
    double getProcessingTime(double simTime) override { return 0.0; }
    void endProcessing(double simTime) override;
};

/**
 * 释放资源单位，工件直接通过
 */
class Release : public LinkedComponent {
private:
    std::vector<Resource*> resource_list;
    std::vector<std::unique_ptr<SampleProvider>> number_of_units_list;

public:
    Release(const std::string& n, SimContext* ctx) : LinkedComponent(n, ctx) {}

    void configure(const json& cfg) override;
    void validate() override;
    void addEntity(SimEntity* ent) override;
};

#endif // SEIZE_HH
