// include/modules/entity_gate.hh
#ifndef ENTITY_GATE_HH
#define ENTITY_GATE_HH

#include "../linked_service.hh"
#include "../utils/config_utils.hh"

/**
 * 门：打开时工件直接通过，关闭时在队列中等待
 * 重新打开后按 release_delay 的间隔依次放行
 */
class EntityGate : public LinkedService {
private:
    std::unique_ptr<SampleProvider> release_delay;
    SimEntity* served_entity = nullptr;

public:
    EntityGate(const std::string& n, SimContext* ctx) : LinkedService(n, ctx) {}

    void configure(const json& cfg) override {
        LinkedService::configure(cfg);
        release_delay = getSampleInput(context, cfg, "release_delay");
        if (!release_delay) release_delay = std::make_unique<SampleConstant>(0.0);
    }

    void validate() override {
        LinkedService::validate();
        requireNextComponent();
        if (release_delay->getMinValue() < 0) {
            throw InputErrorException("Release delay values can not be less than 0.");
        }
    }

    void earlyInit() override {
        LinkedService::earlyInit();
        served_entity = nullptr;
    }

    void addEntity(SimEntity* ent) override {
        // 关闭、停机或已有工件在排队时进入队列
        if (!wait_queue->isEmpty() || !isIdle()) {
            wait_queue->addEntity(ent);
            return;
        }
        registerEntity(ent);
        sendToNextComponent(ent);
    }

protected:
    bool startProcessing(double simTime) override {
        std::optional<int> m = getNextMatchValue(simTime);
        if (wait_queue->getMatchCount(m) == 0) return false;
        served_entity = getNextEntityForMatch(m);
        return true;
    }

    double getProcessingTime(double simTime) override {
        return release_delay->getNextSample(simTime);
    }

    void endProcessing(double simTime) override {
        SimEntity* ent = served_entity;
        served_entity = nullptr;
        sendToNextComponent(ent);
    }
};

#endif // ENTITY_GATE_HH
