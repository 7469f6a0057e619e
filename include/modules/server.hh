// include/modules/server.hh
#ifndef SERVER_HH
#define SERVER_HH

#include "../linked_service.hh"
#include "../utils/config_utils.hh"

// 每次处理一个工件，服务时间来自 service_time
// restart_after_stoppage 为 true 时，被中断的工件以新的服务时间从头开始
class Server : public LinkedService {
private:
    std::unique_ptr<SampleProvider> service_time;
    bool restart_after_stoppage = false;
    SimEntity* served_entity = nullptr;

public:
    Server(const std::string& n, SimContext* ctx) : LinkedService(n, ctx) {
        addOutput("ServedEntity", [this](double) -> json {
            return served_entity ? json(served_entity->getName()) : json(nullptr);
        });
    }

    void configure(const json& cfg) override {
        LinkedService::configure(cfg);
        service_time = getSampleInput(context, cfg, "service_time", true);
        restart_after_stoppage = cfg.value("restart_after_stoppage", false);
    }

    void validate() override {
        LinkedService::validate();
        requireNextComponent();
        if (service_time->getMinValue() < 0) {
            throw InputErrorException("Service time values can not be less than 0.");
        }
    }

    void earlyInit() override {
        LinkedService::earlyInit();
        served_entity = nullptr;
    }

    SimEntity* getServedEntity() const { return served_entity; }

protected:
    bool startProcessing(double simTime) override {
        // 被中断后重新开始的工件
        if (served_entity) return true;

        std::optional<int> m = getNextMatchValue(simTime);
        if (wait_queue->getMatchCount(m) == 0) return false;
        served_entity = getNextEntityForMatch(m);
        return true;
    }

    double getProcessingTime(double simTime) override {
        return service_time->getNextSample(simTime);
    }

    void endProcessing(double simTime) override {
        SimEntity* ent = served_entity;
        served_entity = nullptr;
        sendToNextComponent(ent);
    }

    bool updateForStoppage(double startWork, double stopWork, double resumeWork) override {
        return !restart_after_stoppage;
    }
};

#endif // SERVER_HH
