// include/modules/pack.hh
#ifndef PACK_HH
#define PACK_HH

#include "../linked_service.hh"
#include "../sim_context.hh"
#include "../utils/config_utils.hh"

/**
 * 把 number_of_entities 个匹配的工件装入一个新的 EntityContainer
 * 凑齐数量前不开始
 */
class Pack : public LinkedService {
private:
    std::unique_ptr<SampleProvider> number_of_entities;
    std::unique_ptr<SampleProvider> service_time;
    EntityContainer* container = nullptr;
    int num_to_insert = 0;
    uint64_t container_count = 0;

public:
    Pack(const std::string& n, SimContext* ctx) : LinkedService(n, ctx) {
        addOutput("NumberToInsert", [this](double) -> json { return num_to_insert; });
    }

    void configure(const json& cfg) override {
        LinkedService::configure(cfg);
        number_of_entities = getSampleInput(context, cfg, "number_of_entities");
        if (!number_of_entities) number_of_entities = std::make_unique<SampleConstant>(1.0);
        service_time = getSampleInput(context, cfg, "service_time");
        if (!service_time) service_time = std::make_unique<SampleConstant>(0.0);
    }

    void validate() override {
        LinkedService::validate();
        requireNextComponent();
        if (number_of_entities->getMinValue() < 1) {
            throw InputErrorException("number_of_entities values must be at least 1.");
        }
        if (service_time->getMinValue() < 0) {
            throw InputErrorException("Service time values can not be less than 0.");
        }
    }

    void earlyInit() override {
        LinkedService::earlyInit();
        container = nullptr;
        num_to_insert = 0;
        container_count = 0;
    }

protected:
    bool startProcessing(double simTime) override {
        std::optional<int> m = getNextMatchValue(simTime);
        if (num_to_insert == 0) {
            num_to_insert = static_cast<int>(number_of_entities->getNextSample(simTime));
        }
        if (wait_queue->getMatchCount(m) < static_cast<size_t>(num_to_insert)) return false;

        container_count++;
        container = context->createEntity<EntityContainer>(
            name + "_Container" + std::to_string(container_count));
        container->setGenerated(true);
        for (int i = 0; i < num_to_insert; ++i) {
            container->addEntity(getNextEntityForMatch(m));
        }
        num_to_insert = 0;
        return true;
    }

    double getProcessingTime(double simTime) override {
        return service_time->getNextSample(simTime);
    }

    void endProcessing(double simTime) override {
        EntityContainer* ent = container;
        container = nullptr;
        sendToNextComponent(ent);
    }
};

/**
 * 拆开 EntityContainer，把其中的工件依次交给下游，然后销毁容器
 */
class Unpack : public LinkedService {
private:
    std::unique_ptr<SampleProvider> service_time;
    EntityContainer* container = nullptr;

public:
    Unpack(const std::string& n, SimContext* ctx) : LinkedService(n, ctx) {}

    void configure(const json& cfg) override {
        LinkedService::configure(cfg);
        service_time = getSampleInput(context, cfg, "service_time");
        if (!service_time) service_time = std::make_unique<SampleConstant>(0.0);
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
        container = nullptr;
    }

protected:
    bool startProcessing(double simTime) override {
        std::optional<int> m = getNextMatchValue(simTime);
        if (wait_queue->getMatchCount(m) == 0) return false;
        SimEntity* ent = getNextEntityForMatch(m);
        container = dynamic_cast<EntityContainer*>(ent);
        if (!container) {
            error("Entity %s is not an EntityContainer", ent->getName().c_str());
        }
        return true;
    }

    double getProcessingTime(double simTime) override {
        return service_time->getNextSample(simTime);
    }

    void endProcessing(double simTime) override {
        EntityContainer* cont = container;
        container = nullptr;
        while (SimEntity* ent = cont->removeEntity()) {
            sendToNextComponent(ent);
        }
        cont->kill();
    }
};

#endif // PACK_HH
