// include/modules/entity_generator.hh
#ifndef ENTITY_GENERATOR_HH
#define ENTITY_GENERATOR_HH

#include "../linked_component.hh"
#include "../sim_context.hh"
#include "../utils/config_utils.hh"
#include <map>

/**
 * 按到达间隔产生 SimEntity 并送往下游
 */
class EntityGenerator : public LinkedComponent {
private:
    std::unique_ptr<SampleProvider> first_arrival_time;
    std::unique_ptr<SampleProvider> inter_arrival_time;
    std::unique_ptr<SampleProvider> entities_per_arrival;
    std::map<std::string, std::unique_ptr<SampleProvider>> attributes;
    int64_t max_number = -1;        // < 0 表示不限
    std::string prefix;

    uint64_t num_generated = 0;

    EntityTarget<EntityGenerator> arrival_target;
    EventHandle arrival_handle;

public:
    EntityGenerator(const std::string& n, SimContext* ctx)
        : LinkedComponent(n, ctx), arrival_target(this, &EntityGenerator::processArrival, "processArrival") {
        addOutput("NumberGenerated", [this](double) -> json { return num_generated; });
    }

    void configure(const json& cfg) override {
        LinkedComponent::configure(cfg);
        first_arrival_time = getSampleInput(context, cfg, "first_arrival_time");
        inter_arrival_time = getSampleInput(context, cfg, "inter_arrival_time", true);
        entities_per_arrival = getSampleInput(context, cfg, "entities_per_arrival");
        if (!entities_per_arrival) entities_per_arrival = std::make_unique<SampleConstant>(1.0);
        max_number = getValueInput<int64_t>(cfg, "max_number", -1);
        prefix = getValueInput<std::string>(cfg, "prefix", name + "_");

        attributes.clear();
        if (cfg.contains("attributes")) {
            for (auto& [key, val] : cfg["attributes"].items()) {
                attributes[key] = makeSampleProvider(val, context);
            }
        }
    }

    void validate() override {
        LinkedComponent::validate();
        requireNextComponent();
        if (inter_arrival_time->getMinValue() < 0) {
            throw InputErrorException("Inter-arrival time values can not be less than 0.");
        }
        if (first_arrival_time && first_arrival_time->getMinValue() < 0) {
            throw InputErrorException("First arrival time values can not be less than 0.");
        }
    }

    void earlyInit() override {
        LinkedComponent::earlyInit();
        num_generated = 0;
    }

    void startUp() override {
        LinkedComponent::startUp();
        double dt = first_arrival_time ? first_arrival_time->getNextSample(getSimTime())
                                       : inter_arrival_time->getNextSample(getSimTime());
        scheduleProcess(dt, PRIORITY_WORK, &arrival_target, &arrival_handle);
    }

    void kill() override {
        killEvent(&arrival_handle);
        LinkedComponent::kill();
    }

    uint64_t getNumberGenerated() const { return num_generated; }

    void processArrival() {
        double simTime = getSimTime();
        int count = static_cast<int>(entities_per_arrival->getNextSample(simTime));
        for (int i = 0; i < count; ++i) {
            if (max_number >= 0 && num_generated >= static_cast<uint64_t>(max_number)) return;
            num_generated++;
            SimEntity* ent = context->createEntity<SimEntity>(prefix + std::to_string(num_generated));
            ent->setGenerated(true);
            for (auto& kv : attributes) {
                ent->setAttribute(kv.first, kv.second->getNextSample(simTime));
            }
            registerEntity(ent);
            sendToNextComponent(ent);
        }

        if (max_number >= 0 && num_generated >= static_cast<uint64_t>(max_number)) return;
        scheduleProcess(inter_arrival_time->getNextSample(simTime), PRIORITY_WORK,
                        &arrival_target, &arrival_handle);
    }
};

#endif // ENTITY_GENERATOR_HH
