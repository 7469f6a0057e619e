// main.cpp
#include <iostream>
#include <cstdlib>
#include "sim_core.hh"
#include "sim_context.hh"
#include "entity_factory.hh"
#include "config_loader.hh"  // 包含 loadConfig

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <model.json> [run_seconds]\n";
        return 1;
    }

    EntityFactory::registerBuiltinTypes();

    try {
        // 加载配置文件
        json config = loadConfig(argv[1]);

        double run_duration = 0.0;
        if (config.contains("simulation")) {
            run_duration = config["simulation"].value("run_duration", 0.0);
        }
        if (argc >= 3) {
            run_duration = std::atof(argv[2]);
        }
        if (!(run_duration > 0.0)) {
            std::cerr << "[ERROR] Run duration must be positive (simulation.run_duration or argument)\n";
            return 1;
        }

        SimContext context;
        EntityFactory factory(&context);

        // 构建模型
        factory.instantiateAll(config);

        // 运行仿真
        context.run(run_duration);

        double end_time = context.getEventManager().simSeconds();
        std::cout << "[INFO] Simulation finished at t=" << end_time << " s ("
                  << context.getEventManager().getDispatchCount() << " events)\n";
        std::cout << context.getOutputReport(end_time).dump(2) << "\n";
    } catch (const ErrorException& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    } catch (const InputErrorException& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    } catch (const json::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
