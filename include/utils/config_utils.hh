// include/utils/config_utils.hh
#ifndef CONFIG_UTILS_HH
#define CONFIG_UTILS_HH

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>
#include "../sim_context.hh"
#include "../sample_provider.hh"

using json = nlohmann::json;

// 按名称查找被引用的实体，类型不符时报错
template<typename T>
T* getEntityInput(SimContext* ctx, const json& cfg, const std::string& key, bool required = false) {
    if (!cfg.contains(key) || cfg[key].is_null()) {
        if (required) throw InputErrorException("Missing required input: " + key);
        return nullptr;
    }
    std::string ent_name = cfg[key].get<std::string>();
    Entity* ent = ctx->getEntity(ent_name);
    if (!ent) {
        throw InputErrorException(key + ": entity not found: " + ent_name);
    }
    T* ret = dynamic_cast<T*>(ent);
    if (!ret) {
        throw InputErrorException(key + ": entity has the wrong type: " + ent_name);
    }
    return ret;
}

// 接受单个名称或名称列表
template<typename T>
std::vector<T*> getEntityListInput(SimContext* ctx, const json& cfg, const std::string& key, bool required = false) {
    std::vector<T*> ret;
    if (!cfg.contains(key) || cfg[key].is_null()) {
        if (required) throw InputErrorException("Missing required input: " + key);
        return ret;
    }
    json list = cfg[key].is_array() ? cfg[key] : json::array({cfg[key]});
    for (const auto& item : list) {
        json single = {{key, item}};
        ret.push_back(getEntityInput<T>(ctx, single, key, true));
    }
    return ret;
}

inline std::unique_ptr<SampleProvider> getSampleInput(SimContext* ctx, const json& cfg, const std::string& key,
                                                      bool required = false) {
    if (!cfg.contains(key) || cfg[key].is_null()) {
        if (required) throw InputErrorException("Missing required input: " + key);
        return nullptr;
    }
    return makeSampleProvider(cfg[key], ctx);
}

// 多个数值来源组成的列表，单个值视为长度为 1 的列表
inline std::vector<std::unique_ptr<SampleProvider>> getSampleListInput(SimContext* ctx, const json& cfg,
                                                                       const std::string& key) {
    std::vector<std::unique_ptr<SampleProvider>> ret;
    if (!cfg.contains(key) || cfg[key].is_null()) return ret;
    const json& val = cfg[key];
    if (val.is_array()) {
        for (const auto& item : val) ret.push_back(makeSampleProvider(item, ctx));
    } else {
        ret.push_back(makeSampleProvider(val, ctx));
    }
    return ret;
}

template<typename T>
T getValueInput(const json& cfg, const std::string& key, T def) {
    if (!cfg.contains(key) || cfg[key].is_null()) return def;
    return cfg[key].get<T>();
}

#endif // CONFIG_UTILS_HH
