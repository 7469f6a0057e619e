// include/config_loader.hh
#ifndef CONFIG_LOADER_HH
#define CONFIG_LOADER_HH

#include <iostream>
#include <fstream>
#include "nlohmann/json.hpp"
#include "error_exception.hh"
#include "utils/json_includer.hh"

using json = nlohmann::json;

/**
 * 从文件加载模型配置（处理 include）
 * @param filename 配置文件路径
 * @return 解析后的 JSON 对象
 * 文件无法打开或解析失败时抛出 InputErrorException
 */
inline json loadConfig(const std::string& filename) {
    try {
        return JsonIncluder::loadAndInclude(filename);
    } catch (const json::parse_error& e) {
        throw InputErrorException("JSON parse error in " + filename + " at byte "
                                  + std::to_string(e.byte) + ": " + e.what());
    }
}

#endif // CONFIG_LOADER_HH
