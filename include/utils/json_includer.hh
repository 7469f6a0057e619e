// include/utils/json_includer.hh
#ifndef JSON_INCLUDER_HH
#define JSON_INCLUDER_HH

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "../error_exception.hh"

using json = nlohmann::json;

/**
 * 支持 "include" 的模型文件加载
 *
 * 被包含文件的键合并到当前对象：当前对象已有的标量键优先，
 * "entities" 这类数组则拼接，被包含的条目在前
 * 同一文件可以被不同分支重复包含，但不能出现在自己的包含链上
 */
class JsonIncluder {
public:
    static json loadAndInclude(const std::string& filename) {
        std::vector<std::string> chain;
        return loadFile(filename, chain);
    }

private:
    static json loadFile(const std::string& filename, std::vector<std::string>& chain) {
        std::string path = std::filesystem::absolute(filename).lexically_normal().string();
        for (size_t i = 0; i < chain.size(); ++i) {
            if (chain[i] != path) continue;
            std::string cycle;
            for (size_t j = i; j < chain.size(); ++j) cycle += chain[j] + " -> ";
            throw InputErrorException("Include cycle: " + cycle + path);
        }

        std::ifstream f(filename);
        if (!f.is_open()) {
            throw InputErrorException("Cannot open config file: " + filename);
        }
        std::stringstream buffer;
        buffer << f.rdbuf();
        json root = json::parse(buffer.str());

        chain.push_back(path);
        processIncludes(root, filename, chain);
        chain.pop_back();
        return root;
    }

    static void processIncludes(json& node, const std::string& base_path, std::vector<std::string>& chain) {
        if (node.is_object()) {
            if (node.contains("include")) {
                json list = node["include"].is_array() ? node["include"] : json::array({node["include"]});
                node.erase("include");
                std::string dir = base_path.substr(0, base_path.find_last_of("/\\") + 1);

                // 先按 include 顺序合并所有被包含文件
                json merged = json::object();
                for (const auto& inc : list) {
                    json included = loadFile(dir + inc.get<std::string>(), chain);
                    for (auto& [key, value] : included.items()) {
                        if (!merged.contains(key)) {
                            merged[key] = value;
                        } else if (merged[key].is_array() && value.is_array()) {
                            merged[key].insert(merged[key].end(), value.begin(), value.end());
                        }
                    }
                }

                for (auto& [key, value] : merged.items()) {
                    if (!node.contains(key)) {
                        node[key] = value;
                    } else if (node[key].is_array() && value.is_array()) {
                        json combined = value;
                        combined.insert(combined.end(), node[key].begin(), node[key].end());
                        node[key] = combined;
                    }
                }
            }

            for (auto& [key, value] : node.items()) {
                processIncludes(value, base_path, chain);
            }
        } else if (node.is_array()) {
            for (auto& item : node) {
                processIncludes(item, base_path, chain);
            }
        }
    }
};

#endif // JSON_INCLUDER_HH
