// include/error_exception.hh
#ifndef ERROR_EXCEPTION_HH
#define ERROR_EXCEPTION_HH

#include <cstdarg>
#include <cstdio>
#include <stdexcept>
#include <string>

inline std::string vformatMessage(const char* fmt, va_list args) {
    char buf[512];
    vsnprintf(buf, sizeof(buf), fmt, args);
    return std::string(buf);
}

inline std::string formatMessage(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string msg = vformatMessage(fmt, args);
    va_end(args);
    return msg;
}

/**
 * 运行期致命错误，带有出错实体的名称
 */
class ErrorException : public std::runtime_error {
private:
    std::string ent_name;

    static std::string compose(const std::string& ent, const std::string& msg) {
        return ent.empty() ? msg : ent + ": " + msg;
    }

public:
    explicit ErrorException(const std::string& msg)
        : std::runtime_error(msg) {}

    ErrorException(const std::string& ent, const std::string& msg)
        : std::runtime_error(compose(ent, msg)), ent_name(ent) {}

    const std::string& getEntityName() const { return ent_name; }
};

/**
 * 配置错误：在解析输入或 validate() 阶段发现
 */
class InputErrorException : public std::runtime_error {
public:
    explicit InputErrorException(const std::string& msg)
        : std::runtime_error(msg) {}
};

#endif // ERROR_EXCEPTION_HH
