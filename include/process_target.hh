// include/process_target.hh
#ifndef PROCESS_TARGET_HH
#define PROCESS_TARGET_HH

#include <functional>
#include <string>

/**
 * 事件触发时执行的一段实体行为（即一个进程的“续体”）
 * 进程只在显式的 schedule / wait 调用处挂起：把续体交给调度器后返回即可
 */
class ProcessTarget {
public:
    virtual ~ProcessTarget() = default;
    virtual void process() = 0;
    virtual std::string getDescription() const { return "ProcessTarget"; }
};

struct LambdaTarget : public ProcessTarget {
    std::function<void()> func;
    std::string desc;

    LambdaTarget(std::function<void()> f, std::string d = "LambdaTarget")
        : func(std::move(f)), desc(std::move(d)) {}

    void process() override { func(); }
    std::string getDescription() const override { return desc; }
};

/**
 * 绑定到实体成员函数的目标，通常作为实体成员长期存在，配合 EventHandle 复用
 */
template <typename T>
class EntityTarget : public ProcessTarget {
private:
    T* ent;
    void (T::*method)();
    std::string method_name;

public:
    EntityTarget(T* e, void (T::*m)(), const std::string& name)
        : ent(e), method(m), method_name(name) {}

    void process() override { (ent->*method)(); }

    std::string getDescription() const override {
        return ent->getName() + "." + method_name;
    }
};

// 条件等待使用的谓词
class Conditional {
public:
    virtual ~Conditional() = default;
    virtual bool evaluate() = 0;
};

struct LambdaConditional : public Conditional {
    std::function<bool()> func;
    explicit LambdaConditional(std::function<bool()> f) : func(std::move(f)) {}
    bool evaluate() override { return func(); }
};

#endif // PROCESS_TARGET_HH
