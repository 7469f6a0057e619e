#ifndef EVENT_QUEUE_HH
#define EVENT_QUEUE_HH

#include <list>
#include <map>
#include <memory>
#include <utility>
#include "sim_core.hh"
#include "process_target.hh"

struct Event;

/**
 * 记住一个尚未执行的事件，用于取消或提前执行
 * 同一时刻最多绑定一个事件
 */
class EventHandle {
    friend struct Event;
    friend class EventManager;

    Event* event = nullptr;

public:
    EventHandle() = default;
    ~EventHandle();
    EventHandle(const EventHandle&) = delete;
    EventHandle& operator=(const EventHandle&) = delete;

    bool isScheduled() const { return event != nullptr; }
};

struct Event {
    using NodeKey = std::pair<Tick, int>;
    using NodeList = std::list<Event*>;
    using NodeMap = std::map<NodeKey, NodeList>;

    Tick sched_tick = 0;
    int priority = 0;
    uint64_t seq = 0;           // 插入序号
    bool fifo = true;

    ProcessTarget* target = nullptr;
    std::unique_ptr<ProcessTarget> owned_target;
    EventHandle* handle = nullptr;
    Conditional* cond = nullptr;  // 条件等待时非空
    std::unique_ptr<Conditional> owned_cond;

    // 在 EventQueue 中的位置
    NodeMap::iterator node;
    NodeList::iterator pos;

    Event(ProcessTarget* t, EventHandle* h) : target(t), handle(h) {
        if (handle) handle->event = this;
    }

    Event(std::unique_ptr<ProcessTarget> t, EventHandle* h)
        : target(t.get()), owned_target(std::move(t)), handle(h) {
        if (handle) handle->event = this;
    }

    ~Event() { unbind(); }

    void unbind() {
        if (handle && handle->event == this) handle->event = nullptr;
        handle = nullptr;
    }
};

inline EventHandle::~EventHandle() {
    if (event) event->handle = nullptr;
}

/**
 * 待执行事件的有序集合：按 (tick, priority) 分桶，桶内是链表
 * fifo 事件追加到桶尾，非 fifo 事件插入桶头
 */
class EventQueue {
private:
    Event::NodeMap nodes;
    size_t count = 0;
    uint64_t next_seq = 0;

public:
    EventQueue() = default;
    ~EventQueue() { clear(); }

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void push(std::unique_ptr<Event> ev) {
        Event* e = ev.release();
        e->seq = next_seq++;
        auto node = nodes.try_emplace(Event::NodeKey(e->sched_tick, e->priority)).first;
        e->node = node;
        if (e->fifo) {
            e->pos = node->second.insert(node->second.end(), e);
        } else {
            e->pos = node->second.insert(node->second.begin(), e);
        }
        count++;
    }

    Event* peek() const {
        if (nodes.empty()) return nullptr;
        return nodes.begin()->second.front();
    }

    std::unique_ptr<Event> pop() {
        Event* e = peek();
        if (!e) return nullptr;
        return remove(e);
    }

    std::unique_ptr<Event> remove(Event* e) {
        auto node = e->node;
        node->second.erase(e->pos);
        if (node->second.empty()) nodes.erase(node);
        count--;
        return std::unique_ptr<Event>(e);
    }

    void clear() {
        for (auto& kv : nodes) {
            for (Event* e : kv.second) delete e;
        }
        nodes.clear();
        count = 0;
    }

    bool empty() const { return count == 0; }
    size_t size() const { return count; }

    Tick nextTick() const {
        return nodes.empty() ? MAX_TICK : nodes.begin()->first.first;
    }
};

#endif // EVENT_QUEUE_HH
