/*
 * Event stream - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>

namespace jdkrun {

enum class EventKind { Log, Output, Error };

struct Event {
    EventKind kind;
    std::string payload; // text or raw bytes of a child stream chunk
};

const char* kind_name(EventKind kind);

// {"domain":"jdkrun","event":"output","payload":"..."}
std::string to_json(const Event& ev);
std::string escape_json(const std::string& in);

// Consumer of supervisor/compiler events. emit() may be called from any thread.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const Event& ev) = 0;

    void log(const std::string& text) { emit(Event{EventKind::Log, text}); }
    void output(const std::string& text) { emit(Event{EventKind::Output, text}); }
    void error(const std::string& text) { emit(Event{EventKind::Error, text}); }
};

class CallbackSink : public EventSink {
public:
    explicit CallbackSink(std::function<void(const Event&)> fn) : m_fn(std::move(fn)) {}
    void emit(const Event& ev) override { if (m_fn) m_fn(ev); }
private:
    std::function<void(const Event&)> m_fn;
};

// Non-owning fan-out; sinks must outlive the FanoutSink.
class FanoutSink : public EventSink {
public:
    void add(EventSink* sink);
    void emit(const Event& ev) override;
private:
    std::mutex m_mu;
    std::vector<EventSink*> m_sinks;
};

} // namespace jdkrun
