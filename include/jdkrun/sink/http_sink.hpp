/*
 * HTTP event sink - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jdkrun/core/channel.hpp>
#include <jdkrun/core/event.hpp>
#include <functional>
#include <string>
#include <thread>

namespace jdkrun {

struct HttpSinkConfig {
    std::string endpoint;        // e.g. http://localhost:8123/jdkrun/events
    int timeout_seconds = 5;
};

// Posts every event as JSON (see to_json) from a worker thread, in emit order.
// Delivery failures are reported on stderr once per outage and then dropped.
class HttpEventSink : public EventSink {
public:
    using Transport = std::function<bool(const std::string& endpoint, const std::string& body, int timeout_seconds)>;

    explicit HttpEventSink(HttpSinkConfig cfg);
    HttpEventSink(HttpSinkConfig cfg, Transport transport); // custom transport (tests)
    ~HttpEventSink() override;
    HttpEventSink(const HttpEventSink&) = delete;
    HttpEventSink& operator=(const HttpEventSink&) = delete;

    void emit(const Event& ev) override;
    // Stops accepting events and waits until the queued ones are delivered.
    void flush_and_stop();

private:
    void worker_loop();

    HttpSinkConfig m_cfg;
    Transport m_transport;
    Channel<std::string> m_queue;
    std::thread m_worker;
};

// libcurl POST with Content-Type: application/json; true on a 2xx reply.
bool curl_post_json(const std::string& endpoint, const std::string& body, int timeout_seconds);

} // namespace jdkrun
