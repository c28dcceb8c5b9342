/*
 * HTTP event sink implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/sink/http_sink.hpp>
#include <curl/curl.h>
#include <iostream>

namespace jdkrun {

static size_t curl_discard_cb(char*, size_t size, size_t nmemb, void*){ return size*nmemb; }

bool curl_post_json(const std::string& endpoint, const std::string& body, int timeout_seconds) {
    CURL* curl = curl_easy_init(); if (!curl) return false;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_discard_cb);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    struct curl_slist* headers=nullptr; headers=curl_slist_append(headers, "Content-Type: application/json"); curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    auto res = curl_easy_perform(curl); long code=0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(headers); curl_easy_cleanup(curl);
    return res==CURLE_OK && code/100==2;
}

HttpEventSink::HttpEventSink(HttpSinkConfig cfg)
    : HttpEventSink(std::move(cfg), curl_post_json) {}

HttpEventSink::HttpEventSink(HttpSinkConfig cfg, Transport transport)
    : m_cfg(std::move(cfg)), m_transport(std::move(transport)) {
    m_worker = std::thread([this]{ worker_loop(); });
}

HttpEventSink::~HttpEventSink() {
    flush_and_stop();
}

void HttpEventSink::emit(const Event& ev) {
    m_queue.push(to_json(ev));
}

void HttpEventSink::flush_and_stop() {
    m_queue.close();
    if (m_worker.joinable()) m_worker.join();
}

void HttpEventSink::worker_loop() {
    bool failing = false;
    while (auto body = m_queue.pop()) {
        bool ok = m_transport && m_transport(m_cfg.endpoint, *body, m_cfg.timeout_seconds);
        if (!ok && !failing) std::cerr << "jdkrun: event delivery to " << m_cfg.endpoint << " failed" << '\n';
        failing = !ok;
    }
}

} // namespace jdkrun
