/*
 * Event stream implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/core/event.hpp>
#include <cstdio>

namespace jdkrun {

const char* kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Log: return "log";
        case EventKind::Output: return "output";
        case EventKind::Error: return "error";
    }
    return "log";
}

// Length of the well-formed UTF-8 sequence starting at i, or 0.
static size_t utf8_sequence(const std::string& in, size_t i) {
    auto at = [&](size_t k) -> unsigned { return k < in.size() ? static_cast<unsigned char>(in[k]) : 0u; };
    auto cont = [](unsigned c) { return c >= 0x80 && c <= 0xBF; };
    unsigned c = at(i);
    if (c >= 0xC2 && c <= 0xDF) return cont(at(i+1)) ? 2 : 0;
    if (c >= 0xE0 && c <= 0xEF) {
        unsigned lo = c==0xE0 ? 0xA0 : 0x80, hi = c==0xED ? 0x9F : 0xBF; // no overlongs, no surrogates
        unsigned c1 = at(i+1);
        return (c1 >= lo && c1 <= hi && cont(at(i+2))) ? 3 : 0;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        unsigned lo = c==0xF0 ? 0x90 : 0x80, hi = c==0xF4 ? 0x8F : 0xBF;
        unsigned c1 = at(i+1);
        return (c1 >= lo && c1 <= hi && cont(at(i+2)) && cont(at(i+3))) ? 4 : 0;
    }
    return 0;
}

// Child output is raw bytes: bytes outside a valid UTF-8 sequence become \u00XX.
std::string escape_json(const std::string& in) {
    std::string out; out.reserve(in.size()+16);
    char buf[8];
    for (size_t i=0;i<in.size();) {
        char c = in[i];
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80) {
            size_t len = utf8_sequence(in, i);
            if (len) { out.append(in, i, len); i += len; continue; }
            std::snprintf(buf, sizeof(buf), "\\u%04x", u);
            out += buf; ++i; continue;
        }
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (u < 0x20) {
                    std::snprintf(buf, sizeof(buf), "\\u%04x", u);
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
        ++i;
    }
    return out;
}

std::string to_json(const Event& ev) {
    std::string out = "{\"domain\":\"jdkrun\",\"event\":\"";
    out += kind_name(ev.kind);
    out += "\",\"payload\":\"";
    out += escape_json(ev.payload);
    out += "\"}";
    return out;
}

void FanoutSink::add(EventSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lk(m_mu);
    m_sinks.push_back(sink);
}

void FanoutSink::emit(const Event& ev) {
    std::lock_guard<std::mutex> lk(m_mu);
    for (auto* s : m_sinks) s->emit(ev);
}

} // namespace jdkrun
