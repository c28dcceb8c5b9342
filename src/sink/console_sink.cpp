/*
 * Console event sink implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/sink/console_sink.hpp>

namespace jdkrun {

static std::string apply_color(const std::string& s, const char* code, bool color){ if(!color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

void ConsoleSink::emit(const Event& ev) {
    std::lock_guard<std::mutex> lk(m_mu);
    switch (ev.kind) {
        case EventKind::Output:
            m_out << ev.payload; m_out.flush();
            break;
        case EventKind::Error:
            m_err << apply_color(ev.payload, "31", m_color); m_err.flush();
            break;
        case EventKind::Log:
            m_err << apply_color("[jdkrun] " + ev.payload, "36", m_color) << '\n'; m_err.flush();
            break;
    }
}

} // namespace jdkrun
