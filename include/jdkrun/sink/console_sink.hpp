/*
 * Console event sink - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jdkrun/core/event.hpp>
#include <mutex>
#include <ostream>

namespace jdkrun {

// output -> out, error -> err, log -> err as "[jdkrun] text" (cyan when color).
class ConsoleSink : public EventSink {
public:
    ConsoleSink(std::ostream& out, std::ostream& err, bool color = true)
        : m_out(out), m_err(err), m_color(color) {}
    void emit(const Event& ev) override;
private:
    std::mutex m_mu;
    std::ostream& m_out;
    std::ostream& m_err;
    bool m_color;
};

} // namespace jdkrun
