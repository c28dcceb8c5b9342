/*
 * Single-slot process supervisor implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/exec/supervisor.hpp>
#include <iostream>
#include <type_traits>

namespace jdkrun {

const char* state_name(SlotState s) {
    switch (s) {
        case SlotState::Idle: return "idle";
        case SlotState::Running: return "running";
        case SlotState::Terminating: return "terminating";
    }
    return "idle";
}

std::string describe_exit(const ExitStatus& es) {
    if (es.code) return "Exited with code: " + std::to_string(*es.code);
    if (es.signal) return "Exited with code: none (signal " + std::to_string(*es.signal) + ")";
    return "Exited with code: none";
}

ProcessSupervisor::ProcessSupervisor(ProcessLauncher& launcher, PlatformOps& ops, EventSink& sink, SupervisorOptions opts)
    : m_launcher(launcher), m_ops(ops), m_sink(sink), m_opts(std::move(opts)) {
    m_worker = std::thread([this]{ coordinator_loop(); });
}

ProcessSupervisor::~ProcessSupervisor() {
    m_channel.close();
    if (m_worker.joinable()) m_worker.join();
    // No child may outlive its supervisor.
    if (m_slot.handle && !m_slot.handle->exited()) {
        m_ops.force_kill(m_slot.handle->pid());
        m_slot.handle.reset();
    }
}

void ProcessSupervisor::run(const std::string& working_directory, const std::string& identifier) {
    m_channel.push(RunRequest{working_directory, identifier});
}

void ProcessSupervisor::write_input(const std::string& text) {
    m_channel.push(WriteRequest{text});
}

void ProcessSupervisor::terminate() {
    m_channel.push(TerminateRequest{});
}

void ProcessSupervisor::close_input() {
    m_channel.push(CloseInputRequest{});
}

SlotSnapshot ProcessSupervisor::snapshot() {
    auto reply = std::make_shared<std::promise<SlotSnapshot>>();
    auto fut = reply->get_future();
    if (!m_channel.push(SnapshotRequest{reply})) return SlotSnapshot{};
    return fut.get();
}

void ProcessSupervisor::sync() {
    (void)snapshot();
}

bool ProcessSupervisor::wait_idle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (snapshot().state == SlotState::Idle) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ProcessSupervisor::coordinator_loop() {
    while (auto msg = m_channel.pop()) {
        std::visit([&](auto &m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, RunRequest>) handle_run(m);
            else if constexpr (std::is_same_v<T, WriteRequest>) handle_write(m);
            else if constexpr (std::is_same_v<T, TerminateRequest>) handle_terminate();
            else if constexpr (std::is_same_v<T, CloseInputRequest>) handle_close_input();
            else if constexpr (std::is_same_v<T, DataNotice>) handle_data(m);
            else if constexpr (std::is_same_v<T, ExitNotice>) handle_exit(m);
            else if constexpr (std::is_same_v<T, SnapshotRequest>) m.reply->set_value(make_snapshot());
        }, *msg);
    }
}

void ProcessSupervisor::handle_run(const RunRequest& req) {
    if (m_slot.state == SlotState::Idle) {
        launch(req.working_directory, req.identifier);
        return;
    }
    // Old process must be gone before the new one starts: interrupt it and
    // let its exit notice pick up the most recent request.
    handle_terminate();
    m_slot.pending = PendingRun{req.working_directory, req.identifier};
    trace("queued " + req.identifier + " until generation " + std::to_string(m_slot.generation) + " exits");
}

void ProcessSupervisor::handle_write(const WriteRequest& req) {
    if (m_slot.state == SlotState::Idle || !m_slot.handle) return;
    if (!m_slot.handle->write_stdin(req.text))
        trace("stdin of generation " + std::to_string(m_slot.generation) + " is closed");
}

void ProcessSupervisor::handle_terminate() {
    if (m_slot.state == SlotState::Idle || !m_slot.handle) return;
    m_sink.output("\n");
    if (!m_ops.interrupt(m_slot.handle->pid()))
        trace("interrupt not delivered to pid " + std::to_string(m_slot.handle->pid()));
    // TODO: escalate to force_kill when the interrupt is ignored (needs an exit timeout).
    m_slot.state = SlotState::Terminating;
}

void ProcessSupervisor::handle_close_input() {
    if (m_slot.state == SlotState::Idle || !m_slot.handle) return;
    m_slot.handle->close_input();
}

void ProcessSupervisor::handle_data(const DataNotice& n) {
    if (n.stream == StreamKind::Stdout) m_sink.output(n.data);
    else m_sink.error(n.data);
}

void ProcessSupervisor::handle_exit(ExitNotice& n) {
    bool current = (n.generation == m_slot.generation && m_slot.state != SlotState::Idle);
    std::optional<PendingRun> next;
    if (current) {
        m_slot.handle.reset(); // monitor thread already posted its last message
        m_slot.state = SlotState::Idle;
        m_slot.working_directory.clear();
        m_slot.identifier.clear();
        next = std::move(m_slot.pending);
        m_slot.pending.reset();
        m_last_exit = n.status;
    } else {
        trace("stale exit of generation " + std::to_string(n.generation) + " ignored");
    }
    m_sink.log(describe_exit(n.status));
    m_sink.output("\n");
    if (next) handle_run(RunRequest{next->working_directory, next->identifier});
}

void ProcessSupervisor::launch(const std::string& working_directory, const std::string& identifier) {
    if (m_channel.closed()) return; // shutting down
    std::uint64_t gen = m_next_generation++;
    LaunchSpec spec;
    spec.program = m_opts.runtime;
    spec.args = m_opts.runtime_args;
    spec.args.push_back(identifier);
    spec.cwd = working_directory;

    m_sink.log("Running " + identifier + "...");
    m_slot.generation = gen;
    m_slot.state = SlotState::Running;
    m_slot.working_directory = working_directory;
    m_slot.identifier = identifier;
    m_slot.pending.reset();
    ++m_launches;

    ProcessCallbacks cb;
    cb.on_data = [this, gen](StreamKind k, std::string data) {
        m_channel.push(DataNotice{gen, k, std::move(data)});
    };
    cb.on_exit = [this, gen](ExitStatus es) {
        m_channel.push(ExitNotice{gen, es});
    };
    m_slot.handle = m_launcher.launch(spec, std::move(cb));
    trace("generation " + std::to_string(gen) + " pid " + std::to_string(m_slot.handle->pid()));
}

SlotSnapshot ProcessSupervisor::make_snapshot() const {
    SlotSnapshot s;
    s.state = m_slot.state;
    s.pid = m_slot.handle ? m_slot.handle->pid() : -1;
    s.generation = m_slot.state == SlotState::Idle ? 0 : m_slot.generation;
    s.working_directory = m_slot.working_directory;
    s.identifier = m_slot.identifier;
    s.pending = m_slot.pending;
    s.launches = m_launches;
    s.last_exit = m_last_exit;
    return s;
}

void ProcessSupervisor::trace(const std::string& msg) const {
    if (m_opts.verbose) std::cerr << "[jdkrun] " << msg << '\n';
}

} // namespace jdkrun
