/*
 * Single-slot process supervisor - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Owns at most one running child program. run() launches it (or, if one is
 *   alive, interrupts it and queues the request until its exit arrives),
 *   write_input() and close_input() feed and end its stdin; terminate() asks
 *   it to stop. Every
 *   request, every stdout/stderr chunk and every exit notification is a
 *   message on one channel consumed by a single coordinator thread, which is
 *   the only code touching the slot and the only emitter of events.
 *
 * MIT License.
 */
#pragma once
#include <jdkrun/core/channel.hpp>
#include <jdkrun/core/event.hpp>
#include <jdkrun/exec/process.hpp>
#include <jdkrun/platform/platform_ops.hpp>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace jdkrun {

enum class SlotState { Idle, Running, Terminating };

const char* state_name(SlotState s);

struct PendingRun {
    std::string working_directory;
    std::string identifier;
};

// Copy of the slot as seen by the coordinator.
struct SlotSnapshot {
    SlotState state = SlotState::Idle;
    int pid = -1;
    std::uint64_t generation = 0;   // generation of the current process (0: none yet)
    std::string working_directory;
    std::string identifier;
    std::optional<PendingRun> pending;
    std::uint64_t launches = 0;     // total processes started by this supervisor
    std::optional<ExitStatus> last_exit;
};

struct SupervisorOptions {
    std::string runtime = "java";
    std::vector<std::string> runtime_args; // before the identifier
    bool verbose = false;
};

class ProcessSupervisor {
public:
    // launcher, ops and sink must outlive the supervisor.
    ProcessSupervisor(ProcessLauncher& launcher, PlatformOps& ops, EventSink& sink, SupervisorOptions opts = {});
    ~ProcessSupervisor();
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    void run(const std::string& working_directory, const std::string& identifier);
    void write_input(const std::string& text);
    void terminate();
    // The running program sees EOF on stdin after the input queued so far.
    void close_input();

    // The following block until the coordinator answers; never call them
    // from an EventSink invoked by this supervisor.
    SlotSnapshot snapshot();
    void sync();
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    struct RunRequest { std::string working_directory; std::string identifier; };
    struct WriteRequest { std::string text; };
    struct TerminateRequest {};
    struct CloseInputRequest {};
    struct DataNotice { std::uint64_t generation; StreamKind stream; std::string data; };
    struct ExitNotice { std::uint64_t generation; ExitStatus status; };
    struct SnapshotRequest { std::shared_ptr<std::promise<SlotSnapshot>> reply; };
    using Message = std::variant<RunRequest, WriteRequest, TerminateRequest, CloseInputRequest, DataNotice, ExitNotice, SnapshotRequest>;

    struct Slot {
        std::unique_ptr<ProcessHandle> handle;
        SlotState state = SlotState::Idle;
        std::uint64_t generation = 0;
        std::string working_directory;
        std::string identifier;
        std::optional<PendingRun> pending;
    };

    void coordinator_loop();
    void handle_run(const RunRequest& req);
    void handle_write(const WriteRequest& req);
    void handle_terminate();
    void handle_close_input();
    void handle_data(const DataNotice& n);
    void handle_exit(ExitNotice& n);
    void launch(const std::string& working_directory, const std::string& identifier);
    SlotSnapshot make_snapshot() const;
    void trace(const std::string& msg) const;

    ProcessLauncher& m_launcher;
    PlatformOps& m_ops;
    EventSink& m_sink;
    SupervisorOptions m_opts;

    Channel<Message> m_channel;
    Slot m_slot;                       // coordinator thread only
    std::uint64_t m_next_generation = 1;
    std::uint64_t m_launches = 0;
    std::optional<ExitStatus> m_last_exit;
    std::thread m_worker;
};

std::string describe_exit(const ExitStatus& es);

} // namespace jdkrun
