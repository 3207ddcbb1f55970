#include <iostream>
#include <string>
#include <chrono>
#include <iomanip>
#include <memory>
#include <stdexcept>
#include <thread>
#include <stdexec/execution.hpp>
#include <exec/static_thread_pool.hpp>
#include "relay/relay.hpp"

using namespace relay;
using namespace stdexec;
using namespace std::chrono_literals;

// --- 1. Events ---
// Every event is a shared signal keyed by production line id.
using LineSignal   = relay::signal<std::string>;
using LineListener = LineSignal::listener_type;

// --- 2. Factory Engine ---
class FactoryController {
public:
    FactoryController()
        : ready_(shared_signal<std::string>("factory.ready")),
          progress_(shared_signal<std::string>("factory.progress")),
          emergency_(shared_signal<std::string>("factory.emergency")) {}

    // Orchestrate one production line; every event carries the line id as sender.
    auto run_production_line(std::string line) {
        return just(std::move(line))
            | then([this](std::string id) {
                ready_->call(id);
                for (int i = 0; i < 5; ++i) {
                    std::this_thread::sleep_for(50ms);
                    progress_->call(id);
                }

                if (id == "LINE_ERR_99") {
                    if (emergency_->call(id) == call_status::stopped) {
                        std::cerr << "[CONTROL] emergency chain halted early on " << id << std::endl;
                    }
                    throw std::runtime_error("Hardware Failure");
                }
                return id + " SUCCESS";
            });
    }

private:
    std::shared_ptr<LineSignal> ready_;
    std::shared_ptr<LineSignal> progress_;
    std::shared_ptr<LineSignal> emergency_;
};

// --- 3. Console Reporting ---
// Senders may be `any` when an event is broadcast to every line.
std::string line_name(const LineListener& line) {
    return line.is_any() ? std::string("<all lines>") : line.value();
}

struct LineConsole {
    static void section(const std::string& title) {
        std::cout << "\n--- " << title << " ---" << std::endl;
    }

    static void step(const LineListener& line, int done, int total) {
        std::cout << "[STEP] " << std::left << std::setw(16) << line_name(line)
                  << done << "/" << total << std::endl;
    }
};

int main() {
    exec::static_thread_pool pool{4};
    auto sch = pool.get_scheduler();

    FactoryController controller;

    auto ready     = shared_signal<std::string>("factory.ready");
    auto progress  = shared_signal<std::string>("factory.progress");
    auto emergency = shared_signal<std::string>("factory.emergency");

    // --- 4. Subscribers ---

    // A. Audit log sees every line.
    ready->add([](const LineListener& line) {
        std::cout << "[AUDIT] " << line_name(line) << " ready" << std::endl;
    });

    // B. Dashboard only follows the gold line.
    int steps = 0;
    auto dashboard = progress->add([&steps](const LineListener& line) {
        LineConsole::step(line, ++steps, 5);
    }, LineSignal::default_priority, "LINE_GOLD_001");

    // C. Safety chain: interlock first, then the operator page; the interlock
    //    may cut the chain short.
    auto page = emergency->add([](const LineListener& line) {
        std::cerr << "[PAGE] operator paged for " << line_name(line) << std::endl;
    });
    emergency->add([](const LineListener& line) {
        std::cerr << "[INTERLOCK] emergency stop on " << line_name(line) << std::endl;
        throw stop_dispatch{};
    }, emergency->priority_higher(page));

    // --- 5. Execution ---

    LineConsole::section("nominal production");
    sync_wait(on(sch, controller.run_production_line("LINE_GOLD_001")));

    LineConsole::section("failing line");

    // Drop the dashboard; the safety chain must remain active.
    if (!progress->remove(dashboard)) {
        std::cerr << "[CONTROL] dashboard was already detached" << std::endl;
    }

    try {
        sync_wait(on(sch, controller.run_production_line("LINE_ERR_99")));
    } catch (const std::runtime_error& e) {
        std::cout << "[CONTROL] line aborted: " << e.what() << std::endl;
    }

    // A plant-wide broadcast reaches every subscriber regardless of line.
    ready->call(any);

    std::cout << "slots left on " << emergency->name() << ": " << emergency->size() << std::endl;
    return 0;
}
