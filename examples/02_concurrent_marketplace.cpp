// ============================================================================
// Example 02: Concurrent Marketplace
// ============================================================================
//
// Several clients post tasks while several freelancers race to claim them.
// Each task is won by exactly one freelancer, and every escrowed unit ends up
// either paid out or refunded.
//
// RUN:
//   cd build && ./examples/02_concurrent_marketplace
//
// ============================================================================

#include "pactum/pactum.hpp"

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace pactum;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== Pactum Example 02: Concurrent Marketplace ===" << std::endl;
    std::cout << std::endl;

    constexpr int kClients = 3;
    constexpr int kFreelancers = 4;
    constexpr int kTasksPerClient = 20;
    constexpr Amount kReward = 100;

    const Identity owner("platform");
    InMemoryLedger ledger;
    SystemClock clock;
    EventLog events;
    TaskRegistry registry(RegistryConfig{owner}, ledger, clock, &events);

    for (int c = 0; c < kClients; ++c) {
        if (auto ec = ledger.Mint(Identity("client-" + std::to_string(c)), kTasksPerClient * kReward)) {
            std::cerr << "cannot fund client-" << c << ": " << ec.message() << std::endl;
            return 1;
        }
    }
    const Amount supply = ledger.TotalSupply();

    // Clients post their tasks up front
    std::vector<std::thread> clients;
    for (int c = 0; c < kClients; ++c) {
        clients.emplace_back([&, c] {
            Identity me("client-" + std::to_string(c));
            for (int i = 0; i < kTasksPerClient; ++i) {
                auto id = registry.CreateTask(me, "gig " + std::to_string(i), "", clock.Now() + 1h, kReward);
                if (id.IsErr()) {
                    std::cerr << me << ": create failed: " << id.Error().message() << std::endl;
                }
            }
        });
    }
    for (auto& t : clients) t.join();

    // Freelancers scan the open board and race for every task
    std::atomic<int> claimed{0};
    std::vector<std::thread> freelancers;
    for (int f = 0; f < kFreelancers; ++f) {
        freelancers.emplace_back([&, f] {
            Identity me("freelancer-" + std::to_string(f));
            for (const auto& task : registry.GetTasksByStatus(TaskStatus::Open)) {
                if (registry.AcceptTask(me, task.id).IsOk()) {
                    claimed++;
                    (void)registry.CompleteTask(me, task.id);
                }
            }
        });
    }
    for (auto& t : freelancers) t.join();

    // Clients approve the even-numbered tasks; the odd ones stay assigned and
    // their reward stays in escrow
    for (const auto& task : registry.GetTasksByStatus(TaskStatus::Assigned)) {
        if (task.id % 2 == 0) {
            (void)registry.CompleteTask(task.client, task.id);
        }
    }

    std::cout << "tasks created:   " << registry.GetTotalTasks() << std::endl;
    std::cout << "tasks claimed:   " << claimed.load() << std::endl;
    std::cout << "tasks completed: " << registry.GetTasksByStatus(TaskStatus::Completed).size() << std::endl;
    std::cout << "still in escrow: " << registry.GetHeldBalance() << std::endl;
    std::cout << "platform fees:   " << ledger.BalanceOf(owner) << std::endl;
    std::cout << "events recorded: " << events.Size() << std::endl;
    for (int f = 0; f < kFreelancers; ++f) {
        Identity me("freelancer-" + std::to_string(f));
        std::cout << "  " << me << ": " << registry.GetCompletedTaskCount(me) << " completed, balance "
                  << ledger.BalanceOf(me) << std::endl;
    }

    bool conserved = ledger.TotalSupply() == supply && ledger.Custody() == registry.GetHeldBalance();
    std::cout << "value conserved: " << (conserved ? "yes" : "NO") << std::endl;
    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return conserved ? 0 : 1;
}
