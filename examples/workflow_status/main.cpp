#include "FSMCoreEngine.h"
#include <iostream>
#include <vector>

namespace {

// Record whose status column is driven by the machine
struct Ticket {
    std::string title;
    std::string status;
    std::vector<std::string> history;
};

const char *WORKFLOW_JSON = R"({
    "transitions": {
        "created": ["waiting"],
        "waiting": ["in_progress", "done"],
        "in_progress": ["waiting", "done"],
        "done": null
    },
    "default_state": "created"
})";

void printResult(const FCE::FiniteStateMachine::TransitionResult &result) {
    if (result) {
        std::cout << "  " << result.fromState << " -> " << result.toState << "\n";
    } else {
        std::cout << "  rejected (" << FCE::errorCodeToString(result.error) << "): " << result.errorMessage << "\n";
    }
}

}  // namespace

int main() {
    FCE::Logger::initialize();
    FCE::Logger::setLevel(FCE::LogLevel::Warn);

    std::cout << "=== Workflow Status Example (FCE " << FCE::getVersion(true) << ") ===" << "\n\n";

    // Option 1: Declared definition with a save hook on every transition
    std::cout << "Declared definition:" << "\n";
    {
        FCE::MachineDefinitionBuilder builder;
        builder.withTransitions("draft", {"awaiting_review"})
            .withTransitions("awaiting_review", {"reviewed", "draft"})
            .withTransitions("reviewed", {"published", "rejected"})
            .withTerminalState("published")
            .withTerminalState("rejected")
            .withDefaultState("draft")
            .onAnyTransition([](FCE::FiniteStateMachine &fsm, const std::string &target) {
                Ticket *ticket = fsm.getSubject<Ticket>();
                if (ticket) {
                    ticket->status = target;
                    ticket->history.push_back(fsm.getCurrentState() + " -> " + target);
                }
            })
            .onTransitionTo("published", [](FCE::FiniteStateMachine &fsm, const std::string &) {
                std::cout << "  publishing '" << fsm.getSubject<Ticket>()->title << "'\n";
            });

        auto definition = builder.build();
        Ticket ticket{"Release notes", "draft", {}};
        FCE::FiniteStateMachine fsm(definition, &ticket, ticket.status);

        printResult(fsm.transitionTo("awaiting_review"));
        printResult(fsm.transitionTo("published"));
        printResult(fsm.transitionTo("reviewed"));
        printResult(fsm.transitionTo("published"));
        printResult(fsm.transitionTo("draft"));

        std::cout << "  stored status: " << ticket.status << ", terminal: " << (fsm.isTerminal() ? "yes" : "no")
                  << "\n";
        std::cout << "  symbol PUBLISHED -> " << definition->getStateForSymbol("PUBLISHED").value_or("?") << "\n";
    }

    std::cout << "\n";

    // Option 2: Definition loaded from a JSON document
    std::cout << "Loaded definition:" << "\n";
    {
        auto loaded = FCE::DefinitionLoader::loadFromString(WORKFLOW_JSON);
        if (!loaded) {
            std::cerr << "Failed to load workflow: " << loaded.error << "\n";
            return 1;
        }

        FCE::FiniteStateMachine fsm(loaded.value);
        std::cout << "  initial: " << fsm.getCurrentState() << "\n";
        for (const auto &target : {"waiting", "in_progress", "created", "done"}) {
            printResult(fsm.transitionTo(target));
        }
        std::cout << "  document:\n" << FCE::JsonUtils::toPrettyString(FCE::DefinitionLoader::toJson(*loaded.value))
                  << "\n";
    }

    FCE::Logger::flush();
    return 0;
}
