#include "app/ConsolePrompt.hpp"
#include <string>
#include "domain/ChangeSelector.hpp"

namespace chlog::app {

using application::RemovalDecision;
using domain::ChangeCandidate;

void ConsolePrompt::listCandidates(const std::vector<ChangeCandidate>& candidates) {
    m_out << "Changes found for removal:\n";
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        m_out << "  [" << (i + 1) << "] [" << domain::CategoryToString(candidates[i].category) << "] "
              << candidates[i].entry.description << "\n";
    }
}

std::string ConsolePrompt::ask(const std::string& question) {
    m_out << question << std::flush;
    std::string answer;
    if (!std::getline(m_in, answer)) return "";
    answer.erase(0, answer.find_first_not_of(" \t"));
    answer.erase(answer.find_last_not_of(" \t\r\n") + 1);
    return answer;
}

bool ConsolePrompt::confirmSingle(const ChangeCandidate& candidate) {
    listCandidates({candidate});
    std::string answer = domain::ChangeSelector::ToLower(ask("Remove this change? (y/N): "));
    if (answer != "y" && answer != "yes") {
        m_out << "Cancelled\n";
        return false;
    }
    return true;
}

RemovalDecision ConsolePrompt::chooseMany(const std::vector<ChangeCandidate>& candidates) {
    listCandidates(candidates);
    m_out << "\nChoose an action:\n"
          << "  1) Remove all matches\n"
          << "  2) Pick specific ones\n"
          << "  3) Cancel\n";

    RemovalDecision decision;
    std::string choice = ask("Your choice [1-3]: ");
    if (choice == "1") {
        decision.kind = RemovalDecision::Kind::All;
    } else if (choice == "2") {
        decision.picks = domain::ChangeSelector::ParsePicks(ask("Enter numbers separated by commas: "), candidates.size());
        if (decision.picks.empty()) {
            m_out << "Invalid numbers\n";
        } else {
            decision.kind = RemovalDecision::Kind::Subset;
        }
    } else {
        m_out << "Cancelled\n";
    }
    return decision;
}

} // namespace chlog::app
