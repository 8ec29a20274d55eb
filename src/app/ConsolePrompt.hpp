#pragma once

#include <istream>
#include <ostream>
#include <string>
#include "application/RemovalPrompt.hpp"

namespace chlog::app {

/**
 * @class ConsolePrompt
 * @brief Asks removal questions on a terminal. End of input counts as "no".
 */
class ConsolePrompt : public application::RemovalPrompt {
public:
    ConsolePrompt(std::istream& in, std::ostream& out) : m_in(in), m_out(out) {}

    bool confirmSingle(const domain::ChangeCandidate& candidate) override;
    application::RemovalDecision chooseMany(const std::vector<domain::ChangeCandidate>& candidates) override;

private:
    void listCandidates(const std::vector<domain::ChangeCandidate>& candidates);
    std::string ask(const std::string& question);

    std::istream& m_in;
    std::ostream& m_out;
};

} // namespace chlog::app
