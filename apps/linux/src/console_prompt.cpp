#include "console_prompt.h"

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out)
    : m_in(in),
      m_out(out) {
}

bool ConsolePrompt::read_line(const std::string& prompt, std::string& out) {
    m_out << "\n" << prompt << std::flush;
    if (!std::getline(m_in, out)) {
        m_out << "\n";
        return false;
    }
    return true;
}

void ConsolePrompt::notice(const std::string& text) {
    m_out << text << "\n";
}
