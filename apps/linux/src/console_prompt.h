#pragma once
#include "remote_link.h"
#include <iostream>

// LinePrompt on a pair of streams (stdin/stdout for the CLI).
class ConsolePrompt : public LinePrompt {
public:
    ConsolePrompt(std::istream& in = std::cin, std::ostream& out = std::cout);

    bool read_line(const std::string& prompt, std::string& out) override;

    void notice(const std::string& text) override;

private:
    std::istream& m_in;
    std::ostream& m_out;
};
