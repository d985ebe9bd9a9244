#include "ProgramText.h"

#include <charconv>
#include <sstream>
#include <vector>

namespace StackEvo {

namespace {
std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitStatements(const std::string& text)
{
    std::vector<std::string> statements;
    std::stringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }

        std::stringstream parts(line);
        std::string part;
        while (std::getline(parts, part, ';')) {
            part = trim(part);
            if (!part.empty()) {
                statements.push_back(part);
            }
        }
    }
    return statements;
}
} // namespace

std::string formatProgram(const Program& program, const std::string& separator)
{
    std::string text;
    for (size_t i = 0; i < program.size(); ++i) {
        if (i > 0) {
            text += separator;
        }
        text += formatInstruction(program.at(i));
    }
    return text;
}

Result<Program, MalformedProgram> parseProgram(const std::string& text)
{
    using ProgramResult = Result<Program, MalformedProgram>;

    const auto statements = splitStatements(text);
    std::vector<Instruction> instructions;
    instructions.reserve(statements.size());

    for (size_t i = 0; i < statements.size(); ++i) {
        const int index = static_cast<int>(i);
        std::stringstream tokens(statements[i]);
        std::string mnemonic;
        std::string operandText;
        std::string extra;
        tokens >> mnemonic >> operandText >> extra;

        const auto opcode = opcodeFromString(mnemonic);
        if (!opcode.has_value()) {
            return ProgramResult::error(
                MalformedProgram{ "Unknown opcode '" + mnemonic + "'", index });
        }
        if (!extra.empty()) {
            return ProgramResult::error(
                MalformedProgram{ "Unexpected token '" + extra + "'", index });
        }

        if (!hasOperand(opcode.value())) {
            if (!operandText.empty()) {
                return ProgramResult::error(MalformedProgram{
                    toString(opcode.value()) + " takes no operand", index });
            }
            instructions.push_back(Instruction::make(opcode.value()));
            continue;
        }

        if (operandText.empty()) {
            return ProgramResult::error(MalformedProgram{
                toString(opcode.value()) + " requires an operand", index });
        }

        Value operand = 0;
        const char* begin = operandText.data();
        const char* end = begin + operandText.size();
        const auto [ptr, ec] = std::from_chars(begin, end, operand);
        if (ec != std::errc() || ptr != end) {
            return ProgramResult::error(
                MalformedProgram{ "Operand '" + operandText + "' is not a 32-bit integer", index });
        }
        instructions.push_back(Instruction::make(opcode.value(), operand));
    }

    return Program::create(std::move(instructions));
}

} // namespace StackEvo
