#pragma once

#include "Program.h"
#include "core/Result.h"

#include <string>

namespace StackEvo {

/**
 * Text form of programs: one "OPCODE[ operand]" per line, or ';'-separated.
 * Blank entries and '#' comments are ignored; opcodes are case-insensitive.
 */
std::string formatProgram(const Program& program, const std::string& separator = "\n");

Result<Program, MalformedProgram> parseProgram(const std::string& text);

} // namespace StackEvo
