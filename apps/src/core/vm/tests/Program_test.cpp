#include "core/vm/Program.h"
#include "core/vm/ProgramText.h"

#include <gtest/gtest.h>

using namespace StackEvo;

TEST(ProgramTest, AcceptsWellFormedInstructions)
{
    auto result = Program::create({
        Instruction::make(Opcode::Push, 4),
        Instruction::make(Opcode::Store, 0),
        Instruction::make(Opcode::Load, 0),
        Instruction::make(Opcode::Jz, 0),
        Instruction::make(Opcode::Halt),
    });

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().size(), 5u);
    EXPECT_TRUE(result.value().hasJumps());
    EXPECT_EQ(result.value().operandCount(), 4);
}

TEST(ProgramTest, RejectsJumpTargetOutsideProgram)
{
    auto result = Program::create({
        Instruction::make(Opcode::Jmp, 2),
        Instruction::make(Opcode::Halt),
    });

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().instructionIndex, 0);
}

TEST(ProgramTest, RejectsNegativeJumpTarget)
{
    auto result = Program::create({ Instruction::make(Opcode::Jz, -1) });

    EXPECT_TRUE(result.isError());
}

TEST(ProgramTest, RejectsSlotOutsideVariableBank)
{
    EXPECT_TRUE(Program::create({ Instruction::make(Opcode::Load, kVariableSlotCount) }).isError());
    EXPECT_TRUE(Program::create({ Instruction::make(Opcode::Store, -1) }).isError());
    EXPECT_TRUE(
        Program::create({ Instruction::make(Opcode::Store, kVariableSlotCount - 1) }).isValue());
}

TEST(ProgramTest, RejectsMissingOrUnexpectedOperand)
{
    const auto missing = Program::create({ Instruction::make(Opcode::Push) });
    ASSERT_TRUE(missing.isError());
    EXPECT_NE(missing.errorValue().message.find("requires"), std::string::npos);

    const auto unexpected = Program::create({ Instruction::make(Opcode::Add, 1) });
    ASSERT_TRUE(unexpected.isError());
    EXPECT_NE(unexpected.errorValue().message.find("no operand"), std::string::npos);
}

TEST(ProgramTest, RejectsOpcodeOutsideInstructionSet)
{
    Instruction bogus;
    bogus.opcode = static_cast<Opcode>(kOpcodeCount);

    const auto result = Program::create({ bogus });

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().instructionIndex, 0);
}

TEST(ProgramTest, OpcodeTableCoversEveryOpcode)
{
    for (Opcode opcode : allOpcodes()) {
        const auto& info = opcodeInfo(opcode);
        EXPECT_EQ(info.opcode, opcode);
        EXPECT_EQ(opcodeFromString(info.name), opcode);
    }
    EXPECT_EQ(opcodeFromString("jz"), Opcode::Jz);
    EXPECT_FALSE(opcodeFromString("NOP").has_value());
}

TEST(ProgramTextTest, FormatsOneInstructionPerLine)
{
    auto program = Program::create({
        Instruction::make(Opcode::Push, -3),
        Instruction::make(Opcode::Add),
        Instruction::make(Opcode::Jz, 0),
    });
    ASSERT_TRUE(program.isValue());

    EXPECT_EQ(formatProgram(program.value()), "PUSH -3\nADD\nJZ 0");
    EXPECT_EQ(formatProgram(program.value(), "; "), "PUSH -3; ADD; JZ 0");
}

TEST(ProgramTextTest, ParsesLinesSemicolonsAndComments)
{
    const auto result = parseProgram("push 2   # first operand\n"
                                     "\n"
                                     "PUSH 3; add\n"
                                     "HALT");

    ASSERT_TRUE(result.isValue());
    const Program& program = result.value();
    ASSERT_EQ(program.size(), 4u);
    EXPECT_EQ(program.at(0), Instruction::make(Opcode::Push, 2));
    EXPECT_EQ(program.at(2), Instruction::make(Opcode::Add));
    EXPECT_EQ(program.at(3), Instruction::make(Opcode::Halt));
}

TEST(ProgramTextTest, ReportsUnknownOpcodeWithIndex)
{
    const auto result = parseProgram("PUSH 1; FROB; ADD");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().instructionIndex, 1);
    EXPECT_NE(result.errorValue().message.find("FROB"), std::string::npos);
}

TEST(ProgramTextTest, RejectsBadOperands)
{
    EXPECT_TRUE(parseProgram("PUSH").isError());
    EXPECT_TRUE(parseProgram("PUSH x").isError());
    EXPECT_TRUE(parseProgram("PUSH 99999999999").isError());
    EXPECT_TRUE(parseProgram("DUP 1").isError());
    EXPECT_TRUE(parseProgram("PUSH 1 2").isError());
    EXPECT_TRUE(parseProgram("JMP 5").isError());
}
