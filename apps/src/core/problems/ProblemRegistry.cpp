#include "ProblemRegistry.h"
#include "ArithmeticProblems.h"
#include "core/Assert.h"

namespace StackEvo {

void ProblemRegistry::registerProblem(const std::string& name, ProblemFactory factory)
{
    STACKEVO_ASSERT(factory, "ProblemRegistry: problem factory must be set");
    factories_[name] = std::move(factory);
}

std::unique_ptr<Problem> ProblemRegistry::create(const std::string& name) const
{
    const auto it = factories_.find(name);
    if (it == factories_.end()) {
        return nullptr;
    }
    return it->second();
}

std::vector<std::string> ProblemRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        result.push_back(name);
    }
    return result;
}

ProblemRegistry ProblemRegistry::createDefault()
{
    ProblemRegistry registry;
    registry.registerProblem("add", createAdditionProblem);
    registry.registerProblem("subtract", createSubtractionProblem);
    registry.registerProblem("multiply", createMultiplicationProblem);
    registry.registerProblem("square", createSquareProblem);
    registry.registerProblem("sum-of-squares", createSumOfSquaresProblem);
    registry.registerProblem("fibonacci", createFibonacciProblem);
    return registry;
}

} // namespace StackEvo
