#pragma once

#include "core/evolution/Problem.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace StackEvo {

/**
 * Name-to-factory registry of target problems the CLI can evolve against.
 */
class ProblemRegistry {
public:
    using ProblemFactory = std::function<std::unique_ptr<Problem>()>;

    void registerProblem(const std::string& name, ProblemFactory factory);

    // Null for an unregistered name.
    std::unique_ptr<Problem> create(const std::string& name) const;

    // Registered names, sorted.
    std::vector<std::string> names() const;

    static ProblemRegistry createDefault();

private:
    std::map<std::string, ProblemFactory> factories_;
};

} // namespace StackEvo
