#pragma once

#include <utility>
#include <variant>

namespace StackEvo {

/**
 * Value-or-error return type.
 *
 * Holds either a value of type T or an error of type E. T and E may be the same type.
 *
 * Example:
 *   Result<Program, MalformedProgram> result = Program::create(instructions);
 *   if (result.isError()) {
 *       LOG_WARN(Vm, "Rejected program: {}", result.errorValue().message);
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

    bool isValue() const { return storage_.index() == 0; }
    bool isError() const { return storage_.index() == 1; }

    T& value() { return std::get<0>(storage_); }
    const T& value() const { return std::get<0>(storage_); }

    E& errorValue() { return std::get<1>(storage_); }
    const E& errorValue() const { return std::get<1>(storage_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : storage_(index, std::forward<V>(v))
    {}

    std::variant<T, E> storage_;
};

} // namespace StackEvo
