#pragma once

#include <utility>
#include <variant>

namespace ArmySearch {

/**
 * Value-or-error return type for recoverable failures.
 *
 * Example:
 *   Result<Config, std::string> load()
 *   {
 *       if (!found) return Result<Config, std::string>::error("not found");
 *       return Result<Config, std::string>::okay(config);
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    E& errorValue() & { return std::get<1>(data_); }
    const E& errorValue() const& { return std::get<1>(data_); }
    E&& errorValue() && { return std::get<1>(std::move(data_)); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v))
    {}

    std::variant<T, E> data_;
};

} // namespace ArmySearch
