#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace sqlchain::materializer {

class DesiredColumns final {
public:
    enum class Kind : std::uint8_t {
        AllColumns = 0,
        NoColumns,
        Explicit
    };

    [[nodiscard]] static DesiredColumns all() { return DesiredColumns{Kind::AllColumns, {}}; }
    [[nodiscard]] static DesiredColumns none() { return DesiredColumns{Kind::NoColumns, {}}; }
    [[nodiscard]] static DesiredColumns of(std::vector<std::string> names)
    {
        return DesiredColumns{Kind::Explicit, std::move(names)};
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_all() const noexcept { return kind_ == Kind::AllColumns; }
    [[nodiscard]] bool is_none() const noexcept { return kind_ == Kind::NoColumns; }
    [[nodiscard]] std::span<const std::string> names() const noexcept { return names_; }

private:
    DesiredColumns(Kind kind, std::vector<std::string> names) : kind_{kind}, names_{std::move(names)} {}

    Kind kind_ = Kind::AllColumns;
    std::vector<std::string> names_{};
};

// Shapes the result of an operation. The command builder asks it which
// columns to project before any SQL is generated.
class Materializer {
public:
    virtual ~Materializer() = default;

    [[nodiscard]] virtual DesiredColumns desired_columns() const = 0;
};

}  // namespace sqlchain::materializer
