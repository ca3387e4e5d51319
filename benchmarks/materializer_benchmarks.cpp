#include "sqlchain/execution/native_command.hpp"
#include "sqlchain/materializer/compiled_binder.hpp"
#include "sqlchain/materializer/row_binder.hpp"
#include "sqlchain/model/type_descriptor.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{

using Clock = std::chrono::steady_clock;
using sqlchain::core::Value;
using sqlchain::core::ValueKind;

struct Order final {
    std::int64_t order_id = 0;
    std::int32_t customer_id = 0;
    std::string reference{};
    std::optional<std::string> notes{};
    double total = 0.0;
    bool shipped = false;
};

}  // namespace

namespace sqlchain::model {

template <>
struct TypeMapping<Order> {
    static void describe(TypeDescriptorBuilder<Order>& builder)
    {
        builder.name("Order");
        builder.property("OrderId", &Order::order_id).key();
        builder.property("CustomerId", &Order::customer_id);
        builder.property("Reference", &Order::reference);
        builder.property("Notes", &Order::notes);
        builder.property("Total", &Order::total);
        builder.property("Shipped", &Order::shipped);
    }
};

}  // namespace sqlchain::model

namespace
{

constexpr std::string_view order_query =
    "SELECT [OrderId], [CustomerId], [Reference], [Notes], [Total], [Shipped] FROM [Sales].[Order];";

// In-memory result set; rewound before every pass.
class MemoryCursor final : public sqlchain::execution::RowCursor {
public:
    explicit MemoryCursor(std::size_t rows)
    {
        rows_.reserve(rows);
        for (std::size_t index = 0; index < rows; ++index) {
            rows_.push_back({Value{static_cast<std::int64_t>(index)},
                             Value{static_cast<std::int32_t>(index % 97U)},
                             Value{"SO-" + std::to_string(index)},
                             index % 3U == 0U ? Value{} : Value{"leave at the door"},
                             Value{static_cast<double>(index) * 1.25},
                             Value{index % 2U == 0U}});
        }
    }

    void rewind() noexcept { next_ = 0U; }

    [[nodiscard]] bool read() override
    {
        if (next_ >= rows_.size()) {
            return false;
        }
        current_ = next_++;
        return true;
    }

    [[nodiscard]] std::size_t field_count() const override { return names_.size(); }
    [[nodiscard]] std::string_view name(std::size_t index) const override { return names_.at(index); }
    [[nodiscard]] ValueKind field_type(std::size_t index) const override { return kinds_.at(index); }
    [[nodiscard]] bool is_null(std::size_t index) const override { return value(index).is_null(); }

    [[nodiscard]] bool get_bool(std::size_t index) const override { return value(index).as_bool(); }
    [[nodiscard]] std::int32_t get_int32(std::size_t index) const override { return value(index).as_int32(); }
    [[nodiscard]] std::int64_t get_int64(std::size_t index) const override { return value(index).as_int64(); }
    [[nodiscard]] double get_double(std::size_t index) const override { return value(index).as_double(); }
    [[nodiscard]] std::string get_string(std::size_t index) const override { return value(index).as_string(); }
    [[nodiscard]] sqlchain::core::Blob get_blob(std::size_t index) const override { return value(index).as_blob(); }

private:
    [[nodiscard]] const Value& value(std::size_t index) const { return rows_.at(current_).at(index); }

    std::array<std::string_view, 6> names_{"OrderId", "CustomerId", "Reference", "Notes", "Total", "Shipped"};
    std::array<ValueKind, 6> kinds_{ValueKind::Int64,  ValueKind::Int32,  ValueKind::String,
                                    ValueKind::String, ValueKind::Double, ValueKind::Boolean};
    std::vector<std::vector<Value>> rows_{};
    std::size_t next_ = 0U;
    std::size_t current_ = 0U;
};

enum class Tier {
    Interpreted,
    Compiled
};

struct Scenario final {
    std::string_view name;
    Tier tier;
    std::size_t rows;
};

constexpr std::array scenarios{
    Scenario{"interpreted/100", Tier::Interpreted, 100U},
    Scenario{"compiled/100", Tier::Compiled, 100U},
    Scenario{"interpreted/10000", Tier::Interpreted, 10'000U},
    Scenario{"compiled/10000", Tier::Compiled, 10'000U},
};

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: sqlchain_benchmarks [--iterations N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if ((arg == "--iterations" || arg == "-n") && index + 1 < argc) {
            const auto value = std::strtoull(argv[index + 1], nullptr, 10);
            if (value > 0U) {
                return static_cast<std::size_t>(value);
            }
        }
    }

    return default_iterations;
}

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t rows = 0U;
    std::uint64_t compilations = 0U;
    std::int64_t checksum = 0;
    Clock::duration elapsed{};
};

BenchmarkSummary run_scenario(const Scenario& scenario, std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    MemoryCursor cursor{scenario.rows};
    sqlchain::materializer::CompiledBinderCache cache;
    const auto& type = sqlchain::model::type_descriptor<Order>();

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        cursor.rewind();
        std::shared_ptr<const sqlchain::materializer::CompiledBinder> binder;
        if (scenario.tier == Tier::Compiled) {
            binder = cache.get_or_compile(order_query, cursor, type);
        }
        while (cursor.read()) {
            Order order{};
            if (binder) {
                binder->bind(cursor, &order);
            } else {
                sqlchain::materializer::bind_row(cursor, type, &order);
            }
            summary.checksum += order.customer_id;
            ++summary.rows;
        }
    }
    const auto stop = Clock::now();
    summary.elapsed = stop - start;
    summary.compilations = cache.compilations();

    return summary;
}

void report_summary(const Scenario& scenario, const BenchmarkSummary& summary)
{
    const auto seconds = std::chrono::duration<double>(summary.elapsed).count();
    const auto rows_per_second = seconds > 0.0 ? static_cast<double>(summary.rows) / seconds : 0.0;
    const auto ns_per_row = summary.rows > 0U
                                ? std::chrono::duration<double, std::nano>(summary.elapsed).count() / summary.rows
                                : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << scenario.name << "\n";
    std::cout << "  Passes: " << summary.iterations << "\n";
    std::cout << "  Rows: " << summary.rows << "\n";
    std::cout << "  Binder compilations: " << summary.compilations << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Rows/s: " << rows_per_second << "\n";
    std::cout << "  ns/row: " << ns_per_row << "\n";
    std::cout << "  Checksum: " << summary.checksum << "\n";
}

}  // namespace

int main(int argc, char** argv)
{
    const auto iterations = parse_iterations_from_args(argc, argv, 200U);
    for (const auto& scenario : scenarios) {
        const auto summary = run_scenario(scenario, iterations);
        report_summary(scenario, summary);
    }
    return EXIT_SUCCESS;
}
